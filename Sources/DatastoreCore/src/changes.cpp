#include "datastore/changes.hpp"
#include "datastore/list.hpp"
#include "datastore/map.hpp"
#include "datastore/record.hpp"
#include "datastore/string.hpp"
#include "datastore/table.hpp"
#include <algorithm>

namespace datastore {

namespace {

bool same_states(const record_state& a, const record_state& b) {
    if (a.size() != b.size()) return false;
    for (const auto& [name, value] : a) {
        auto it = b.find(name);
        if (it == b.end() || !same_value(value, it->second)) return false;
    }
    return true;
}

bool same_records(const std::vector<std::shared_ptr<db_record>>& a,
                  const std::vector<std::shared_ptr<db_record>>& b) {
    if (a.size() != b.size()) return false;
    return std::all_of(a.begin(), a.end(), [&b](const auto& rec) {
        return std::find(b.begin(), b.end(), rec) != b.end();
    });
}

template<typename Change>
std::vector<Change> unpack(const std::vector<db_change>& changes) {
    std::vector<Change> result;
    result.reserve(changes.size());
    for (const auto& change : changes) {
        result.push_back(std::get<Change>(change));
    }
    return result;
}

} // namespace

const change_metadata& metadata_of(const db_change& change) noexcept {
    return std::visit([](const auto& c) -> const change_metadata& { return c; }, change);
}

bool is_noop(const db_change& change) {
    return std::visit([](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, record_change>) {
            return same_states(c.old_state, c.new_state);
        } else if constexpr (std::is_same_v<T, table_change>) {
            return same_records(c.removed, c.added);
        } else {
            return c.removed == c.added;
        }
    }, change);
}

db_type args_type(const changed_args& args) noexcept {
    return std::visit([](const auto& a) { return a.target->type(); }, args);
}

const db_object* args_target(const changed_args& args) noexcept {
    return std::visit([](const auto& a) -> const db_object* { return a.target.get(); }, args);
}

changed_args make_changed_args(const std::shared_ptr<db_object>& target,
                               const std::vector<db_change>& changes) {
    switch (target->type()) {
        case db_type::list:
            return list_changed_args{std::static_pointer_cast<db_list>(target), unpack<list_change>(changes)};
        case db_type::map:
            return map_changed_args{std::static_pointer_cast<db_map>(target), unpack<map_change>(changes)};
        case db_type::string:
            return string_changed_args{std::static_pointer_cast<db_string>(target), unpack<string_change>(changes)};
        case db_type::record:
            return record_changed_args{std::static_pointer_cast<db_record>(target), unpack<record_change>(changes)};
        case db_type::table:
            return table_changed_args{std::static_pointer_cast<db_table>(target), unpack<table_change>(changes)};
    }
    return table_changed_args{std::static_pointer_cast<db_table>(target), unpack<table_change>(changes)};
}

} // namespace datastore
