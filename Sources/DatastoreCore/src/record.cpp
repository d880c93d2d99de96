#include "datastore/record.hpp"
#include "datastore/errors.hpp"
#include "datastore/list.hpp"
#include "datastore/map.hpp"
#include "datastore/string.hpp"
#include "datastore/transaction.hpp"
#include <unordered_set>

namespace datastore {

namespace {

const char* kind_name(const record_value& value) noexcept {
    switch (value.index()) {
        case 0: return "json";
        case 1: return "list";
        case 2: return "map";
        case 3: return "string";
    }
    return "json";
}

} // namespace

db_record::db_record(std::shared_ptr<transaction_manager> txn, record_state state)
    : db_object(db_type::record, std::move(txn))
    , state_(std::move(state))
{
    std::unordered_set<const db_object*> seen;
    for (const auto& [name, value] : state_) {
        auto* child = owned_object(value);
        if (!child) continue;
        if (child->parent()) {
            throw ownership_error("Property '" + name + "' holds a " + to_string(child->type()) +
                                  " that already belongs to " + child->parent()->id());
        }
        if (!seen.insert(child).second) {
            throw ownership_error("Property '" + name + "' shares its " + to_string(child->type()) +
                                  " with another property");
        }
    }
    for (const auto& [name, value] : state_) {
        if (auto* child = owned_object(value)) {
            set_parent(*child, this);
        }
    }
}

db_record::~db_record() {
    for (const auto& [name, value] : state_) {
        if (auto* child = owned_object(value); child && child->parent() == this) {
            set_parent(*child, nullptr);
        }
    }
}

std::vector<std::string> db_record::property_names() const {
    std::vector<std::string> names;
    names.reserve(state_.size());
    for (const auto& [name, value] : state_) {
        names.push_back(name);
    }
    return names;
}

const record_value& db_record::get(const std::string& name) const {
    auto it = state_.find(name);
    if (it == state_.end()) {
        throw property_error("Record " + id() + " has no property '" + name + "'");
    }
    return it->second;
}

template<typename T>
const T& db_record::get_as(const std::string& name, const char* kind) const {
    const auto& value = get(name);
    if (auto* typed = std::get_if<T>(&value)) {
        return *typed;
    }
    throw property_error("Property '" + name + "' holds a " + kind_name(value) + ", not a " + kind);
}

const json& db_record::get_json(const std::string& name) const {
    return get_as<json>(name, "json");
}

std::shared_ptr<db_list> db_record::get_list(const std::string& name) const {
    return get_as<std::shared_ptr<db_list>>(name, "list");
}

std::shared_ptr<db_map> db_record::get_map(const std::string& name) const {
    return get_as<std::shared_ptr<db_map>>(name, "map");
}

std::shared_ptr<db_string> db_record::get_string(const std::string& name) const {
    return get_as<std::shared_ptr<db_string>>(name, "string");
}

void db_record::set(const std::string& name, record_value value) {
    auto& tm = writable("db_record::set");

    auto it = state_.find(name);
    if (it == state_.end()) {
        throw property_error("Record " + id() + " has no property '" + name + "'");
    }
    if (it->second.index() != value.index()) {
        throw property_error(std::string("Property '") + name + "' holds a " + kind_name(it->second) +
                             ", cannot assign a " + kind_name(value));
    }
    if (same_value(it->second, value)) return;

    auto* incoming = owned_object(value);
    if (incoming && incoming->parent()) {
        throw ownership_error("Cannot assign " + incoming->id() + " to '" + name +
                              "': it already belongs to " + incoming->parent()->id());
    }

    record_value previous = std::move(it->second);
    if (auto* orphan = owned_object(previous)) {
        set_parent(*orphan, nullptr);
    }
    if (incoming) {
        set_parent(*incoming, this);
    }
    it->second = value;

    record_change change;
    change.old_state.emplace(name, std::move(previous));
    change.new_state.emplace(name, std::move(value));
    tm.record(shared_from_this(), std::move(change));
}

json db_record::to_json() const {
    json result = json::object();
    for (const auto& [name, value] : state_) {
        result[name] = datastore::to_json(value);
    }
    return result;
}

} // namespace datastore
