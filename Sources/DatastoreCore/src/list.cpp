#include "datastore/list.hpp"
#include "datastore/range.hpp"
#include "datastore/transaction.hpp"

namespace datastore {

db_list::db_list(std::shared_ptr<transaction_manager> txn, std::vector<json> values)
    : db_object(db_type::list, std::move(txn))
    , values_(std::move(values))
{}

std::optional<json> db_list::first() const {
    if (values_.empty()) return std::nullopt;
    return values_.front();
}

std::optional<json> db_list::last() const {
    if (values_.empty()) return std::nullopt;
    return values_.back();
}

std::optional<json> db_list::get(int64_t index) const {
    auto i = detail::resolve_index(index, static_cast<int64_t>(values_.size()));
    if (!i) return std::nullopt;
    return values_[static_cast<size_t>(*i)];
}

int64_t db_list::index_of(const json& value, int64_t start, int64_t stop) const {
    return detail::find_first_in_range(static_cast<int64_t>(values_.size()), start, stop,
        [&](int64_t i) { return values_[static_cast<size_t>(i)] == value; });
}

int64_t db_list::last_index_of(const json& value, int64_t start, int64_t stop) const {
    return detail::find_last_in_range(static_cast<int64_t>(values_.size()), start, stop,
        [&](int64_t i) { return values_[static_cast<size_t>(i)] == value; });
}

int64_t db_list::find_index(const predicate_t& fn, int64_t start, int64_t stop) const {
    return detail::find_first_in_range(static_cast<int64_t>(values_.size()), start, stop,
        [&](int64_t i) { return fn(values_[static_cast<size_t>(i)], i); });
}

int64_t db_list::find_last_index(const predicate_t& fn, int64_t start, int64_t stop) const {
    return detail::find_last_in_range(static_cast<int64_t>(values_.size()), start, stop,
        [&](int64_t i) { return fn(values_[static_cast<size_t>(i)], i); });
}

void db_list::set(int64_t index, json value) {
    writable("db_list::set");
    auto i = detail::resolve_index(index, static_cast<int64_t>(values_.size()));
    if (!i) return;
    std::vector<json> added;
    added.push_back(std::move(value));
    replace("db_list::set", *i, 1, std::move(added));
}

void db_list::push(json value) {
    writable("db_list::push");
    std::vector<json> added;
    added.push_back(std::move(value));
    replace("db_list::push", static_cast<int64_t>(values_.size()), 0, std::move(added));
}

void db_list::insert(int64_t index, json value) {
    writable("db_list::insert");
    std::vector<json> added;
    added.push_back(std::move(value));
    replace("db_list::insert", detail::clamp_insert_index(index, static_cast<int64_t>(values_.size())),
            0, std::move(added));
}

void db_list::remove(int64_t index) {
    writable("db_list::remove");
    auto i = detail::resolve_index(index, static_cast<int64_t>(values_.size()));
    if (!i) return;
    replace("db_list::remove", *i, 1, {});
}

void db_list::splice(int64_t index, int64_t count, std::vector<json> values) {
    writable("db_list::splice");
    auto size = static_cast<int64_t>(values_.size());
    auto start = detail::clamp_insert_index(index, size);
    replace("db_list::splice", start, detail::clamp_count(start, count, size), std::move(values));
}

void db_list::clear() {
    writable("db_list::clear");
    replace("db_list::clear", 0, static_cast<int64_t>(values_.size()), {});
}

void db_list::replace(const char* operation, int64_t index, int64_t count, std::vector<json> values) {
    if (count == 0 && values.empty()) return;
    auto& tm = writable(operation);

    auto first = values_.begin() + index;
    list_change change;
    change.index = index;
    change.removed.assign(std::make_move_iterator(first), std::make_move_iterator(first + count));
    first = values_.erase(first, first + count);
    values_.insert(first, values.begin(), values.end());
    change.added = std::move(values);

    tm.record(shared_from_this(), std::move(change));
}

json db_list::to_json() const {
    return json(values_);
}

} // namespace datastore
