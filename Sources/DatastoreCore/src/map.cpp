#include "datastore/map.hpp"
#include "datastore/transaction.hpp"

namespace datastore {

db_map::db_map(std::shared_ptr<transaction_manager> txn, json::object_t items)
    : db_object(db_type::map, std::move(txn))
{
    for (auto& [key, value] : items) {
        items_.emplace(key, std::move(value));
    }
}

std::vector<std::string> db_map::keys() const {
    std::vector<std::string> result;
    result.reserve(items_.size());
    for (const auto& [key, value] : items_) {
        result.push_back(key);
    }
    return result;
}

std::vector<json> db_map::values() const {
    std::vector<json> result;
    result.reserve(items_.size());
    for (const auto& [key, value] : items_) {
        result.push_back(value);
    }
    return result;
}

std::optional<json> db_map::get(const std::string& key) const {
    auto it = items_.find(key);
    if (it == items_.end()) return std::nullopt;
    return it->second;
}

void db_map::set(const std::string& key, json value) {
    auto& tm = writable("db_map::set");
    std::optional<json> before;
    auto it = items_.find(key);
    if (it != items_.end()) {
        before = it->second;
        it->second = value;
    } else {
        items_.emplace(key, value);
    }
    record(tm, key, before, value);
}

void db_map::remove(const std::string& key) {
    auto& tm = writable("db_map::remove");
    auto it = items_.find(key);
    if (it == items_.end()) return;
    std::optional<json> before = std::move(it->second);
    items_.erase(it);
    record(tm, key, before, std::nullopt);
}

void db_map::clear() {
    auto& tm = writable("db_map::clear");
    if (items_.empty()) return;
    map_change change;
    for (auto& [key, value] : items_) {
        change.removed.emplace(key, std::move(value));
    }
    items_.clear();
    tm.record(shared_from_this(), std::move(change));
}

void db_map::record(transaction_manager& tm, const std::string& key,
                    const std::optional<json>& before, const std::optional<json>& after) {
    map_change change;
    if (before) change.removed.emplace(key, *before);
    if (after) change.added.emplace(key, *after);
    tm.record(shared_from_this(), std::move(change));
}

json db_map::to_json() const {
    json result = json::object();
    for (const auto& [key, value] : items_) {
        result[key] = value;
    }
    return result;
}

} // namespace datastore
