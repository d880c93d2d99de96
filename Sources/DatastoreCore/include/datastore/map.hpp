#pragma once

#ifdef __cplusplus

#include "db_object.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace datastore {

// ============================================================================
// db_map - String keys to JSON values
// ============================================================================
//
// Iteration order is unspecified. All changes made to one map inside one
// transaction collapse into a single map_change.

class db_map : public db_object {
public:
    using items_t = std::unordered_map<std::string, json>;

    db_map(std::shared_ptr<transaction_manager> txn, json::object_t items = {});

    bool empty() const noexcept { return items_.empty(); }
    size_t size() const noexcept { return items_.size(); }

    std::vector<std::string> keys() const;
    std::vector<json> values() const;
    const items_t& items() const noexcept { return items_; }

    bool has(const std::string& key) const { return items_.find(key) != items_.end(); }

    /// The value for `key`, or nullopt if the key is missing.
    std::optional<json> get(const std::string& key) const;

    void set(const std::string& key, json value);

    /// No-op if the key is missing.
    void remove(const std::string& key);

    void clear();

    json to_json() const override;

private:
    void record(transaction_manager& tm, const std::string& key,
                const std::optional<json>& before, const std::optional<json>& after);

    items_t items_;
};

} // namespace datastore

#endif // __cplusplus
