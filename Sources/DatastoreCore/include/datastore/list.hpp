#pragma once

#ifdef __cplusplus

#include "db_object.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace datastore {

// ============================================================================
// db_list - Ordered collection of JSON values
// ============================================================================
//
// Indices may be negative (offset from the end). Search ranges are inclusive
// and wrap around when the stop bound precedes the start bound (forward
// searches) or follows it (backward searches).

class db_list : public db_object {
public:
    using const_iterator = std::vector<json>::const_iterator;
    using const_reverse_iterator = std::vector<json>::const_reverse_iterator;
    using predicate_t = std::function<bool(const json& value, int64_t index)>;

    db_list(std::shared_ptr<transaction_manager> txn, std::vector<json> values = {});

    bool empty() const noexcept { return values_.empty(); }
    size_t size() const noexcept { return values_.size(); }

    std::optional<json> first() const;
    std::optional<json> last() const;

    /// The value at `index`, or nullopt if out of range.
    std::optional<json> get(int64_t index) const;

    const std::vector<json>& values() const noexcept { return values_; }
    const_iterator begin() const noexcept { return values_.begin(); }
    const_iterator end() const noexcept { return values_.end(); }
    const_reverse_iterator rbegin() const noexcept { return values_.rbegin(); }
    const_reverse_iterator rend() const noexcept { return values_.rend(); }

    int64_t index_of(const json& value, int64_t start = 0, int64_t stop = -1) const;
    int64_t last_index_of(const json& value, int64_t start = -1, int64_t stop = 0) const;
    int64_t find_index(const predicate_t& fn, int64_t start = 0, int64_t stop = -1) const;
    int64_t find_last_index(const predicate_t& fn, int64_t start = -1, int64_t stop = 0) const;

    /// No-op if `index` is out of range.
    void set(int64_t index, json value);
    void push(json value);
    void insert(int64_t index, json value);
    /// No-op if `index` is out of range.
    void remove(int64_t index);
    void splice(int64_t index, int64_t count, std::vector<json> values = {});
    void clear();

    json to_json() const override;

private:
    // Replace `count` values at a resolved `index` and buffer the delta.
    void replace(const char* operation, int64_t index, int64_t count, std::vector<json> values);

    std::vector<json> values_;
};

} // namespace datastore

#endif // __cplusplus
