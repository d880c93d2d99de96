#pragma once

#ifdef __cplusplus

#include "db_object.hpp"
#include <cstdint>
#include <string>

namespace datastore {

// ============================================================================
// db_string - A single mutable text value
// ============================================================================
//
// Indices are byte offsets into the UTF-8 text and follow db_list's rules:
// negative values count from the end, insertion points are clamped.
// An offset inside a multi-byte character snaps to that character's start,
// and a removed range is widened to end on a character boundary, so edits
// never split a code point.

class db_string : public db_object {
public:
    db_string(std::shared_ptr<transaction_manager> txn, std::string value = {});

    bool empty() const noexcept { return value_.empty(); }
    size_t size() const noexcept { return value_.size(); }

    const std::string& get() const noexcept { return value_; }

    void set(const std::string& value);
    void append(const std::string& value);
    void insert(int64_t index, const std::string& value);
    void splice(int64_t index, int64_t count, const std::string& value = {});
    void clear();

    json to_json() const override;

private:
    void replace(transaction_manager& tm, int64_t index, int64_t count, const std::string& value);

    std::string value_;
};

} // namespace datastore

#endif // __cplusplus
