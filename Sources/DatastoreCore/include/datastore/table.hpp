#pragma once

#ifdef __cplusplus

#include "db_object.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace datastore {

// ============================================================================
// token - Identifies a record shape; keys the tables of a model_db
// ============================================================================
//
// Every constructed token is distinct, even when two share a name. Copies
// compare equal to the original.

class token {
public:
    explicit token(std::string name);

    const std::string& name() const noexcept { return name_; }
    uint64_t id() const noexcept { return id_; }

    bool operator==(const token& other) const noexcept { return id_ == other.id_; }
    bool operator!=(const token& other) const noexcept { return id_ != other.id_; }

private:
    std::string name_;
    uint64_t id_;
};

// ============================================================================
// db_table - Records keyed by their db id
// ============================================================================
//
// A table is always a root: parent() is nullptr. Records in the table have
// the table as their parent.

class db_table : public db_object {
public:
    /// Throws ownership_error if one of `records` already has a parent.
    db_table(std::shared_ptr<transaction_manager> txn, token tok,
             std::vector<std::shared_ptr<db_record>> records = {});
    ~db_table() override;

    const token& db_token() const noexcept { return token_; }

    bool empty() const noexcept { return records_.empty(); }
    size_t size() const noexcept { return records_.size(); }

    bool has(const std::string& id) const { return records_.find(id) != records_.end(); }

    /// The record with `id`, or nullptr if it is not in the table.
    std::shared_ptr<db_record> get(const std::string& id) const;

    /// All records, in unspecified order.
    std::vector<std::shared_ptr<db_record>> records() const;

    /// No-op if the record is already in this table. Throws ownership_error
    /// if it belongs to another table.
    void insert(const std::shared_ptr<db_record>& record);

    /// No-op if `id` is not in the table. The removed record is detached.
    void remove(const std::string& id);

    void clear();

    json to_json() const override;

private:
    friend class model_db;

    // Release every record without recording a change. Used when the table
    // is unregistered from its database.
    void detach_all() noexcept;

    token token_;
    std::unordered_map<std::string, std::shared_ptr<db_record>> records_;
};

} // namespace datastore

#endif // __cplusplus
