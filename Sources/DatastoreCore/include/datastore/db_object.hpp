#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "changes.hpp"
#include "observation.hpp"
#include <memory>
#include <string>

namespace datastore {

// ============================================================================
// db_object - Common identity, parent link and change channel
// ============================================================================
//
// Objects are always handled through std::shared_ptr (see model_db's factory
// methods). Ownership flows from parent to child; parent() is a plain
// back-pointer that the owning record or table sets and clears.

class db_object : public std::enable_shared_from_this<db_object> {
public:
    using changed_signal = signal<const db_object&, const changed_args&>;

    virtual ~db_object() = default;

    db_object(const db_object&) = delete;
    db_object& operator=(const db_object&) = delete;

    db_type type() const noexcept { return type_; }
    const std::string& id() const noexcept { return id_; }

    /// The owning record or table, or nullptr for roots and detached objects.
    db_object* parent() const noexcept { return parent_; }

    /// Emitted asynchronously (on the database's scheduler) after each commit
    /// that changed this object or one of its descendants.
    changed_signal& changed() noexcept { return changed_; }

    /// Snapshot of the current content.
    virtual json to_json() const = 0;

protected:
    db_object(db_type type, std::shared_ptr<transaction_manager> txn);

    /// Throws transaction_error unless a transaction is recording.
    transaction_manager& writable(const char* operation);

    template<typename T>
    std::shared_ptr<T> self() {
        return std::static_pointer_cast<T>(shared_from_this());
    }

    const std::shared_ptr<transaction_manager>& txn() const noexcept { return txn_; }

    static void set_parent(db_object& child, db_object* parent) noexcept {
        child.parent_ = parent;
    }

private:
    db_type type_;
    std::string id_;
    db_object* parent_ = nullptr;
    std::shared_ptr<transaction_manager> txn_;
    changed_signal changed_;
};

} // namespace datastore

#endif // __cplusplus
