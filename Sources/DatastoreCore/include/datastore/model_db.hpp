#pragma once

#ifdef __cplusplus

#include "bubbler.hpp"
#include "errors.hpp"
#include "list.hpp"
#include "log.hpp"
#include "map.hpp"
#include "record.hpp"
#include "scheduler.hpp"
#include "string.hpp"
#include "table.hpp"
#include "transaction.hpp"
#include "types.hpp"
#include "undo.hpp"
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace datastore {

struct configuration {
    /// Stamped on every change committed by this database.
    std::string user_id = "local";

    /// Stamped on every change. Empty = a fresh UUID per database.
    std::string session_id;

    /// Scheduler for `changed` notifications. nullptr = queued_scheduler.
    shared_scheduler sched = nullptr;

    /// Maximum number of undo checkpoints kept. 0 = unbounded.
    size_t undo_limit = 0;

    configuration() = default;

    explicit configuration(shared_scheduler s) : sched(std::move(s)) {}

    configuration(std::string user, std::string session, shared_scheduler s = nullptr)
        : user_id(std::move(user)), session_id(std::move(session)), sched(std::move(s)) {}
};

// ============================================================================
// model_db - Table registry, object factory and transaction entry point
// ============================================================================
//
// Usage:
//   datastore::model_db db;
//   datastore::token todo("todo");
//   auto table = db.create_table(todo);
//   auto rec = db.create_record({{"title", db.create_string("milk")}, {"done", false}});
//   db.transact([&] { table->insert(rec); });
//   db.undo();

class model_db {
public:
    model_db();
    explicit model_db(configuration config);

    // Non-copyable and non-moveable (objects hold the transaction manager)
    model_db(const model_db&) = delete;
    model_db& operator=(const model_db&) = delete;
    model_db(model_db&&) = delete;
    model_db& operator=(model_db&&) = delete;

    // ========================================================================
    // Transactions
    // ========================================================================

    /// Run `block` with mutation enabled, then commit. Throws reentrancy_error
    /// if a transaction is already open. If `block` throws, everything it
    /// changed before throwing is still committed and the exception is rethrown.
    template<typename F>
    void transact(F&& block) {
        run_transaction(transaction_kind::normal, std::forward<F>(block));
    }

    [[nodiscard]] bool in_transaction() const noexcept { return txn_->is_open(); }

    // ========================================================================
    // Undo / redo
    // ========================================================================

    [[nodiscard]] bool can_undo() const noexcept { return undo_.can_undo(); }
    [[nodiscard]] bool can_redo() const noexcept { return undo_.can_redo(); }

    /// Revert the most recent transaction. No-op if there is nothing to undo.
    /// Throws reentrancy_error inside a transaction. If the replay fails, its
    /// partial effects are reverted, nothing is published, the checkpoint
    /// stays on the undo stack and the error propagates.
    void undo();

    /// Re-apply the most recently undone transaction. No-op if there is
    /// nothing to redo. Throws reentrancy_error inside a transaction.
    void redo();

    const undo_manager& history() const noexcept { return undo_; }

    // ========================================================================
    // Factories - fresh, unattached objects; usable inside or outside a transaction
    // ========================================================================

    std::shared_ptr<db_list> create_list(std::vector<json> values = {});
    std::shared_ptr<db_map> create_map(json::object_t items = {});
    std::shared_ptr<db_string> create_string(std::string value = {});
    std::shared_ptr<db_record> create_record(record_state state);

    // ========================================================================
    // Tables
    // ========================================================================

    /// Throws table_exists_error if a table for `tok` already exists.
    std::shared_ptr<db_table> create_table(const token& tok,
                                           std::vector<std::shared_ptr<db_record>> records = {});

    bool has_table(const token& tok) const;

    /// Throws table_not_found_error if no table exists for `tok`.
    std::shared_ptr<db_table> get_table(const token& tok) const;

    /// Throws table_not_found_error if no table exists for `tok`.
    void delete_table(const token& tok);

    /// Registered tables, in creation order.
    const std::vector<std::shared_ptr<db_table>>& tables() const noexcept { return tables_; }

    const configuration& config() const noexcept { return config_; }
    const shared_scheduler& get_scheduler() const noexcept { return bubbler_.get_scheduler(); }

private:
    template<typename F>
    void run_transaction(transaction_kind kind, F&& block) {
        txn_->begin(kind);
        try {
            block();
        } catch (const std::exception& e) {
            LOG_WARN("model_db", "%s transaction failed, committing applied changes: %s",
                     to_string(kind), e.what());
            commit(kind);
            throw;
        } catch (...) {
            LOG_WARN("model_db", "%s transaction failed, committing applied changes", to_string(kind));
            commit(kind);
            throw;
        }
        commit(kind);
    }

    void commit(transaction_kind kind);
    void replay(transaction_kind kind, change_set checkpoint);
    void abandon(transaction_kind kind, change_set checkpoint);

    std::vector<std::shared_ptr<db_table>>::const_iterator find_table(const token& tok) const;

    configuration config_;
    std::shared_ptr<transaction_manager> txn_;
    change_bubbler bubbler_;
    undo_manager undo_;
    std::vector<std::shared_ptr<db_table>> tables_;
};

} // namespace datastore

#endif // __cplusplus
