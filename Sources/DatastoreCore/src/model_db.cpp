#include "datastore/model_db.hpp"
#include <algorithm>
#include <mutex>

namespace datastore {

namespace {

configuration resolve(configuration config) {
    static std::once_flag log_env_once;
    std::call_once(log_env_once, init_log_level_from_env);

    if (config.session_id.empty()) {
        config.session_id = generate_db_id();
    }
    if (!config.sched) {
        config.sched = default_scheduler::make_default();
    }
    return config;
}

} // namespace

model_db::model_db()
    : model_db(configuration())
{}

model_db::model_db(configuration config)
    : config_(resolve(std::move(config)))
    , txn_(std::make_shared<transaction_manager>(config_.user_id, config_.session_id))
    , bubbler_(config_.sched)
    , undo_(config_.undo_limit)
{
    LOG_INFO("model_db", "Opened database (user %s, session %s)",
             config_.user_id.c_str(), config_.session_id.c_str());
}

// ============================================================================
// Undo / redo
// ============================================================================

void model_db::undo() {
    if (txn_->is_open()) {
        throw reentrancy_error("undo() cannot be called inside a transaction");
    }
    auto checkpoint = undo_.take_undo();
    if (!checkpoint) return;
    replay(transaction_kind::undo, std::move(*checkpoint));
}

void model_db::redo() {
    if (txn_->is_open()) {
        throw reentrancy_error("redo() cannot be called inside a transaction");
    }
    auto checkpoint = undo_.take_redo();
    if (!checkpoint) return;
    replay(transaction_kind::redo, std::move(*checkpoint));
}

void model_db::replay(transaction_kind kind, change_set checkpoint) {
    bool undoing = kind == transaction_kind::undo;
    LOG_INFO("model_db", "%s of %zu changes", undoing ? "Undo" : "Redo", checkpoint.change_count());

    txn_->begin(kind);
    try {
        undo_manager::replay(checkpoint, undoing ? replay_direction::backward
                                                 : replay_direction::forward);
    } catch (const std::exception& e) {
        LOG_ERROR("model_db", "%s failed, reverting: %s", to_string(kind), e.what());
        abandon(kind, std::move(checkpoint));
        throw;
    } catch (...) {
        LOG_ERROR("model_db", "%s failed, reverting", to_string(kind));
        abandon(kind, std::move(checkpoint));
        throw;
    }
    commit(kind);

    if (undoing) {
        undo_.push_redo(std::move(checkpoint));
    } else {
        undo_.push_undo(std::move(checkpoint));
    }
}

// Closes a failed replay. The mutations it managed to apply are reverted in a
// second transaction and neither transaction is published, so live state and
// both stacks are left as they were before the replay started.
void model_db::abandon(transaction_kind kind, change_set checkpoint) {
    auto partial = txn_->end();
    if (!partial.journal.empty()) {
        txn_->begin(kind);
        try {
            undo_manager::replay(partial, replay_direction::backward);
        } catch (...) {
            txn_->end();
            LOG_ERROR("model_db", "Could not revert partial %s; dropping history", to_string(kind));
            undo_.clear();
            throw;
        }
        txn_->end();
    }

    if (kind == transaction_kind::undo) {
        undo_.push_undo(std::move(checkpoint));
    } else {
        undo_.push_redo(std::move(checkpoint));
    }
}

void model_db::commit(transaction_kind kind) {
    auto changes = txn_->end();
    LOG_DEBUG("model_db", "Committed %s transaction with %zu changes", to_string(kind),
              changes.change_count());
    bubbler_.dispatch(changes);
    undo_.on_commit(std::move(changes), kind);
}

// ============================================================================
// Factories
// ============================================================================

std::shared_ptr<db_list> model_db::create_list(std::vector<json> values) {
    return std::make_shared<db_list>(txn_, std::move(values));
}

std::shared_ptr<db_map> model_db::create_map(json::object_t items) {
    return std::make_shared<db_map>(txn_, std::move(items));
}

std::shared_ptr<db_string> model_db::create_string(std::string value) {
    return std::make_shared<db_string>(txn_, std::move(value));
}

std::shared_ptr<db_record> model_db::create_record(record_state state) {
    return std::make_shared<db_record>(txn_, std::move(state));
}

// ============================================================================
// Tables
// ============================================================================

std::vector<std::shared_ptr<db_table>>::const_iterator model_db::find_table(const token& tok) const {
    return std::find_if(tables_.begin(), tables_.end(),
                        [&tok](const auto& table) { return table->db_token() == tok; });
}

std::shared_ptr<db_table> model_db::create_table(const token& tok,
                                                 std::vector<std::shared_ptr<db_record>> records) {
    if (find_table(tok) != tables_.end()) {
        throw table_exists_error("Table already exists for token '" + tok.name() + "'");
    }
    auto table = std::make_shared<db_table>(txn_, tok, std::move(records));
    tables_.push_back(table);
    LOG_INFO("model_db", "Created table '%s' with %zu records", tok.name().c_str(), table->size());
    return table;
}

bool model_db::has_table(const token& tok) const {
    return find_table(tok) != tables_.end();
}

std::shared_ptr<db_table> model_db::get_table(const token& tok) const {
    auto it = find_table(tok);
    if (it == tables_.end()) {
        throw table_not_found_error("No table for token '" + tok.name() + "'");
    }
    return *it;
}

void model_db::delete_table(const token& tok) {
    auto it = find_table(tok);
    if (it == tables_.end()) {
        throw table_not_found_error("No table for token '" + tok.name() + "'");
    }
    auto table = *it;
    tables_.erase(it);
    table->detach_all();
    LOG_INFO("model_db", "Deleted table '%s'", tok.name().c_str());
}

} // namespace datastore
