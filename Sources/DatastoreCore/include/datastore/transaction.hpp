#pragma once

#ifdef __cplusplus

#include "changes.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace datastore {

enum class transaction_kind {
    normal,  ///< Started by model_db::transact
    undo,    ///< Replay of an undo checkpoint's inverse
    redo     ///< Replay of an undone checkpoint
};

const char* to_string(transaction_kind kind) noexcept;

/// The ordered changes of one object within one transaction.
struct object_changes {
    std::shared_ptr<db_object> object;
    std::vector<db_change> changes;
};

/// A single mutation, exactly as it was applied.
struct journal_entry {
    std::shared_ptr<db_object> object;
    db_change change;
};

/// Everything one transaction changed.
///
/// `entries` is the per-object view used for notifications: ordered by each
/// object's first change, list and string deltas kept one per mutation, map,
/// record and table deltas collapsed into one per object. `journal` keeps
/// every mutation in operation order and is what undo/redo replays.
struct change_set {
    change_metadata metadata;
    std::vector<object_changes> entries;
    std::vector<journal_entry> journal;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
    [[nodiscard]] size_t change_count() const noexcept;
};

// ============================================================================
// transaction_manager - The single gate all mutation flows through
// ============================================================================
//
// State machine: idle -> recording -> idle. Every db object created by one
// model_db shares that database's manager; mutators call writable() before
// touching live state and then buffer the delta they produced.

class transaction_manager {
public:
    transaction_manager(std::string user_id, std::string session_id);

    transaction_manager(const transaction_manager&) = delete;
    transaction_manager& operator=(const transaction_manager&) = delete;

    [[nodiscard]] bool is_open() const noexcept { return open_; }
    [[nodiscard]] transaction_kind kind() const noexcept { return kind_; }

    const std::string& user_id() const noexcept { return metadata_.user_id; }
    const std::string& session_id() const noexcept { return metadata_.session_id; }

    /// Start recording. Throws reentrancy_error if a transaction is already open.
    void begin(transaction_kind kind);

    /// Stop recording and hand back the buffered changes, without no-op deltas.
    change_set end();

    /// Throws transaction_error unless a transaction is open.
    void require_open(const char* operation) const;

    /// Buffer the delta of one mutation of `object`, stamped with the
    /// transaction metadata.
    void record(const std::shared_ptr<db_object>& object, db_change change);

private:
    object_changes& entry_for(const std::shared_ptr<db_object>& object);

    bool open_ = false;
    transaction_kind kind_ = transaction_kind::normal;
    change_metadata metadata_;
    std::vector<object_changes> entries_;
    std::vector<journal_entry> journal_;
    std::unordered_map<const db_object*, size_t> entry_index_;
};

} // namespace datastore

#endif // __cplusplus
