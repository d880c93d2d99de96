#pragma once

#ifdef __cplusplus

#include "transaction.hpp"
#include <cstddef>
#include <deque>
#include <optional>

namespace datastore {

enum class replay_direction {
    backward,  ///< Apply the inverse of each change, newest first
    forward    ///< Re-apply each change, oldest first
};

// ============================================================================
// undo_manager - Undo and redo stacks of committed transactions
// ============================================================================
//
// Each checkpoint is the full change_set of one normal transaction. Replays
// run as their own (undo/redo) transactions through the regular mutators;
// those transactions never create checkpoints, the replayed checkpoint just
// moves to the opposite stack.

class undo_manager {
public:
    /// `limit` bounds the undo stack (0 = unbounded).
    explicit undo_manager(size_t limit = 0) : limit_(limit) {}

    [[nodiscard]] bool can_undo() const noexcept { return !undo_stack_.empty(); }
    [[nodiscard]] bool can_redo() const noexcept { return !redo_stack_.empty(); }
    size_t undo_depth() const noexcept { return undo_stack_.size(); }
    size_t redo_depth() const noexcept { return redo_stack_.size(); }

    /// Record a commit. Normal transactions push a checkpoint and invalidate
    /// the redo stack; replays are ignored.
    void on_commit(change_set changes, transaction_kind kind);

    std::optional<change_set> take_undo();
    std::optional<change_set> take_redo();
    void push_undo(change_set checkpoint);
    void push_redo(change_set checkpoint);

    void clear();

    /// Apply a checkpoint to the live objects. Must run inside a transaction.
    static void replay(const change_set& checkpoint, replay_direction direction);

private:
    void trim();

    size_t limit_;
    std::deque<change_set> undo_stack_;
    std::deque<change_set> redo_stack_;
};

} // namespace datastore

#endif // __cplusplus
