#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace datastore {

// ============================================================================
// change_metadata - Fields stamped on every change by the open transaction
// ============================================================================

struct change_metadata {
    /// True if the change was generated by an undo replay
    bool is_undo = false;

    /// True if the change was generated by a redo replay
    bool is_redo = false;

    /// False only for undo/redo replays
    bool is_local = true;

    std::string user_id;
    std::string session_id;
};

// ============================================================================
// Per-type deltas
// ============================================================================

struct list_change : change_metadata {
    /// Resolved (non-negative) index of the modification
    int64_t index = 0;

    /// Values removed at `index`
    std::vector<json> removed;

    /// Values added at `index`
    std::vector<json> added;
};

struct map_change : change_metadata {
    json::object_t removed;
    json::object_t added;
};

struct string_change : change_metadata {
    int64_t index = 0;
    std::string removed;
    std::string added;
};

struct record_change : change_metadata {
    /// Values of the touched properties before the transaction touched them
    record_state old_state;

    /// Values of the touched properties afterwards
    record_state new_state;
};

struct table_change : change_metadata {
    std::vector<std::shared_ptr<db_record>> removed;
    std::vector<std::shared_ptr<db_record>> added;
};

/// One delta buffered by a transaction. The alternative always matches the
/// db_type of the object it was recorded for.
using db_change = std::variant<list_change, map_change, string_change, record_change, table_change>;

const change_metadata& metadata_of(const db_change& change) noexcept;

/// True if applying the change would leave the object as it was.
bool is_noop(const db_change& change);

// ============================================================================
// Changed args - the payload of every `changed` notification
// ============================================================================

struct list_changed_args {
    std::shared_ptr<db_list> target;
    std::vector<list_change> changes;
};

struct map_changed_args {
    std::shared_ptr<db_map> target;
    std::vector<map_change> changes;
};

struct string_changed_args {
    std::shared_ptr<db_string> target;
    std::vector<string_change> changes;
};

struct record_changed_args {
    std::shared_ptr<db_record> target;
    std::vector<record_change> changes;
};

struct table_changed_args {
    std::shared_ptr<db_table> target;
    std::vector<table_change> changes;
};

using changed_args = std::variant<
    list_changed_args,
    map_changed_args,
    string_changed_args,
    record_changed_args,
    table_changed_args
>;

db_type args_type(const changed_args& args) noexcept;

/// The object that generated the changes.
const db_object* args_target(const changed_args& args) noexcept;

/// True if `args` was republished by `receiver` on behalf of a descendant.
inline bool is_bubbled(const db_object& receiver, const changed_args& args) noexcept {
    return args_target(args) != &receiver;
}

/// Build the typed args for `target` out of its buffered changes.
changed_args make_changed_args(const std::shared_ptr<db_object>& target,
                               const std::vector<db_change>& changes);

} // namespace datastore

#endif // __cplusplus
