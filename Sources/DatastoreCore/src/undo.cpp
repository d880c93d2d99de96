#include "datastore/undo.hpp"
#include "datastore/list.hpp"
#include "datastore/log.hpp"
#include "datastore/map.hpp"
#include "datastore/record.hpp"
#include "datastore/string.hpp"
#include "datastore/table.hpp"
#include <type_traits>
#include <utility>
#include <variant>

namespace datastore {

namespace {

// The inverse of a delta swaps what was removed with what was added.
db_change invert(const db_change& change) {
    return std::visit([](auto c) -> db_change {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, record_change>) {
            std::swap(c.old_state, c.new_state);
        } else {
            std::swap(c.removed, c.added);
        }
        return c;
    }, change);
}

void apply_change(db_list& list, const list_change& c) {
    list.splice(c.index, static_cast<int64_t>(c.removed.size()), c.added);
}

void apply_change(db_string& str, const string_change& c) {
    str.splice(c.index, static_cast<int64_t>(c.removed.size()), c.added);
}

void apply_change(db_map& map, const map_change& c) {
    for (const auto& [key, value] : c.removed) {
        if (c.added.count(key) == 0) map.remove(key);
    }
    for (const auto& [key, value] : c.added) {
        map.set(key, value);
    }
}

void apply_change(db_record& rec, const record_change& c) {
    for (const auto& [name, value] : c.new_state) {
        rec.set(name, value);
    }
}

void apply_change(db_table& table, const table_change& c) {
    for (const auto& rec : c.removed) {
        table.remove(rec->id());
    }
    for (const auto& rec : c.added) {
        table.insert(rec);
    }
}

void apply_change(db_object& object, const db_change& change) {
    switch (object.type()) {
        case db_type::list:
            apply_change(static_cast<db_list&>(object), std::get<list_change>(change));
            break;
        case db_type::map:
            apply_change(static_cast<db_map&>(object), std::get<map_change>(change));
            break;
        case db_type::string:
            apply_change(static_cast<db_string&>(object), std::get<string_change>(change));
            break;
        case db_type::record:
            apply_change(static_cast<db_record&>(object), std::get<record_change>(change));
            break;
        case db_type::table:
            apply_change(static_cast<db_table&>(object), std::get<table_change>(change));
            break;
    }
}

} // namespace

void undo_manager::on_commit(change_set changes, transaction_kind kind) {
    if (kind != transaction_kind::normal) return;

    redo_stack_.clear();
    if (changes.empty()) return;

    undo_stack_.push_back(std::move(changes));
    trim();
}

std::optional<change_set> undo_manager::take_undo() {
    if (undo_stack_.empty()) return std::nullopt;
    change_set checkpoint = std::move(undo_stack_.back());
    undo_stack_.pop_back();
    return checkpoint;
}

std::optional<change_set> undo_manager::take_redo() {
    if (redo_stack_.empty()) return std::nullopt;
    change_set checkpoint = std::move(redo_stack_.back());
    redo_stack_.pop_back();
    return checkpoint;
}

void undo_manager::push_undo(change_set checkpoint) {
    undo_stack_.push_back(std::move(checkpoint));
    trim();
}

void undo_manager::push_redo(change_set checkpoint) {
    redo_stack_.push_back(std::move(checkpoint));
}

void undo_manager::clear() {
    undo_stack_.clear();
    redo_stack_.clear();
}

void undo_manager::replay(const change_set& checkpoint, replay_direction direction) {
    LOG_DEBUG("undo_manager", "Replaying %zu mutations %s", checkpoint.journal.size(),
              direction == replay_direction::backward ? "backward" : "forward");

    if (direction == replay_direction::backward) {
        for (auto it = checkpoint.journal.rbegin(); it != checkpoint.journal.rend(); ++it) {
            apply_change(*it->object, invert(it->change));
        }
    } else {
        for (const auto& entry : checkpoint.journal) {
            apply_change(*entry.object, entry.change);
        }
    }
}

void undo_manager::trim() {
    while (limit_ != 0 && undo_stack_.size() > limit_) {
        LOG_DEBUG("undo_manager", "Undo limit %zu reached, dropping oldest checkpoint", limit_);
        undo_stack_.pop_front();
    }
}

} // namespace datastore
