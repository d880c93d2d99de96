#include "datastore/transaction.hpp"
#include "datastore/db_object.hpp"
#include "datastore/errors.hpp"
#include "datastore/log.hpp"
#include "datastore/record.hpp"
#include <algorithm>
#include <type_traits>

namespace datastore {

namespace {

bool contains(const std::vector<std::shared_ptr<db_record>>& records, const std::shared_ptr<db_record>& rec) {
    return std::find(records.begin(), records.end(), rec) != records.end();
}

// Per key: `removed` keeps the value from before the transaction first touched
// it, `added` the latest one. A key that was absent before and is absent now
// has no entry in either.
void collapse(map_change& acc, const map_change& next) {
    for (const auto& [key, value] : next.removed) {
        bool touched = acc.removed.count(key) != 0 || acc.added.count(key) != 0;
        if (!touched) acc.removed[key] = value;
        if (next.added.count(key) == 0) acc.added.erase(key);
    }
    for (const auto& [key, value] : next.added) {
        acc.added[key] = value;
    }
}

void collapse(record_change& acc, const record_change& next) {
    for (const auto& [name, value] : next.old_state) {
        acc.old_state.emplace(name, value);
    }
    for (const auto& [name, value] : next.new_state) {
        acc.new_state.insert_or_assign(name, value);
    }
}

// Same rule as maps, keyed by record identity
void collapse(table_change& acc, const table_change& next) {
    for (const auto& rec : next.removed) {
        bool touched = contains(acc.removed, rec) || contains(acc.added, rec);
        if (!touched) acc.removed.push_back(rec);
        acc.added.erase(std::remove(acc.added.begin(), acc.added.end(), rec), acc.added.end());
    }
    for (const auto& rec : next.added) {
        if (!contains(acc.added, rec)) acc.added.push_back(rec);
    }
}

/// Merge `next` into `acc` if both are of a collapsing kind. Returns false for
/// list and string deltas, which are kept one per mutation.
bool try_collapse(db_change& acc, const db_change& next) {
    if (acc.index() != next.index()) return false;
    return std::visit([&next](auto& a) -> bool {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, list_change> || std::is_same_v<T, string_change>) {
            return false;
        } else {
            collapse(a, std::get<T>(next));
            return true;
        }
    }, acc);
}

} // namespace

const char* to_string(transaction_kind kind) noexcept {
    switch (kind) {
        case transaction_kind::normal: return "normal";
        case transaction_kind::undo: return "undo";
        case transaction_kind::redo: return "redo";
    }
    return "normal";
}

size_t change_set::change_count() const noexcept {
    size_t count = 0;
    for (const auto& entry : entries) {
        count += entry.changes.size();
    }
    return count;
}

transaction_manager::transaction_manager(std::string user_id, std::string session_id) {
    metadata_.user_id = std::move(user_id);
    metadata_.session_id = std::move(session_id);
}

void transaction_manager::begin(transaction_kind kind) {
    if (open_) {
        throw reentrancy_error(std::string("Cannot start a ") + to_string(kind) +
                               " transaction while another transaction is open");
    }
    open_ = true;
    kind_ = kind;
    metadata_.is_undo = kind == transaction_kind::undo;
    metadata_.is_redo = kind == transaction_kind::redo;
    metadata_.is_local = kind == transaction_kind::normal;
    LOG_DEBUG("transaction", "Opened %s transaction", to_string(kind));
}

change_set transaction_manager::end() {
    change_set result;
    result.metadata = metadata_;

    for (auto& entry : entries_) {
        auto& changes = entry.changes;
        changes.erase(std::remove_if(changes.begin(), changes.end(),
                                     [](const db_change& c) { return is_noop(c); }),
                      changes.end());
        if (!changes.empty()) {
            result.entries.push_back(std::move(entry));
        }
    }

    result.journal = std::move(journal_);

    entries_.clear();
    journal_.clear();
    entry_index_.clear();
    open_ = false;

    LOG_DEBUG("transaction", "Closed %s transaction: %zu objects, %zu changes",
              to_string(kind_), result.entries.size(), result.change_count());
    return result;
}

void transaction_manager::require_open(const char* operation) const {
    if (!open_) {
        throw transaction_error(std::string(operation) + ": db objects can only be modified inside a transaction");
    }
}

void transaction_manager::record(const std::shared_ptr<db_object>& object, db_change change) {
    std::visit([this](auto& c) { static_cast<change_metadata&>(c) = metadata_; }, change);

    auto& changes = entry_for(object).changes;
    if (changes.empty() || !try_collapse(changes.back(), change)) {
        changes.push_back(change);
    }
    journal_.push_back(journal_entry{object, std::move(change)});
}

object_changes& transaction_manager::entry_for(const std::shared_ptr<db_object>& object) {
    auto it = entry_index_.find(object.get());
    if (it != entry_index_.end()) {
        return entries_[it->second];
    }
    entry_index_.emplace(object.get(), entries_.size());
    entries_.push_back(object_changes{object, {}});
    return entries_.back();
}

} // namespace datastore
