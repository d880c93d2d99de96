#include "datastore/table.hpp"
#include "datastore/errors.hpp"
#include "datastore/record.hpp"
#include "datastore/transaction.hpp"

namespace datastore {

namespace {

std::atomic<uint64_t> g_next_token_id{1};

} // namespace

token::token(std::string name)
    : name_(std::move(name))
    , id_(g_next_token_id.fetch_add(1, std::memory_order_relaxed))
{}

db_table::db_table(std::shared_ptr<transaction_manager> txn, token tok,
                   std::vector<std::shared_ptr<db_record>> records)
    : db_object(db_type::table, std::move(txn))
    , token_(std::move(tok))
{
    for (const auto& rec : records) {
        if (rec->parent() && rec->parent() != this) {
            throw ownership_error("Record " + rec->id() + " already belongs to table " +
                                  rec->parent()->id());
        }
    }
    for (const auto& rec : records) {
        set_parent(*rec, this);
        records_.emplace(rec->id(), rec);
    }
}

db_table::~db_table() {
    for (const auto& [id, rec] : records_) {
        if (rec->parent() == this) {
            set_parent(*rec, nullptr);
        }
    }
}

std::shared_ptr<db_record> db_table::get(const std::string& id) const {
    auto it = records_.find(id);
    return it != records_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<db_record>> db_table::records() const {
    std::vector<std::shared_ptr<db_record>> result;
    result.reserve(records_.size());
    for (const auto& [id, rec] : records_) {
        result.push_back(rec);
    }
    return result;
}

void db_table::insert(const std::shared_ptr<db_record>& rec) {
    auto& tm = writable("db_table::insert");
    if (rec->parent() == this) return;
    if (rec->parent()) {
        throw ownership_error("Record " + rec->id() + " already belongs to table " +
                              rec->parent()->id());
    }
    set_parent(*rec, this);
    records_.emplace(rec->id(), rec);

    table_change change;
    change.added.push_back(rec);
    tm.record(shared_from_this(), std::move(change));
}

void db_table::remove(const std::string& id) {
    auto& tm = writable("db_table::remove");
    auto it = records_.find(id);
    if (it == records_.end()) return;
    auto rec = std::move(it->second);
    records_.erase(it);
    set_parent(*rec, nullptr);

    table_change change;
    change.removed.push_back(std::move(rec));
    tm.record(shared_from_this(), std::move(change));
}

void db_table::clear() {
    auto& tm = writable("db_table::clear");
    if (records_.empty()) return;
    table_change change;
    for (auto& [id, rec] : records_) {
        set_parent(*rec, nullptr);
        change.removed.push_back(std::move(rec));
    }
    records_.clear();
    tm.record(shared_from_this(), std::move(change));
}

void db_table::detach_all() noexcept {
    for (const auto& [id, rec] : records_) {
        if (rec->parent() == this) {
            set_parent(*rec, nullptr);
        }
    }
    records_.clear();
}

json db_table::to_json() const {
    json result = json::object();
    for (const auto& [id, rec] : records_) {
        result[id] = rec->to_json();
    }
    return result;
}

} // namespace datastore
