#include "datastore/string.hpp"
#include "datastore/range.hpp"
#include "datastore/transaction.hpp"

namespace datastore {

namespace {

bool is_continuation(const std::string& text, int64_t index) {
    return index < static_cast<int64_t>(text.size())
        && (static_cast<unsigned char>(text[static_cast<size_t>(index)]) & 0xC0) == 0x80;
}

// Move a byte offset back to the start of the code point it falls in.
int64_t floor_boundary(const std::string& text, int64_t index) {
    while (index > 0 && is_continuation(text, index)) --index;
    return index;
}

// Move a byte offset forward past the code point it falls in.
int64_t ceil_boundary(const std::string& text, int64_t index) {
    while (is_continuation(text, index)) ++index;
    return index;
}

} // namespace

db_string::db_string(std::shared_ptr<transaction_manager> txn, std::string value)
    : db_object(db_type::string, std::move(txn))
    , value_(std::move(value))
{}

void db_string::set(const std::string& value) {
    auto& tm = writable("db_string::set");
    replace(tm, 0, static_cast<int64_t>(value_.size()), value);
}

void db_string::append(const std::string& value) {
    auto& tm = writable("db_string::append");
    replace(tm, static_cast<int64_t>(value_.size()), 0, value);
}

void db_string::insert(int64_t index, const std::string& value) {
    auto& tm = writable("db_string::insert");
    auto start = floor_boundary(value_, detail::clamp_insert_index(index, static_cast<int64_t>(value_.size())));
    replace(tm, start, 0, value);
}

void db_string::splice(int64_t index, int64_t count, const std::string& value) {
    auto& tm = writable("db_string::splice");
    auto size = static_cast<int64_t>(value_.size());
    auto offset = detail::clamp_insert_index(index, size);
    auto end = ceil_boundary(value_, offset + detail::clamp_count(offset, count, size));
    auto start = floor_boundary(value_, offset);
    replace(tm, start, end - start, value);
}

void db_string::clear() {
    auto& tm = writable("db_string::clear");
    replace(tm, 0, static_cast<int64_t>(value_.size()), {});
}

void db_string::replace(transaction_manager& tm, int64_t index, int64_t count, const std::string& value) {
    if (count == 0 && value.empty()) return;

    string_change change;
    change.index = index;
    change.removed = value_.substr(static_cast<size_t>(index), static_cast<size_t>(count));
    change.added = value;
    value_.replace(static_cast<size_t>(index), static_cast<size_t>(count), value);

    tm.record(shared_from_this(), std::move(change));
}

json db_string::to_json() const {
    return value_;
}

} // namespace datastore
