#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace datastore {

using json = nlohmann::json;

class db_object;
class db_list;
class db_map;
class db_string;
class db_record;
class db_table;
class transaction_manager;

// ============================================================================
// db_type - The closed set of db object kinds
// ============================================================================

enum class db_type {
    list,
    map,
    string,
    record,
    table
};

const char* to_string(db_type type) noexcept;

/// Generate a fresh db id (random RFC 4122 v4 UUID, lowercase hyphenated).
std::string generate_db_id();

// ============================================================================
// Record state
// ============================================================================

/// A record property holds either a plain JSON value or a collection the
/// record exclusively owns.
using record_value = std::variant<
    json,
    std::shared_ptr<db_list>,
    std::shared_ptr<db_map>,
    std::shared_ptr<db_string>
>;

/// Property name -> value. Also used for the partial old/new states of a record change.
using record_state = std::map<std::string, record_value>;

/// Structural equality: JSON compares by value, collections by identity.
bool same_value(const record_value& a, const record_value& b);

/// The collection held by a property, or nullptr for a JSON value.
db_object* owned_object(const record_value& value) noexcept;

json to_json(const record_value& value);

} // namespace datastore

#endif // __cplusplus
