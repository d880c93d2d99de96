#pragma once

#ifdef __cplusplus

#include "db_object.hpp"
#include <memory>
#include <string>
#include <vector>

namespace datastore {

// ============================================================================
// db_record - A fixed set of named properties
// ============================================================================
//
// The property names and the kind of each value (JSON, list, map or string)
// are fixed when the record is created. Collection-valued properties are
// owned by the record: their parent() is this record until they are replaced.

class db_record : public db_object {
public:
    /// Takes ownership of every collection in `state`.
    /// Throws ownership_error if one already has a parent.
    db_record(std::shared_ptr<transaction_manager> txn, record_state state);
    ~db_record() override;

    bool has(const std::string& name) const { return state_.find(name) != state_.end(); }
    std::vector<std::string> property_names() const;
    const record_state& state() const noexcept { return state_; }

    /// Throws property_error for an unknown property.
    const record_value& get(const std::string& name) const;

    /// Typed accessors. Throw property_error if the property is unknown or
    /// holds a different kind of value.
    const json& get_json(const std::string& name) const;
    std::shared_ptr<db_list> get_list(const std::string& name) const;
    std::shared_ptr<db_map> get_map(const std::string& name) const;
    std::shared_ptr<db_string> get_string(const std::string& name) const;

    /// Replace a property's value. The value must be of the property's kind.
    /// A collection value must not have a parent; the collection it replaces
    /// is detached from this record.
    void set(const std::string& name, record_value value);

    json to_json() const override;

private:
    template<typename T>
    const T& get_as(const std::string& name, const char* kind) const;

    record_state state_;
};

} // namespace datastore

#endif // __cplusplus
