#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace datastore {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// A transaction was opened while another one is still recording.
class reentrancy_error : public db_error {
public:
    explicit reentrancy_error(const std::string& msg) : db_error(msg) {}
};

/// A db object was mutated while no transaction is open.
class transaction_error : public db_error {
public:
    explicit transaction_error(const std::string& msg) : db_error(msg) {}
};

class table_exists_error : public db_error {
public:
    explicit table_exists_error(const std::string& msg) : db_error(msg) {}
};

class table_not_found_error : public db_error {
public:
    explicit table_not_found_error(const std::string& msg) : db_error(msg) {}
};

/// The object already belongs to another parent.
class ownership_error : public db_error {
public:
    explicit ownership_error(const std::string& msg) : db_error(msg) {}
};

/// The property is not part of the record's state.
class property_error : public db_error {
public:
    explicit property_error(const std::string& msg) : db_error(msg) {}
};

} // namespace datastore

#endif // __cplusplus
