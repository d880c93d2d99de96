#include "datastore/db_object.hpp"
#include "datastore/transaction.hpp"

namespace datastore {

db_object::db_object(db_type type, std::shared_ptr<transaction_manager> txn)
    : type_(type)
    , id_(generate_db_id())
    , txn_(std::move(txn))
{}

transaction_manager& db_object::writable(const char* operation) {
    txn_->require_open(operation);
    return *txn_;
}

} // namespace datastore
