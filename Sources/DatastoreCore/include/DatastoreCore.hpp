#pragma once

// DatastoreCore - In-memory transactional JSON document model
//
// Usage:
//   #include <DatastoreCore.hpp>
//
//   int main() {
//       datastore::model_db db;
//       datastore::token todo("todo");
//       auto todos = db.create_table(todo);
//
//       auto item = db.create_record({
//           {"title", db.create_string("Buy milk")},
//           {"tags", db.create_list()},
//           {"done", false},
//       });
//
//       auto token = todos->changed().connect([](const datastore::db_object&,
//                                                const datastore::changed_args& args) {
//           std::cout << datastore::to_string(datastore::args_type(args)) << " changed" << std::endl;
//       });
//
//       // Mutations only inside a transaction
//       db.transact([&] {
//           todos->insert(item);
//           item->get_list("tags")->push("groceries");
//       });
//
//       // Observers run when the host drains the scheduler
//       std::static_pointer_cast<datastore::queued_scheduler>(db.get_scheduler())->process_pending();
//
//       db.undo();  // item removed, tags empty again
//   }

#include "datastore/log.hpp"
#include "datastore/types.hpp"
#include "datastore/errors.hpp"
#include "datastore/scheduler.hpp"
#include "datastore/observation.hpp"
#include "datastore/changes.hpp"
#include "datastore/db_object.hpp"
#include "datastore/list.hpp"
#include "datastore/map.hpp"
#include "datastore/string.hpp"
#include "datastore/record.hpp"
#include "datastore/table.hpp"
#include "datastore/transaction.hpp"
#include "datastore/bubbler.hpp"
#include "datastore/undo.hpp"
#include "datastore/model_db.hpp"
