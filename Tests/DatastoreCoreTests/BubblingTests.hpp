#pragma once

#include <DatastoreCore.hpp>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace bubbling_tests {

using datastore::json;

/// One delivered `changed` emission, as seen by a test observer.
struct received {
    const datastore::db_object* sender;
    const datastore::db_object* target;
    bool bubbled;
};

inline size_t drain(datastore::model_db& db) {
    return std::static_pointer_cast<datastore::queued_scheduler>(db.get_scheduler())->process_pending();
}

inline datastore::notification_token observe(const std::shared_ptr<datastore::db_object>& object,
                                             std::vector<received>& log) {
    return object->changed().connect([&log](const datastore::db_object& sender,
                                            const datastore::changed_args& args) {
        log.push_back({&sender, datastore::args_target(args), datastore::is_bubbled(sender, args)});
    });
}

// ============================================================================
// test_list_change_bubbles_to_table - list, then record, then table
// ============================================================================

void test_list_change_bubbles_to_table() {
    std::cout << "  test_list_change_bubbles_to_table..." << std::flush;

    datastore::model_db db;
    datastore::token todo("todo");
    auto table = db.create_table(todo);
    auto tags = db.create_list();
    auto rec = db.create_record({{"tags", tags}, {"title", json("milk")}});
    db.transact([&] { table->insert(rec); });
    drain(db);

    std::vector<received> log;
    auto t1 = observe(tags, log);
    auto t2 = observe(rec, log);
    auto t3 = observe(table, log);

    std::vector<datastore::changed_args> copies;
    auto t4 = table->changed().connect([&](const datastore::db_object&, const datastore::changed_args& args) {
        copies.push_back(args);
    });

    db.transact([&] { tags->push("dairy"); });

    // Nothing is delivered until the host drains the scheduler
    assert(log.empty());
    assert(drain(db) == 3);

    assert(log.size() == 3);
    assert(log[0].sender == tags.get() && !log[0].bubbled);
    assert(log[1].sender == rec.get() && log[1].bubbled);
    assert(log[2].sender == table.get() && log[2].bubbled);
    for (const auto& r : log) {
        assert(r.target == tags.get());
    }

    // The table republishes the list's own args
    assert(copies.size() == 1);
    assert(datastore::args_type(copies[0]) == datastore::db_type::list);
    const auto& list_args = std::get<datastore::list_changed_args>(copies[0]);
    assert(list_args.target == tags);
    assert(list_args.changes.size() == 1);
    assert(list_args.changes[0].added == (std::vector<json>{"dairy"}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_record_change_bubbles_to_table - direct on the record, bubbled on the table
// ============================================================================

void test_record_change_bubbles_to_table() {
    std::cout << "  test_record_change_bubbles_to_table..." << std::flush;

    datastore::model_db db;
    datastore::token todo("todo");
    auto rec = db.create_record({{"done", json(false)}});
    auto table = db.create_table(todo, {rec});

    std::vector<received> log;
    auto t1 = observe(rec, log);
    auto t2 = observe(table, log);

    std::vector<datastore::record_change> deltas;
    auto t3 = rec->changed().connect([&](const datastore::db_object&, const datastore::changed_args& args) {
        for (const auto& c : std::get<datastore::record_changed_args>(args).changes) {
            deltas.push_back(c);
        }
    });

    db.transact([&] {
        rec->set("done", json(true));
        rec->set("done", json("maybe"));
    });
    drain(db);

    assert(log.size() == 2);
    assert(log[0].sender == rec.get() && !log[0].bubbled);
    assert(log[1].sender == table.get() && log[1].bubbled && log[1].target == rec.get());

    // Record changes collapse: first old value, last new value
    assert(deltas.size() == 1);
    assert(std::get<json>(deltas[0].old_state.at("done")) == false);
    assert(std::get<json>(deltas[0].new_state.at("done")) == "maybe");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_each_child_change_bubbles_separately - ancestors fire once per child change
// ============================================================================

void test_each_child_change_bubbles_separately() {
    std::cout << "  test_each_child_change_bubbles_separately..." << std::flush;

    datastore::model_db db;
    auto notes = db.create_string();
    auto tags = db.create_list();
    auto rec = db.create_record({{"notes", notes}, {"tags", tags}});

    std::vector<received> log;
    auto t1 = observe(rec, log);

    db.transact([&] {
        tags->push(1);
        notes->append("hi");
        tags->push(2);
    });
    drain(db);

    // Ordered by each object's first change in the transaction
    assert(log.size() == 2);
    assert(log[0].target == tags.get() && log[0].bubbled);
    assert(log[1].target == notes.get() && log[1].bubbled);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_commit_order - notifications of separate commits keep commit order
// ============================================================================

void test_commit_order() {
    std::cout << "  test_commit_order..." << std::flush;

    datastore::model_db db;
    auto a = db.create_map();
    auto b = db.create_map();

    std::vector<std::string> order;
    auto t1 = a->changed().connect([&](const datastore::db_object&, const datastore::changed_args&) {
        order.push_back("a");
    });
    auto t2 = b->changed().connect([&](const datastore::db_object&, const datastore::changed_args&) {
        order.push_back("b");
    });

    db.transact([&] { b->set("k", 1); });
    db.transact([&] { a->set("k", 1); });
    db.transact([&] { b->set("k", 2); });
    drain(db);

    assert(order == (std::vector<std::string>{"b", "a", "b"}));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_detached_objects_do_not_bubble
// ============================================================================

void test_detached_objects_do_not_bubble() {
    std::cout << "  test_detached_objects_do_not_bubble..." << std::flush;

    datastore::model_db db;
    datastore::token todo("todo");
    auto items = db.create_list();
    auto rec = db.create_record({{"items", items}});
    auto table = db.create_table(todo, {rec});

    db.transact([&] { rec->set("items", db.create_list()); });
    drain(db);
    assert(items->parent() == nullptr);

    std::vector<received> log;
    auto t1 = observe(rec, log);
    auto t2 = observe(table, log);
    int direct = 0;
    auto t3 = items->changed().connect([&](const datastore::db_object&, const datastore::changed_args&) {
        direct++;
    });

    db.transact([&] { items->push("orphan"); });
    drain(db);
    assert(direct == 1);
    assert(log.empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_token_lifetime - destroying the token stops delivery
// ============================================================================

void test_token_lifetime() {
    std::cout << "  test_token_lifetime..." << std::flush;

    datastore::model_db db;
    auto str = db.create_string();

    int calls = 0;
    {
        auto token = str->changed().connect([&](const datastore::db_object&, const datastore::changed_args&) {
            calls++;
        });
        assert(token.is_valid());
        assert(str->changed().observer_count() == 1);

        db.transact([&] { str->append("a"); });
        drain(db);
        assert(calls == 1);
    }
    assert(str->changed().observer_count() == 0);

    db.transact([&] { str->append("b"); });
    drain(db);
    assert(calls == 1);

    // Explicit unregister, and a token outliving its object
    datastore::notification_token survivor;
    {
        auto temp = db.create_list();
        survivor = temp->changed().connect([](const datastore::db_object&, const datastore::changed_args&) {});
        assert(survivor);
    }
    survivor.unregister();
    assert(!survivor.is_valid());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unavailable_scheduler_drops_notifications
// ============================================================================

void test_unavailable_scheduler_drops_notifications() {
    std::cout << "  test_unavailable_scheduler_drops_notifications..." << std::flush;

    int posted = 0;
    auto sched = std::make_shared<datastore::callback_scheduler>(
        [&](std::function<void()>&&) { posted++; },
        nullptr,
        [] { return false; });

    datastore::model_db db(datastore::configuration{sched});
    auto list = db.create_list();
    db.transact([&] { list->push(1); });

    assert(posted == 0);
    assert(list->size() == 1);
    assert(db.can_undo());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_plan - the bubbler's delivery plan for one change set
// ============================================================================

void test_plan() {
    std::cout << "  test_plan..." << std::flush;

    datastore::model_db db;
    datastore::token todo("todo");
    auto body = db.create_string();
    auto tags = db.create_list();
    auto rec = db.create_record({{"body", body}, {"tags", tags}});
    auto table = db.create_table(todo, {rec});

    datastore::string_change appended;
    appended.added = "x";
    datastore::list_change pushed;
    pushed.added.push_back(1);

    datastore::change_set changes;
    changes.entries.push_back({body, {appended}});
    changes.entries.push_back({tags, {pushed}});

    auto plan = datastore::change_bubbler::plan(changes);
    assert(plan.size() == 6);
    assert(plan[0].receiver == body);
    assert(plan[1].receiver == rec);
    assert(plan[2].receiver == table);
    assert(plan[3].receiver == tags);
    assert(plan[4].receiver == rec);
    assert(plan[5].receiver == table);
    assert(datastore::args_target(plan[4].args) == tags.get());

    // An empty change set schedules nothing
    datastore::change_bubbler bubbler(db.get_scheduler());
    bubbler.dispatch(datastore::change_set{});
    assert(drain(db) == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Run all bubbling tests
// ============================================================================

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Change Bubbling Tests ---" << std::endl;

    test_list_change_bubbles_to_table();
    test_record_change_bubbles_to_table();
    test_each_child_change_bubbles_separately();
    test_commit_order();
    test_detached_objects_do_not_bubble();
    test_token_lifetime();
    test_unavailable_scheduler_drops_notifications();
    test_plan();

    std::cout << "--- Change Bubbling Tests: All passed ---" << std::endl;
}

} // namespace bubbling_tests
