#include <KeystoneCore.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cassert>
#include <cmath>
#include <iostream>

#include "FieldTests.hpp"
#include "QueryTests.hpp"
#include "ConcurrencyTests.hpp"

using namespace keystone;

// ============================================================================
// Model Definitions
// ============================================================================

value_t random_token() {
    return boost::uuids::to_string(boost::uuids::random_generator()());
}

model_schema session_schema() {
    model_schema session("Session");
    session.add("token", string_field({.generator = random_token, .nullable = false}))
           .add("created", datetime_field({.generator = now_utc, .nullable = false}));
    return session;
}

model_schema task_schema() {
    field_options status;
    status.choices = choice_map{{std::string("ok"), "Ok"}, {std::string("fail"), "Failed"}};
    status.nullable = false;

    model_schema task("Task");
    task.add("title", string_field())
        .add("status", string_field(status))
        .add("done", bool_field({.default_value = false}));
    return task;
}

configuration memory_config(const std::string& prefix = "test") {
    return configuration(store_backend::memory, prefix);
}

template<typename Error, typename Fn>
bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}

// ============================================================================
// Test: Session end to end
// ============================================================================

void test_session_end_to_end() {
    std::cout << "Testing session end to end..." << std::endl;

    keystone_db db(memory_config());
    db.register_model(session_schema());

    auto now = now_utc();
    auto first = db.create("Session", {{"token", "shared"}, {"created", now - std::chrono::seconds(1)}});
    auto second = db.create("Session", {{"token", "shared"}, {"created", now}});
    db.create("Session", {{"token", "other"}});

    assert(*first->id() == 1);
    assert(*second->id() == 2);

    auto yesterday = now - std::chrono::hours(24);
    auto found = db.query("Session", {{"token", "shared"}, {"created__gte", yesterday}});
    assert(found.count() == 2);

    auto ordered = found.order_by("created");
    assert(ordered.first()->id() == first->id());
    assert(ordered.last()->id() == second->id());
    assert(ordered.first()->get_as<timestamp_t>("created") == now - std::chrono::seconds(1));

    // Generated defaults
    auto generated = db.create("Session");
    assert(!generated->get_as<std::string>("token").empty());
    assert(generated->get_as<std::string>("token") != first->get_as<std::string>("token"));
    assert(generated->get_as<timestamp_t>("created") >= now);

    // Stored record layout
    auto raw = db.store().get(db.instance_key(*first));
    assert(raw.has_value());
    auto record = nlohmann::json::parse(*raw);
    assert(record["id"] == 1);
    assert(record["token"] == "shared");
    assert(record["created"] == format_datetime(now - std::chrono::seconds(1)));
    assert(record.size() == 3);

    std::cout << "  Session test passed!" << std::endl;
}

// ============================================================================
// Test: Task choices
// ============================================================================

void test_task_choices() {
    std::cout << "Testing task choices..." << std::endl;

    keystone_db db(memory_config());
    db.register_model(task_schema());

    auto ok = db.create("Task", {{"title", "write"}, {"status", "ok"}});
    assert(ok->get_as<bool>("done") == false);

    bool threw = false;
    try {
        db.create("Task", {{"title", "broken"}, {"status", "bogus"}});
    } catch (const validation_error& e) {
        threw = true;
        // Field errors name the model and field
        assert(std::string(e.what()).find("(Task -> status)") != std::string::npos);
    }
    assert(threw);

    // Nothing persisted, no id consumed
    assert(db.query("Task").count() == 1);
    assert(db.ids().current("Task") == 1);

    // A failed save leaves the instance unsaved and unchanged
    auto pending = db.make("Task", {{"title", "later"}});
    assert(throws<validation_error>([&] { db.save(pending); }));
    assert(!pending->is_saved());
    assert(is_null(pending->get("done")));
    pending->set("status", std::string("fail"));
    db.save(pending);
    assert(*pending->id() == 2);
    assert(pending->get_as<bool>("done") == false);

    assert(db.query("Task", {{"status", "fail"}}).count() == 1);
    assert(db.query("Task", {{"done", false}}).count() == 2);

    std::cout << "  Task test passed!" << std::endl;
}

// ============================================================================
// Test: References do not cascade
// ============================================================================

void test_reference_no_cascade() {
    std::cout << "Testing reference without cascade..." << std::endl;

    keystone_db db(memory_config());
    model_schema b("B");
    b.add("label", string_field());
    model_schema a("A");
    a.add("b", reference_field("B"));
    db.register_model(std::move(b));
    db.register_model(std::move(a));

    auto target = db.create("B", {{"label", "target"}});
    auto source = db.create("A", {{"b", target}});
    assert(db.query("A").first()->get_as<instance_ptr>("b")->get_as<std::string>("label") == "target");

    assert(db.remove(*target) == 1);
    assert(db.query("B").empty());

    // The A record is still there, but its reference can't be resolved,
    // in lenient mode too
    assert(db.store().get(db.instance_key(*source)).has_value());
    assert(throws<relation_error>([&] { db.query("A"); }));
    assert(throws<validation_error>([&] { db.query("A"); }));

    std::cout << "  Reference test passed!" << std::endl;
}

// ============================================================================
// Test: make / create / save
// ============================================================================

void test_make_create_save() {
    std::cout << "Testing make, create and save..." << std::endl;

    keystone_db db(memory_config());
    db.register_model(task_schema());

    // make rejects unknown fields, create ignores them
    assert(throws<validation_error>([&] { db.make("Task", {{"title", "x"}, {"owner", "me"}}); }));
    auto created = db.create("Task", {{"title", "x"}, {"status", "ok"}, {"owner", "me"}});
    assert(created->is_saved());
    assert(!created->contains("owner"));

    // Unknown models
    assert(throws<validation_error>([&] { db.make("Nope"); }));
    assert(throws<validation_error>([&] { db.create("Nope"); }));

    // Saving again overwrites the same record
    created->set("title", std::string("renamed"));
    db.save(created);
    assert(*created->id() == 1);
    auto all = db.query("Task");
    assert(all.count() == 1);
    assert(all.first()->get_as<std::string>("title") == "renamed");
    assert(*all.first() == *created);

    // Equality covers every field
    auto copy = std::make_shared<model_instance>(*created);
    assert(*copy == *created);
    copy->set("done", true);
    assert(*copy != *created);

    assert(db.instance_key(*created) == "test:Task:1");
    assert(throws<validation_error>([&] { db.instance_key(*db.make("Task")); }));

    // Manager handle
    auto tasks = db.objects("Task");
    tasks.create({{"title", "y"}, {"status", "fail"}});
    assert(tasks.count() == 2);
    assert(tasks.where({{"status", "fail"}}).count() == 1);
    assert(tasks.all().count() == 2);

    // Non-finite numbers never reach the store
    model_schema reading("Reading");
    reading.add("value", number_field());
    db.register_model(std::move(reading));
    assert(throws<validation_error>([&] { db.create("Reading", {{"value", std::nan("")}}); }));
    assert(throws<validation_error>([&] { db.create("Reading", {{"value", HUGE_VAL}}); }));
    assert(db.query("Reading").empty());

    std::cout << "  Make/create/save test passed!" << std::endl;
}

// ============================================================================
// Test: update
// ============================================================================

void test_update() {
    std::cout << "Testing update..." << std::endl;

    keystone_db db(memory_config());
    db.register_model(task_schema());
    model_schema note("Note");
    note.add("text", string_field());
    db.register_model(std::move(note));

    auto a = db.create("Task", {{"title", "a"}, {"status", "ok"}});
    auto b = db.create("Task", {{"title", "b"}, {"status", "ok"}});
    auto c = db.create("Task", {{"title", "c"}, {"status", "fail"}});

    // Single instance; other fields keep their stored values
    assert(db.update("Task", a, {{"done", true}}) == 1);
    assert(a->get_as<bool>("done") == true);
    auto stored_a = db.query("Task", {{"title", "a"}}).first();
    assert(stored_a->get_as<bool>("done") == true);
    assert(stored_a->get_as<std::string>("status") == "ok");

    // A list of instances
    assert(db.update("Task", instance_list{b, c}, {{"title", "bc"}}) == 2);
    assert(db.query("Task", {{"title", "bc"}}).count() == 2);

    // A query result
    auto failing = db.query("Task", {{"status", "fail"}});
    assert(db.update("Task", failing, {{"status", "ok"}}) == 1);
    assert(db.query("Task", {{"status", "fail"}}).empty());

    // Everything
    assert(db.update("Task", {{"status", "fail"}}) == 3);
    assert(db.query("Task", {{"status", "fail"}}).count() == 3);

    // Filtered
    assert(db.update("Task", filter{{"title", "a"}}, {{"title", "A"}}) == 1);
    assert(db.query("Task", {{"title", "A"}}).count() == 1);

    // Rejected updates change nothing
    assert(throws<validation_error>([&] { db.update("Task", a, {{"owner", "me"}}); }));
    assert(throws<validation_error>([&] { db.update("Task", a, {{"id", 5}}); }));
    assert(throws<validation_error>([&] { db.update("Task", a, {{"status", "bogus"}}); }));
    assert(db.query("Task", {{"status", "bogus"}}).empty());

    // Targets must be a non-empty list of saved instances of the model
    auto note_instance = db.create("Note", {{"text", "n"}});
    assert(throws<validation_error>([&] { db.update("Task", instance_list{}, {{"done", false}}); }));
    assert(throws<validation_error>([&] { db.update("Task", instance_list{a, note_instance}, {{"done", false}}); }));
    assert(throws<validation_error>([&] { db.update("Task", db.make("Task"), {{"done", false}}); }));
    assert(throws<validation_error>([&] { db.update("Task", db.query("Note"), {{"done", false}}); }));

    // Records deleted in the meantime are skipped
    db.remove(*b);
    assert(db.update("Task", instance_list{a, b}, {{"done", false}}) == 1);

    std::cout << "  Update test passed!" << std::endl;
}

// ============================================================================
// Test: registration
// ============================================================================

void test_registration() {
    std::cout << "Testing model registration..." << std::endl;

    keystone_db db(memory_config());
    db.register_model(task_schema());

    // Duplicate names
    assert(throws<validation_error>([&] { db.register_model(task_schema()); }));

    // References need a registered target
    model_schema orphan("Orphan");
    orphan.add("parent", reference_field("Missing"));
    assert(throws<validation_error>([&] { db.register_model(orphan); }));

    // Self references are fine
    model_schema node("Node");
    node.add("parent", reference_field("Node"));
    db.register_model(std::move(node));

    assert(throws<validation_error>([&] { db.register_model(model_schema("Bad:Name")); }));

    // Inheritance
    model_schema animal("Animal");
    animal.add("name", string_field({.nullable = false}));
    model_schema dog("Dog", animal);
    dog.add("breed", string_field());
    db.register_models({animal, dog});

    auto rex = db.create("Dog", {{"name", "Rex"}, {"breed", "collie"}});
    assert(rex->get_as<std::string>("name") == "Rex");
    assert(db.query("Dog", {{"name", "Rex"}}).count() == 1);
    assert(db.query("Animal").empty());

    auto names = db.schemas();
    assert(names.size() == 4);
    assert(names[0]->name() == "Task" && names[3]->name() == "Dog");
    assert(db.get_schema("Animal") != nullptr);
    assert(db.get_schema("Orphan") == nullptr);

    std::cout << "  Registration test passed!" << std::endl;
}

// ============================================================================
// Test: relation depth
// ============================================================================

void test_relation_depth() {
    std::cout << "Testing relation depth..." << std::endl;

    auto store = std::make_shared<memory_store>();
    {
        keystone_db db(memory_config(), store);
        model_schema node("Node");
        node.add("name", string_field())
            .add("parent", reference_field("Node"));
        db.register_model(std::move(node));

        instance_ptr parent;
        for (int i = 0; i < 5; ++i) {
            value_map values{{"name", "n" + std::to_string(i)}};
            if (parent) values["parent"] = parent;
            parent = db.create("Node", values);
        }

        auto leaf = db.query("Node", {{"name", "n4"}}).first();
        auto hop = leaf->get_as<instance_ptr>("parent");
        assert(hop->get_as<instance_ptr>("parent")->get_as<std::string>("name") == "n2");

        // Nested predicates through several references
        assert(db.query("Node", {{"parent__parent__name", "n1"}}).count() == 1);
    }
    {
        configuration config = memory_config();
        config.max_relation_depth = 2;
        keystone_db db(config, store);
        model_schema node("Node");
        node.add("name", string_field())
            .add("parent", reference_field("Node"));
        db.register_model(std::move(node));

        assert(db.query("Node", {{"name", "n1"}}).count() == 1);
        assert(throws<relation_error>([&] { db.query("Node", {{"name", "n4"}}); }));
    }

    std::cout << "  Relation depth test passed!" << std::endl;
}

// ============================================================================
// Test: reference cycles
// ============================================================================

void test_reference_cycles() {
    std::cout << "Testing reference cycles..." << std::endl;

    keystone_db db(memory_config());
    model_schema node("Node");
    node.add("name", string_field())
        .add("parent", reference_field("Node"));
    db.register_model(std::move(node));

    // A record that refers to itself
    auto a = db.create("Node", {{"name", "a"}});
    assert(db.update("Node", a, {{"parent", a}}) == 1);
    assert(a.use_count() == 1);
    assert(a->get_as<instance_ptr>("parent") == a);

    std::weak_ptr<model_instance> loaded_a;
    std::weak_ptr<model_instance> loaded_parent;
    {
        auto found = db.query("Node", {{"name", "a"}});
        assert(found.count() == 1);
        auto self = found.first();
        auto parent = self->get_as<instance_ptr>("parent");
        assert(parent->id() == a->id());
        // Each record is loaded once per query
        assert(parent->get_as<instance_ptr>("parent").get() == parent.get());
        assert(db.query("Node", {{"parent__parent__name", "a"}}).count() == 1);
        loaded_a = self;
        loaded_parent = parent;
    }
    assert(loaded_a.expired());
    assert(loaded_parent.expired());

    // Two records that refer to each other
    auto b = db.create("Node", {{"name", "b"}});
    auto c = db.create("Node", {{"name", "c"}, {"parent", b}});
    assert(db.update("Node", b, {{"parent", *c->id()}}) == 1);

    std::weak_ptr<model_instance> loaded_c;
    {
        auto all = db.query("Node");
        assert(all.count() == 3);

        auto found_b = db.query("Node", {{"name", "b"}}).first();
        auto hop_c = found_b->get_as<instance_ptr>("parent");
        assert(hop_c->get_as<std::string>("name") == "c");
        auto hop_b = hop_c->get_as<instance_ptr>("parent");
        assert(hop_b->id() == found_b->id());
        assert(hop_b->get_as<instance_ptr>("parent").get() == hop_c.get());

        assert(db.query("Node", {{"parent__parent__name", "b"}}).count() == 1);
        assert(db.query("Node", {{"parent__parent__parent__name", "b"}}).count() == 1);
        loaded_c = hop_c;
    }
    assert(loaded_c.expired());

    // Copies own what they refer to, so they outlive the query
    instance_ptr copy;
    {
        auto found_c = db.query("Node", {{"name", "c"}}).first();
        copy = std::make_shared<model_instance>(*found_c->get_as<instance_ptr>("parent"));
    }
    assert(copy->get_as<std::string>("name") == "b");
    assert(copy->get_as<instance_ptr>("parent")->get_as<std::string>("name") == "c");

    std::cout << "  Reference cycles test passed!" << std::endl;
}

// ============================================================================
// Test: configuration
// ============================================================================

void test_configuration() {
    std::cout << "Testing configuration..." << std::endl;

    // ':' is stripped from the prefix
    {
        keystone_db db(memory_config("my:app"));
        assert(db.prefix() == "myapp");
        db.register_model(task_schema());
        auto task = db.create("Task", {{"status", "ok"}});
        assert(db.instance_key(*task) == "myapp:Task:1");
        assert(db.store().get("max_id:myapp:Task") == "1");
        assert(db.store().get("__lock__:myapp") == "0");
    }

    // An empty prefix falls back to the default
    {
        keystone_db db(memory_config(""));
        assert(db.prefix() == "keystone");
    }
    {
        keystone_db db(memory_config(":"));
        assert(db.prefix() == "keystone");
    }

    // Key pattern characters are stripped too
    {
        keystone_db db(memory_config("[x]?\\"));
        assert(db.prefix() == "x");
    }
    {
        auto store = std::make_shared<memory_store>();
        keystone_db wide(memory_config("a*"), store);
        keystone_db other(memory_config("ab"), store);
        assert(wide.prefix() == "a");
        wide.register_model(task_schema());
        other.register_model(task_schema());
        other.create("Task", {{"status", "ok"}});
        assert(wide.query("Task").empty());
        assert(other.query("Task").count() == 1);
    }

    // Prefixes keep contexts apart on one store
    {
        auto store = std::make_shared<memory_store>();
        keystone_db left(memory_config("left"), store);
        keystone_db right(memory_config("right"), store);
        left.register_model(task_schema());
        right.register_model(task_schema());
        left.create("Task", {{"status", "ok"}});
        assert(left.query("Task").count() == 1);
        assert(right.query("Task").empty());
    }

    // Default configuration: in-memory SQLite
    {
        keystone_db db;
        db.register_model(task_schema());
        db.create("Task", {{"status", "ok"}});
        assert(db.query("Task").count() == 1);
        assert(db.config().backend == store_backend::sqlite);
    }

    // Unusable stores fail once, at construction
    assert(throws<configuration_error>([] {
        keystone_db db(configuration("/nonexistent/keystone/dir/db.sqlite"));
    }));
    assert(throws<configuration_error>([] {
        keystone_db db(memory_config(), nullptr);
    }));
    assert(throws<configuration_error>([] {
        configuration config = memory_config();
        config.max_relation_depth = 0;
        keystone_db db(config);
    }));

    std::cout << "  Configuration test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    set_log_level(log_level::error);

    try {
        field_tests::run_all();
        query_tests::run_all();
        concurrency_tests::run_all();

        test_session_end_to_end();
        test_task_choices();
        test_reference_no_cascade();
        test_make_create_save();
        test_update();
        test_registration();
        test_relation_depth();
        test_reference_cycles();
        test_configuration();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
