#pragma once

#include <KeystoneCore.hpp>
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace concurrency_tests {

using namespace keystone;

model_schema counter_schema() {
    model_schema tick("Tick");
    tick.add("worker", number_field({.nullable = false}))
        .add("created", datetime_field({.generator = now_utc}));
    return tick;
}

std::filesystem::path temp_db_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("keystone_" + name + ".sqlite");
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
    return path;
}

void check_ids(const std::vector<model_id_t>& ids, size_t expected) {
    std::set<model_id_t> unique(ids.begin(), ids.end());
    assert(ids.size() == expected);
    assert(unique.size() == expected);
    assert(*unique.begin() == 1);
    assert(*unique.rbegin() == static_cast<model_id_t>(expected));
}

// ============================================================================
// test_allocator_sequence
// ============================================================================

void test_allocator_sequence() {
    std::cout << "  test_allocator_sequence..." << std::flush;

    memory_store store;
    id_allocator ids(store, "alloc");
    ids.reset_lock();
    assert(store.get("__lock__:alloc") == "0");
    assert(ids.current("Tick") == 0);

    model_id_t previous = 0;
    for (int i = 0; i < 20; ++i) {
        auto id = ids.next_id("Tick");
        assert(id > previous);
        previous = id;
    }
    assert(previous == 20);
    assert(ids.current("Tick") == 20);
    assert(store.get("max_id:alloc:Tick") == "20");
    assert(store.get("__lock__:alloc") == "0");

    // Counters are per model
    assert(ids.next_id("Tock") == 1);

    // A corrupted counter fails loudly
    store.set("max_id:alloc:Broken", "many");
    bool threw = false;
    try {
        ids.next_id("Broken");
    } catch (const store_error&) {
        threw = true;
    }
    assert(threw);
    assert(store.get("__lock__:alloc") == "0");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_concurrent_creates - no collisions, strictly increasing in issue order
// ============================================================================

void test_concurrent_creates() {
    std::cout << "  test_concurrent_creates..." << std::flush;

    constexpr int thread_count = 8;
    constexpr int per_thread = 10;

    keystone_db db(configuration(store_backend::memory, "conc"));
    db.register_model(counter_schema());

    std::mutex mutex;
    std::vector<model_id_t> ids;
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&, t] {
            model_id_t last = 0;
            for (int i = 0; i < per_thread; ++i) {
                auto tick = db.create("Tick", {{"worker", t}});
                auto id = *tick->id();
                // Ids seen by one thread only grow
                assert(id > last);
                last = id;
                std::lock_guard<std::mutex> lock(mutex);
                ids.push_back(id);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    check_ids(ids, thread_count * per_thread);
    assert(db.query("Tick").count() == thread_count * per_thread);
    assert(db.ids().current("Tick") == thread_count * per_thread);
    assert(db.store().get("__lock__:conc") == "0");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_shared_store_contexts - several contexts on one store
// ============================================================================

void test_shared_store_contexts() {
    std::cout << "  test_shared_store_contexts..." << std::flush;

    auto store = std::make_shared<memory_store>();
    keystone_db first(configuration(store_backend::memory, "shared"), store);
    keystone_db second(configuration(store_backend::memory, "shared"), store);
    first.register_model(counter_schema());
    second.register_model(counter_schema());

    std::mutex mutex;
    std::vector<model_id_t> ids;
    auto work = [&](keystone_db& db, int worker) {
        for (int i = 0; i < 30; ++i) {
            auto id = *db.create("Tick", {{"worker", worker}})->id();
            std::lock_guard<std::mutex> lock(mutex);
            ids.push_back(id);
        }
    };
    std::thread a(work, std::ref(first), 1);
    std::thread b(work, std::ref(second), 2);
    a.join();
    b.join();

    check_ids(ids, 60);
    assert(first.query("Tick").count() == 60);
    assert(second.query("Tick", {{"worker", 2}}).count() == 30);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_async_operations
// ============================================================================

void test_async_operations() {
    std::cout << "  test_async_operations..." << std::flush;

    configuration config(store_backend::memory, "async");
    config.non_blocking = true;
    config.worker_threads = 4;
    keystone_db db(config);
    db.register_model(counter_schema());

    constexpr int count = 64;
    std::vector<std::future<instance_ptr>> pending;
    pending.reserve(count);
    for (int i = 0; i < count; ++i) {
        pending.push_back(db.create_async("Tick", {{"worker", i % 4}}));
    }

    std::vector<model_id_t> ids;
    for (auto& future : pending) {
        ids.push_back(*future.get()->id());
    }
    check_ids(ids, count);

    auto all = db.query_async("Tick").get();
    assert(all.count() == count);

    auto updated = db.update_async("Tick", {{"worker", 9}}, filter{{"worker", 0}}).get();
    assert(updated == count / 4);
    assert(db.query("Tick", {{"worker", 9}}).count() == count / 4);

    auto unsaved = db.make("Tick", {{"worker", 5}});
    db.save_async(unsaved).get();
    assert(unsaved->is_saved());
    assert(*unsaved->id() == count + 1);

    auto removed = db.remove_async("Tick", db.query("Tick", {{"worker", 9}}).as_list()).get();
    assert(removed == static_cast<size_t>(count / 4));

    // Errors travel through the future
    bool threw = false;
    try {
        db.create_async("Tick", {{"worker", "not a number"}}).get();
    } catch (const validation_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_shared_scheduler_teardown - a context outlived by its scheduler
// ============================================================================

void test_shared_scheduler_teardown() {
    std::cout << "  test_shared_scheduler_teardown..." << std::flush;

    auto pool = std::make_shared<thread_pool_scheduler>(1);
    auto store = std::make_shared<memory_store>();

    // Keeps the only worker busy until released
    std::promise<void> release;
    auto gate = release.get_future().share();
    pool->post([gate] { gate.wait(); });

    std::thread opener;
    std::future<instance_ptr> pending;
    {
        configuration config(store_backend::memory, "teardown");
        config.sched = pool;
        keystone_db db(config, store);
        db.register_model(counter_schema());

        pending = db.create_async("Tick", {{"worker", 1}});
        assert(pending.wait_for(std::chrono::milliseconds(0)) == std::future_status::timeout);

        opener = std::thread([&release] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            release.set_value();
        });
        // Leaving the scope waits for the queued create
    }
    opener.join();

    assert(pending.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    assert(*pending.get()->id() == 1);
    assert(store->get("teardown:Tick:1").has_value());
    assert(pool.use_count() == 1);

    // The pool keeps serving other contexts
    {
        configuration config(store_backend::memory, "teardown");
        config.sched = pool;
        keystone_db db(config, store);
        db.register_model(counter_schema());
        auto next = db.create_async("Tick", {{"worker", 2}});
        assert(*next.get()->id() == 2);
        assert(db.query("Tick").count() == 2);
        // The future is still held here; destruction does not wait on it
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_store
// ============================================================================

void test_sqlite_store() {
    std::cout << "  test_sqlite_store..." << std::flush;

    sqlite_store store(":memory:");
    assert(!store.get("missing").has_value());

    store.set("a:1", "one");
    store.set("a:2", "two");
    store.set("b:1", "other");
    assert(store.get("a:1") == "one");

    store.multi_set({{"a:3", "three"}, {"a:1", "uno"}});
    auto values = store.multi_get({"a:1", "a:9", "a:3"});
    assert(values.size() == 3);
    assert(values[0] == "uno");
    assert(!values[1].has_value());
    assert(values[2] == "three");

    auto keys = store.keys("a:*");
    assert(keys.size() == 3);
    assert(keys[0] == "a:1" && keys[2] == "a:3");

    std::vector<std::string> scanned;
    store.scan("b:*", [&](const std::string& key) { scanned.push_back(key); });
    assert(scanned.size() == 1 && scanned[0] == "b:1");

    assert(store.increment("counter") == 1);
    assert(store.increment("counter") == 2);
    assert(store.get("counter") == "2");

    assert(store.remove({"a:1", "a:2", "a:missing"}) == 2);
    assert(store.keys("a:*").size() == 1);

    // Many keys in one multi_get
    std::vector<std::string> many;
    for (int i = 0; i < 1200; ++i) {
        auto key = "m:" + std::to_string(i);
        store.set(key, std::to_string(i));
        many.push_back(key);
    }
    auto fetched = store.multi_get(many);
    assert(fetched.size() == 1200);
    assert(fetched[1199] == "1199");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_persistence - records survive reopening the file
// ============================================================================

void test_sqlite_persistence() {
    std::cout << "  test_sqlite_persistence..." << std::flush;

    auto path = temp_db_path("persistence");
    model_id_t saved_id = 0;
    {
        keystone_db db(configuration(path.string()));
        db.register_model(counter_schema());
        saved_id = *db.create("Tick", {{"worker", 7}})->id();
        db.create("Tick", {{"worker", 8}});
    }
    {
        keystone_db db(configuration(path.string()));
        db.register_model(counter_schema());
        auto ticks = db.query("Tick").order_by("id");
        assert(ticks.count() == 2);
        assert(ticks.first()->id() == saved_id);
        assert(ticks.first()->get_as<int64_t>("worker") == 7);

        // Counters persist as well
        assert(*db.create("Tick", {{"worker", 9}})->id() == 3);
    }
    std::filesystem::remove(path);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sqlite_concurrent_creates
// ============================================================================

void test_sqlite_concurrent_creates() {
    std::cout << "  test_sqlite_concurrent_creates..." << std::flush;

    auto path = temp_db_path("concurrent");
    configuration config(path.string());
    config.non_blocking = true;
    config.worker_threads = 6;
    {
        keystone_db db(config);
        db.register_model(counter_schema());

        std::vector<std::future<instance_ptr>> pending;
        for (int i = 0; i < 60; ++i) {
            pending.push_back(db.create_async("Tick", {{"worker", i}}));
        }
        std::vector<model_id_t> ids;
        for (auto& future : pending) {
            ids.push_back(*future.get()->id());
        }
        check_ids(ids, 60);
        assert(db.query("Tick").count() == 60);
    }
    std::filesystem::remove(path);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing concurrency and stores..." << std::endl;
    test_allocator_sequence();
    test_concurrent_creates();
    test_shared_store_contexts();
    test_async_operations();
    test_shared_scheduler_teardown();
    test_sqlite_store();
    test_sqlite_persistence();
    test_sqlite_concurrent_creates();
}

} // namespace concurrency_tests
