#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "field.hpp"
#include "model.hpp"
#include "schema.hpp"
#include "store.hpp"
#include "id_allocator.hpp"
#include "query.hpp"
#include "scheduler.hpp"
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace keystone {

enum class store_backend {
    sqlite,
    memory
};

struct configuration {
    /// Store used when no kv_store is passed to keystone_db
    store_backend backend = store_backend::sqlite;

    /// SQLite database file path. Use ":memory:" for an in-memory database.
    std::string path = ":memory:";

    /// Namespace of every key this context writes. ':' is stripped.
    std::string prefix = "keystone";

    /// Lenient mode: log and skip bad records, null out bad values and read
    /// unregistered models as raw records. Strict mode throws validation_error.
    bool ignore_deserialization_errors = true;

    /// true: enumerate records with kv_store::keys, false: with kv_store::scan
    bool use_keys = true;

    /// Run *_async operations on a worker pool instead of the calling thread
    bool non_blocking = false;
    size_t worker_threads = 4;

    /// Reference chains deeper than this fail with relation_error
    int max_relation_depth = 16;

    /// Scheduler for *_async operations. nullptr = chosen by non_blocking.
    /// May be shared between contexts; a context waits for its own queued
    /// jobs when it is destroyed.
    std::shared_ptr<scheduler> sched = nullptr;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}

    configuration(store_backend b, const std::string& pre) : backend(b), prefix(pre) {}
};

class model_manager;

// ============================================================================
// keystone_db - schemas bound to one store connection
// ============================================================================
//
// Usage:
//   keystone::keystone_db db(keystone::configuration("app.sqlite"));
//   keystone::model_schema session("Session");
//   session.add("token", keystone::string_field())
//          .add("created", keystone::datetime_field({.generator = keystone::now_utc}));
//   db.register_model(std::move(session));
//
//   auto s = db.create("Session", {{"token", "abc"}});
//   auto recent = db.query("Session", {{"created__gte", yesterday}}).order_by("created");

class keystone_db {
public:
    /// Throws configuration_error when the store can't be opened
    explicit keystone_db(configuration config = configuration());

    /// Uses a caller supplied store; config.backend and config.path are ignored
    keystone_db(configuration config, std::shared_ptr<kv_store> store);

    ~keystone_db();

    keystone_db(const keystone_db&) = delete;
    keystone_db& operator=(const keystone_db&) = delete;

    const configuration& config() const { return config_; }
    const std::string& prefix() const { return config_.prefix; }
    kv_store& store() { return *store_; }
    id_allocator& ids() { return *ids_; }

    // ------------------------------------------------------------------------
    // Schemas
    // ------------------------------------------------------------------------

    std::shared_ptr<const model_schema> register_model(model_schema schema);
    void register_models(std::vector<model_schema> schemas);

    std::shared_ptr<const model_schema> get_schema(const std::string& model_name) const;
    std::vector<std::shared_ptr<const model_schema>> schemas() const;
    const schema_registry& registry() const { return registry_; }

    // ------------------------------------------------------------------------
    // Instances
    // ------------------------------------------------------------------------

    /// Unsaved instance. Unknown field names throw validation_error.
    instance_ptr make(const std::string& model_name, const value_map& values = {}) const;

    /// make + save. Unknown field names are logged and ignored.
    instance_ptr create(const std::string& model_name, const value_map& values = {});

    /// Cleans every field, assigns an id on first save and writes the record.
    /// On failure nothing is written and the instance is unchanged.
    void save(model_instance& instance);
    void save(const instance_ptr& instance);

    query_set query(const std::string& model_name, const filter& f = {});

    model_manager objects(const std::string& model_name);

    /// Updates the given fields of every stored instance of model_name
    size_t update(const std::string& model_name, const value_map& values);
    size_t update(const std::string& model_name, const filter& where, const value_map& values);
    size_t update(const std::string& model_name, const instance_ptr& target, const value_map& values);
    size_t update(const std::string& model_name, const instance_list& targets, const value_map& values);
    size_t update(const std::string& model_name, const query_set& targets, const value_map& values);

    /// Deletes the records of the given saved instances; returns how many existed
    size_t remove(const std::string& model_name, const instance_list& instances);
    size_t remove(const model_instance& instance);
    size_t remove_all(const std::string& model_name);

    /// "<prefix>:<model>:<id>"; throws validation_error for unsaved instances
    std::string instance_key(const model_instance& instance) const;

    // ------------------------------------------------------------------------
    // Async variants, run on the configured scheduler
    // ------------------------------------------------------------------------

    std::future<void> save_async(instance_ptr instance);
    std::future<instance_ptr> create_async(std::string model_name, value_map values = {});
    std::future<query_set> query_async(std::string model_name, filter f = {});
    std::future<size_t> update_async(std::string model_name, value_map values, filter where = {});
    std::future<size_t> remove_async(std::string model_name, instance_list instances);

    scheduler& sched() { return *sched_; }

private:
    class async_ticket;

    void init();
    template<typename Fn>
    auto run_async(Fn&& fn);
    void async_finished();
    size_t update_targets(const std::shared_ptr<const model_schema>& schema,
                          const instance_list& targets,
                          const value_map& values);
    void check_update_values(const model_schema& schema, const value_map& values) const;

    configuration config_;
    std::shared_ptr<kv_store> store_;
    schema_registry registry_;
    std::unique_ptr<id_allocator> ids_;
    std::unique_ptr<query_engine> engine_;
    std::shared_ptr<scheduler> sched_;

    // *_async jobs queued or running; the destructor waits for zero
    std::mutex async_mutex_;
    std::condition_variable async_idle_;
    size_t async_pending_ = 0;
};

// ============================================================================
// model_manager - keystone_db operations bound to one model name
// ============================================================================

class model_manager {
public:
    model_manager(keystone_db& db, std::string model_name)
        : db_(db), model_name_(std::move(model_name)) {}

    const std::string& model_name() const { return model_name_; }

    instance_ptr make(const value_map& values = {}) const { return db_.make(model_name_, values); }
    instance_ptr create(const value_map& values = {}) { return db_.create(model_name_, values); }

    query_set all() { return db_.query(model_name_); }
    query_set where(const filter& f) { return db_.query(model_name_, f); }
    size_t count(const filter& f = {}) { return db_.query(model_name_, f).count(); }

    size_t update(const value_map& values) { return db_.update(model_name_, values); }
    size_t update(const filter& f, const value_map& values) { return db_.update(model_name_, f, values); }

    size_t remove(const instance_list& instances) { return db_.remove(model_name_, instances); }
    size_t remove_all() { return db_.remove_all(model_name_); }

private:
    keystone_db& db_;
    std::string model_name_;
};

} // namespace keystone

#endif // __cplusplus
