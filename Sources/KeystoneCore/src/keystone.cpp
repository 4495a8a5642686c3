#include "keystone/keystone.hpp"
#include "keystone/log.hpp"
#include <algorithm>
#include <cstring>
#include <iterator>
#include <utility>

namespace keystone {

// Global log level - default warn
std::atomic<log_level> g_log_level{log_level::warn};

namespace {

const char* const k_default_prefix = "keystone";

// ':' separates key parts; the rest would turn record patterns into wider globs
constexpr const char* k_prefix_forbidden = ":*?[]\\";

std::string sanitize_prefix(const std::string& prefix) {
    std::string cleaned;
    cleaned.reserve(prefix.size());
    std::copy_if(prefix.begin(), prefix.end(), std::back_inserter(cleaned),
                 [](char c) { return std::strchr(k_prefix_forbidden, c) == nullptr; });
    if (cleaned != prefix) {
        LOG_WARN("keystone", "prefix '%s' must not contain any of '%s', using '%s'", prefix.c_str(),
                 k_prefix_forbidden, cleaned.c_str());
    }
    if (cleaned.empty()) {
        LOG_WARN("keystone", "empty prefix, using '%s'", k_default_prefix);
        cleaned = k_default_prefix;
    }
    return cleaned;
}

std::shared_ptr<kv_store> open_store(const configuration& config) {
    switch (config.backend) {
        case store_backend::memory:
            return std::make_shared<memory_store>();
        case store_backend::sqlite:
            try {
                return std::make_shared<sqlite_store>(config.path);
            } catch (const store_error& e) {
                throw configuration_error(std::string("can't open store: ") + e.what());
            }
    }
    throw configuration_error("unknown store backend");
}

validation_error wrap_field_error(const std::exception& e, const std::string& model_name,
                                  const std::string& field_name) {
    return validation_error(std::string(e.what()) + " (" + model_name + " -> " + field_name + ")");
}

} // namespace

keystone_db::keystone_db(configuration config) : config_(std::move(config)) {
    store_ = open_store(config_);
    init();
}

keystone_db::keystone_db(configuration config, std::shared_ptr<kv_store> store)
    : config_(std::move(config)), store_(std::move(store)) {
    if (!store_) {
        throw configuration_error("no store given");
    }
    init();
}

keystone_db::~keystone_db() {
    // The scheduler may be shared and outlive this context; wait for our own
    // queued jobs instead of relying on its shutdown
    std::unique_lock<std::mutex> lock(async_mutex_);
    async_idle_.wait(lock, [this] { return async_pending_ == 0; });
    lock.unlock();

    sched_.reset();
    config_.sched.reset();
}

void keystone_db::init() {
    config_.prefix = sanitize_prefix(config_.prefix);
    if (config_.max_relation_depth < 1) {
        throw configuration_error("max_relation_depth must be at least 1");
    }

    ids_ = std::make_unique<id_allocator>(*store_, config_.prefix);
    try {
        ids_->reset_lock();
    } catch (const store_error& e) {
        throw configuration_error(std::string("store is not writable: ") + e.what());
    }

    query_options options;
    options.prefix = config_.prefix;
    options.lenient = config_.ignore_deserialization_errors;
    options.use_keys = config_.use_keys;
    options.max_relation_depth = config_.max_relation_depth;
    engine_ = std::make_unique<query_engine>(*store_, registry_, std::move(options));

    if (config_.sched) {
        sched_ = config_.sched;
    } else if (config_.non_blocking) {
        if (config_.worker_threads == 0) {
            throw configuration_error("non_blocking needs at least one worker thread");
        }
        sched_ = std::make_shared<thread_pool_scheduler>(config_.worker_threads);
    } else {
        sched_ = std::make_shared<immediate_scheduler>();
    }

    LOG_INFO("keystone", "context ready (prefix '%s', %s mode)", config_.prefix.c_str(),
             config_.ignore_deserialization_errors ? "lenient" : "strict");
}

// ============================================================================
// Schemas
// ============================================================================

std::shared_ptr<const model_schema> keystone_db::register_model(model_schema schema) {
    return registry_.register_model(std::move(schema));
}

void keystone_db::register_models(std::vector<model_schema> schemas) {
    for (auto& schema : schemas) {
        registry_.register_model(std::move(schema));
    }
}

std::shared_ptr<const model_schema> keystone_db::get_schema(const std::string& model_name) const {
    return registry_.get_schema(model_name);
}

std::vector<std::shared_ptr<const model_schema>> keystone_db::schemas() const {
    return registry_.all_schemas();
}

// ============================================================================
// Instances
// ============================================================================

instance_ptr keystone_db::make(const std::string& model_name, const value_map& values) const {
    auto instance = std::make_shared<model_instance>(registry_.require(model_name));
    instance->assign(values);
    return instance;
}

instance_ptr keystone_db::create(const std::string& model_name, const value_map& values) {
    auto instance = std::make_shared<model_instance>(registry_.require(model_name));
    for (const auto& [name, value] : values) {
        if (!instance->contains(name) || name == "id") {
            LOG_WARN("keystone", "%s.create: ignoring parameter %s", model_name.c_str(), name.c_str());
            continue;
        }
        instance->set(name, value);
    }
    save(*instance);
    return instance;
}

void keystone_db::save(model_instance& instance) {
    const std::string& model_name = instance.model_name();
    auto registered = registry_.get_schema(model_name);
    if (registered != instance.schema_ptr()) {
        throw validation_error(model_name + " instances can only be saved through a registered schema");
    }

    // Clean copies so a failure leaves the instance untouched
    nlohmann::json record = nlohmann::json::object();
    std::vector<std::unique_ptr<field_spec>> cleaned;
    cleaned.reserve(instance.fields().size());
    for (const auto& [name, field] : instance.fields()) {
        auto copy = field->clone();
        if (name != "id") {
            try {
                record[name] = copy->clean();
            } catch (const validation_error& e) {
                throw wrap_field_error(e, model_name, name);
            }
        }
        cleaned.push_back(std::move(copy));
    }

    model_id_t id = instance.id() ? *instance.id() : ids_->next_id(model_name);
    record["id"] = id;

    store_->set(engine_->record_key(model_name, id), record.dump());

    for (size_t i = 0; i < cleaned.size(); ++i) {
        const auto& name = instance.fields()[i].first;
        if (name != "id") {
            instance.field(name).set_value(cleaned[i]->value());
        }
    }
    if (!instance.id()) {
        instance.assign_id(id);
    }
    LOG_DEBUG("keystone", "saved %s:%lld", model_name.c_str(), static_cast<long long>(id));
}

void keystone_db::save(const instance_ptr& instance) {
    if (!instance) {
        throw validation_error("can't save a null instance");
    }
    save(*instance);
}

query_set keystone_db::query(const std::string& model_name, const filter& f) {
    return engine_->execute(model_name, f);
}

model_manager keystone_db::objects(const std::string& model_name) {
    return model_manager(*this, model_name);
}

// ============================================================================
// Update
// ============================================================================

void keystone_db::check_update_values(const model_schema& schema, const value_map& values) const {
    for (const auto& [name, _] : values) {
        if (name == "id") {
            throw validation_error(schema.name() + ".id can not be updated");
        }
        if (!schema.has_field(name)) {
            throw validation_error(schema.name() + " has no field " + name);
        }
    }
}

size_t keystone_db::update(const std::string& model_name, const value_map& values) {
    auto schema = registry_.require(model_name);
    check_update_values(*schema, values);
    return update_targets(schema, engine_->execute(model_name).as_list(), values);
}

size_t keystone_db::update(const std::string& model_name, const filter& where, const value_map& values) {
    auto schema = registry_.require(model_name);
    check_update_values(*schema, values);
    return update_targets(schema, engine_->execute(model_name, where).as_list(), values);
}

size_t keystone_db::update(const std::string& model_name, const instance_ptr& target, const value_map& values) {
    return update(model_name, instance_list{target}, values);
}

size_t keystone_db::update(const std::string& model_name, const instance_list& targets, const value_map& values) {
    auto schema = registry_.require(model_name);
    check_update_values(*schema, values);
    if (targets.empty()) {
        throw validation_error("update of " + model_name + " needs at least one target instance");
    }
    for (const auto& target : targets) {
        if (!target || target->model_name() != model_name) {
            throw validation_error("update targets must all be " + model_name + " instances");
        }
        if (!target->is_saved()) {
            throw validation_error("can't update an unsaved " + model_name + " instance");
        }
    }
    return update_targets(schema, targets, values);
}

size_t keystone_db::update(const std::string& model_name, const query_set& targets, const value_map& values) {
    if (targets.schema().name() != model_name) {
        throw validation_error("query result of " + targets.schema().name() + " can't update " + model_name);
    }
    auto schema = registry_.require(model_name);
    check_update_values(*schema, values);
    return update_targets(schema, targets.as_list(), values);
}

size_t keystone_db::update_targets(const std::shared_ptr<const model_schema>& schema,
                                   const instance_list& targets,
                                   const value_map& values) {
    kv_store::key_value_list entries;
    std::vector<std::pair<instance_ptr, std::vector<std::pair<std::string, value_t>>>> applied;

    for (const auto& target : targets) {
        model_id_t id = *target->id();
        auto record = engine_->load_record(schema->name(), id);
        if (!record) {
            LOG_WARN("keystone", "%s:%lld is not stored, skipping update", schema->name().c_str(),
                     static_cast<long long>(id));
            continue;
        }

        std::vector<std::pair<std::string, value_t>> new_values;
        for (const auto& [name, value] : values) {
            auto field = schema->find(name)->clone();
            field->set_value(value);
            try {
                (*record)[name] = field->clean();
            } catch (const validation_error& e) {
                throw wrap_field_error(e, schema->name(), name);
            }
            new_values.emplace_back(name, field->value());
        }
        entries.emplace_back(engine_->record_key(schema->name(), id), record->dump());
        applied.emplace_back(target, std::move(new_values));
    }

    if (entries.empty()) {
        return 0;
    }
    store_->multi_set(entries);

    for (auto& [target, new_values] : applied) {
        for (auto& [name, value] : new_values) {
            target->write(name, std::move(value));
        }
    }
    LOG_DEBUG("keystone", "updated %zu %s records", entries.size(), schema->name().c_str());
    return entries.size();
}

// ============================================================================
// Remove
// ============================================================================

std::string keystone_db::instance_key(const model_instance& instance) const {
    auto id = instance.id();
    if (!id) {
        throw validation_error(instance.model_name() + " instance is not saved and has no key");
    }
    return engine_->record_key(instance.model_name(), *id);
}

size_t keystone_db::remove(const std::string& model_name, const instance_list& instances) {
    std::vector<std::string> keys;
    keys.reserve(instances.size());
    for (const auto& instance : instances) {
        if (!instance || instance->model_name() != model_name) {
            throw validation_error("only " + model_name + " instances can be removed here");
        }
        keys.push_back(instance_key(*instance));
    }
    if (keys.empty()) {
        return 0;
    }
    return store_->remove(keys);
}

size_t keystone_db::remove(const model_instance& instance) {
    return store_->remove({instance_key(instance)});
}

size_t keystone_db::remove_all(const std::string& model_name) {
    auto keys = engine_->record_keys(model_name);
    if (keys.empty()) {
        return 0;
    }
    size_t removed = store_->remove(keys);
    LOG_DEBUG("keystone", "removed %zu %s records", removed, model_name.c_str());
    return removed;
}

// ============================================================================
// Async
// ============================================================================

// Held by every queued job. Released once the job has run, or when the
// scheduler drops it without running it.
class keystone_db::async_ticket {
public:
    explicit async_ticket(keystone_db& db) : db_(db) {
        std::lock_guard<std::mutex> lock(db.async_mutex_);
        ++db.async_pending_;
    }

    async_ticket(const async_ticket&) = delete;
    async_ticket& operator=(const async_ticket&) = delete;

    ~async_ticket() { db_.async_finished(); }

private:
    keystone_db& db_;
};

void keystone_db::async_finished() {
    std::lock_guard<std::mutex> lock(async_mutex_);
    if (--async_pending_ == 0) {
        async_idle_.notify_all();
    }
}

template<typename Fn>
auto keystone_db::run_async(Fn&& fn) {
    return submit(*sched_, std::forward<Fn>(fn), std::make_shared<async_ticket>(*this));
}

std::future<void> keystone_db::save_async(instance_ptr instance) {
    return run_async([this, instance = std::move(instance)] { save(instance); });
}

std::future<instance_ptr> keystone_db::create_async(std::string model_name, value_map values) {
    return run_async([this, model_name = std::move(model_name), values = std::move(values)] {
        return create(model_name, values);
    });
}

std::future<query_set> keystone_db::query_async(std::string model_name, filter f) {
    return run_async([this, model_name = std::move(model_name), f = std::move(f)] {
        return query(model_name, f);
    });
}

std::future<size_t> keystone_db::update_async(std::string model_name, value_map values, filter where) {
    return run_async([this, model_name = std::move(model_name), values = std::move(values),
                      where = std::move(where)] {
        return update(model_name, where, values);
    });
}

std::future<size_t> keystone_db::remove_async(std::string model_name, instance_list instances) {
    return run_async([this, model_name = std::move(model_name), instances = std::move(instances)] {
        return remove(model_name, instances);
    });
}

} // namespace keystone
