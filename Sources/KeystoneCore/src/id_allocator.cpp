#include "keystone/id_allocator.hpp"
#include "keystone/log.hpp"
#include <charconv>

namespace keystone {

namespace {

// Sets the lock flag for its lifetime; clears it on every exit path
class lock_flag_guard {
public:
    lock_flag_guard(kv_store& store, const std::string& key) : store_(store), key_(key) {
        store_.set(key_, "1");
    }

    ~lock_flag_guard() {
        try {
            store_.set(key_, "0");
        } catch (const std::exception& e) {
            LOG_ERROR("ids", "failed to release %s: %s", key_.c_str(), e.what());
        }
    }

    lock_flag_guard(const lock_flag_guard&) = delete;
    lock_flag_guard& operator=(const lock_flag_guard&) = delete;

private:
    kv_store& store_;
    const std::string& key_;
};

} // namespace

id_allocator::id_allocator(kv_store& store, std::string prefix)
    : store_(store), prefix_(std::move(prefix)), lock_key_("__lock__:" + prefix_) {}

void id_allocator::reset_lock() {
    store_.set(lock_key_, "0");
}

std::string id_allocator::counter_key(const std::string& model_name) const {
    return "max_id:" + prefix_ + ":" + model_name;
}

model_id_t id_allocator::next_id(const std::string& model_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    lock_flag_guard flag(store_, lock_key_);
    model_id_t id = store_.increment(counter_key(model_name));
    LOG_DEBUG("ids", "issued %s:%lld", model_name.c_str(), static_cast<long long>(id));
    return id;
}

model_id_t id_allocator::current(const std::string& model_name) {
    auto text = store_.get(counter_key(model_name));
    if (!text) {
        return 0;
    }
    model_id_t value = 0;
    auto [ptr, ec] = std::from_chars(text->data(), text->data() + text->size(), value);
    if (ec != std::errc() || ptr != text->data() + text->size()) {
        throw store_error(counter_key(model_name) + " holds a non-integer value: " + *text);
    }
    return value;
}

} // namespace keystone
