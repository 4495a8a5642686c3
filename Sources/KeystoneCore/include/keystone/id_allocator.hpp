#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "store.hpp"
#include <mutex>
#include <string>

namespace keystone {

// ============================================================================
// id_allocator - strictly increasing ids per model name
// ============================================================================
//
// Persisted layout:
//   "max_id:<prefix>:<model>"  highest id issued for the model
//   "__lock__:<prefix>"        "1" while an increment is in progress, else "0"
//
// One allocator (and one lock) per context, shared by all of its models.
// Uniqueness across contexts on the same store comes from kv_store::increment.

class id_allocator {
public:
    id_allocator(kv_store& store, std::string prefix);

    id_allocator(const id_allocator&) = delete;
    id_allocator& operator=(const id_allocator&) = delete;

    /// Writes "0" to the lock key. Called once when the context starts.
    void reset_lock();

    /// Issues the next id for model_name. Throws store_error.
    model_id_t next_id(const std::string& model_name);

    /// Highest id issued so far (0 if none)
    model_id_t current(const std::string& model_name);

    std::string counter_key(const std::string& model_name) const;
    const std::string& lock_key() const { return lock_key_; }

private:
    kv_store& store_;
    std::string prefix_;
    std::string lock_key_;
    std::mutex mutex_;
};

} // namespace keystone

#endif // __cplusplus
