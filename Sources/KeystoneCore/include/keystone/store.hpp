#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include "db.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace keystone {

// ============================================================================
// kv_store - the key-value operations the mapping layer needs
// ============================================================================
//
// Patterns are glob style ("keystone:Session:*"). Values are UTF-8 text.
// Implementations must be safe for concurrent use.

class kv_store {
public:
    using key_value_list = std::vector<std::pair<std::string, std::string>>;
    using key_visitor = std::function<void(const std::string&)>;

    virtual ~kv_store() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;

    /// One entry per key, in key order; nullopt for missing keys
    virtual std::vector<std::optional<std::string>> multi_get(const std::vector<std::string>& keys) = 0;
    virtual void multi_set(const key_value_list& entries) = 0;

    /// Returns the number of keys that existed
    virtual size_t remove(const std::vector<std::string>& keys) = 0;

    virtual std::vector<std::string> keys(const std::string& pattern) = 0;

    /// Streaming enumeration; visit is called once per matching key
    virtual void scan(const std::string& pattern, const key_visitor& visit) = 0;

    /// Atomically adds one to an integer value (0 if absent) and returns it
    virtual int64_t increment(const std::string& key) = 0;
};

// ============================================================================
// memory_store - in-process ordered map
// ============================================================================

class memory_store : public kv_store {
public:
    memory_store() = default;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    std::vector<std::optional<std::string>> multi_get(const std::vector<std::string>& keys) override;
    void multi_set(const key_value_list& entries) override;
    size_t remove(const std::vector<std::string>& keys) override;
    std::vector<std::string> keys(const std::string& pattern) override;
    void scan(const std::string& pattern, const key_visitor& visit) override;
    int64_t increment(const std::string& key) override;

    size_t size() const;

private:
    static constexpr size_t scan_batch_size = 64;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> data_;
};

// ============================================================================
// sqlite_store - kv table in a SQLite database
// ============================================================================

class sqlite_store : public kv_store {
public:
    /// path may be ":memory:". Throws store_error when the database can't be opened.
    explicit sqlite_store(const std::string& path);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    std::vector<std::optional<std::string>> multi_get(const std::vector<std::string>& keys) override;
    void multi_set(const key_value_list& entries) override;
    size_t remove(const std::vector<std::string>& keys) override;
    std::vector<std::string> keys(const std::string& pattern) override;
    void scan(const std::string& pattern, const key_visitor& visit) override;
    int64_t increment(const std::string& key) override;

    const std::string& path() const { return db_->path(); }

private:
    std::recursive_mutex mutex_;
    std::unique_ptr<database> db_;
};

} // namespace keystone

#endif // __cplusplus
