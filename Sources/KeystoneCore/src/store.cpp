#include "keystone/store.hpp"
#include "keystone/log.hpp"
#include <fnmatch.h>
#include <algorithm>
#include <charconv>

namespace keystone {

namespace {

bool glob_match(const std::string& pattern, const std::string& key) {
    return fnmatch(pattern.c_str(), key.c_str(), 0) == 0;
}

int64_t parse_counter(const std::string& key, const std::string& text) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw store_error("value of " + key + " is not an integer: " + text);
    }
    return value;
}

// Keeps IN (...) lists well below SQLITE_MAX_VARIABLE_NUMBER
constexpr size_t max_params_per_statement = 500;

} // namespace

// ============================================================================
// memory_store
// ============================================================================

std::optional<std::string> memory_store::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void memory_store::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
}

std::vector<std::optional<std::string>> memory_store::multi_get(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::optional<std::string>> values;
    values.reserve(keys.size());
    for (const auto& key : keys) {
        auto it = data_.find(key);
        if (it == data_.end()) {
            values.emplace_back(std::nullopt);
        } else {
            values.emplace_back(it->second);
        }
    }
    return values;
}

void memory_store::multi_set(const key_value_list& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : entries) {
        data_[key] = value;
    }
}

size_t memory_store::remove(const std::vector<std::string>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (const auto& key : keys) {
        removed += data_.erase(key);
    }
    return removed;
}

std::vector<std::string> memory_store::keys(const std::string& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [key, _] : data_) {
        if (glob_match(pattern, key)) {
            result.push_back(key);
        }
    }
    return result;
}

void memory_store::scan(const std::string& pattern, const key_visitor& visit) {
    // Batches are collected under the lock and visited without it, so the
    // visitor may call back into the store.
    std::optional<std::string> cursor;
    bool done = false;
    while (!done) {
        std::vector<std::string> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = cursor ? data_.upper_bound(*cursor) : data_.begin();
            for (size_t examined = 0; it != data_.end() && examined < scan_batch_size; ++it, ++examined) {
                cursor = it->first;
                if (glob_match(pattern, it->first)) {
                    batch.push_back(it->first);
                }
            }
            done = it == data_.end();
        }
        for (const auto& key : batch) {
            visit(key);
        }
    }
}

int64_t memory_store::increment(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    int64_t value = it == data_.end() ? 0 : parse_counter(key, it->second);
    ++value;
    data_[key] = std::to_string(value);
    return value;
}

size_t memory_store::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

// ============================================================================
// sqlite_store
// ============================================================================

sqlite_store::sqlite_store(const std::string& path)
    : db_(std::make_unique<database>(path)) {
    db_->exec("CREATE TABLE IF NOT EXISTS kv (key TEXT PRIMARY KEY, value TEXT NOT NULL)");
    LOG_DEBUG("store", "opened sqlite store at %s", path.c_str());
}

std::optional<std::string> sqlite_store::get(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto select = db_->prepare("SELECT value FROM kv WHERE key = ?");
    select.bind(1, key);
    if (!select.step()) {
        return std::nullopt;
    }
    return select.text(0);
}

void sqlite_store::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto upsert = db_->prepare("INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?)");
    upsert.bind(1, key).bind(2, value);
    upsert.step();
}

std::vector<std::optional<std::string>> sqlite_store::multi_get(const std::vector<std::string>& keys) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::map<std::string, std::string> found;

    for (size_t start = 0; start < keys.size(); start += max_params_per_statement) {
        size_t end = std::min(keys.size(), start + max_params_per_statement);
        std::string sql = "SELECT key, value FROM kv WHERE key IN (?";
        for (size_t i = start + 1; i < end; ++i) {
            sql += ", ?";
        }
        sql += ")";

        auto select = db_->prepare(sql);
        for (size_t i = start; i < end; ++i) {
            select.bind(static_cast<int>(i - start + 1), keys[i]);
        }
        while (select.step()) {
            auto key = select.text(0);
            auto value = select.text(1);
            if (key && value) {
                found[*key] = std::move(*value);
            }
        }
    }

    std::vector<std::optional<std::string>> values;
    values.reserve(keys.size());
    for (const auto& key : keys) {
        auto it = found.find(key);
        if (it == found.end()) {
            values.emplace_back(std::nullopt);
        } else {
            values.emplace_back(it->second);
        }
    }
    return values;
}

void sqlite_store::multi_set(const key_value_list& entries) {
    if (entries.empty()) return;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    transaction tx(*db_);
    auto upsert = db_->prepare("INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?)");
    for (const auto& [key, value] : entries) {
        upsert.bind(1, key).bind(2, value);
        upsert.step();
        upsert.reset();
    }
    tx.commit();
}

size_t sqlite_store::remove(const std::vector<std::string>& keys) {
    if (keys.empty()) return 0;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t removed = 0;
    transaction tx(*db_);
    auto erase = db_->prepare("DELETE FROM kv WHERE key = ?");
    for (const auto& key : keys) {
        erase.bind(1, key);
        erase.step();
        removed += static_cast<size_t>(db_->changes());
        erase.reset();
    }
    tx.commit();
    return removed;
}

std::vector<std::string> sqlite_store::keys(const std::string& pattern) {
    std::vector<std::string> result;
    scan(pattern, [&](const std::string& key) { result.push_back(key); });
    return result;
}

void sqlite_store::scan(const std::string& pattern, const key_visitor& visit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto select = db_->prepare("SELECT key FROM kv WHERE key GLOB ? ORDER BY key");
    select.bind(1, pattern);
    while (select.step()) {
        if (auto key = select.text(0)) {
            visit(*key);
        }
    }
}

int64_t sqlite_store::increment(const std::string& key) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    transaction tx(*db_);
    int64_t value = 0;
    {
        auto select = db_->prepare("SELECT value FROM kv WHERE key = ?");
        select.bind(1, key);
        if (select.step()) {
            value = parse_counter(key, select.text(0).value_or(""));
        }
    }
    ++value;
    auto upsert = db_->prepare("INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?)");
    upsert.bind(1, key).bind(2, std::to_string(value));
    upsert.step();
    tx.commit();
    return value;
}

} // namespace keystone
