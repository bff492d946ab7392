#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// String-keyed hash map split into shards, each guarded by its own
// reader/writer lock. Readers of different keys (and of the same key)
// never block each other; writers only block their own shard.
template <typename V>
class ShardedMap {
public:
    explicit ShardedMap(std::size_t shards = 64)
        : shard_count_(shards ? shards : 1), shards_(shard_count_) {}

    ShardedMap(const ShardedMap&) = delete;
    ShardedMap& operator=(const ShardedMap&) = delete;

    // Copy of the value stored under key, if any.
    std::optional<V> find(const std::string& key) const {
        const Shard& s = shard_for_(key);
        std::shared_lock<std::shared_mutex> lock(s.mu);
        auto it = s.map.find(key);
        if (it == s.map.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const std::string& key) const {
        const Shard& s = shard_for_(key);
        std::shared_lock<std::shared_mutex> lock(s.mu);
        return s.map.find(key) != s.map.end();
    }

    void insert_or_assign(const std::string& key, V value) {
        Shard& s = shard_for_(key);
        std::unique_lock<std::shared_mutex> lock(s.mu);
        s.map[key] = std::move(value);
    }

    // Insert value unless key is already present.
    // Returns the value that ends up stored under key.
    V insert_if_absent(const std::string& key, V value) {
        Shard& s = shard_for_(key);
        std::unique_lock<std::shared_mutex> lock(s.mu);
        auto res = s.map.emplace(key, std::move(value));
        return res.first->second;
    }

    // Returns true if an entry was removed.
    bool erase(const std::string& key) {
        Shard& s = shard_for_(key);
        std::unique_lock<std::shared_mutex> lock(s.mu);
        return s.map.erase(key) > 0;
    }

    void clear() {
        for (auto& s : shards_) {
            std::unique_lock<std::shared_mutex> lock(s.mu);
            s.map.clear();
        }
    }

    std::size_t size() const {
        std::size_t n = 0;
        for (const auto& s : shards_) {
            std::shared_lock<std::shared_mutex> lock(s.mu);
            n += s.map.size();
        }
        return n;
    }

private:
    struct Shard {
        mutable std::shared_mutex mu;
        std::unordered_map<std::string, V> map;
    };

    Shard& shard_for_(const std::string& key) {
        return shards_[std::hash<std::string>{}(key) % shard_count_];
    }
    const Shard& shard_for_(const std::string& key) const {
        return shards_[std::hash<std::string>{}(key) % shard_count_];
    }

    std::size_t shard_count_;
    std::vector<Shard> shards_;
};
