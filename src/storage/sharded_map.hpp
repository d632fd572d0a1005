#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace respkv::storage {

// Thread-safe string-keyed hash map split into independently locked shards.
//
// Concurrency model:
//   - A key hashes to exactly one shard; each shard owns a std::shared_mutex.
//   - get() / size() take shared (read) locks.
//   - insert_or_assign() / get_or_emplace() take an exclusive (write) lock on
//     one shard only.
//   Keys in different shards never contend.  No lock outlives the call.
template <typename V, std::size_t ShardCount = 32>
class ShardedMap {
    static_assert(ShardCount > 0, "ShardedMap needs at least one shard");

public:
    ShardedMap() = default;

    // Not copyable – copies of a live map would silently race.
    ShardedMap(const ShardedMap&)            = delete;
    ShardedMap& operator=(const ShardedMap&) = delete;

    // Returns a copy of the value for `key`, or std::nullopt if not present.
    [[nodiscard]] std::optional<V> get(std::string_view key) const {
        const auto& shard = shard_for(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.map.find(std::string(key));
        if (it == shard.map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    // Inserts or overwrites `key` with `value`.
    void insert_or_assign(std::string key, V value) {
        auto& shard = shard_for(key);
        std::unique_lock lock(shard.mutex);
        shard.map.insert_or_assign(std::move(key), std::move(value));
    }

    // Returns the value for `key`, inserting `make()` first if absent.
    // The fast path (key already present) only takes a shared lock.
    template <typename Factory>
    V get_or_emplace(std::string key, Factory&& make) {
        auto& shard = shard_for(key);
        {
            std::shared_lock lock(shard.mutex);
            auto it = shard.map.find(key);
            if (it != shard.map.end()) {
                return it->second;
            }
        }
        std::unique_lock lock(shard.mutex);
        // Another writer may have inserted between the two locks.
        auto [it, inserted] = shard.map.try_emplace(std::move(key));
        if (inserted) {
            it->second = std::forward<Factory>(make)();
        }
        return it->second;
    }

    // Total number of keys.  Shards are visited one at a time, so the result
    // is not an atomic snapshot under concurrent writes.
    [[nodiscard]] std::size_t size() const {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            total += shard.map.size();
        }
        return total;
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, V> map;
    };

    [[nodiscard]] std::size_t shard_index(std::string_view key) const noexcept {
        return std::hash<std::string_view>{}(key) % ShardCount;
    }

    Shard& shard_for(std::string_view key) { return shards_[shard_index(key)]; }
    const Shard& shard_for(std::string_view key) const { return shards_[shard_index(key)]; }

    std::array<Shard, ShardCount> shards_;
};

} // namespace respkv::storage
