#pragma once

#include "resp/frame.hpp"
#include "storage/sharded_map.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace respkv::storage {

// ── Backend ───────────────────────────────────────────────────────────────────
//
// Process-wide store with three independent namespaces:
//   map  : key -> Frame                  (GET / SET)
//   hmap : key -> (field -> Frame)       (HGET / HSET / HGETALL / HMGET)
//   dset : key -> set of Frame           (SADD / SISMEMBER)
// A key may live in several namespaces at once with unrelated values.
//
// Backend is a cheap, copyable handle; all copies share the same state, which
// lives as long as the last copy.  Every operation is thread-safe.  Outer
// namespaces are sharded (see ShardedMap); each hash and set additionally
// owns its own reader/writer lock, so unrelated keys never contend and no
// lock is held across two calls.
class Backend {
public:
    Backend();

    // ── map ──────────────────────────────────────────────────────────────────
    [[nodiscard]] std::optional<resp::Frame> get(std::string_view key) const;
    void set(std::string key, resp::Frame value);

    // ── hmap ─────────────────────────────────────────────────────────────────
    [[nodiscard]] std::optional<resp::Frame> hget(std::string_view key, std::string_view field) const;

    // Creates the hash for `key` on first write; hashes are never removed.
    void hset(std::string key, std::string field, resp::Frame value);

    // Copy of the whole hash, sorted by field, or nullopt if `key` was never set.
    [[nodiscard]] std::optional<std::map<std::string, resp::Frame>> hgetall(std::string_view key) const;

    // One value per requested field that is present; absent fields are
    // skipped, so the result may be shorter than `fields`.  nullopt if `key`
    // was never set.
    [[nodiscard]] std::optional<std::vector<resp::Frame>> hmget(
        std::string_view key, const std::vector<std::string>& fields) const;

    // Always the text as a SimpleString.
    [[nodiscard]] std::optional<resp::Frame> echo(std::string_view text) const;

    // ── dset ─────────────────────────────────────────────────────────────────

    // Adds `item` to the set for `key`, creating the set if needed.
    // Returns 1 if newly added, 0 if it was already a member.
    std::uint8_t sadd(std::string key, resp::Frame item);

    // 1 if `item` is in the set for `key`, 0 otherwise (missing key included).
    [[nodiscard]] std::uint8_t sismember(std::string_view key, const resp::Frame& item) const;

    // ── Introspection ────────────────────────────────────────────────────────
    [[nodiscard]] std::size_t key_count() const;
    [[nodiscard]] std::size_t hash_count() const;
    [[nodiscard]] std::size_t set_count() const;

private:
    struct FieldTable {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, resp::Frame> fields;
    };

    struct MemberSet {
        mutable std::shared_mutex mutex;
        std::unordered_set<resp::Frame> members;
    };

    struct State {
        ShardedMap<resp::Frame> map;
        ShardedMap<std::shared_ptr<FieldTable>> hmap;
        ShardedMap<std::shared_ptr<MemberSet>> dset;
    };

    std::shared_ptr<State> state_;
};

} // namespace respkv::storage
