#include "storage/backend.hpp"

#include <mutex>
#include <shared_mutex>

namespace respkv::storage {

Backend::Backend() : state_(std::make_shared<State>()) {}

// ── map ──────────────────────────────────────────────────────────────────────

std::optional<resp::Frame> Backend::get(std::string_view key) const {
    return state_->map.get(key);
}

void Backend::set(std::string key, resp::Frame value) {
    state_->map.insert_or_assign(std::move(key), std::move(value));
}

// ── hmap ─────────────────────────────────────────────────────────────────────

std::optional<resp::Frame> Backend::hget(std::string_view key, std::string_view field) const {
    const auto table = state_->hmap.get(key);
    if (!table) {
        return std::nullopt;
    }
    std::shared_lock lock((*table)->mutex);
    auto it = (*table)->fields.find(std::string(field));
    if (it == (*table)->fields.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Backend::hset(std::string key, std::string field, resp::Frame value) {
    auto table = state_->hmap.get_or_emplace(std::move(key),
                                             [] { return std::make_shared<FieldTable>(); });
    std::unique_lock lock(table->mutex);
    table->fields.insert_or_assign(std::move(field), std::move(value));
}

std::optional<std::map<std::string, resp::Frame>> Backend::hgetall(std::string_view key) const {
    const auto table = state_->hmap.get(key);
    if (!table) {
        return std::nullopt;
    }
    std::shared_lock lock((*table)->mutex);
    return std::map<std::string, resp::Frame>((*table)->fields.begin(), (*table)->fields.end());
}

std::optional<std::vector<resp::Frame>> Backend::hmget(
    std::string_view key, const std::vector<std::string>& fields) const
{
    const auto table = state_->hmap.get(key);
    if (!table) {
        return std::nullopt;
    }
    std::vector<resp::Frame> values;
    values.reserve(fields.size());

    std::shared_lock lock((*table)->mutex);
    for (const auto& field : fields) {
        auto it = (*table)->fields.find(field);
        if (it != (*table)->fields.end()) {
            values.push_back(it->second);
        }
    }
    return values;
}

std::optional<resp::Frame> Backend::echo(std::string_view text) const {
    return resp::Frame::simple(std::string(text));
}

// ── dset ─────────────────────────────────────────────────────────────────────

std::uint8_t Backend::sadd(std::string key, resp::Frame item) {
    auto set = state_->dset.get_or_emplace(std::move(key),
                                           [] { return std::make_shared<MemberSet>(); });
    std::unique_lock lock(set->mutex);
    return set->members.insert(std::move(item)).second ? 1 : 0;
}

std::uint8_t Backend::sismember(std::string_view key, const resp::Frame& item) const {
    const auto set = state_->dset.get(key);
    if (!set) {
        return 0;
    }
    std::shared_lock lock((*set)->mutex);
    return (*set)->members.contains(item) ? 1 : 0;
}

// ── Introspection ────────────────────────────────────────────────────────────

std::size_t Backend::key_count() const {
    return state_->map.size();
}

std::size_t Backend::hash_count() const {
    return state_->hmap.size();
}

std::size_t Backend::set_count() const {
    return state_->dset.size();
}

} // namespace respkv::storage
