/// @file memory_store.cpp
/// @brief MemoryStore implementation: hash-striped shards, each a map
///        guarded by its own mutex.

#include "rk/store/memory_store.hpp"

#include <algorithm>
#include <charconv>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rk::store {

using foundation::Duration;
using foundation::ErrorCode;
using foundation::LimiterError;
using foundation::LimiterResult;
using foundation::Timestamp;

namespace {

struct Entry {
    std::string value;
    Timestamp expiresAt;
};

struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> entries;
    std::size_t writesSinceSweep = 0;
};

std::size_t eraseExpired(Shard& shard, Timestamp now) {
    std::size_t removed = 0;
    for (auto it = shard.entries.begin(); it != shard.entries.end();) {
        if (it->second.expiresAt <= now) {
            it = shard.entries.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    shard.writesSinceSweep = 0;
    return removed;
}

LimiterError invalidTtl(std::string_view key) {
    return LimiterError(ErrorCode::InvalidArgument,
                        "ttl must be positive for key: " + std::string(key));
}

} // anonymous namespace

struct MemoryStore::Impl {
    std::shared_ptr<const foundation::Clock> clock;
    std::vector<Shard> shards;
    std::size_t sweepEveryWrites;

    Impl(std::shared_ptr<const foundation::Clock> c, const MemoryStoreConfig& config)
        : clock(std::move(c)),
          shards(std::max<std::size_t>(config.shardCount, 1)),
          sweepEveryWrites(config.sweepEveryWrites) {}

    Shard& shardFor(std::string_view key) {
        return shards[std::hash<std::string_view>{}(key) % shards.size()];
    }

    // Find a live entry; erases it first if it has expired. Caller holds the shard lock.
    Entry* findLive(Shard& shard, std::string_view key, Timestamp now) {
        auto it = shard.entries.find(std::string(key));
        if (it == shard.entries.end()) {
            return nullptr;
        }
        if (it->second.expiresAt <= now) {
            shard.entries.erase(it);
            return nullptr;
        }
        return &it->second;
    }

    // Count a write and sweep the shard when due. Caller holds the shard lock.
    void noteWrite(Shard& shard, Timestamp now) {
        if (sweepEveryWrites == 0) {
            return;
        }
        if (++shard.writesSinceSweep >= sweepEveryWrites) {
            eraseExpired(shard, now);
        }
    }
};

MemoryStore::MemoryStore(std::shared_ptr<const foundation::Clock> clock,
                         MemoryStoreConfig config)
    : impl_(std::make_unique<Impl>(std::move(clock), config)) {}

MemoryStore::~MemoryStore() = default;

LimiterResult<std::optional<std::string>> MemoryStore::get(
    std::string_view key, Deadline /*deadline*/) {
    auto& shard = impl_->shardFor(key);
    std::lock_guard lock(shard.mutex);

    auto* entry = impl_->findLive(shard, key, impl_->clock->now());
    if (entry == nullptr) {
        return LimiterResult<std::optional<std::string>>::ok(std::nullopt);
    }
    return LimiterResult<std::optional<std::string>>::ok(entry->value);
}

LimiterResult<void> MemoryStore::set(std::string_view key, std::string_view value,
                                     Duration ttl, Deadline /*deadline*/) {
    if (ttl <= Duration::zero()) {
        return LimiterResult<void>::err(invalidTtl(key));
    }
    auto& shard = impl_->shardFor(key);
    std::lock_guard lock(shard.mutex);

    auto now = impl_->clock->now();
    shard.entries[std::string(key)] = Entry{std::string(value), now + ttl};
    impl_->noteWrite(shard, now);
    return LimiterResult<void>::ok();
}

LimiterResult<int64_t> MemoryStore::increment(std::string_view key, int64_t delta,
                                              Duration ttl, Deadline /*deadline*/) {
    if (ttl <= Duration::zero()) {
        return LimiterResult<int64_t>::err(invalidTtl(key));
    }
    auto& shard = impl_->shardFor(key);
    std::lock_guard lock(shard.mutex);

    auto now = impl_->clock->now();
    int64_t current = 0;
    if (auto* entry = impl_->findLive(shard, key, now)) {
        const auto& v = entry->value;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), current);
        if (ec != std::errc{} || ptr != v.data() + v.size()) {
            return LimiterResult<int64_t>::err(
                LimiterError(ErrorCode::InvalidArgument,
                             "value is not an integer for key: " + std::string(key)));
        }
    }

    int64_t updated = current + delta;
    shard.entries[std::string(key)] = Entry{std::to_string(updated), now + ttl};
    impl_->noteWrite(shard, now);
    return LimiterResult<int64_t>::ok(updated);
}

LimiterResult<bool> MemoryStore::compareAndSwap(
    std::string_view key, const std::optional<std::string>& expected,
    std::string_view desired, Duration ttl, Deadline /*deadline*/) {
    if (ttl <= Duration::zero()) {
        return LimiterResult<bool>::err(invalidTtl(key));
    }
    auto& shard = impl_->shardFor(key);
    std::lock_guard lock(shard.mutex);

    auto now = impl_->clock->now();
    auto* entry = impl_->findLive(shard, key, now);

    bool matches = expected.has_value()
        ? (entry != nullptr && entry->value == *expected)
        : (entry == nullptr);
    if (!matches) {
        return LimiterResult<bool>::ok(false);
    }

    shard.entries[std::string(key)] = Entry{std::string(desired), now + ttl};
    impl_->noteWrite(shard, now);
    return LimiterResult<bool>::ok(true);
}

LimiterResult<bool> MemoryStore::remove(std::string_view key, Deadline /*deadline*/) {
    auto& shard = impl_->shardFor(key);
    std::lock_guard lock(shard.mutex);

    if (impl_->findLive(shard, key, impl_->clock->now()) == nullptr) {
        return LimiterResult<bool>::ok(false);
    }
    shard.entries.erase(std::string(key));
    return LimiterResult<bool>::ok(true);
}

std::size_t MemoryStore::size() const {
    auto now = impl_->clock->now();
    std::size_t count = 0;
    for (const auto& shard : impl_->shards) {
        std::lock_guard lock(shard.mutex);
        count += static_cast<std::size_t>(std::count_if(
            shard.entries.begin(), shard.entries.end(),
            [now](const auto& kv) { return kv.second.expiresAt > now; }));
    }
    return count;
}

std::size_t MemoryStore::heldEntries() const {
    std::size_t count = 0;
    for (const auto& shard : impl_->shards) {
        std::lock_guard lock(shard.mutex);
        count += shard.entries.size();
    }
    return count;
}

std::size_t MemoryStore::purgeExpired() {
    auto now = impl_->clock->now();
    std::size_t removed = 0;
    for (auto& shard : impl_->shards) {
        std::lock_guard lock(shard.mutex);
        removed += eraseExpired(shard, now);
    }
    return removed;
}

} // namespace rk::store
