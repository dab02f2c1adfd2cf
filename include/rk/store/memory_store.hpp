#pragma once

/// @file memory_store.hpp
/// @brief In-process Store backend with striped locking and TTL expiry.

#include <cstddef>
#include <memory>

#include "rk/foundation/clock.hpp"
#include "rk/store/store.hpp"

namespace rk::store {

/// Configuration for a MemoryStore.
struct MemoryStoreConfig {
    /// Number of lock stripes; keys are assigned by hash.
    std::size_t shardCount = 64;

    /// Writes to a shard between sweeps of its expired entries (0 disables).
    std::size_t sweepEveryWrites = 128;
};

/// Single-process Store keeping entries in hash-striped shards.
///
/// Each shard owns a mutex and its slice of the key space, so calls for
/// different keys rarely contend and never wait on a global lock. Expiry is
/// judged against the injected Clock. Expired entries are dropped when their
/// key is touched, by a sweep of the locked shard every sweepEveryWrites
/// writes to it, or in bulk by purgeExpired().
///
/// Example:
/// @code
///   auto store = std::make_shared<MemoryStore>(systemClock());
///   auto swapped = store->compareAndSwap("k", std::nullopt, "v1",
///                                        std::chrono::seconds(10),
///                                        deadlineAfter(50ms));
/// @endcode
class MemoryStore final : public Store {
public:
    explicit MemoryStore(std::shared_ptr<const foundation::Clock> clock,
                         MemoryStoreConfig config = {});
    ~MemoryStore() override;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    [[nodiscard]] foundation::LimiterResult<std::optional<std::string>> get(
        std::string_view key, Deadline deadline) override;

    [[nodiscard]] foundation::LimiterResult<void> set(
        std::string_view key, std::string_view value,
        foundation::Duration ttl, Deadline deadline) override;

    [[nodiscard]] foundation::LimiterResult<int64_t> increment(
        std::string_view key, int64_t delta,
        foundation::Duration ttl, Deadline deadline) override;

    [[nodiscard]] foundation::LimiterResult<bool> compareAndSwap(
        std::string_view key, const std::optional<std::string>& expected,
        std::string_view desired, foundation::Duration ttl, Deadline deadline) override;

    [[nodiscard]] foundation::LimiterResult<bool> remove(
        std::string_view key, Deadline deadline) override;

    /// Number of live (unexpired) entries.
    [[nodiscard]] std::size_t size() const;

    /// Number of entries held, expired or not, until a sweep reclaims them.
    [[nodiscard]] std::size_t heldEntries() const;

    /// Drop every expired entry. @return Number of entries removed.
    std::size_t purgeExpired();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rk::store
