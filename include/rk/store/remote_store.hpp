#pragma once

/// @file remote_store.hpp
/// @brief Store backend shared across processes through a Redis-protocol server.

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "rk/store/kv_connection.hpp"
#include "rk/store/store.hpp"

namespace rk::store {

/// Configuration for a RemoteStore.
struct RemoteStoreConfig {
    /// Maximum number of simultaneously open connections.
    std::size_t maxConnections = 8;
};

/// Pool statistics snapshot.
struct RemotePoolStats {
    std::size_t idle = 0;
    std::size_t open = 0;
    uint64_t created = 0;
    uint64_t discarded = 0;
};

/// Store that keeps every key on a networked Redis-compatible server.
///
/// Plain reads and writes map to GET/SET/DEL. increment() and
/// compareAndSwap() run as server-side Lua scripts, so each executes
/// atomically in a single round-trip and never leaves a key half-updated.
/// Scripts are invoked by SHA-1 (EVALSHA) and re-sent in full (EVAL) when
/// the server answers NOSCRIPT.
///
/// Connections come from a bounded pool: a caller waits for a free
/// connection only until its deadline, then fails with StoreTimeout.
/// Connections that hit a transport error are discarded.
///
/// Example:
/// @code
///   auto store = std::make_shared<RemoteStore>(
///       respConnectionFactory({.host = "cache.internal", .port = 6379}));
/// @endcode
class RemoteStore final : public Store {
public:
    explicit RemoteStore(KvConnectionFactory factory, RemoteStoreConfig config = {});
    ~RemoteStore() override;

    RemoteStore(const RemoteStore&) = delete;
    RemoteStore& operator=(const RemoteStore&) = delete;

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

    [[nodiscard]] RemotePoolStats poolStats() const;

    /// KEYS[1] = key; ARGV = {hasExpected ("1"/"0"), expected, desired, ttlMillis}.
    /// Returns 1 if swapped, 0 on conflict.
    static constexpr std::string_view kCompareAndSwapScript =
        "local cur = redis.call('GET', KEYS[1])\n"
        "if ARGV[1] == '1' then\n"
        "  if cur ~= ARGV[2] then return 0 end\n"
        "elseif cur then\n"
        "  return 0\n"
        "end\n"
        "redis.call('SET', KEYS[1], ARGV[3], 'PX', ARGV[4])\n"
        "return 1\n";

    /// KEYS[1] = key; ARGV = {delta, ttlMillis}. Returns the new value.
    static constexpr std::string_view kIncrementScript =
        "local v = redis.call('INCRBY', KEYS[1], ARGV[1])\n"
        "redis.call('PEXPIRE', KEYS[1], ARGV[2])\n"
        "return v\n";

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Lowercase hex SHA-1 digest, as used by EVALSHA.
[[nodiscard]] std::string scriptSha1(std::string_view script);

/// TTL in whole milliseconds, rounded up (PX arguments must be integers).
[[nodiscard]] int64_t ttlMillis(foundation::Duration ttl);

} // namespace rk::store
