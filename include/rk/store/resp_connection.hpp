#pragma once

/// @file resp_connection.hpp
/// @brief hiredis-backed connection to a Redis-compatible server.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "rk/store/kv_connection.hpp"

namespace rk::store {

/// Endpoint and session options for RespConnection.
struct RespEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;

    /// Sent with AUTH after connecting when set.
    std::optional<std::string> password;

    /// Logical database selected after connecting (0 = default, no SELECT sent).
    int database = 0;
};

/// Blocking hiredis context whose every wait is bounded by a deadline.
///
/// connect() runs redisConnectWithTimeout with the time left until the
/// deadline, then AUTH and SELECT as configured. execute() sets the socket
/// timeout to what is left of the caller's deadline and issues the command
/// through redisCommandArgv, so keys and values are binary-safe. A timeout
/// or I/O error frees the context and marks the connection unhealthy.
///
/// Example:
/// @code
///   auto conn = RespConnection::connect({.host = "cache", .port = 6379},
///                                       deadlineAfter(100ms));
///   if (conn.hasValue()) {
///       auto pong = conn.value()->execute({"PING"}, deadlineAfter(50ms));
///   }
/// @endcode
class RespConnection final : public KvConnection {
    /// Only connect() can name this, so only connect() can construct.
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    explicit RespConnection(Passkey);
    ~RespConnection() override;

    RespConnection(const RespConnection&) = delete;
    RespConnection& operator=(const RespConnection&) = delete;

    /// Connect and run AUTH/SELECT as configured.
    [[nodiscard]] static foundation::LimiterResult<std::unique_ptr<RespConnection>> connect(
        const RespEndpoint& endpoint, Deadline deadline);

    [[nodiscard]] foundation::LimiterResult<RespValue> execute(
        const std::vector<std::string>& args, Deadline deadline) override;

    [[nodiscard]] bool isHealthy() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Factory producing RespConnections to @p endpoint, for RemoteStore.
[[nodiscard]] KvConnectionFactory respConnectionFactory(RespEndpoint endpoint);

} // namespace rk::store
