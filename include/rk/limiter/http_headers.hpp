#pragma once

/// @file http_headers.hpp
/// @brief Mapping of a Decision onto HTTP status and rate-limit headers.
///
/// The limiter does not serve HTTP itself; an embedding gateway calls these
/// helpers to surface a decision to its clients.

#include <string>
#include <utility>
#include <vector>

#include "rk/limiter/decision.hpp"

namespace rk::limiter {

inline constexpr int kHttpOk = 200;
inline constexpr int kHttpTooManyRequests = 429;

/// Header name/value pair, in emission order.
using HttpHeader = std::pair<std::string, std::string>;

/// 200 for an admitted request, 429 Too Many Requests for a denied one.
[[nodiscard]] int httpStatusFor(const Decision& decision) noexcept;

/// Rate-limit headers for @p decision:
///
/// | Header                | Value                                        |
/// |-----------------------|----------------------------------------------|
/// | X-RateLimit-Limit     | decision.limit                               |
/// | X-RateLimit-Remaining | decision.remaining (omitted when unknown)    |
/// | X-RateLimit-Reset     | resetAt as epoch seconds, rounded up         |
/// | Retry-After           | retryAfter in whole seconds, rounded up;     |
/// |                       | denied decisions only                        |
[[nodiscard]] std::vector<HttpHeader> rateLimitHeaders(const Decision& decision);

} // namespace rk::limiter
