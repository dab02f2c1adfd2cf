/// @file http_headers.cpp
/// @brief Decision to HTTP header mapping.

#include "rk/limiter/http_headers.hpp"

#include <chrono>

namespace rk::limiter {

int httpStatusFor(const Decision& decision) noexcept {
    return decision.allowed ? kHttpOk : kHttpTooManyRequests;
}

std::vector<HttpHeader> rateLimitHeaders(const Decision& decision) {
    std::vector<HttpHeader> headers;
    headers.reserve(4);

    headers.emplace_back("X-RateLimit-Limit", std::to_string(decision.limit));
    if (decision.remaining != kUnknownRemaining) {
        headers.emplace_back("X-RateLimit-Remaining", std::to_string(decision.remaining));
    }

    auto resetSecs = std::chrono::ceil<std::chrono::seconds>(decision.resetAt.time_since_epoch());
    headers.emplace_back("X-RateLimit-Reset", std::to_string(resetSecs.count()));

    if (!decision.allowed && decision.retryAfter) {
        auto wait = std::chrono::ceil<std::chrono::seconds>(*decision.retryAfter);
        if (wait < std::chrono::seconds{0}) {
            wait = std::chrono::seconds{0};
        }
        headers.emplace_back("Retry-After", std::to_string(wait.count()));
    }
    return headers;
}

} // namespace rk::limiter
