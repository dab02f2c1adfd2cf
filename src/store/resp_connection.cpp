/// @file resp_connection.cpp
/// @brief RespConnection implementation over a blocking hiredis context.
///
/// Every call re-arms the context's socket timeout with the time left until
/// the caller's deadline, so a connection never blocks past it.

#include "rk/store/resp_connection.hpp"

#include "rk/foundation/limiter_logger.hpp"

#include <hiredis/hiredis.h>

#include <cerrno>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <sys/time.h>

namespace rk::store {

using foundation::ErrorCode;
using foundation::LimiterError;
using foundation::LimiterResult;
using foundation::LogCategory;

namespace {

struct ContextDeleter {
    void operator()(redisContext* ctx) const noexcept { redisFree(ctx); }
};
using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;

struct ReplyDeleter {
    void operator()(redisReply* reply) const noexcept { freeReplyObject(reply); }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

/// Time left until @p deadline as a timeval; nullopt once it has passed.
std::optional<timeval> timeLeft(Deadline deadline) {
    auto left = std::chrono::ceil<std::chrono::microseconds>(
        deadline - std::chrono::steady_clock::now());
    if (left <= std::chrono::microseconds::zero()) {
        return std::nullopt;
    }
    timeval tv{};
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(left.count() / 1'000'000);
    tv.tv_usec = static_cast<decltype(tv.tv_usec)>(left.count() % 1'000'000);
    return tv;
}

LimiterError deadlineExceeded(std::string_view what) {
    return LimiterError(ErrorCode::StoreTimeout,
                        std::string(what) + ": store deadline exceeded");
}

/// Classify the error hiredis left on @p ctx.
LimiterError contextError(const redisContext& ctx, Deadline deadline, std::string_view what) {
    std::string message = std::string(what) + ": " + ctx.errstr;
    bool timedOut = ctx.err == REDIS_ERR_TIMEOUT ||
                    (ctx.err == REDIS_ERR_IO && (errno == EAGAIN || errno == EWOULDBLOCK)) ||
                    std::chrono::steady_clock::now() >= deadline;
    if (timedOut) {
        return LimiterError(ErrorCode::StoreTimeout, std::move(message));
    }
    if (ctx.err == REDIS_ERR_PROTOCOL) {
        return LimiterError(ErrorCode::StoreProtocolError, std::move(message));
    }
    return LimiterError(ErrorCode::StoreUnavailable, std::move(message));
}

/// Copy a hiredis reply tree into library-independent RespValues.
LimiterResult<RespValue> toRespValue(const redisReply& reply) {
    using R = LimiterResult<RespValue>;
    switch (reply.type) {
        case REDIS_REPLY_STRING:
            return R::ok(RespValue::bulk(std::string(reply.str, reply.len)));
        case REDIS_REPLY_STATUS:
            return R::ok(RespValue::simple(std::string(reply.str, reply.len)));
        case REDIS_REPLY_ERROR:
            return R::ok(RespValue::error(std::string(reply.str, reply.len)));
        case REDIS_REPLY_INTEGER:
            return R::ok(RespValue::integerValue(static_cast<int64_t>(reply.integer)));
        case REDIS_REPLY_NIL:
            return R::ok(RespValue::nil());
        case REDIS_REPLY_ARRAY: {
            std::vector<RespValue> items;
            items.reserve(reply.elements);
            for (std::size_t i = 0; i < reply.elements; ++i) {
                auto item = toRespValue(*reply.element[i]);
                if (item.hasError()) {
                    return item;
                }
                items.push_back(std::move(item).value());
            }
            return R::ok(RespValue::array(std::move(items)));
        }
        default:
            // RESP3 types; this client never negotiates protocol 3.
            return R::err(LimiterError(ErrorCode::StoreProtocolError,
                                       "unsupported reply type " + std::to_string(reply.type)));
    }
}

} // anonymous namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct RespConnection::Impl {
    ContextPtr ctx;

    LimiterError failure(LimiterError error) {
        ctx.reset();
        return error;
    }

    LimiterResult<void> open(const RespEndpoint& endpoint, Deadline deadline) {
        auto tv = timeLeft(deadline);
        if (!tv) {
            return LimiterResult<void>::err(deadlineExceeded("connect"));
        }
        ctx.reset(redisConnectWithTimeout(endpoint.host.c_str(), endpoint.port, *tv));
        if (!ctx) {
            return LimiterResult<void>::err(
                LimiterError(ErrorCode::StoreUnavailable, "cannot allocate redis context"));
        }
        if (ctx->err != 0) {
            return LimiterResult<void>::err(failure(contextError(
                *ctx, deadline,
                "connect to " + endpoint.host + ":" + std::to_string(endpoint.port))));
        }
        return LimiterResult<void>::ok();
    }

    LimiterResult<RespValue> command(const std::vector<std::string>& args, Deadline deadline) {
        const std::string_view name = args.empty() ? std::string_view("command") : args.front();
        auto tv = timeLeft(deadline);
        if (!tv) {
            return LimiterResult<RespValue>::err(failure(deadlineExceeded(name)));
        }
        if (redisSetTimeout(ctx.get(), *tv) != REDIS_OK) {
            return LimiterResult<RespValue>::err(
                failure(contextError(*ctx, deadline, "set timeout")));
        }

        std::vector<const char*> argv;
        std::vector<std::size_t> lengths;
        argv.reserve(args.size());
        lengths.reserve(args.size());
        for (const auto& arg : args) {
            argv.push_back(arg.data());
            lengths.push_back(arg.size());
        }

        ReplyPtr reply(static_cast<redisReply*>(redisCommandArgv(
            ctx.get(), static_cast<int>(argv.size()), argv.data(), lengths.data())));
        if (!reply) {
            // The stream position is unknown after a failed round-trip.
            return LimiterResult<RespValue>::err(failure(contextError(*ctx, deadline, name)));
        }

        auto value = toRespValue(*reply);
        if (value.hasError()) {
            return LimiterResult<RespValue>::err(failure(value.error()));
        }
        return value;
    }
};

// ── Public API ──────────────────────────────────────────────────────────────

RespConnection::RespConnection(Passkey) : impl_(std::make_unique<Impl>()) {}

RespConnection::~RespConnection() = default;

LimiterResult<std::unique_ptr<RespConnection>> RespConnection::connect(
    const RespEndpoint& endpoint, Deadline deadline) {
    using R = LimiterResult<std::unique_ptr<RespConnection>>;
    auto conn = std::make_unique<RespConnection>(Passkey{});

    auto opened = conn->impl_->open(endpoint, deadline);
    if (opened.hasError()) {
        RK_LOG_ERROR(LogCategory::Store, std::string(opened.error().message()));
        return R::err(opened.error());
    }

    auto handshake = [&](const std::vector<std::string>& cmd) -> LimiterResult<void> {
        auto reply = conn->execute(cmd, deadline);
        if (reply.hasError()) {
            return LimiterResult<void>::err(reply.error());
        }
        if (reply.value().isError()) {
            conn->impl_->ctx.reset();
            return LimiterResult<void>::err(LimiterError(
                ErrorCode::StoreUnavailable, cmd.front() + " rejected: " + reply.value().text));
        }
        return LimiterResult<void>::ok();
    };

    if (endpoint.password) {
        if (auto r = handshake({"AUTH", *endpoint.password}); r.hasError()) {
            RK_LOG_ERROR(LogCategory::Store, std::string(r.error().message()));
            return R::err(r.error());
        }
    }
    if (endpoint.database != 0) {
        if (auto r = handshake({"SELECT", std::to_string(endpoint.database)}); r.hasError()) {
            RK_LOG_ERROR(LogCategory::Store, std::string(r.error().message()));
            return R::err(r.error());
        }
    }
    return R::ok(std::move(conn));
}

LimiterResult<RespValue> RespConnection::execute(const std::vector<std::string>& args,
                                                 Deadline deadline) {
    if (!impl_->ctx) {
        return LimiterResult<RespValue>::err(
            LimiterError(ErrorCode::StoreUnavailable, "connection is closed"));
    }
    return impl_->command(args, deadline);
}

bool RespConnection::isHealthy() const {
    return impl_->ctx != nullptr;
}

KvConnectionFactory respConnectionFactory(RespEndpoint endpoint) {
    return [endpoint = std::move(endpoint)](Deadline deadline)
               -> LimiterResult<std::unique_ptr<KvConnection>> {
        auto conn = RespConnection::connect(endpoint, deadline);
        if (conn.hasError()) {
            return LimiterResult<std::unique_ptr<KvConnection>>::err(conn.error());
        }
        return LimiterResult<std::unique_ptr<KvConnection>>::ok(std::move(conn).value());
    };
}

} // namespace rk::store
