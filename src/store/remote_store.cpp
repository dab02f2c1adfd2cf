/// @file remote_store.cpp
/// @brief RemoteStore implementation: bounded connection pool plus
///        Lua-scripted atomic primitives.

#include "rk/store/remote_store.hpp"

#include "rk/foundation/limiter_logger.hpp"

#include <openssl/evp.h>

#include <condition_variable>
#include <mutex>
#include <utility>
#include <vector>

namespace rk::store {

using foundation::Duration;
using foundation::ErrorCode;
using foundation::LimiterError;
using foundation::LimiterResult;
using foundation::LogCategory;
using foundation::StoreFailure;

std::string scriptSha1(std::string_view script) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(script.data(), script.size(), digest, &length, EVP_sha1(), nullptr) != 1) {
        return {};
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        out += kHex[digest[i] >> 4];
        out += kHex[digest[i] & 0x0F];
    }
    return out;
}

int64_t ttlMillis(Duration ttl) {
    auto ms = std::chrono::ceil<std::chrono::milliseconds>(ttl).count();
    return ms < 1 ? 1 : ms;
}

// ── Impl ────────────────────────────────────────────────────────────────────

struct RemoteStore::Impl {
    KvConnectionFactory factory;
    RemoteStoreConfig config;
    std::string casSha;
    std::string incrementSha;

    mutable std::mutex mutex;
    std::condition_variable available;
    std::vector<std::unique_ptr<KvConnection>> idle;
    std::size_t open{0};
    uint64_t created{0};
    uint64_t discarded{0};

    Impl(KvConnectionFactory f, RemoteStoreConfig cfg)
        : factory(std::move(f)),
          config(cfg),
          casSha(scriptSha1(kCompareAndSwapScript)),
          incrementSha(scriptSha1(kIncrementScript)) {
        if (config.maxConnections == 0) {
            config.maxConnections = 1;
        }
    }

    /// Connection checked out of the pool; returned (or discarded) on scope exit.
    class Lease {
    public:
        Lease(Impl& pool, std::unique_ptr<KvConnection> conn)
            : pool_(&pool), conn_(std::move(conn)) {}
        ~Lease() {
            if (conn_) {
                pool_->release(std::move(conn_));
            }
        }
        Lease(Lease&& other) noexcept
            : pool_(other.pool_), conn_(std::move(other.conn_)) {}
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        KvConnection& operator*() { return *conn_; }
        KvConnection* operator->() { return conn_.get(); }

    private:
        Impl* pool_;
        std::unique_ptr<KvConnection> conn_;
    };

    LimiterResult<Lease> acquire(Deadline deadline) {
        std::unique_lock lock(mutex);
        bool ready = available.wait_until(lock, deadline, [this] {
            return !idle.empty() || open < config.maxConnections;
        });
        if (!ready) {
            return LimiterResult<Lease>::err(LimiterError(
                ErrorCode::StoreTimeout, "timed out waiting for a store connection"));
        }

        if (!idle.empty()) {
            auto conn = std::move(idle.back());
            idle.pop_back();
            return LimiterResult<Lease>::ok(Lease(*this, std::move(conn)));
        }

        ++open;
        lock.unlock();

        auto conn = factory(deadline);
        if (conn.hasError()) {
            lock.lock();
            --open;
            lock.unlock();
            available.notify_one();
            return LimiterResult<Lease>::err(conn.error());
        }

        lock.lock();
        ++created;
        lock.unlock();
        return LimiterResult<Lease>::ok(Lease(*this, std::move(conn).value()));
    }

    void release(std::unique_ptr<KvConnection> conn) {
        {
            std::lock_guard lock(mutex);
            if (conn->isHealthy()) {
                idle.push_back(std::move(conn));
            } else {
                --open;
                ++discarded;
            }
        }
        available.notify_one();
    }

    /// Tag @p error with the command and key it belongs to.
    static LimiterError located(const LimiterError& error, std::string_view op,
                                std::string_view key) {
        return error.withContext(StoreFailure{std::string(op), std::string(key), 0});
    }

    /// Run one command; args[1] is always the key.
    LimiterResult<RespValue> command(const std::vector<std::string>& args, Deadline deadline) {
        auto lease = acquire(deadline);
        if (lease.hasError()) {
            return LimiterResult<RespValue>::err(located(lease.error(), args[0], args[1]));
        }
        auto reply = lease.value()->execute(args, deadline);
        if (reply.hasError()) {
            return LimiterResult<RespValue>::err(located(reply.error(), args[0], args[1]));
        }
        return reply;
    }

    /// Run a cached script, loading it on NOSCRIPT.
    LimiterResult<RespValue> script(std::string_view body, const std::string& sha,
                                    std::string_view key, std::vector<std::string> argv,
                                    Deadline deadline) {
        auto lease = acquire(deadline);
        if (lease.hasError()) {
            return LimiterResult<RespValue>::err(located(lease.error(), "EVALSHA", key));
        }

        std::vector<std::string> cmd{"EVALSHA", sha, "1", std::string(key)};
        cmd.insert(cmd.end(), argv.begin(), argv.end());
        auto reply = lease.value()->execute(cmd, deadline);
        if (reply.hasError()) {
            return LimiterResult<RespValue>::err(located(reply.error(), "EVALSHA", key));
        }
        if (!reply.value().isError() || reply.value().text.rfind("NOSCRIPT", 0) != 0) {
            return reply;
        }

        RK_LOG_DEBUG(LogCategory::Store, "script cache miss, sending EVAL");
        cmd[0] = "EVAL";
        cmd[1] = std::string(body);
        reply = lease.value()->execute(cmd, deadline);
        if (reply.hasError()) {
            return LimiterResult<RespValue>::err(located(reply.error(), "EVAL", key));
        }
        return reply;
    }
};

namespace {

LimiterError replyError(std::string_view op, std::string_view key, const RespValue& reply) {
    auto code = reply.text.find("not an integer") != std::string::npos
                    ? ErrorCode::InvalidArgument
                    : ErrorCode::StoreProtocolError;
    return LimiterError(code, std::string(op) + ": " + reply.text,
                        StoreFailure{std::string(op), std::string(key), 0});
}

LimiterError unexpectedReply(std::string_view op, std::string_view key) {
    return LimiterError(ErrorCode::StoreProtocolError,
                        std::string("unexpected reply type for ") + std::string(op),
                        StoreFailure{std::string(op), std::string(key), 0});
}

LimiterError invalidTtl(std::string_view key) {
    return LimiterError(ErrorCode::InvalidArgument,
                        "ttl must be positive for key: " + std::string(key));
}

} // anonymous namespace

// ── Public API ──────────────────────────────────────────────────────────────

RemoteStore::RemoteStore(KvConnectionFactory factory, RemoteStoreConfig config)
    : impl_(std::make_unique<Impl>(std::move(factory), config)) {}

RemoteStore::~RemoteStore() = default;

LimiterResult<std::optional<std::string>> RemoteStore::get(std::string_view key,
                                                           Deadline deadline) {
    using R = LimiterResult<std::optional<std::string>>;
    auto reply = impl_->command({"GET", std::string(key)}, deadline);
    if (reply.hasError()) {
        return R::err(reply.error());
    }
    const auto& v = reply.value();
    switch (v.type) {
        case RespValue::Type::Nil:
            return R::ok(std::nullopt);
        case RespValue::Type::BulkString:
            return R::ok(v.text);
        case RespValue::Type::Error:
            return R::err(replyError("GET", key, v));
        default:
            return R::err(unexpectedReply("GET", key));
    }
}

LimiterResult<void> RemoteStore::set(std::string_view key, std::string_view value,
                                     Duration ttl, Deadline deadline) {
    if (ttl <= Duration::zero()) {
        return LimiterResult<void>::err(invalidTtl(key));
    }
    auto reply = impl_->command(
        {"SET", std::string(key), std::string(value), "PX", std::to_string(ttlMillis(ttl))},
        deadline);
    if (reply.hasError()) {
        return LimiterResult<void>::err(reply.error());
    }
    if (reply.value().isError()) {
        return LimiterResult<void>::err(replyError("SET", key, reply.value()));
    }
    return LimiterResult<void>::ok();
}

LimiterResult<int64_t> RemoteStore::increment(std::string_view key, int64_t delta,
                                              Duration ttl, Deadline deadline) {
    if (ttl <= Duration::zero()) {
        return LimiterResult<int64_t>::err(invalidTtl(key));
    }
    auto reply = impl_->script(kIncrementScript, impl_->incrementSha, key,
                               {std::to_string(delta), std::to_string(ttlMillis(ttl))},
                               deadline);
    if (reply.hasError()) {
        return LimiterResult<int64_t>::err(reply.error());
    }
    const auto& v = reply.value();
    if (v.isError()) {
        return LimiterResult<int64_t>::err(replyError("INCRBY", key, v));
    }
    if (v.type != RespValue::Type::Integer) {
        return LimiterResult<int64_t>::err(unexpectedReply("INCRBY", key));
    }
    return LimiterResult<int64_t>::ok(v.integer);
}

LimiterResult<bool> RemoteStore::compareAndSwap(std::string_view key,
                                                const std::optional<std::string>& expected,
                                                std::string_view desired, Duration ttl,
                                                Deadline deadline) {
    if (ttl <= Duration::zero()) {
        return LimiterResult<bool>::err(invalidTtl(key));
    }
    auto reply = impl_->script(
        kCompareAndSwapScript, impl_->casSha, key,
        {expected ? "1" : "0", expected.value_or(std::string()), std::string(desired),
         std::to_string(ttlMillis(ttl))},
        deadline);
    if (reply.hasError()) {
        return LimiterResult<bool>::err(reply.error());
    }
    const auto& v = reply.value();
    if (v.isError()) {
        return LimiterResult<bool>::err(replyError("CAS", key, v));
    }
    if (v.type != RespValue::Type::Integer) {
        return LimiterResult<bool>::err(unexpectedReply("CAS", key));
    }
    return LimiterResult<bool>::ok(v.integer == 1);
}

LimiterResult<bool> RemoteStore::remove(std::string_view key, Deadline deadline) {
    auto reply = impl_->command({"DEL", std::string(key)}, deadline);
    if (reply.hasError()) {
        return LimiterResult<bool>::err(reply.error());
    }
    const auto& v = reply.value();
    if (v.isError()) {
        return LimiterResult<bool>::err(replyError("DEL", key, v));
    }
    if (v.type != RespValue::Type::Integer) {
        return LimiterResult<bool>::err(unexpectedReply("DEL", key));
    }
    return LimiterResult<bool>::ok(v.integer > 0);
}

RemotePoolStats RemoteStore::poolStats() const {
    std::lock_guard lock(impl_->mutex);
    RemotePoolStats stats;
    stats.idle = impl_->idle.size();
    stats.open = impl_->open;
    stats.created = impl_->created;
    stats.discarded = impl_->discarded;
    return stats;
}

} // namespace rk::store
