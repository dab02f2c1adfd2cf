#pragma once

/// @file kv_connection.hpp
/// @brief Connection seam between RemoteStore and a networked key/value server.

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "rk/foundation/limiter_result.hpp"
#include "rk/store/store.hpp"

namespace rk::store {

/// One reply from a Redis-protocol server, detached from the client library.
struct RespValue {
    enum class Type : uint8_t {
        SimpleString,  ///< +OK
        Error,         ///< -ERR ...
        Integer,       ///< :42
        BulkString,    ///< $3\r\nfoo
        Nil,           ///< $-1 or *-1
        Array          ///< *2 ...
    };

    Type type = Type::Nil;
    std::string text;                 ///< SimpleString, Error and BulkString payload.
    int64_t integer = 0;              ///< Integer payload.
    std::vector<RespValue> elements;  ///< Array payload.

    [[nodiscard]] bool isError() const noexcept { return type == Type::Error; }
    [[nodiscard]] bool isNil() const noexcept { return type == Type::Nil; }

    static RespValue simple(std::string s) { return make(Type::SimpleString, std::move(s)); }
    static RespValue error(std::string s) { return make(Type::Error, std::move(s)); }
    static RespValue bulk(std::string s) { return make(Type::BulkString, std::move(s)); }
    static RespValue nil() { return RespValue{}; }

    static RespValue integerValue(int64_t v) {
        RespValue out;
        out.type = Type::Integer;
        out.integer = v;
        return out;
    }

    static RespValue array(std::vector<RespValue> items) {
        RespValue out;
        out.type = Type::Array;
        out.elements = std::move(items);
        return out;
    }

private:
    static RespValue make(Type type, std::string text) {
        RespValue out;
        out.type = type;
        out.text = std::move(text);
        return out;
    }
};

/// One established connection to a Redis-protocol server.
///
/// execute() sends a single command and waits for its reply until the
/// deadline. A server-side error reply is returned as a RespValue of type
/// Error, not as a LimiterError; LimiterErrors are reserved for transport
/// failures (StoreUnavailable, StoreTimeout, StoreProtocolError), after
/// which the connection reports itself unhealthy.
class KvConnection {
public:
    virtual ~KvConnection() = default;

    [[nodiscard]] virtual foundation::LimiterResult<RespValue> execute(
        const std::vector<std::string>& args, Deadline deadline) = 0;

    /// False once a transport failure has left the stream in an unknown state.
    [[nodiscard]] virtual bool isHealthy() const = 0;
};

/// Creates new connections on demand for a RemoteStore pool.
using KvConnectionFactory =
    std::function<foundation::LimiterResult<std::unique_ptr<KvConnection>>(Deadline)>;

} // namespace rk::store
