#pragma once

/// @file limiter_error.hpp
/// @brief Limiter error type used with Result<T, LimiterError>.

#include <any>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "rk/foundation/error_code.hpp"

namespace rk::foundation {

/// Where a Store-range failure happened.
///
/// Store backends attach the command and key; the CAS driver adds how many
/// attempts it made. The failure policy copies these into its log line.
struct StoreFailure {
    std::string operation;  ///< "GET", "EVALSHA", "CAS", "decode", ...
    std::string key;        ///< Full store key; empty for connection setup.
    uint32_t attempts = 0;  ///< CAS attempts made; 0 outside the CAS loop.
};

/// Error code plus message, with optional type-erased context.
///
/// Example:
/// @code
///   return LimiterResult<bool>::err(
///       LimiterError(ErrorCode::StoreTimeout, "no reply before deadline",
///                    StoreFailure{"GET", "rk:api:user-42"}));
/// @endcode
class LimiterError {
public:
    LimiterError() = default;

    LimiterError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    LimiterError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Subsystem range the code belongs to ("Config", "Store", ...).
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }

    /// True when the limiter's failure policy may turn this into a Decision.
    [[nodiscard]] bool isStoreFailure() const noexcept {
        return foundation::isStoreFailure(code_);
    }

    /// Same code and message with @p context in place of any previous one.
    [[nodiscard]] LimiterError withContext(std::any context) const {
        return LimiterError(code_, message_, std::move(context));
    }

    /// Typed context, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace rk::foundation
