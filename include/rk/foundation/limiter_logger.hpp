#pragma once

/// @file limiter_logger.hpp
/// @brief LimiterLogger wrapping kcenon logger_system for structured limiter logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rk/foundation/limiter_result.hpp"

namespace rk::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories for structured filtering.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Limiter facade and registry
    Store     = 1, ///< Store backends and connections
    Algorithm = 2, ///< Per-key state transitions
    Config    = 3  ///< Configuration loading and validation
};

/// Total number of log categories.
inline constexpr std::size_t kLogCategoryCount = 4;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Store", "Algorithm", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.key = "user-42";
///   ctx.algorithm = "token_bucket";
///   ctx.extra["error"] = "store timeout";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Core,
///                         "failure policy applied", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> key;
    std::optional<std::string> algorithm;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Limiter logger wrapping kcenon's logging system.
///
/// Uses PIMPL to hide kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Store     | Info          |
/// | Algorithm | Debug         |
/// | Config    | Info          |
class LimiterLogger {
public:
    LimiterLogger();
    ~LimiterLogger();

    // Non-copyable, movable.
    LimiterLogger(const LimiterLogger&) = delete;
    LimiterLogger& operator=(const LimiterLogger&) = delete;
    LimiterLogger(LimiterLogger&&) noexcept;
    LimiterLogger& operator=(LimiterLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context data.
    /// Context fields are appended as key-value pairs to the log message.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    LimiterResult<void> flush();

    /// Get the global LimiterLogger singleton instance.
    static LimiterLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rk::foundation

/// @name RK_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// RK_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef RK_MIN_LOG_LEVEL
    #define RK_MIN_LOG_LEVEL 0
#endif

#define RK_LOG(level, cat, msg)                                                  \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= RK_MIN_LOG_LEVEL &&                       \
            ::rk::foundation::LimiterLogger::instance().isEnabled((level), (cat))) \
        {                                                                        \
            ::rk::foundation::LimiterLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define RK_LOG_DEBUG(cat, msg) \
    RK_LOG(::rk::foundation::LogLevel::Debug, (cat), (msg))

#define RK_LOG_INFO(cat, msg) \
    RK_LOG(::rk::foundation::LogLevel::Info, (cat), (msg))

#define RK_LOG_WARN(cat, msg) \
    RK_LOG(::rk::foundation::LogLevel::Warning, (cat), (msg))

#define RK_LOG_ERROR(cat, msg) \
    RK_LOG(::rk::foundation::LogLevel::Error, (cat), (msg))

/// @}
