#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the rate limiter.

#include <cstdint>
#include <string_view>

namespace rk::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone. The Config
/// range is the ConfigurationError class (never retried); the Store range
/// is the StoreUnavailable class (governed by the failure policy).
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Config (0x0100 - 0x01FF)
    ConfigLoadFailed = 0x0100,
    ConfigKeyNotFound = 0x0101,
    ConfigTypeMismatch = 0x0102,
    InvalidCapacity = 0x0103,
    InvalidWindow = 0x0104,
    InvalidRefillRate = 0x0105,
    InvalidCost = 0x0106,
    CostExceedsCapacity = 0x0107,
    UnknownAlgorithm = 0x0108,
    UnknownFailurePolicy = 0x0109,
    InvalidStoreOptions = 0x010A,

    // Store (0x0200 - 0x02FF)
    StoreUnavailable = 0x0200,
    StoreTimeout = 0x0201,
    StoreProtocolError = 0x0202,
    ContentionExhausted = 0x0203,
    CorruptState = 0x0204,

    // Logger (0x0300 - 0x03FF)
    LoggerError = 0x0300,
    LoggerNotInitialized = 0x0301,
    LoggerFlushFailed = 0x0302,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Config";
        case 0x0200: return "Store";
        case 0x0300: return "Logger";
        default: return "Unknown";
    }
}

/// True for invalid quota parameters and other permanent caller errors.
constexpr bool isConfigurationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0100;
}

/// True for errors the failure policy converts into a Decision.
constexpr bool isStoreFailure(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0200;
}

} // namespace rk::foundation
