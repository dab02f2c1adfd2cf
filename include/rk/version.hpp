#pragma once

/// @file version.hpp
/// @brief Library version and the version of the persisted state format.

#define RK_VERSION_MAJOR 0
#define RK_VERSION_MINOR 1
#define RK_VERSION_PATCH 0
#define RK_VERSION_STRING "0.1.0"

/// Bumped whenever the encoding of per-key limiter state changes. Records
/// written under another format version decode as CorruptState, so a mixed
/// fleet never misreads a neighbour's quota.
#define RK_STATE_FORMAT_VERSION 1

namespace rk {

struct Version {
    static constexpr int major = RK_VERSION_MAJOR;
    static constexpr int minor = RK_VERSION_MINOR;
    static constexpr int patch = RK_VERSION_PATCH;
    static constexpr const char* string = RK_VERSION_STRING;

    /// Leading tag of every stored state record ("v1" for format 1).
    static constexpr int stateFormat = RK_STATE_FORMAT_VERSION;
    static constexpr const char* stateTag = "v1";

    static_assert(RK_STATE_FORMAT_VERSION == 1, "update stateTag with the format version");
};

} // namespace rk
