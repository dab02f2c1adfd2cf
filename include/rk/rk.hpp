#pragma once

/// @file rk.hpp
/// @brief Umbrella header for the ratekeeper library.

#include "rk/version.hpp"
#include "rk/core/result.hpp"

#include "rk/foundation/clock.hpp"
#include "rk/foundation/config_manager.hpp"
#include "rk/foundation/error_code.hpp"
#include "rk/foundation/limiter_error.hpp"
#include "rk/foundation/limiter_logger.hpp"
#include "rk/foundation/limiter_result.hpp"

#include "rk/store/memory_store.hpp"
#include "rk/store/remote_store.hpp"
#include "rk/store/resp_connection.hpp"
#include "rk/store/store.hpp"

#include "rk/limiter/decision.hpp"
#include "rk/limiter/http_headers.hpp"
#include "rk/limiter/limiter_config.hpp"
#include "rk/limiter/limiter_registry.hpp"
#include "rk/limiter/rate_limiter.hpp"
