#pragma once

/// @file limiter_result.hpp
/// @brief LimiterResult<T> type alias for limiter error handling.

#include "rk/core/result.hpp"
#include "rk/foundation/limiter_error.hpp"

namespace rk::foundation {

/// Result type specialized with LimiterError.
///
/// Every store backend, algorithm and the limiter facade return
/// LimiterResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   LimiterResult<int64_t> checkCost(int64_t cost) {
///       if (cost <= 0) {
///           return LimiterResult<int64_t>::err(
///               LimiterError(ErrorCode::InvalidCost, "cost must be positive"));
///       }
///       return LimiterResult<int64_t>::ok(cost);
///   }
/// @endcode
template <typename T>
using LimiterResult = rk::Result<T, LimiterError>;

}  // namespace rk::foundation
