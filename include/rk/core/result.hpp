#pragma once

/// @file result.hpp
/// @brief Result<T, E>: either a success value or an error, never both.

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace rk {

/// Outcome of an operation that can fail without throwing.
///
/// Store calls, algorithm transitions and configuration loading all return
/// a Result. Callers branch on hasError() and either hand the error to the
/// limiter's failure policy or pass it up unchanged.
///
/// @tparam T Success value type.
/// @tparam E Error type; ratekeeper uses foundation::LimiterError throughout.
///
/// Example:
/// @code
///   auto result = limiter.decide("user-42");
///   if (result.hasError()) {
///       return result.error().code();
///   }
///   bool allowed = result.value().allowed;
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<kValue>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<kError>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == kValue; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == kError; }

    /// Undefined behavior unless hasValue().
    [[nodiscard]] const T& value() const& { return std::get<kValue>(data_); }
    [[nodiscard]] T& value() & { return std::get<kValue>(data_); }
    [[nodiscard]] T&& value() && { return std::get<kValue>(std::move(data_)); }

    /// Undefined behavior unless hasError().
    [[nodiscard]] const E& error() const& { return std::get<kError>(data_); }

private:
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    // Indexed, so T and E may even be the same type.
    std::variant<T, E> data_;
};

/// Result of an operation that yields nothing on success.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(std::nullopt); }
    static Result err(E error) { return Result(std::optional<E>(std::move(error))); }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }

    /// Undefined behavior unless hasError().
    [[nodiscard]] const E& error() const& { return *error_; }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

}  // namespace rk
