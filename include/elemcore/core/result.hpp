#pragma once

/// @file result.hpp
/// @brief Result<T,E>: success value or error, no exceptions.

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

namespace elemcore {

/// Outcome of an operation that can be rejected.
///
/// Modifier registration, configuration loading and element-name parsing
/// return a Result; lookups with a documented neutral default (affinity,
/// resistance, missing stats) return the default instead.
///
/// The engine instantiates this through foundation::EngineResult<T>.
///
/// Example:
/// @code
///   auto element = parseElement("Fire");
///   if (element) {
///       table.Set(element.value(), ElementType::Water, 0.5f);
///   } else {
///       log(element.error().message());
///   }
/// @endcode
template <typename T, typename E>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Throws std::bad_variant_access when holding an error.
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Throws std::bad_variant_access when holding a value.
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    std::variant<T, E> data_;
};

/// Pass/fail outcome carrying only the error.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool hasError() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Throws std::bad_optional_access on success.
    [[nodiscard]] const E& error() const& { return error_.value(); }

private:
    Result() = default;
    explicit Result(E error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace elemcore
