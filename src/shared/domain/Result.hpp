/**
 * @file Result.hpp
 * @brief Success-or-failure return type for fallible domain factories
 */

#pragma once

#include "shared/exception/DomainException.hpp"
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace shared::domain {

/**
 * @brief Outcome of a fallible operation
 *
 * Holds either a value of type T or a human-readable failure message, never
 * both. Invalid input is an expected outcome and travels as a failed Result;
 * reading the wrong side is a contract violation and throws DomainException.
 *
 * @tparam T The type of the success value
 */
template<typename T>
class Result {
private:
    std::optional<T> value_;
    std::string error_;

    Result(std::optional<T> value, std::string error)
        : value_(std::move(value)),
          error_(std::move(error)) {}

public:
    using value_type = T;

    /**
     * @brief Create a successful result
     */
    static Result success(T value) {
        return Result(std::optional<T>(std::move(value)), std::string());
    }

    /**
     * @brief Create a failed result
     * @param error Human-readable failure message
     */
    static Result failure(std::string error) {
        return Result(std::nullopt, std::move(error));
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return value_.has_value();
    }

    [[nodiscard]] bool isFailure() const noexcept {
        return !value_.has_value();
    }

    explicit operator bool() const noexcept {
        return isSuccess();
    }

    /**
     * @brief Get the success value
     * @throws shared::exception::DomainException if this is a failure
     */
    [[nodiscard]] const T& getValue() const& {
        if (!value_) {
            throw shared::exception::DomainException(
                "RESULT_HAS_NO_VALUE",
                "Result holds a failure: " + error_
            );
        }
        return *value_;
    }

    [[nodiscard]] T getValue() && {
        if (!value_) {
            throw shared::exception::DomainException(
                "RESULT_HAS_NO_VALUE",
                "Result holds a failure: " + error_
            );
        }
        return std::move(*value_);
    }

    /**
     * @brief Get the failure message
     * @throws shared::exception::DomainException if this is a success
     */
    [[nodiscard]] const std::string& getError() const {
        if (value_) {
            throw shared::exception::DomainException(
                "RESULT_HAS_NO_ERROR",
                "Result holds a value"
            );
        }
        return error_;
    }

    [[nodiscard]] T valueOr(T fallback) const& {
        return value_ ? *value_ : std::move(fallback);
    }

    /**
     * @brief Transform the success value, keeping a failure as is
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        if (!value_) {
            return Result<U>::failure(error_);
        }
        return Result<U>::success(std::invoke(std::forward<F>(f), *value_));
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && {
        using U = std::decay_t<std::invoke_result_t<F, T&&>>;
        if (!value_) {
            return Result<U>::failure(std::move(error_));
        }
        return Result<U>::success(std::invoke(std::forward<F>(f), std::move(*value_)));
    }

    /**
     * @brief Chain another fallible step; it runs only on success
     *
     * @p f must return a Result.
     */
    template<typename F>
    [[nodiscard]] auto andThen(F&& f) const& {
        using R = std::invoke_result_t<F, const T&>;
        if (!value_) {
            return R::failure(error_);
        }
        return std::invoke(std::forward<F>(f), *value_);
    }

    template<typename F>
    [[nodiscard]] auto andThen(F&& f) && {
        using R = std::invoke_result_t<F, T&&>;
        if (!value_) {
            return R::failure(std::move(error_));
        }
        return std::invoke(std::forward<F>(f), std::move(*value_));
    }

    /**
     * @brief Rewrite the failure message, keeping a success as is
     */
    template<typename F>
    [[nodiscard]] Result mapError(F&& f) const& {
        if (value_) {
            return success(*value_);
        }
        return failure(std::invoke(std::forward<F>(f), error_));
    }

    template<typename F>
    [[nodiscard]] Result mapError(F&& f) && {
        if (value_) {
            return success(std::move(*value_));
        }
        return failure(std::invoke(std::forward<F>(f), error_));
    }
};

} // namespace shared::domain
