/**
 * @file ValueObject.hpp
 * @brief Base class for Value Objects in DDD
 */

#pragma once

#include <string>
#include <utility>

namespace shared::domain {

/**
 * @brief Base template class for Value Objects
 *
 * Value Objects are immutable objects that are defined by their attributes.
 * Derived classes keep their constructor private and expose a static factory,
 * so every reachable instance has passed the factory's checks.
 *
 * @tparam T The type of the underlying value
 */
template<typename T>
class ValueObject {
protected:
    T value_;

    /**
     * @brief Construct a new Value Object
     * @param value The underlying value
     */
    explicit ValueObject(T value) : value_(std::move(value)) {}

    /**
     * @brief Attribute equality, for use by derived comparison operators
     */
    [[nodiscard]] bool sameValueAs(const ValueObject& other) const {
        return value_ == other.value_;
    }

    [[nodiscard]] bool lessThan(const ValueObject& other) const {
        return value_ < other.value_;
    }

public:
    virtual ~ValueObject() = default;

    // Copyable and movable, never reassigned
    ValueObject(const ValueObject&) = default;
    ValueObject& operator=(const ValueObject&) = delete;
    ValueObject(ValueObject&&) noexcept = default;
    ValueObject& operator=(ValueObject&&) noexcept = delete;

    /**
     * @brief Get the underlying value
     */
    [[nodiscard]] const T& getValue() const noexcept {
        return value_;
    }
};

/**
 * @brief Specialization for string-based Value Objects
 */
class StringValueObject : public ValueObject<std::string> {
protected:
    explicit StringValueObject(std::string value)
        : ValueObject<std::string>(std::move(value)) {}

public:
    /**
     * @brief Check if the value is empty
     */
    [[nodiscard]] bool isEmpty() const noexcept {
        return value_.empty();
    }

    /**
     * @brief Get the string length
     */
    [[nodiscard]] size_t length() const noexcept {
        return value_.length();
    }

    [[nodiscard]] std::string toString() const {
        return value_;
    }
};

} // namespace shared::domain
