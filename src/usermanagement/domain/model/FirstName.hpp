/**
 * @file FirstName.hpp
 * @brief Value Object for a person's first name
 */

#pragma once

#include "shared/domain/ValueObject.hpp"
#include <optional>
#include <string>

namespace usermanagement::domain::model {

/**
 * @brief First Name Value Object
 *
 * Carries no invariant of its own; the distinct type keeps first names
 * from being passed where another name is expected.
 */
class FirstName : public shared::domain::StringValueObject {
private:
    explicit FirstName(std::string value) : StringValueObject(std::move(value)) {}

public:
    static FirstName of(std::string value) {
        return FirstName(std::move(value));
    }

    /**
     * @brief Derive an optional FirstName from raw input
     * @return std::nullopt for an empty string, the wrapped input otherwise
     */
    static std::optional<FirstName> fromInput(const std::string& value) {
        if (value.empty()) {
            return std::nullopt;
        }
        return FirstName(value);
    }

    bool operator==(const FirstName& other) const {
        return sameValueAs(other);
    }

    bool operator!=(const FirstName& other) const {
        return !(*this == other);
    }
};

} // namespace usermanagement::domain::model
