/**
 * @file LastName.hpp
 * @brief Value Object for a person's last name
 */

#pragma once

#include "shared/domain/ValueObject.hpp"
#include <optional>
#include <string>

namespace usermanagement::domain::model {

/**
 * @brief Last Name Value Object (see FirstName)
 */
class LastName : public shared::domain::StringValueObject {
private:
    explicit LastName(std::string value) : StringValueObject(std::move(value)) {}

public:
    static LastName of(std::string value) {
        return LastName(std::move(value));
    }

    static std::optional<LastName> fromInput(const std::string& value) {
        if (value.empty()) {
            return std::nullopt;
        }
        return LastName(value);
    }

    bool operator==(const LastName& other) const {
        return sameValueAs(other);
    }

    bool operator!=(const LastName& other) const {
        return !(*this == other);
    }
};

} // namespace usermanagement::domain::model
