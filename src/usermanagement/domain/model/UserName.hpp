/**
 * @file UserName.hpp
 * @brief Value Object for a validated user name
 */

#pragma once

#include "shared/domain/Result.hpp"
#include "shared/domain/ValueObject.hpp"
#include <cstddef>
#include <string>

namespace usermanagement::domain::model {

/**
 * @brief User Name Value Object
 *
 * Holds a string of 1 to MAX_LENGTH bytes. The constructor is private and
 * create() is the only way to obtain an instance, so every UserName in the
 * program satisfies the length invariant.
 */
class UserName : public shared::domain::StringValueObject {
public:
    static constexpr size_t MIN_LENGTH = 1;
    static constexpr size_t MAX_LENGTH = 10;

private:
    explicit UserName(std::string value) : StringValueObject(std::move(value)) {}

public:
    /**
     * @brief Check whether a string satisfies the user name invariant
     */
    [[nodiscard]] static bool isValid(const std::string& value) noexcept;

    /**
     * @brief Create a UserName
     * @param value Raw user name, kept verbatim (no trimming)
     * @return The UserName, or a failure "UserName is invalid: '<value>'."
     */
    static shared::domain::Result<UserName> create(const std::string& value);

    /**
     * @brief Create a UserName from a C string; nullptr is treated as ""
     */
    static shared::domain::Result<UserName> create(const char* value);

    bool operator==(const UserName& other) const {
        return sameValueAs(other);
    }

    bool operator!=(const UserName& other) const {
        return !(*this == other);
    }

    bool operator<(const UserName& other) const {
        return lessThan(other);
    }
};

} // namespace usermanagement::domain::model
