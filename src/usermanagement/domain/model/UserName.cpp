/**
 * @file UserName.cpp
 * @brief UserName validation and factory
 */

#include "UserName.hpp"

namespace usermanagement::domain::model {

bool UserName::isValid(const std::string& value) noexcept {
    return value.length() >= MIN_LENGTH && value.length() <= MAX_LENGTH;
}

shared::domain::Result<UserName> UserName::create(const std::string& value) {
    if (!isValid(value)) {
        return shared::domain::Result<UserName>::failure(
            "UserName is invalid: '" + value + "'.");
    }
    return shared::domain::Result<UserName>::success(UserName(value));
}

shared::domain::Result<UserName> UserName::create(const char* value) {
    return create(std::string(value != nullptr ? value : ""));
}

} // namespace usermanagement::domain::model
