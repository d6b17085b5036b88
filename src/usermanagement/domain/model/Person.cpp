/**
 * @file Person.cpp
 * @brief Person factory
 */

#include "Person.hpp"

namespace usermanagement::domain::model {

shared::domain::Result<Person> tryCreatePerson(
    const std::string& firstName,
    const std::string& lastName,
    const std::string& userName
) {
    auto maybeFirstName = FirstName::fromInput(firstName);
    auto maybeLastName = LastName::fromInput(lastName);

    auto userNameResult = UserName::create(userName);
    if (userNameResult.isFailure()) {
        return shared::domain::Result<Person>::failure(
            "Problem creating Person. " + userNameResult.getError());
    }

    return shared::domain::Result<Person>::success(Person(
        std::move(maybeFirstName),
        std::move(maybeLastName),
        std::move(userNameResult).getValue()
    ));
}

shared::domain::Result<Person> tryCreatePerson(
    const char* firstName,
    const char* lastName,
    const char* userName
) {
    auto orEmpty = [](const char* value) {
        return std::string(value != nullptr ? value : "");
    };
    return tryCreatePerson(orEmpty(firstName), orEmpty(lastName), orEmpty(userName));
}

} // namespace usermanagement::domain::model
