/**
 * @file Person.hpp
 * @brief Aggregate for a registered person
 */

#pragma once

#include "FirstName.hpp"
#include "LastName.hpp"
#include "UserName.hpp"
#include "shared/domain/Result.hpp"
#include <optional>
#include <string>

namespace usermanagement::domain::model {

class Person;

/**
 * @brief Create a Person from raw input
 *
 * Empty first or last names become absent fields. The user name must pass
 * UserName::create; otherwise the result is a failure of the form
 * "Problem creating Person. UserName is invalid: '<userName>'.".
 *
 * @param firstName Raw first name, may be empty
 * @param lastName Raw last name, may be empty
 * @param userName Raw user name
 */
shared::domain::Result<Person> tryCreatePerson(
    const std::string& firstName,
    const std::string& lastName,
    const std::string& userName
);

/**
 * @brief Create a Person from C strings; a nullptr argument is treated as ""
 */
shared::domain::Result<Person> tryCreatePerson(
    const char* firstName,
    const char* lastName,
    const char* userName
);

/**
 * @brief Person Aggregate
 *
 * Only tryCreatePerson can construct a Person, and it does so only after the
 * user name has been validated. There are no mutators.
 */
class Person {
private:
    std::optional<FirstName> firstName_;
    std::optional<LastName> lastName_;
    UserName userName_;

    Person(
        std::optional<FirstName> firstName,
        std::optional<LastName> lastName,
        UserName userName
    )
        : firstName_(std::move(firstName)),
          lastName_(std::move(lastName)),
          userName_(std::move(userName)) {}

    friend shared::domain::Result<Person> tryCreatePerson(
        const std::string& firstName,
        const std::string& lastName,
        const std::string& userName
    );

public:
    [[nodiscard]] const std::optional<FirstName>& getFirstName() const noexcept {
        return firstName_;
    }

    [[nodiscard]] const std::optional<LastName>& getLastName() const noexcept {
        return lastName_;
    }

    [[nodiscard]] const UserName& getUserName() const noexcept {
        return userName_;
    }
};

} // namespace usermanagement::domain::model
