/**
 * @file CreatePersonCommand.hpp
 * @brief Command DTO for registering a person
 */

#pragma once

#include <string>
#include <utility>

namespace usermanagement::application::command {

/**
 * @brief Command for creating a person from raw input
 */
struct CreatePersonCommand {
    std::string firstName;
    std::string lastName;
    std::string userName;

    CreatePersonCommand() = default;

    CreatePersonCommand(
        std::string firstName,
        std::string lastName,
        std::string userName
    )
        : firstName(std::move(firstName)),
          lastName(std::move(lastName)),
          userName(std::move(userName)) {}
};

} // namespace usermanagement::application::command
