/**
 * @file CreatePersonUseCase.hpp
 * @brief Use case for registering a person
 */

#pragma once

#include "../command/CreatePersonCommand.hpp"
#include "../response/PersonResponse.hpp"
#include "shared/domain/Result.hpp"

namespace usermanagement::application::usecase {

/**
 * @brief Use case for creating a Person from a command
 *
 * Rejected input is returned as a failed Result and logged at warn level.
 */
class CreatePersonUseCase {
public:
    shared::domain::Result<response::PersonResponse> execute(
        const command::CreatePersonCommand& command
    ) const;
};

} // namespace usermanagement::application::usecase
