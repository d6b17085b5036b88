/**
 * @file CreatePersonUseCase.cpp
 * @brief CreatePersonUseCase implementation
 */

#include "usermanagement/application/usecase/CreatePersonUseCase.hpp"
#include "usermanagement/domain/model/Person.hpp"
#include <spdlog/spdlog.h>

namespace usermanagement::application::usecase {

shared::domain::Result<response::PersonResponse> CreatePersonUseCase::execute(
    const command::CreatePersonCommand& command
) const {
    spdlog::debug("Creating person: firstName='{}', lastName='{}', userName='{}'",
                  command.firstName, command.lastName, command.userName);

    auto result = domain::model::tryCreatePerson(
        command.firstName,
        command.lastName,
        command.userName
    ).map(response::PersonResponse::fromDomain);

    if (result) {
        spdlog::info("Person created: userName={}", result.getValue().userName);
    } else {
        spdlog::warn("Person rejected: {}", result.getError());
    }
    return result;
}

} // namespace usermanagement::application::usecase
