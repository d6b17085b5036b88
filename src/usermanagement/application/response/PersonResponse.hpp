/**
 * @file PersonResponse.hpp
 * @brief Response DTO for a created person
 */

#pragma once

#include "../../domain/model/Person.hpp"
#include <json/json.h>
#include <optional>
#include <string>

namespace usermanagement::application::response {

/**
 * @brief Flat view of a Person for output
 */
struct PersonResponse {
    std::optional<std::string> firstName;
    std::optional<std::string> lastName;
    std::string userName;

    static PersonResponse fromDomain(const domain::model::Person& person) {
        PersonResponse response;
        if (person.getFirstName()) {
            response.firstName = person.getFirstName()->getValue();
        }
        if (person.getLastName()) {
            response.lastName = person.getLastName()->getValue();
        }
        response.userName = person.getUserName().getValue();
        return response;
    }

    /**
     * @brief Serialize to JSON; absent names are written as null
     */
    [[nodiscard]] Json::Value toJson() const {
        Json::Value json;
        json["firstName"] = firstName ? Json::Value(*firstName) : Json::Value(Json::nullValue);
        json["lastName"] = lastName ? Json::Value(*lastName) : Json::Value(Json::nullValue);
        json["userName"] = userName;
        return json;
    }
};

} // namespace usermanagement::application::response
