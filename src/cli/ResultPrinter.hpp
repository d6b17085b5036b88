/**
 * @file ResultPrinter.hpp
 * @brief Console output for person-registry
 */

#pragma once

#include "shared/domain/Result.hpp"
#include "usermanagement/application/response/PersonResponse.hpp"
#include <json/json.h>
#include <ostream>
#include <string>

namespace cli {

/**
 * @brief Render JSON with two-space indentation
 */
std::string toJsonString(const Json::Value& json);

/**
 * @brief Print the outcome of a create request
 *
 * A created person goes to @p out as JSON, a failure message to @p err as
 * "error: <message>", so @p out only ever carries JSON.
 *
 * @return true if the person was created
 */
bool printResult(
    const shared::domain::Result<usermanagement::application::response::PersonResponse>& result,
    std::ostream& out,
    std::ostream& err
);

} // namespace cli
