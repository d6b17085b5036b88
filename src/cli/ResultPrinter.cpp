/**
 * @file ResultPrinter.cpp
 * @brief Console output for person-registry
 */

#include "cli/ResultPrinter.hpp"

namespace cli {

std::string toJsonString(const Json::Value& json) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, json);
}

bool printResult(
    const shared::domain::Result<usermanagement::application::response::PersonResponse>& result,
    std::ostream& out,
    std::ostream& err
) {
    if (!result) {
        err << "error: " << result.getError() << std::endl;
        return false;
    }
    out << toJsonString(result.getValue().toJson()) << std::endl;
    return true;
}

} // namespace cli
