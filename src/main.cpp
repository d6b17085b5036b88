/**
 * @file main.cpp
 * @brief person-registry entry point
 *
 * Usage: person-registry [<firstName> <lastName> <userName>]
 *
 * With three arguments the person is created once and printed as JSON.
 * Without arguments a fixed set of sample requests is run.
 */

#include "cli/ResultPrinter.hpp"
#include "config/config_manager.h"
#include "logging/logger.h"
#include "usermanagement/application/usecase/CreatePersonUseCase.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <vector>

namespace {

using usermanagement::application::command::CreatePersonCommand;
using usermanagement::application::usecase::CreatePersonUseCase;

/**
 * @brief Initialize logging system from configuration
 */
void initializeLogging() {
    auto& config = common::ConfigManager::getInstance();
    common::Logger::initialize(
        config.getString(common::ConfigManager::SERVICE_NAME,
                         common::ConfigManager::DEFAULT_SERVICE_NAME),
        config.getString(common::ConfigManager::LOG_LEVEL,
                         common::ConfigManager::DEFAULT_LOG_LEVEL),
        config.getBool(common::ConfigManager::LOG_TO_FILE, false),
        config.getString(common::ConfigManager::LOG_FILE,
                         common::ConfigManager::DEFAULT_LOG_FILE)
    );
}

bool runCommand(const CreatePersonUseCase& useCase, const CreatePersonCommand& command) {
    return cli::printResult(useCase.execute(command), std::cout, std::cerr);
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [<firstName> <lastName> <userName>]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc != 1 && argc != 4) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        initializeLogging();

        CreatePersonUseCase useCase;

        if (argc == 4) {
            return runCommand(useCase, CreatePersonCommand(argv[1], argv[2], argv[3])) ? 0 : 1;
        }

        const std::vector<CreatePersonCommand> samples = {
            {"Lisa", "Simpson", "lisa rocks"},
            {"Homer", "Simpson", ""},
            {"Marge", "Simpson", "lisa rocks"},
        };
        for (const auto& sample : samples) {
            runCommand(useCase, sample);
        }
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("person-registry failed: {}", e.what());
        return 1;
    }
}
