/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "config_manager.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace common {

namespace {

const std::set<std::string> TRUE_WORDS = {"true", "1", "yes", "on"};
const std::set<std::string> FALSE_WORDS = {"false", "0", "no", "off"};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::optional<std::string> ConfigManager::lookup(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = config_.find(key);
        if (it != config_.end()) {
            return it->second;
        }
    }
    if (const char* env = std::getenv(key.c_str())) {
        return std::string(env);
    }
    return std::nullopt;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return lookup(key).value_or(defaultValue);
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    auto value = lookup(key);
    if (!value || value->empty()) {
        return defaultValue;
    }

    size_t parsed = 0;
    try {
        int number = std::stoi(*value, &parsed);
        if (parsed == value->length()) {
            return number;
        }
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range, reported below
    }
    spdlog::warn("Config '{}' is not an integer: '{}' (using default: {})",
                 key, *value, defaultValue);
    return defaultValue;
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    auto value = lookup(key);
    if (!value || value->empty()) {
        return defaultValue;
    }

    const std::string word = toLower(*value);
    if (TRUE_WORDS.count(word) > 0) {
        return true;
    }
    if (FALSE_WORDS.count(word) > 0) {
        return false;
    }
    spdlog::warn("Config '{}' is not a boolean: '{}' (using default: {})",
                 key, *value, defaultValue);
    return defaultValue;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    for (const char* key : {SERVICE_NAME, LOG_LEVEL, LOG_TO_FILE, LOG_FILE}) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
        }
    }
}

} // namespace common
