#pragma once
#include <reliability/core/config/app_config.hpp>
#include <string>

namespace Reliability {

/**
 * Loads and validates YAML configuration.
 * Every failure (missing file, missing field, wrong type, invalid value)
 * throws std::runtime_error naming the offending field.
 */
class ConfigLoader {
public:
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
    static AppConfig::AppConfiguration loadFromString(const std::string& yaml_text);
};

} // namespace Reliability
