#ifndef CONFIG_PARSER_H
#define CONFIG_PARSER_H

#include <string>
#include <nlohmann/json.hpp>
#include "checker_config.h"

class ConfigParser {
public:
    static bool parseConfig(const std::string& config_file, CheckerConfig& config);
    static bool parseConfigJson(const nlohmann::json& json_config, CheckerConfig& config);
    static bool saveConfig(const std::string& config_file, const CheckerConfig& config);
    static nlohmann::json toJson(const CheckerConfig& config);
    static CheckerConfig getDefaultConfig();

private:
    static void validateConfig(CheckerConfig& config);
};

#endif // CONFIG_PARSER_H
