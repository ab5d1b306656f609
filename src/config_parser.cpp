#include "config_parser.h"
#include "lookup_logger.h"
#include <fstream>
#include <iostream>

bool ConfigParser::parseConfig(const std::string& config_file, CheckerConfig& config) {
    try {
        std::ifstream file(config_file);
        if (!file.is_open()) {
            return false;
        }

        nlohmann::json json_config;
        file >> json_config;

        if (!parseConfigJson(json_config, config)) {
            return false;
        }

        LOOKUP_LOG_INFO("config", "Loaded configuration from " + config_file);
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error parsing config file: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigParser::parseConfigJson(const nlohmann::json& json_config, CheckerConfig& config) {
    try {
        if (!json_config.is_object()) {
            std::cerr << "Error parsing config: top level must be an object" << std::endl;
            return false;
        }

        // WHOIS transport
        if (json_config.contains("whois_server")) {
            config.whois_server = json_config["whois_server"].get<std::string>();
        }

        if (json_config.contains("whois_port")) {
            config.whois_port = json_config["whois_port"];
        }

        if (json_config.contains("timeout_seconds")) {
            config.timeout_seconds = json_config["timeout_seconds"];
        }

        if (json_config.contains("follow_referrals")) {
            config.follow_referrals = json_config["follow_referrals"];
        }

        if (json_config.contains("command_fallback")) {
            config.command_fallback = json_config["command_fallback"];
        }

        if (json_config.contains("tld_servers")) {
            config.tld_servers.clear();
            for (auto& [tld, server] : json_config["tld_servers"].items()) {
                config.tld_servers[tld] = server.get<std::string>();
            }
        }

        // Session
        if (json_config.contains("throttle_ms")) {
            config.throttle_ms = json_config["throttle_ms"];
        }

        if (json_config.contains("use_color")) {
            config.use_color = json_config["use_color"];
        }

        if (json_config.contains("output_format")) {
            config.output_format = json_config["output_format"].get<std::string>();
        }

        // Logging groups
        if (json_config.contains("logging")) {
            for (auto& [group, enabled] : json_config["logging"].items()) {
                config.logging[group] = enabled.get<bool>();
            }
        }

        validateConfig(config);
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << std::endl;
        return false;
    }
}

nlohmann::json ConfigParser::toJson(const CheckerConfig& config) {
    nlohmann::json json_config;

    json_config["whois_server"] = config.whois_server;
    json_config["whois_port"] = config.whois_port;
    json_config["timeout_seconds"] = config.timeout_seconds;
    json_config["follow_referrals"] = config.follow_referrals;
    json_config["command_fallback"] = config.command_fallback;
    json_config["tld_servers"] = config.tld_servers;

    json_config["throttle_ms"] = config.throttle_ms;
    json_config["use_color"] = config.use_color;
    json_config["output_format"] = config.output_format;

    json_config["logging"] = config.logging;

    return json_config;
}

bool ConfigParser::saveConfig(const std::string& config_file, const CheckerConfig& config) {
    try {
        nlohmann::json json_config = toJson(config);

        std::ofstream file(config_file);
        if (!file.is_open()) {
            return false;
        }

        file << json_config.dump(4);
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error saving config file: " << e.what() << std::endl;
        return false;
    }
}

CheckerConfig ConfigParser::getDefaultConfig() {
    CheckerConfig config;
    config.whois_server = "";
    config.whois_port = 43;
    config.timeout_seconds = 10;
    config.follow_referrals = true;
    config.command_fallback = true;
    config.tld_servers.clear();

    config.throttle_ms = 500;
    config.use_color = true;
    config.output_format = "text";

    // Only configuration problems are reported by default
    config.logging = {
        {"whois", false},
        {"parser", false},
        {"session", false},
        {"config", true}
    };

    return config;
}

void ConfigParser::validateConfig(CheckerConfig& config) {
    if (config.whois_port < 1 || config.whois_port > 65535) {
        LOOKUP_LOG_WARNING("config", "Invalid whois_port " + std::to_string(config.whois_port) + ", using default 43");
        config.whois_port = 43;
    }

    if (config.timeout_seconds < 1 || config.timeout_seconds > 60) {
        LOOKUP_LOG_WARNING("config", "Invalid timeout_seconds " + std::to_string(config.timeout_seconds) + ", using default 10");
        config.timeout_seconds = 10;
    }

    if (config.throttle_ms < 0 || config.throttle_ms > 10000) {
        LOOKUP_LOG_WARNING("config", "Invalid throttle_ms " + std::to_string(config.throttle_ms) + ", using default 500");
        config.throttle_ms = 500;
    }

    if (config.output_format != "text" && config.output_format != "json") {
        LOOKUP_LOG_WARNING("config", "Unknown output_format '" + config.output_format + "', using text");
        config.output_format = "text";
    }

    // Drop TLD mappings that cannot be queried
    for (auto it = config.tld_servers.begin(); it != config.tld_servers.end();) {
        if (it->first.empty() || it->second.empty()) {
            LOOKUP_LOG_WARNING("config", "Ignoring empty tld_servers entry");
            it = config.tld_servers.erase(it);
        } else {
            ++it;
        }
    }
}
