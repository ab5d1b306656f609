#include "config_manager.h"

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

void ConfigManager::setConfig(const CheckerConfig& config) {
    config_ = config;
}

const CheckerConfig& ConfigManager::getConfig() const {
    return config_;
}

bool ConfigManager::isJsonOutput() const {
    return config_.output_format == "json";
}

