#ifndef CONFIG_MANAGER_H
#define CONFIG_MANAGER_H

#include "checker_config.h"
#include <string>

class ConfigManager {
public:
    static ConfigManager& getInstance();

    void setConfig(const CheckerConfig& config);
    const CheckerConfig& getConfig() const;

    bool isJsonOutput() const;

private:
    ConfigManager() = default;
    CheckerConfig config_;
};

#endif // CONFIG_MANAGER_H
