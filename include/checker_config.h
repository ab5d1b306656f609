#ifndef CHECKER_CONFIG_H
#define CHECKER_CONFIG_H

#include <map>
#include <string>

struct CheckerConfig {
    // WHOIS transport
    std::string whois_server; // Empty for automatic selection
    int whois_port = 43;
    int timeout_seconds = 10;
    bool follow_referrals = true;
    bool command_fallback = true;
    std::map<std::string, std::string> tld_servers;

    // Session
    int throttle_ms = 500;
    bool use_color = true;
    std::string output_format = "text";

    // Logging groups
    std::map<std::string, bool> logging = {
        {"whois", false},
        {"parser", false},
        {"session", false},
        {"config", true}
    };
};

#endif // CHECKER_CONFIG_H
