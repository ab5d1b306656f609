
#ifndef WHOIS_LOOKUP_ENGINE_H
#define WHOIS_LOOKUP_ENGINE_H

#include <string>
#include <map>
#include <mutex>
#include <stdexcept>
#include "checker_config.h"
#include "whois_record.h"

// Socket or command failure while talking to a WHOIS server
class WhoisTransportError : public std::runtime_error {
public:
    WhoisTransportError(const std::string& category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    const std::string& category() const { return category_; }

private:
    std::string category_;
};

class WhoisLookupEngine {
public:
    struct WhoisConfig {
        std::string server = ""; // Empty for automatic selection
        int port = 43;
        int timeout = 10;
        bool followReferrals = true;
        bool commandFallback = true;
        std::map<std::string, std::string> tldServers;
    };

    WhoisLookupEngine();
    explicit WhoisLookupEngine(const WhoisConfig& config);
    ~WhoisLookupEngine();

    // Query, follow the registrar referral and parse. Never throws.
    LookupResult performLookup(const std::string& domain);

    // Server that answers for the domain's TLD, empty when none is known
    std::string resolveServer(const std::string& domain);

    void setConfig(const WhoisConfig& config);
    const WhoisConfig& getConfig() const { return config_; }

    static bool validateConfig(const WhoisConfig& config, std::string& error);
    static WhoisConfig configFromChecker(const CheckerConfig& config);
    static const std::map<std::string, std::string>& getBuiltinServers();

    static const char* const kIanaServer;

private:
    WhoisConfig config_;
    mutable std::mutex engineMutex_;

    // TLD servers learned from IANA during this run
    std::map<std::string, std::string> discoveredServers_;

    std::string resolveServerLocked(const std::string& domain);
    // Registry answer, with the registrar answer it refers to in referralText
    std::string fetchResponse(const std::string& domain, const std::string& server, std::string& referralText);
    std::string buildQuery(const std::string& server, const std::string& domain) const;

    // Raw protocol exchange, throws WhoisTransportError
    std::string queryServer(const std::string& server, const std::string& query) const;

    // System whois binary
    std::string lookupWithCommand(const std::string& domain) const;
    std::string executeCommand(const std::string& command, int timeoutSeconds, int& exitCode) const;

    static LookupError makeError(LookupErrorKind kind, const std::string& category, const std::string& message);
};

#endif // WHOIS_LOOKUP_ENGINE_H
