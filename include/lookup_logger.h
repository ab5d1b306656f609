#ifndef LOOKUP_LOGGER_H
#define LOOKUP_LOGGER_H

#include <string>
#include <map>
#include <iostream>
#include <mutex>

/**
 * Centralized logging for the lookup tool. Messages are tagged with a group
 * ("whois", "parser", "session", "config") and filtered by the "logging"
 * section of the JSON config file.
 */
class LookupLogger {
public:
    static LookupLogger& getInstance();

    // Configure logging filters from CheckerConfig
    void setGroupFilters(const std::map<std::string, bool>& filters);

    // Check if logging is enabled for a specific group
    bool isLoggingEnabled(const std::string& group) const;

    // Log sink, stderr unless redirected
    void setOutput(std::ostream& out);

    void log(const std::string& group, const std::string& message);
    void logInfo(const std::string& group, const std::string& message);
    void logWarning(const std::string& group, const std::string& message);
    void logError(const std::string& group, const std::string& message);

private:
    LookupLogger() = default;
    ~LookupLogger() = default;
    LookupLogger(const LookupLogger&) = delete;
    LookupLogger& operator=(const LookupLogger&) = delete;

    std::map<std::string, bool> group_filters_;
    std::ostream* out_ = &std::cerr;
    mutable std::mutex mutex_;
};

#define LOOKUP_LOG(group, message) \
    LookupLogger::getInstance().log(group, message)

#define LOOKUP_LOG_INFO(group, message) \
    LookupLogger::getInstance().logInfo(group, message)

#define LOOKUP_LOG_WARNING(group, message) \
    LookupLogger::getInstance().logWarning(group, message)

#define LOOKUP_LOG_ERROR(group, message) \
    LookupLogger::getInstance().logError(group, message)

#define IS_LOOKUP_LOGGING_ENABLED(group) \
    LookupLogger::getInstance().isLoggingEnabled(group)

#endif // LOOKUP_LOGGER_H
