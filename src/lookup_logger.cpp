#include "lookup_logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

LookupLogger& LookupLogger::getInstance() {
    static LookupLogger instance;
    return instance;
}

void LookupLogger::setGroupFilters(const std::map<std::string, bool>& filters) {
    std::lock_guard<std::mutex> lock(mutex_);
    group_filters_ = filters;
}

bool LookupLogger::isLoggingEnabled(const std::string& group) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = group_filters_.find(group);
    if (it != group_filters_.end()) {
        return it->second;
    }
    // Default to true if group not found in config
    return true;
}

void LookupLogger::setOutput(std::ostream& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = &out;
}

void LookupLogger::log(const std::string& group, const std::string& message) {
    if (!isLoggingEnabled(group)) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream timestamp;
    timestamp << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    timestamp << "." << std::setfill('0') << std::setw(3) << ms.count();

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << "[" << timestamp.str() << "] [" << group << "] " << message << std::endl;
}

void LookupLogger::logInfo(const std::string& group, const std::string& message) {
    log(group, "[INFO] " + message);
}

void LookupLogger::logWarning(const std::string& group, const std::string& message) {
    log(group, "[WARNING] " + message);
}

void LookupLogger::logError(const std::string& group, const std::string& message) {
    log(group, "[ERROR] " + message);
}
