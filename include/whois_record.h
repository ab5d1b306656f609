#ifndef WHOIS_RECORD_H
#define WHOIS_RECORD_H

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * A WHOIS field that registries report either once or repeated.
 * Single(T) | Multiple(vector<T>), read through first() and size().
 */
template <typename T>
class FieldValue {
public:
    FieldValue() : value_(std::vector<T>{}) {}
    FieldValue(T single) : value_(std::move(single)) {}
    FieldValue(std::vector<T> multiple) : value_(std::move(multiple)) {}

    bool isSingle() const { return std::holds_alternative<T>(value_); }
    bool isMultiple() const { return !isSingle(); }

    // An empty Multiple counts as absent
    bool empty() const {
        return isMultiple() && std::get<std::vector<T>>(value_).empty();
    }

    size_t size() const {
        return isSingle() ? 1 : std::get<std::vector<T>>(value_).size();
    }

    const T* first() const {
        if (isSingle()) {
            return &std::get<T>(value_);
        }
        const auto& values = std::get<std::vector<T>>(value_);
        return values.empty() ? nullptr : &values.front();
    }

    // Flattened copy, single values become a one element list
    std::vector<T> values() const {
        if (isSingle()) {
            return {std::get<T>(value_)};
        }
        return std::get<std::vector<T>>(value_);
    }

private:
    std::variant<T, std::vector<T>> value_;
};

using WhoisClock = std::chrono::system_clock;
using WhoisTime = WhoisClock::time_point;

// Date as printed by the registry, plus its parsed value when a known format matched
struct WhoisDate {
    std::string raw;
    std::optional<WhoisTime> value;

    bool isValid() const { return value.has_value(); }

    // YYYY-MM-DD in local time, empty when invalid
    std::string format() const;

    static WhoisDate fromTime(WhoisTime time);
    static WhoisDate parse(const std::string& text);
};

struct WhoisRecord {
    std::optional<FieldValue<std::string>> domainName;
    std::optional<FieldValue<WhoisDate>> creationDate;
    std::optional<FieldValue<WhoisDate>> expirationDate;
    std::optional<FieldValue<WhoisDate>> updatedDate;
    std::optional<std::string> registrar;
    std::optional<std::string> whoisServer;
    std::optional<FieldValue<std::string>> nameServers;
    std::optional<FieldValue<std::string>> status;
    std::optional<FieldValue<std::string>> emails;
    std::optional<std::string> dnssec;

    std::string rawText;

    bool hasDomainName() const;
};

enum class LookupErrorKind {
    NOT_FOUND, // registry answered with an error text, usually "no match"
    FAILURE    // transport, command or parse fault
};

struct LookupError {
    LookupErrorKind kind = LookupErrorKind::FAILURE;
    std::string category;
    std::string message;
};

using LookupResult = std::variant<WhoisRecord, LookupError>;

#endif // WHOIS_RECORD_H
