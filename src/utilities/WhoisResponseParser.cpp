#include "WhoisResponseParser.hpp"
#include "lookup_logger.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <sstream>

const std::vector<WhoisResponseParser::FieldPattern> WhoisResponseParser::fieldPatterns_ = {
    {Field::DOMAIN_NAME, R"(Domain Name:\s*(.+))", false},
    {Field::DOMAIN_NAME, R"(domain:\s*(.+))", true},
    {Field::REGISTRAR, R"(Registrar:\s*(.+))", false},
    {Field::WHOIS_SERVER, R"(Whois Server:\s*(.+))", false},
    {Field::CREATION_DATE, R"(Creation Date:\s*(.+))", false},
    {Field::CREATION_DATE, R"((created|registered):\s*(.+))", true},
    {Field::UPDATED_DATE, R"(Updated Date:\s*(.+))", false},
    {Field::UPDATED_DATE, R"((changed|last-update|last-modified):\s*(.+))", true},
    {Field::EXPIRATION_DATE, R"(Expir\w+ Date:\s*(.+))", false},
    {Field::EXPIRATION_DATE, R"((paid-till|expires|expire):\s*(.+))", true},
    {Field::NAME_SERVER, R"(Name Server:\s*(.+))", false},
    {Field::NAME_SERVER, R"(nserver:\s*(.+))", true},
    {Field::STATUS, R"(Status:\s*(.+))", false},
    {Field::DNSSEC, R"(DNSSEC:\s*(.+))", false}
};

// Registry answers for names without a registration, matched at line start.
// Wider than the classifier's not-found phrases on purpose: "no object found"
// and the "status: free/available" lines end up as ambiguous lookups, never
// as available ones.
const std::vector<std::string> WhoisResponseParser::notFoundMarkers_ = {
    "no match for",
    "no match",
    "not found",
    "no entries found",
    "no data found",
    "no object found",
    "domain not found",
    "the queried object does not exist",
    "this tld has no whois server",
    "status: free",
    "status: available"
};

template <typename T>
std::optional<FieldValue<T>> WhoisResponseParser::toField(std::vector<T> values) {
    if (values.empty()) {
        return std::nullopt;
    }
    if (values.size() == 1) {
        return FieldValue<T>(std::move(values.front()));
    }
    return FieldValue<T>(std::move(values));
}

LookupResult WhoisResponseParser::parse(const std::string& domain, const std::string& registryText,
                                        const std::string& referralText) {
    if (referralText.empty() || isNotFoundResponse(registryText)) {
        return parse(domain, registryText);
    }
    if (isNotFoundResponse(referralText)) {
        LOOKUP_LOG("parser", "Registrar has no record for " + domain + ", keeping the registry answer");
        return parse(domain, registryText);
    }
    return parse(domain, registryText + "\n" + referralText);
}

LookupResult WhoisResponseParser::parse(const std::string& domain, const std::string& rawText) {
    if (isNotFoundResponse(rawText)) {
        LOOKUP_LOG("parser", "Registry reports no record for " + domain);
        LookupError error;
        error.kind = LookupErrorKind::NOT_FOUND;
        error.category = "WhoisError";
        error.message = trim(rawText);
        return error;
    }

    static const std::regex emailRegex(R"([\w.+-]+@[\w-]+\.[\w.-]+)");

    std::vector<std::regex> compiled;
    compiled.reserve(fieldPatterns_.size());
    for (const auto& fieldPattern : fieldPatterns_) {
        compiled.emplace_back(fieldPattern.pattern, std::regex::icase);
    }

    std::map<Field, std::vector<std::string>> textFields;
    std::map<Field, std::vector<WhoisDate>> dateFields;
    std::vector<std::string> emails;

    for (const auto& line : splitLines(rawText)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '%' || trimmed[0] == '#') {
            continue;
        }

        for (size_t i = 0; i < fieldPatterns_.size(); i++) {
            const auto& fieldPattern = fieldPatterns_[i];
            std::smatch match;
            if (!std::regex_search(trimmed, match, compiled[i])) {
                continue;
            }
            if (fieldPattern.lineStart && match.position(0) != 0) {
                continue;
            }

            // Value is always the last capture group
            std::string value = trim(match[match.size() - 1].str());
            if (value.empty()) {
                continue;
            }

            switch (fieldPattern.field) {
                case Field::CREATION_DATE:
                case Field::UPDATED_DATE:
                case Field::EXPIRATION_DATE:
                    appendUniqueDate(dateFields[fieldPattern.field], value);
                    break;
                default:
                    appendUnique(textFields[fieldPattern.field], value);
                    break;
            }
            break;
        }

        for (std::sregex_iterator it(trimmed.begin(), trimmed.end(), emailRegex), end; it != end; ++it) {
            appendUnique(emails, it->str());
        }
    }

    WhoisRecord record;
    record.rawText = rawText;
    record.domainName = toField(textFields[Field::DOMAIN_NAME]);
    record.creationDate = toField(dateFields[Field::CREATION_DATE]);
    record.updatedDate = toField(dateFields[Field::UPDATED_DATE]);
    record.expirationDate = toField(dateFields[Field::EXPIRATION_DATE]);
    record.nameServers = toField(textFields[Field::NAME_SERVER]);
    record.status = toField(textFields[Field::STATUS]);
    record.emails = toField(emails);

    // Registry and registrar sections both name these, the later one is more specific
    if (!textFields[Field::REGISTRAR].empty()) {
        record.registrar = textFields[Field::REGISTRAR].back();
    }
    if (!textFields[Field::WHOIS_SERVER].empty()) {
        record.whoisServer = normalizeServer(textFields[Field::WHOIS_SERVER].back());
    }
    if (!textFields[Field::DNSSEC].empty()) {
        record.dnssec = textFields[Field::DNSSEC].front();
    }

    if (!record.hasDomainName()) {
        LOOKUP_LOG("parser", "No domain name field in response for " + domain);
    }

    return record;
}

bool WhoisResponseParser::isNotFoundResponse(const std::string& rawText) {
    for (const auto& line : splitLines(rawText)) {
        std::string lower = trim(line);
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        for (const auto& marker : notFoundMarkers_) {
            if (lower.compare(0, marker.size(), marker) == 0) {
                return true;
            }
        }
    }
    return false;
}

std::string WhoisResponseParser::extractReferralServer(const std::string& rawText) {
    static const std::regex referralRegex(R"(^(refer|whois|Registrar WHOIS Server|Whois Server):\s*(\S+))",
                                          std::regex::icase);
    std::string server;

    for (const auto& line : splitLines(rawText)) {
        std::smatch match;
        std::string trimmed = trim(line);
        if (std::regex_search(trimmed, match, referralRegex)) {
            server = normalizeServer(match[2].str());
        }
    }
    return server;
}

std::vector<std::string> WhoisResponseParser::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    size_t skipped = 0;
    while (std::getline(iss, line)) {
        if (line.size() > kMaxLineLength) {
            skipped++;
            continue;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    if (skipped > 0 && IS_LOOKUP_LOGGING_ENABLED("parser")) {
        LOOKUP_LOG_WARNING("parser", "Skipped " + std::to_string(skipped) + " overlong response line(s)");
    }
    return lines;
}

std::string WhoisResponseParser::trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string WhoisResponseParser::normalizeServer(const std::string& server) {
    std::string normalized = trim(server);
    for (const std::string prefix : {"whois://", "http://", "https://", "rwhois://"}) {
        if (normalized.compare(0, prefix.size(), prefix) == 0) {
            normalized = normalized.substr(prefix.size());
            break;
        }
    }
    size_t slash = normalized.find('/');
    if (slash != std::string::npos) {
        normalized = normalized.substr(0, slash);
    }
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

void WhoisResponseParser::appendUnique(std::vector<std::string>& values, const std::string& value) {
    auto sameIgnoringCase = [&value](const std::string& existing) {
        return existing.size() == value.size() &&
               std::equal(existing.begin(), existing.end(), value.begin(),
                   [](char a, char b) {
                       return std::tolower(static_cast<unsigned char>(a)) ==
                              std::tolower(static_cast<unsigned char>(b));
                   });
    };
    if (std::none_of(values.begin(), values.end(), sameIgnoringCase)) {
        values.push_back(value);
    }
}

void WhoisResponseParser::appendUniqueDate(std::vector<WhoisDate>& values, const std::string& value) {
    WhoisDate date = WhoisDate::parse(value);
    auto sameDate = [&date](const WhoisDate& existing) {
        if (existing.isValid() && date.isValid()) {
            return *existing.value == *date.value;
        }
        return existing.raw == date.raw;
    };
    if (std::none_of(values.begin(), values.end(), sameDate)) {
        values.push_back(date);
    }
}
