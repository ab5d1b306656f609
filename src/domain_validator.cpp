#include "domain_validator.h"
#include <algorithm>
#include <cctype>
#include <regex>

const char* const DomainValidator::kPatternHint =
    "Domain should match pattern: example.com, sub.example.net, etc.";

bool DomainValidator::validate(const std::string& input) {
    // Longest name DNS can carry
    if (input.size() > 253) {
        return false;
    }

    static const std::regex domainRegex(
        R"(^([a-zA-Z0-9]([a-zA-Z0-9\-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,10}$)");
    return std::regex_match(input, domainRegex);
}

std::string DomainValidator::normalize(const std::string& input) {
    size_t start = input.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = input.find_last_not_of(" \t\r\n");

    std::string normalized = input.substr(start, end - start + 1);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}

std::string DomainValidator::extractTld(const std::string& domain) {
    size_t dot = domain.rfind('.');
    if (dot == std::string::npos) {
        return "";
    }
    return domain.substr(dot + 1);
}
