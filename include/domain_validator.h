#ifndef DOMAIN_VALIDATOR_H
#define DOMAIN_VALIDATOR_H

#include <string>

class DomainValidator {
public:
    // Labels of 1-63 alphanumerics (hyphens inside), dot separated,
    // ending in an alphabetic TLD of 2-10 characters
    static bool validate(const std::string& input);

    // Trim surrounding whitespace and lowercase
    static std::string normalize(const std::string& input);

    // Rightmost label, empty when there is no dot
    static std::string extractTld(const std::string& domain);

    static const char* const kPatternHint;
};

#endif // DOMAIN_VALIDATOR_H
