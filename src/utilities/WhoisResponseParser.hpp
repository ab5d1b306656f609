
#ifndef WHOIS_RESPONSE_PARSER_H
#define WHOIS_RESPONSE_PARSER_H

#include <string>
#include <vector>
#include "whois_record.h"

class WhoisResponseParser {
public:
    // Record extracted from the response, or a NOT_FOUND LookupError when
    // the registry reports that the name has no registration
    static LookupResult parse(const std::string& domain, const std::string& rawText);

    // Registry answer plus the registrar answer it referred to. Only the
    // registry decides whether the name is registered; a registrar reply
    // that reports a miss is ignored.
    static LookupResult parse(const std::string& domain, const std::string& registryText,
                              const std::string& referralText);

    static bool isNotFoundResponse(const std::string& rawText);

    // WHOIS server named by a referral line ("refer:", "whois:",
    // "Registrar WHOIS Server:"), empty when there is none
    static std::string extractReferralServer(const std::string& rawText);

private:
    enum class Field {
        DOMAIN_NAME,
        REGISTRAR,
        WHOIS_SERVER,
        CREATION_DATE,
        UPDATED_DATE,
        EXPIRATION_DATE,
        NAME_SERVER,
        STATUS,
        DNSSEC
    };

    struct FieldPattern {
        Field field;
        std::string pattern;
        bool lineStart; // key must open the line
    };

    // Longer lines are skipped before any regex runs on them
    static constexpr size_t kMaxLineLength = 1024;

    static const std::vector<FieldPattern> fieldPatterns_;
    static const std::vector<std::string> notFoundMarkers_;

    static std::vector<std::string> splitLines(const std::string& text);
    static std::string trim(const std::string& value);
    static std::string normalizeServer(const std::string& server);

    static void appendUnique(std::vector<std::string>& values, const std::string& value);
    static void appendUniqueDate(std::vector<WhoisDate>& values, const std::string& value);

    template <typename T>
    static std::optional<FieldValue<T>> toField(std::vector<T> values);
};

#endif // WHOIS_RESPONSE_PARSER_H
