#ifndef AVAILABILITY_CLASSIFIER_H
#define AVAILABILITY_CLASSIFIER_H

#include <string>
#include <vector>
#include "whois_record.h"

enum class Outcome {
    INVALID_SYNTAX,
    NO_RECORD,
    EXPIRED,
    REGISTERED,
    REGISTERED_OPAQUE,
    REGISTERED_PRIVATE,
    LOOKUP_AMBIGUOUS,
    LOOKUP_FAILED
};

struct Verdict {
    bool available = false;
    Outcome outcome = Outcome::LOOKUP_FAILED;
    std::string message;
};

/**
 * Turns a WHOIS lookup result into an availability verdict with evidence.
 * Pure: the current time is passed in and nothing is read from the environment.
 * Ambiguous input never yields "available".
 */
class AvailabilityClassifier {
public:
    static Verdict classify(const std::string& domain, const LookupResult& result, WhoisTime now);
    static Verdict classifyRecord(const std::string& domain, const WhoisRecord& record, WhoisTime now);
    static Verdict classifyError(const std::string& domain, const LookupError& error);

    // Lowercase phrases matched as substrings of the registry error text
    static const std::vector<std::string>& notFoundPhrases();
    static const std::vector<std::string>& privacyPhrases();

    static bool matchesAny(const std::string& text, const std::vector<std::string>& phrases);

    // Detail fragments for a registered record, in display order
    static std::vector<std::string> collectFragments(const WhoisRecord& record);
};

std::string outcomeToString(Outcome outcome);

#endif // AVAILABILITY_CLASSIFIER_H
