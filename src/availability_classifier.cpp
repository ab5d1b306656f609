#include "availability_classifier.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string toLower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

const WhoisDate* firstValidDate(const std::optional<FieldValue<WhoisDate>>& field) {
    if (!field || field->empty()) {
        return nullptr;
    }
    const WhoisDate* date = field->first();
    if (date == nullptr || !date->isValid()) {
        return nullptr;
    }
    return date;
}

bool isPresent(const std::optional<FieldValue<std::string>>& field) {
    if (!field || field->empty()) {
        return false;
    }
    if (field->isSingle()) {
        return !field->first()->empty();
    }
    return true;
}

std::string formatStatus(const FieldValue<std::string>& status) {
    if (status.isSingle()) {
        return *status.first();
    }

    std::vector<std::string> values = status.values();
    std::ostringstream oss;
    for (size_t i = 0; i < values.size() && i < 2; i++) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    if (values.size() > 2) {
        oss << " and " << (values.size() - 2) << " more";
    }
    return oss.str();
}

} // namespace

const std::vector<std::string>& AvailabilityClassifier::notFoundPhrases() {
    static const std::vector<std::string> phrases = {
        "no match for",
        "no entries found",
        "not found",
        "no data found",
        "no match",
        "domain not found",
        "domain available"
    };
    return phrases;
}

const std::vector<std::string>& AvailabilityClassifier::privacyPhrases() {
    static const std::vector<std::string> phrases = {
        "redacted for privacy",
        "registration private",
        "data protected"
    };
    return phrases;
}

bool AvailabilityClassifier::matchesAny(const std::string& text, const std::vector<std::string>& phrases) {
    std::string lower = toLower(text);
    return std::any_of(phrases.begin(), phrases.end(),
        [&lower](const std::string& phrase) { return lower.find(phrase) != std::string::npos; });
}

Verdict AvailabilityClassifier::classify(const std::string& domain, const LookupResult& result, WhoisTime now) {
    if (const auto* record = std::get_if<WhoisRecord>(&result)) {
        return classifyRecord(domain, *record, now);
    }
    return classifyError(domain, std::get<LookupError>(result));
}

std::vector<std::string> AvailabilityClassifier::collectFragments(const WhoisRecord& record) {
    std::vector<std::string> fragments;

    if (const WhoisDate* created = firstValidDate(record.creationDate)) {
        fragments.push_back("Created: " + created->format());
    }

    if (const WhoisDate* expires = firstValidDate(record.expirationDate)) {
        fragments.push_back("Expires: " + expires->format());
    }

    if (record.registrar && !record.registrar->empty()) {
        fragments.push_back("Registrar: " + *record.registrar);
    }

    if (isPresent(record.nameServers)) {
        fragments.push_back("Nameservers: " + std::to_string(record.nameServers->size()) + " configured");
    }

    if (isPresent(record.status)) {
        fragments.push_back("Status: " + formatStatus(*record.status));
    }

    return fragments;
}

Verdict AvailabilityClassifier::classifyRecord(const std::string& domain, const WhoisRecord& record, WhoisTime now) {
    Verdict verdict;

    if (!record.hasDomainName()) {
        verdict.available = true;
        verdict.outcome = Outcome::NO_RECORD;
        verdict.message = "Domain " + domain + " appears to be available (No domain record found)";
        return verdict;
    }

    // A lapsed registration wins over every other detail
    if (const WhoisDate* expires = firstValidDate(record.expirationDate)) {
        if (*expires->value < now) {
            verdict.available = true;
            verdict.outcome = Outcome::EXPIRED;
            verdict.message = "Domain " + domain + " expired on " + expires->format() +
                              " and may be available for registration";
            return verdict;
        }
    }

    std::vector<std::string> fragments = collectFragments(record);
    verdict.available = false;

    if (fragments.empty()) {
        verdict.outcome = Outcome::REGISTERED_OPAQUE;
        verdict.message = "Domain " + domain + " appears to be registered, but limited details are available";
        return verdict;
    }

    std::ostringstream details;
    for (size_t i = 0; i < fragments.size(); i++) {
        if (i > 0) details << " | ";
        details << fragments[i];
    }

    verdict.outcome = Outcome::REGISTERED;
    verdict.message = "Domain " + domain + " is registered (" + details.str() + ")";
    return verdict;
}

Verdict AvailabilityClassifier::classifyError(const std::string& domain, const LookupError& error) {
    Verdict verdict;
    verdict.available = false;

    if (error.kind == LookupErrorKind::FAILURE) {
        verdict.outcome = Outcome::LOOKUP_FAILED;
        verdict.message = "Error checking " + domain + ": " + error.category + " - " + error.message;
        return verdict;
    }

    if (matchesAny(error.message, notFoundPhrases())) {
        verdict.available = true;
        verdict.outcome = Outcome::NO_RECORD;
        verdict.message = "Domain " + domain + " appears to be available (WHOIS response: " +
                          error.message.substr(0, error.message.find('.')) + ")";
        return verdict;
    }

    if (matchesAny(error.message, privacyPhrases())) {
        verdict.outcome = Outcome::REGISTERED_PRIVATE;
        verdict.message = "Domain " + domain + " is registered with privacy protection";
        return verdict;
    }

    verdict.outcome = Outcome::LOOKUP_AMBIGUOUS;
    verdict.message = "Error checking " + domain + ": " + error.message;
    return verdict;
}

std::string outcomeToString(Outcome outcome) {
    switch (outcome) {
        case Outcome::INVALID_SYNTAX: return "invalid_syntax";
        case Outcome::NO_RECORD: return "no_record";
        case Outcome::EXPIRED: return "expired";
        case Outcome::REGISTERED: return "registered";
        case Outcome::REGISTERED_OPAQUE: return "registered_opaque";
        case Outcome::REGISTERED_PRIVATE: return "registered_private";
        case Outcome::LOOKUP_AMBIGUOUS: return "lookup_ambiguous";
        case Outcome::LOOKUP_FAILED: return "lookup_failed";
    }
    return "unknown";
}
