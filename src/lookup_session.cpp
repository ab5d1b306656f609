#include "lookup_session.h"
#include "domain_validator.h"
#include "lookup_logger.h"
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace {

const char* const kColorTitle = "1;36";
const char* const kColorSuccess = "1;32";
const char* const kColorFailure = "1;31";
const char* const kColorNotice = "1;33";

} // namespace

LookupSession::LookupSession(LookupFunction lookup, std::ostream& out, const SessionOptions& options)
    : lookup_(std::move(lookup)),
      out_(out),
      options_(options),
      sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }),
      clock_([]() { return WhoisClock::now(); }) {
}

void LookupSession::setSleepFunction(SleepFunction sleep) {
    sleep_ = std::move(sleep);
}

void LookupSession::setClockFunction(ClockFunction clock) {
    clock_ = std::move(clock);
}

bool LookupSession::isQuitCommand(const std::string& input) {
    return input == "quit" || input == "exit" || input == "q";
}

StepResult LookupSession::processInput(SessionState& state, const std::string& rawInput) {
    std::string domain = DomainValidator::normalize(rawInput);

    if (isQuitCommand(domain)) {
        return StepResult::QUIT;
    }

    if (domain.empty()) {
        if (!options_.jsonOutput) {
            out_ << "Please enter a domain name" << std::endl;
        }
        return StepResult::CONTINUE;
    }

    if (!DomainValidator::validate(domain)) {
        LOOKUP_LOG("session", "Rejected input: " + domain);
        printInvalid(domain);
        return StepResult::CONTINUE;
    }

    checkDomain(state, domain);
    return StepResult::CONTINUE;
}

Verdict LookupSession::checkDomain(SessionState& state, const std::string& domain) {
    if (!options_.jsonOutput) {
        printColored("Checking " + domain + "...", kColorNotice);
    }
    state.checked++;

    // Keep WHOIS servers from rate limiting us
    if (options_.throttle.count() > 0) {
        sleep_(options_.throttle);
    }

    LookupResult result;
    try {
        result = lookup_(domain);
    } catch (const std::exception& e) {
        LOOKUP_LOG_ERROR("session", "Lookup for " + domain + " threw: " + e.what());
        LookupError error;
        error.kind = LookupErrorKind::FAILURE;
        error.category = "LookupError";
        error.message = e.what();
        result = error;
    }

    Verdict verdict = AvailabilityClassifier::classify(domain, result, clock_());
    LOOKUP_LOG("session", domain + " -> " + outcomeToString(verdict.outcome));

    if (verdict.available) {
        state.availableDomains.push_back(domain);
    }

    printVerdict(domain, verdict);
    return verdict;
}

void LookupSession::run(std::istream& in, SessionState& state, const std::atomic<bool>* interrupted) {
    auto isInterrupted = [interrupted]() { return interrupted != nullptr && interrupted->load(); };

    while (true) {
        if (!options_.jsonOutput) {
            out_ << "\nEnter domain to check (e.g., example.com): " << std::flush;
        }

        std::string line;
        if (!std::getline(in, line)) {
            if (isInterrupted()) {
                state.interrupted = true;
            } else if (!options_.jsonOutput) {
                out_ << std::endl;
            }
            break;
        }

        if (isInterrupted()) {
            state.interrupted = true;
            break;
        }

        if (processInput(state, line) == StepResult::QUIT) {
            break;
        }

        if (isInterrupted()) {
            state.interrupted = true;
            break;
        }
    }

    if (state.interrupted) {
        printInterrupted();
    }
}

void LookupSession::runBatch(const std::vector<std::string>& inputs, SessionState& state,
                             const std::atomic<bool>* interrupted) {
    for (const auto& input : inputs) {
        if (interrupted != nullptr && interrupted->load()) {
            state.interrupted = true;
            break;
        }
        if (processInput(state, input) == StepResult::QUIT) {
            break;
        }
    }

    if (state.interrupted) {
        printInterrupted();
    }
}

void LookupSession::printBanner() {
    if (options_.jsonOutput) {
        return;
    }
    printColored("\n=== Domain Availability Checker ===", kColorTitle);
    out_ << "Enter domain names to check (type 'quit' or 'exit' to finish)" << std::endl;
    out_ << "Press Ctrl+C to exit at any time\n" << std::endl;
}

void LookupSession::printSummary(const SessionState& state) {
    if (options_.jsonOutput) {
        json summary = {
            {"checked", state.checked},
            {"available_count", state.availableDomains.size()},
            {"available_domains", state.availableDomains},
            {"interrupted", state.interrupted}
        };
        out_ << json{{"summary", summary}}.dump() << std::endl;
        return;
    }

    printColored("\n=== Domain Lookup Summary ===", kColorTitle);
    out_ << "Domains checked: " << state.checked << std::endl;
    out_ << "Available domains found: " << state.availableDomains.size() << std::endl;

    if (!state.availableDomains.empty()) {
        printColored("\nAvailable Domains:", kColorSuccess);
        for (const auto& domain : state.availableDomains) {
            out_ << "  - " << domain << std::endl;
        }
    }

    printColored("\nThank you for using the Domain Availability Checker!", kColorTitle);
}

void LookupSession::printColored(const std::string& text, const std::string& colorCode) {
    if (options_.useColor) {
        out_ << "\033[" << colorCode << "m" << text << "\033[0m" << std::endl;
    } else {
        out_ << text << std::endl;
    }
}

void LookupSession::printInvalid(const std::string& domain) {
    if (options_.jsonOutput) {
        json line = {
            {"domain", domain},
            {"available", false},
            {"outcome", outcomeToString(Outcome::INVALID_SYNTAX)},
            {"message", "Invalid domain format: " + domain}
        };
        out_ << line.dump() << std::endl;
        return;
    }
    printColored("Invalid domain format: " + domain, kColorFailure);
    out_ << DomainValidator::kPatternHint << std::endl;
}

void LookupSession::printVerdict(const std::string& domain, const Verdict& verdict) {
    if (options_.jsonOutput) {
        json line = {
            {"domain", domain},
            {"available", verdict.available},
            {"outcome", outcomeToString(verdict.outcome)},
            {"message", verdict.message}
        };
        out_ << line.dump() << std::endl;
        return;
    }

    // Ambiguous and failed lookups share the registered marker
    if (verdict.available) {
        printColored("✓ " + verdict.message, kColorSuccess);
    } else {
        printColored("✗ " + verdict.message, kColorFailure);
    }
}

void LookupSession::printInterrupted() {
    if (options_.jsonOutput) {
        return;
    }
    printColored("\n\nSearch interrupted by user.", kColorNotice);
}
