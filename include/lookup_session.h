#ifndef LOOKUP_SESSION_H
#define LOOKUP_SESSION_H

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include "availability_classifier.h"
#include "whois_record.h"

// Counters for one run, owned by the caller
struct SessionState {
    int checked = 0;
    std::vector<std::string> availableDomains;
    bool interrupted = false;
};

enum class StepResult {
    CONTINUE,
    QUIT
};

/**
 * Interactive loop around the validator and classifier: reads domains,
 * throttles WHOIS traffic, prints one verdict per domain and a final summary.
 */
class LookupSession {
public:
    using LookupFunction = std::function<LookupResult(const std::string&)>;
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;
    using ClockFunction = std::function<WhoisTime()>;

    struct SessionOptions {
        std::chrono::milliseconds throttle{500};
        bool useColor = true;
        bool jsonOutput = false;
    };

    LookupSession(LookupFunction lookup, std::ostream& out, const SessionOptions& options);

    void setSleepFunction(SleepFunction sleep);
    void setClockFunction(ClockFunction clock);

    // One raw line of input: quit command, empty, invalid or a domain to check
    StepResult processInput(SessionState& state, const std::string& rawInput);

    // Look up an already validated domain and report the verdict
    Verdict checkDomain(SessionState& state, const std::string& domain);

    // Prompt until quit, end of input or interrupt
    void run(std::istream& in, SessionState& state, const std::atomic<bool>* interrupted = nullptr);

    // Check a fixed list without prompting
    void runBatch(const std::vector<std::string>& inputs, SessionState& state,
                  const std::atomic<bool>* interrupted = nullptr);

    void printBanner();
    void printSummary(const SessionState& state);

    static bool isQuitCommand(const std::string& input);

private:
    LookupFunction lookup_;
    std::ostream& out_;
    SessionOptions options_;
    SleepFunction sleep_;
    ClockFunction clock_;

    void printColored(const std::string& text, const std::string& colorCode);
    void printInvalid(const std::string& domain);
    void printVerdict(const std::string& domain, const Verdict& verdict);
    void printInterrupted();
};

#endif // LOOKUP_SESSION_H
