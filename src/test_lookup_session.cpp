#include "lookup_session.h"
#include "lookup_logger.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

static int failures = 0;

void check(bool condition, const std::string& name) {
    std::cout << name << ": " << (condition ? "PASS" : "FAIL") << std::endl;
    if (!condition) failures++;
}

size_t countOccurrences(const std::string& text, const std::string& part) {
    size_t count = 0;
    for (size_t pos = text.find(part); pos != std::string::npos; pos = text.find(part, pos + part.size())) {
        count++;
    }
    return count;
}

// Scripted WHOIS collaborator: example.com registered, free.com unregistered
LookupResult fakeLookup(const std::string& domain, std::vector<std::string>& calls) {
    calls.push_back(domain);

    if (domain == "free.com") {
        LookupError error;
        error.kind = LookupErrorKind::NOT_FOUND;
        error.category = "WhoisError";
        error.message = "No match for \"FREE.COM\".";
        return error;
    }
    if (domain == "broken.com") {
        throw std::runtime_error("connection reset");
    }

    WhoisRecord record;
    record.domainName = FieldValue<std::string>(domain);
    record.registrar = "Fake Registrar";
    return record;
}

LookupSession::SessionOptions plainOptions() {
    LookupSession::SessionOptions options;
    options.throttle = std::chrono::milliseconds(500);
    options.useColor = false;
    options.jsonOutput = false;
    return options;
}

void testEndToEnd() {
    std::cout << "\n--- Test 1: Scripted Session ---" << std::endl;

    std::vector<std::string> calls;
    std::vector<std::chrono::milliseconds> sleeps;
    std::ostringstream out;

    LookupSession session(
        [&calls](const std::string& domain) { return fakeLookup(domain, calls); },
        out, plainOptions());
    session.setSleepFunction([&sleeps](std::chrono::milliseconds delay) { sleeps.push_back(delay); });

    std::istringstream in("not-a-domain\nexample.com\nquit\nfree.com\n");
    SessionState state;
    session.run(in, state);
    session.printSummary(state);

    std::string output = out.str();
    check(countOccurrences(output, "Invalid domain format: not-a-domain") == 1, "one invalid syntax report");
    check(calls.size() == 1 && calls[0] == "example.com", "only the valid domain is looked up");
    check(countOccurrences(output, "✗ Domain example.com is registered (Registrar: Fake Registrar)") == 1,
          "one verdict for example.com");
    check(state.checked == 1, "checked count is one");
    check(output.find("Domains checked: 1") != std::string::npos, "summary reports checked=1");
    check(output.find("Available domains found: 0") != std::string::npos, "summary reports no available");
    check(sleeps.size() == 1 && sleeps[0].count() == 500, "throttle applied once per check");
    check(!state.interrupted, "not interrupted");
}

void testAvailableTracking() {
    std::cout << "\n--- Test 2: Available Domains ---" << std::endl;

    std::vector<std::string> calls;
    std::ostringstream out;
    LookupSession session(
        [&calls](const std::string& domain) { return fakeLookup(domain, calls); },
        out, plainOptions());
    session.setSleepFunction([](std::chrono::milliseconds) {});

    SessionState state;
    check(session.processInput(state, "  FREE.com ") == StepResult::CONTINUE, "mixed case input continues");
    check(session.processInput(state, "") == StepResult::CONTINUE, "empty input continues");
    check(session.processInput(state, "example.com") == StepResult::CONTINUE, "registered input continues");
    check(session.processInput(state, "EXIT") == StepResult::QUIT, "exit quits");
    check(session.processInput(state, "q") == StepResult::QUIT, "q quits");

    check(state.checked == 2, "empty input not counted");
    check(state.availableDomains.size() == 1 && state.availableDomains[0] == "free.com", "available list in order");
    check(out.str().find("Please enter a domain name") != std::string::npos, "empty input prompt");
    check(out.str().find("✓ Domain free.com appears to be available (WHOIS response: No match for \"FREE)") != std::string::npos,
          "available verdict line");

    session.printSummary(state);
    check(out.str().find("  - free.com") != std::string::npos, "summary lists available domain");
}

void testCollaboratorFailure() {
    std::cout << "\n--- Test 3: Collaborator Exception ---" << std::endl;

    std::vector<std::string> calls;
    std::ostringstream out;
    LookupSession session(
        [&calls](const std::string& domain) { return fakeLookup(domain, calls); },
        out, plainOptions());
    session.setSleepFunction([](std::chrono::milliseconds) {});

    SessionState state;
    Verdict verdict = session.checkDomain(state, "broken.com");
    check(!verdict.available, "exception is not available");
    check(verdict.outcome == Outcome::LOOKUP_FAILED, "exception is lookup_failed");
    check(verdict.message == "Error checking broken.com: LookupError - connection reset", "exception message");

    // Session keeps going after a failure
    session.processInput(state, "example.com");
    check(state.checked == 2, "later domains still checked");
}

void testInterrupt() {
    std::cout << "\n--- Test 4: Interrupt ---" << std::endl;

    std::vector<std::string> calls;
    std::ostringstream out;
    std::atomic<bool> interrupted{false};

    LookupSession session(
        [&calls, &interrupted](const std::string& domain) {
            interrupted = true;
            return fakeLookup(domain, calls);
        },
        out, plainOptions());
    session.setSleepFunction([](std::chrono::milliseconds) {});

    std::istringstream in("example.com\nfree.com\n");
    SessionState state;
    session.run(in, state, &interrupted);
    session.printSummary(state);

    check(calls.size() == 1, "loop stops after the current domain");
    check(state.interrupted, "state marked interrupted");
    check(out.str().find("Search interrupted by user.") != std::string::npos, "interrupt notice printed");
    check(out.str().find("Domains checked: 1") != std::string::npos, "summary still printed");
}

void testJsonOutput() {
    std::cout << "\n--- Test 5: JSON Output ---" << std::endl;

    std::vector<std::string> calls;
    std::ostringstream out;
    auto options = plainOptions();
    options.jsonOutput = true;

    LookupSession session(
        [&calls](const std::string& domain) { return fakeLookup(domain, calls); },
        out, options);
    session.setSleepFunction([](std::chrono::milliseconds) {});

    SessionState state;
    session.runBatch({"bad..name", "free.com", "example.com"}, state);
    session.printSummary(state);

    std::vector<json> lines;
    std::istringstream iss(out.str());
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty()) lines.push_back(json::parse(line));
    }

    check(lines.size() == 4, "three results and a summary");
    if (lines.size() != 4) return;
    check(lines[0]["outcome"] == "invalid_syntax", "invalid syntax line");
    check(lines[1]["available"] == true && lines[1]["outcome"] == "no_record", "available line");
    check(lines[2]["outcome"] == "registered", "registered line");
    check(lines[3]["summary"]["checked"] == 2, "summary checked count");
    check(lines[3]["summary"]["available_domains"] == json::array({"free.com"}), "summary available list");
}

void testColoredOutput() {
    std::cout << "\n--- Test 6: Colors ---" << std::endl;

    std::vector<std::string> calls;
    std::ostringstream out;
    auto options = plainOptions();
    options.useColor = true;

    LookupSession session(
        [&calls](const std::string& domain) { return fakeLookup(domain, calls); },
        out, options);
    session.setSleepFunction([](std::chrono::milliseconds) {});

    SessionState state;
    session.printBanner();
    session.processInput(state, "free.com");
    check(out.str().find("\033[1;36m\n=== Domain Availability Checker ===\033[0m") != std::string::npos, "banner in cyan");
    check(out.str().find("\033[1;32m✓ Domain free.com") != std::string::npos, "available verdict in green");
}

int main(int argc, char* argv[]) {
    std::cout << "LookupSession Test Suite" << std::endl;
    std::cout << "========================" << std::endl;

    LookupLogger::getInstance().setGroupFilters({{"session", false}});

    try {
        testEndToEnd();
        testAvailableTracking();
        testCollaboratorFailure();
        testInterrupt();
        testJsonOutput();
        testColoredOutput();
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    if (failures > 0) {
        std::cout << "\n" << failures << " check(s) failed" << std::endl;
        return 1;
    }
    std::cout << "\nAll tests completed successfully!" << std::endl;
    return 0;
}
