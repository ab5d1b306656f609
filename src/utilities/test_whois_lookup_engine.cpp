#include "WhoisLookupEngine.hpp"
#include "availability_classifier.h"
#include "lookup_logger.h"
#include <iostream>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

static int failures = 0;

void check(bool condition, const std::string& name) {
    std::cout << name << ": " << (condition ? "PASS" : "FAIL") << std::endl;
    if (!condition) failures++;
}

// Answers one canned response per accepted connection on 127.0.0.1
class LoopbackWhoisServer {
public:
    explicit LoopbackWhoisServer(std::vector<std::string> responses) : responses_(std::move(responses)) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0) {
            throw std::runtime_error("socket failed");
        }

        int reuse = 1;
        setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;

        if (bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || listen(listenFd_, 4) < 0) {
            ::close(listenFd_);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackWhoisServer() {
        if (thread_.joinable()) {
            thread_.join();
        }
        ::close(listenFd_);
    }

    int port() const { return port_; }

    std::vector<std::string> queries() {
        if (thread_.joinable()) {
            thread_.join();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return queries_;
    }

private:
    int listenFd_ = -1;
    int port_ = 0;
    std::vector<std::string> responses_;
    std::vector<std::string> queries_;
    std::mutex mutex_;
    std::thread thread_;

    void serve() {
        for (const auto& response : responses_) {
            int client = ::accept(listenFd_, nullptr, nullptr);
            if (client < 0) {
                return;
            }

            std::string query;
            char buffer[256];
            while (query.find("\r\n") == std::string::npos) {
                ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
                if (n <= 0) break;
                query.append(buffer, static_cast<size_t>(n));
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                queries_.push_back(query);
            }

            if (!response.empty()) {
                ::send(client, response.data(), response.size(), MSG_NOSIGNAL);
            }
            ::close(client);
        }
    }
};

WhoisLookupEngine::WhoisConfig loopbackConfig(int port) {
    WhoisLookupEngine::WhoisConfig config;
    config.server = "127.0.0.1";
    config.port = port;
    config.timeout = 5;
    config.followReferrals = false;
    config.commandFallback = false;
    return config;
}

void testConfigValidation() {
    std::cout << "\n--- Test 1: Configuration Validation ---" << std::endl;

    std::string error;
    WhoisLookupEngine::WhoisConfig config;
    check(WhoisLookupEngine::validateConfig(config, error), "default config is valid");

    config.port = 0;
    check(!WhoisLookupEngine::validateConfig(config, error), "port 0 rejected");
    std::cout << "Error message: " << error << std::endl;

    config = WhoisLookupEngine::WhoisConfig();
    config.timeout = 61;
    check(!WhoisLookupEngine::validateConfig(config, error), "timeout above 60 rejected");

    config = WhoisLookupEngine::WhoisConfig();
    config.server = "whois.example.com; rm -rf /";
    check(!WhoisLookupEngine::validateConfig(config, error), "shell characters rejected");

    CheckerConfig checker;
    checker.whois_server = "whois.example.net";
    checker.whois_port = 4343;
    checker.tld_servers["test"] = "whois.nic.test";
    auto converted = WhoisLookupEngine::configFromChecker(checker);
    check(converted.server == "whois.example.net" && converted.port == 4343, "checker config converted");
    check(converted.tldServers.at("test") == "whois.nic.test", "tld servers carried over");
}

void testServerSelection() {
    std::cout << "\n--- Test 2: Server Selection ---" << std::endl;

    WhoisLookupEngine::WhoisConfig config;
    config.tldServers["org"] = "whois.custom-org.example";

    WhoisLookupEngine engine(config);
    check(engine.resolveServer("example.com") == "whois.verisign-grs.com", "builtin server for .com");
    check(engine.resolveServer("example.org") == "whois.custom-org.example", "configured server wins over builtin");
    check(engine.resolveServer("EXAMPLE.NET") == "whois.verisign-grs.com", "tld match ignores case");

    config.server = "whois.override.example";
    engine.setConfig(config);
    check(engine.resolveServer("example.com") == "whois.override.example", "explicit server overrides all");
}

void testRegisteredLookup() {
    std::cout << "\n--- Test 3: Registered Domain Over TCP ---" << std::endl;

    LoopbackWhoisServer server({
        "Domain Name: EXAMPLE.COM\r\n"
        "Registrar: Loopback Registrar\r\n"
        "Creation Date: 2001-02-03T00:00:00Z\r\n"
        "Registry Expiry Date: 2099-02-03T00:00:00Z\r\n"
        "Name Server: NS1.EXAMPLE.COM\r\n"
    });

    WhoisLookupEngine engine(loopbackConfig(server.port()));
    LookupResult result = engine.performLookup("example.com");
    auto queries = server.queries();

    check(queries.size() == 1 && queries[0] == "example.com\r\n", "query line sent");
    const WhoisRecord* record = std::get_if<WhoisRecord>(&result);
    check(record != nullptr && record->hasDomainName(), "record returned");

    Verdict verdict = AvailabilityClassifier::classify("example.com", result, WhoisClock::now());
    check(!verdict.available, "classified as registered");
    check(verdict.message.find("Registrar: Loopback Registrar") != std::string::npos, "registrar evidence");
}

void testNotFoundLookup() {
    std::cout << "\n--- Test 4: Unregistered Domain Over TCP ---" << std::endl;

    LoopbackWhoisServer server({"No match for \"FREE-NAME-42.COM\".\r\n"});

    WhoisLookupEngine engine(loopbackConfig(server.port()));
    LookupResult result = engine.performLookup("free-name-42.com");
    server.queries();

    const LookupError* error = std::get_if<LookupError>(&result);
    check(error != nullptr && error->kind == LookupErrorKind::NOT_FOUND, "not found error returned");
    check(AvailabilityClassifier::classify("free-name-42.com", result, WhoisClock::now()).available,
          "classified as available");
}

void testReferral() {
    std::cout << "\n--- Test 5: Registrar Referral ---" << std::endl;

    LoopbackWhoisServer server({
        "Domain Name: EXAMPLE.COM\r\nRegistrar WHOIS Server: localhost\r\n",
        "Domain Name: example.com\r\nRegistrar: Referred Registrar\r\n"
    });

    auto config = loopbackConfig(server.port());
    config.followReferrals = true;
    WhoisLookupEngine engine(config);
    LookupResult result = engine.performLookup("example.com");
    auto queries = server.queries();

    check(queries.size() == 2, "registry and registrar both queried");
    const WhoisRecord* record = std::get_if<WhoisRecord>(&result);
    check(record != nullptr && record->registrar && *record->registrar == "Referred Registrar",
          "registrar answer merged");
}

void testRegistrarMiss() {
    std::cout << "\n--- Test 6: Registrar Without A Record ---" << std::endl;

    LoopbackWhoisServer server({
        "Domain Name: EXAMPLE.COM\r\nRegistrar WHOIS Server: localhost\r\nRegistrar: Registry Side Registrar\r\n",
        "Domain not found.\r\n"
    });

    auto config = loopbackConfig(server.port());
    config.followReferrals = true;
    WhoisLookupEngine engine(config);
    LookupResult result = engine.performLookup("example.com");
    auto queries = server.queries();

    check(queries.size() == 2, "registrar queried");
    const WhoisRecord* record = std::get_if<WhoisRecord>(&result);
    check(record != nullptr && *record->registrar == "Registry Side Registrar", "registry answer kept");

    Verdict verdict = AvailabilityClassifier::classify("example.com", result, WhoisClock::now());
    check(!verdict.available, "registered despite the registrar miss");
}

void testOverlongResponseLine() {
    std::cout << "\n--- Test 7: Overlong Response Line ---" << std::endl;

    LoopbackWhoisServer server({"Domain Name: " + std::string(500000, 'x') + "\r\n"});

    WhoisLookupEngine engine(loopbackConfig(server.port()));
    LookupResult result = engine.performLookup("example.com");
    server.queries();

    const WhoisRecord* record = std::get_if<WhoisRecord>(&result);
    check(record != nullptr && !record->hasDomainName(), "overlong line skipped without crashing");
}

void testTransportFailures() {
    std::cout << "\n--- Test 8: Transport Failures ---" << std::endl;

    // Grab a free port and release it so nothing listens there
    int probe = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    bind(probe, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(probe, reinterpret_cast<sockaddr*>(&addr), &len);
    int closedPort = ntohs(addr.sin_port);
    ::close(probe);

    WhoisLookupEngine engine(loopbackConfig(closedPort));
    LookupResult result = engine.performLookup("example.com");
    const LookupError* error = std::get_if<LookupError>(&result);
    check(error != nullptr && error->kind == LookupErrorKind::FAILURE, "refused connection is a failure");
    check(error && error->category == "SocketError", "failure category is SocketError");

    Verdict verdict = AvailabilityClassifier::classify("example.com", result, WhoisClock::now());
    check(verdict.outcome == Outcome::LOOKUP_FAILED, "refused connection is lookup_failed");

    LoopbackWhoisServer silent({""});
    WhoisLookupEngine emptyEngine(loopbackConfig(silent.port()));
    result = emptyEngine.performLookup("example.com");
    silent.queries();
    error = std::get_if<LookupError>(&result);
    check(error != nullptr && error->category == "ParseError", "empty response is a parse error");

    result = engine.performLookup("not_a_domain");
    error = std::get_if<LookupError>(&result);
    check(error != nullptr && error->category == "ValueError", "invalid domain is rejected before lookup");
}

void testLiveLookups() {
    std::cout << "\n--- Test 9: Live Lookups ---" << std::endl;

    WhoisLookupEngine engine;
    std::vector<std::string> domains = {"google.com", "example.org", "this-domain-should-not-exist-12345.com"};

    for (const auto& domain : domains) {
        auto startTime = std::chrono::high_resolution_clock::now();
        LookupResult result = engine.performLookup(domain);
        auto endTime = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

        Verdict verdict = AvailabilityClassifier::classify(domain, result, WhoisClock::now());
        std::cout << "  " << domain << " [" << outcomeToString(verdict.outcome) << "] "
                  << verdict.message << " (" << duration.count() << " ms)" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::cout << "WhoisLookupEngine Test Suite" << std::endl;
    std::cout << "============================" << std::endl;

    LookupLogger::getInstance().setGroupFilters({{"whois", true}, {"parser", true}});

    try {
        testConfigValidation();
        testServerSelection();
        testRegisteredLookup();
        testNotFoundLookup();
        testReferral();
        testRegistrarMiss();
        testOverlongResponseLine();
        testTransportFailures();

        const char* live = std::getenv("WHOIS_LIVE_TESTS");
        if (live != nullptr && std::string(live) == "1") {
            testLiveLookups();
        }
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
