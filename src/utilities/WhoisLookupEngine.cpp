#include "WhoisLookupEngine.hpp"
#include "WhoisResponseParser.hpp"
#include "domain_validator.h"
#include "lookup_logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

const char* const WhoisLookupEngine::kIanaServer = "whois.iana.org";

namespace {

constexpr size_t kMaxResponseSize = 1024 * 1024;

class SocketHandle {
public:
    explicit SocketHandle(int fd = -1) : fd_(fd) {}
    ~SocketHandle() { reset(); }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    SocketHandle(SocketHandle&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    SocketHandle& operator=(SocketHandle&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    void reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

std::string errnoText(int err) {
    return std::strerror(err);
}

// Non-blocking connect bounded by timeoutMs, socket is left blocking on success
void connectWithTimeout(int fd, const sockaddr* addr, socklen_t addrLen, int timeoutMs) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        throw WhoisTransportError("SocketError", "fcntl failed: " + errnoText(errno));
    }

    if (::connect(fd, addr, addrLen) < 0) {
        if (errno != EINPROGRESS) {
            throw WhoisTransportError("SocketError", "connect failed: " + errnoText(errno));
        }

        pollfd pfd = {fd, POLLOUT, 0};
        int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready == 0) {
            throw WhoisTransportError("TimeoutError", "connect timed out");
        }
        if (ready < 0) {
            if (errno == EINTR) {
                throw WhoisTransportError("InterruptedError", "connect interrupted");
            }
            throw WhoisTransportError("SocketError", "poll failed: " + errnoText(errno));
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
            throw WhoisTransportError("SocketError", "getsockopt failed: " + errnoText(errno));
        }
        if (soError != 0) {
            throw WhoisTransportError("SocketError", "connect failed: " + errnoText(soError));
        }
    }

    if (fcntl(fd, F_SETFL, flags) < 0) {
        throw WhoisTransportError("SocketError", "fcntl failed: " + errnoText(errno));
    }
}

void sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                throw WhoisTransportError("InterruptedError", "send interrupted");
            }
            throw WhoisTransportError("SocketError", "send failed: " + errnoText(errno));
        }
        sent += static_cast<size_t>(n);
    }
}

// Read until the server closes the connection
std::string receiveAll(int fd, int timeoutMs) {
    std::string response;
    char buffer[4096];

    while (true) {
        pollfd pfd = {fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, timeoutMs);
        if (ready == 0) {
            throw WhoisTransportError("TimeoutError", "read timed out");
        }
        if (ready < 0) {
            if (errno == EINTR) {
                throw WhoisTransportError("InterruptedError", "read interrupted");
            }
            throw WhoisTransportError("SocketError", "poll failed: " + errnoText(errno));
        }

        ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                throw WhoisTransportError("InterruptedError", "read interrupted");
            }
            throw WhoisTransportError("SocketError", "recv failed: " + errnoText(errno));
        }

        response.append(buffer, static_cast<size_t>(n));
        if (response.size() > kMaxResponseSize) {
            throw WhoisTransportError("SocketError", "response exceeds " + std::to_string(kMaxResponseSize) + " bytes");
        }
    }

    return response;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

WhoisLookupEngine::WhoisLookupEngine() {
    LOOKUP_LOG("whois", "WhoisLookupEngine initialized");
}

WhoisLookupEngine::WhoisLookupEngine(const WhoisConfig& config) : config_(config) {
    LOOKUP_LOG("whois", "WhoisLookupEngine initialized");
}

WhoisLookupEngine::~WhoisLookupEngine() {
    LOOKUP_LOG("whois", "WhoisLookupEngine destroyed");
}

void WhoisLookupEngine::setConfig(const WhoisConfig& config) {
    std::lock_guard<std::mutex> lock(engineMutex_);
    config_ = config;
    discoveredServers_.clear();
}

const std::map<std::string, std::string>& WhoisLookupEngine::getBuiltinServers() {
    static const std::map<std::string, std::string> servers = {
        {"com", "whois.verisign-grs.com"},
        {"net", "whois.verisign-grs.com"},
        {"org", "whois.pir.org"},
        {"info", "whois.nic.info"},
        {"biz", "whois.nic.biz"},
        {"io", "whois.nic.io"},
        {"ai", "whois.nic.ai"},
        {"co", "whois.nic.co"},
        {"me", "whois.nic.me"},
        {"us", "whois.nic.us"},
        {"xyz", "whois.nic.xyz"},
        {"app", "whois.nic.google"},
        {"dev", "whois.nic.google"},
        {"uk", "whois.nic.uk"},
        {"de", "whois.denic.de"},
        {"fr", "whois.nic.fr"},
        {"nl", "whois.domain-registry.nl"},
        {"eu", "whois.eu"},
        {"ca", "whois.cira.ca"},
        {"au", "whois.auda.org.au"},
        {"ru", "whois.tcinet.ru"},
        {"jp", "whois.jprs.jp"}
    };
    return servers;
}

LookupResult WhoisLookupEngine::performLookup(const std::string& domain) {
    std::lock_guard<std::mutex> lock(engineMutex_);

    std::string validationError;
    if (!validateConfig(config_, validationError)) {
        LOOKUP_LOG_ERROR("whois", "Invalid config: " + validationError);
        return makeError(LookupErrorKind::FAILURE, "ConfigError", validationError);
    }

    if (!DomainValidator::validate(domain)) {
        return makeError(LookupErrorKind::FAILURE, "ValueError", "Invalid domain name: " + domain);
    }

    LOOKUP_LOG("whois", "Performing WHOIS lookup for " + domain);

    std::string response;
    std::string referral;
    try {
        std::string server = resolveServerLocked(domain);
        if (server.empty()) {
            return makeError(LookupErrorKind::NOT_FOUND, "WhoisError",
                             "This TLD has no whois server: ." + DomainValidator::extractTld(domain));
        }
        response = fetchResponse(domain, server, referral);

    } catch (const WhoisTransportError& e) {
        LOOKUP_LOG_WARNING("whois", "Socket lookup failed for " + domain + ": " + e.category() + " - " + e.what());
        if (!config_.commandFallback || e.category() == "InterruptedError") {
            return makeError(LookupErrorKind::FAILURE, e.category(), e.what());
        }

        try {
            LOOKUP_LOG("whois", "Trying whois command for " + domain);
            response = lookupWithCommand(domain);
        } catch (const WhoisTransportError& fallbackError) {
            LOOKUP_LOG_ERROR("whois", "whois command failed for " + domain + ": " + fallbackError.what());
            return makeError(LookupErrorKind::FAILURE, e.category(),
                             std::string(e.what()) + " (whois command: " + fallbackError.what() + ")");
        }

    } catch (const std::exception& e) {
        LOOKUP_LOG_ERROR("whois", "Exception during WHOIS lookup: " + std::string(e.what()));
        return makeError(LookupErrorKind::FAILURE, "LookupError", e.what());
    }

    if (isBlank(response)) {
        return makeError(LookupErrorKind::FAILURE, "ParseError", "Empty WHOIS response for " + domain);
    }

    try {
        return WhoisResponseParser::parse(domain, response, referral);
    } catch (const std::exception& e) {
        LOOKUP_LOG_ERROR("whois", "Failed to parse WHOIS response: " + std::string(e.what()));
        return makeError(LookupErrorKind::FAILURE, "ParseError", e.what());
    }
}

std::string WhoisLookupEngine::resolveServer(const std::string& domain) {
    std::lock_guard<std::mutex> lock(engineMutex_);
    return resolveServerLocked(domain);
}

std::string WhoisLookupEngine::resolveServerLocked(const std::string& domain) {
    if (!config_.server.empty()) {
        return config_.server;
    }

    std::string tld = toLower(DomainValidator::extractTld(domain));

    auto configured = config_.tldServers.find(tld);
    if (configured != config_.tldServers.end()) {
        return configured->second;
    }

    const auto& builtin = getBuiltinServers();
    auto known = builtin.find(tld);
    if (known != builtin.end()) {
        return known->second;
    }

    auto discovered = discoveredServers_.find(tld);
    if (discovered != discoveredServers_.end()) {
        return discovered->second;
    }

    LOOKUP_LOG("whois", "Asking " + std::string(kIanaServer) + " for the ." + tld + " server");
    std::string ianaResponse = queryServer(kIanaServer, tld + "\r\n");
    std::string server = WhoisResponseParser::extractReferralServer(ianaResponse);
    discoveredServers_[tld] = server;

    LOOKUP_LOG("whois", "." + tld + " is served by " + (server.empty() ? "<none>" : server));
    return server;
}

std::string WhoisLookupEngine::fetchResponse(const std::string& domain, const std::string& server,
                                             std::string& referralText) {
    std::string response = queryServer(server, buildQuery(server, domain));

    if (!config_.followReferrals) {
        return response;
    }

    std::string referral = WhoisResponseParser::extractReferralServer(response);
    if (referral.empty() || referral == toLower(server)) {
        return response;
    }

    LOOKUP_LOG("whois", "Following referral from " + server + " to " + referral);
    try {
        referralText = queryServer(referral, buildQuery(referral, domain));
    } catch (const WhoisTransportError& e) {
        // The registry answer alone is still usable
        LOOKUP_LOG_WARNING("whois", "Referral to " + referral + " failed: " + e.what());
    }
    return response;
}

std::string WhoisLookupEngine::buildQuery(const std::string& server, const std::string& domain) const {
    if (server == "whois.denic.de") {
        return "-T dn,ace " + domain + "\r\n";
    }
    return domain + "\r\n";
}

std::string WhoisLookupEngine::queryServer(const std::string& server, const std::string& query) const {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    std::string port = std::to_string(config_.port);
    addrinfo* addresses = nullptr;
    int rc = getaddrinfo(server.c_str(), port.c_str(), &hints, &addresses);
    if (rc != 0) {
        throw WhoisTransportError("ResolveError", "Cannot resolve " + server + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addressGuard(addresses, &freeaddrinfo);

    int timeoutMs = config_.timeout * 1000;
    SocketHandle socket;
    std::string lastCategory = "SocketError";
    std::string lastMessage = "no usable address";

    for (addrinfo* ai = addresses; ai != nullptr; ai = ai->ai_next) {
        SocketHandle candidate(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
        if (!candidate.valid()) {
            lastMessage = "socket failed: " + errnoText(errno);
            continue;
        }

        try {
            connectWithTimeout(candidate.get(), ai->ai_addr, ai->ai_addrlen, timeoutMs);
            socket = std::move(candidate);
            break;
        } catch (const WhoisTransportError& e) {
            lastCategory = e.category();
            lastMessage = e.what();
        }
    }

    if (!socket.valid()) {
        throw WhoisTransportError(lastCategory, "Cannot connect to " + server + ":" + port + ": " + lastMessage);
    }

    LOOKUP_LOG("whois", "Connected to " + server + ":" + port);

    sendAll(socket.get(), query);
    std::string response = receiveAll(socket.get(), timeoutMs);

    LOOKUP_LOG("whois", "Received " + std::to_string(response.size()) + " bytes from " + server);
    return response;
}

std::string WhoisLookupEngine::lookupWithCommand(const std::string& domain) const {
    int exitCode = 0;
    std::string output = executeCommand("whois " + domain + " 2>&1", config_.timeout + 5, exitCode);

    if (exitCode == 124) {
        throw WhoisTransportError("TimeoutError", "whois command timed out");
    }
    if (exitCode == 126 || exitCode == 127) {
        throw WhoisTransportError("CommandError", "whois command not available");
    }
    if (isBlank(output)) {
        throw WhoisTransportError("CommandError", "No output from whois command");
    }

    // whois exits non-zero for unregistered names but still prints the registry answer
    if (exitCode != 0) {
        LOOKUP_LOG("whois", "whois command exited with code " + std::to_string(exitCode));
    }
    return output;
}

std::string WhoisLookupEngine::executeCommand(const std::string& command, int timeoutSeconds, int& exitCode) const {
    std::string result;

    std::string timeoutCommand = "timeout " + std::to_string(timeoutSeconds) + " " + command;
    FILE* pipe = popen(timeoutCommand.c_str(), "r");

    if (!pipe) {
        throw WhoisTransportError("CommandError", "Failed to execute command: " + command);
    }

    char buffer[1024];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result += buffer;
    }

    int status = pclose(pipe);
    if (status == -1) {
        throw WhoisTransportError("CommandError", "Failed to collect command status: " + command);
    }
    exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    return result;
}

bool WhoisLookupEngine::validateConfig(const WhoisConfig& config, std::string& error) {
    if (config.port < 1 || config.port > 65535) {
        error = "Port must be between 1 and 65535";
        return false;
    }

    if (config.timeout < 1 || config.timeout > 60) {
        error = "Timeout must be between 1 and 60 seconds";
        return false;
    }

    auto hasBadChar = [](const std::string& server) {
        return std::any_of(server.begin(), server.end(), [](unsigned char c) {
            return std::isspace(c) || c == ';' || c == '|' || c == '&' || c == '`' || c == '$';
        });
    };

    if (hasBadChar(config.server)) {
        error = "Invalid WHOIS server format";
        return false;
    }

    for (const auto& [tld, server] : config.tldServers) {
        if (server.empty() || hasBadChar(server)) {
            error = "Invalid WHOIS server for ." + tld;
            return false;
        }
    }

    return true;
}

WhoisLookupEngine::WhoisConfig WhoisLookupEngine::configFromChecker(const CheckerConfig& config) {
    WhoisConfig whoisConfig;
    whoisConfig.server = config.whois_server;
    whoisConfig.port = config.whois_port;
    whoisConfig.timeout = config.timeout_seconds;
    whoisConfig.followReferrals = config.follow_referrals;
    whoisConfig.commandFallback = config.command_fallback;
    whoisConfig.tldServers = config.tld_servers;
    return whoisConfig;
}

LookupError WhoisLookupEngine::makeError(LookupErrorKind kind, const std::string& category, const std::string& message) {
    LookupError error;
    error.kind = kind;
    error.category = category;
    error.message = message;
    return error;
}
