#include <iostream>
#include <string>
#include <vector>
#include <atomic>
#include <exception>
#include <csignal>
#include <signal.h>
#include <unistd.h>

#include "checker_config.h"
#include "config_parser.h"
#include "config_manager.h"
#include "lookup_logger.h"
#include "lookup_session.h"
#include "utilities/WhoisLookupEngine.hpp"

namespace {

const char* const kVersion = "0.1.0";
const char* const kDefaultConfigFile = "config/domain_lookup.json";

// Set from the signal handler, polled by the session between domains
std::atomic<bool> interrupted{false};

void signalHandler(int) {
    interrupted = true;
}

// No SA_RESTART so a blocked read on stdin returns and the summary still prints
void installSignalHandlers() {
    struct sigaction action;
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] [domain ...]\n"
              << "\n"
              << "Checks domain availability with WHOIS. Without domains an interactive\n"
              << "prompt is started.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE   JSON configuration (default " << kDefaultConfigFile << ")\n"
              << "  -j, --json          one JSON object per verdict\n"
              << "      --no-color      disable ANSI colors\n"
              << "  -v, --version       print version and exit\n"
              << "  -h, --help          print this help and exit" << std::endl;
}

struct CommandLine {
    std::string configFile = kDefaultConfigFile;
    bool configGiven = false;
    bool json = false;
    bool noColor = false;
    bool showVersion = false;
    bool showHelp = false;
    std::vector<std::string> domains;
};

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            cmd.configFile = argv[++i];
            cmd.configGiven = true;
        } else if (arg == "-j" || arg == "--json") {
            cmd.json = true;
        } else if (arg == "--no-color") {
            cmd.noColor = true;
        } else if (arg == "-v" || arg == "--version") {
            cmd.showVersion = true;
        } else if (arg == "-h" || arg == "--help") {
            cmd.showHelp = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else {
            cmd.domains.push_back(arg);
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return 1;
    }

    if (cmd.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    if (cmd.showVersion) {
        std::cout << "domain-lookup " << kVersion << std::endl;
        return 0;
    }

    installSignalHandlers();

    // ======== LOAD CONFIGURATION ========

    CheckerConfig config = ConfigParser::getDefaultConfig();
    try {
        if (!ConfigParser::parseConfig(cmd.configFile, config)) {
            if (cmd.configGiven) {
                LOOKUP_LOG_WARNING("config", "Could not load config from " + cmd.configFile + ", using defaults");
            }
            config = ConfigParser::getDefaultConfig();
        }
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        config = ConfigParser::getDefaultConfig();
    }

    if (cmd.json) {
        config.output_format = "json";
    }
    if (cmd.noColor || !isatty(STDOUT_FILENO)) {
        config.use_color = false;
    }

    ConfigManager::getInstance().setConfig(config);
    LookupLogger::getInstance().setGroupFilters(config.logging);

    // ======== WHOIS ENGINE ========

    WhoisLookupEngine::WhoisConfig whoisConfig = WhoisLookupEngine::configFromChecker(config);
    std::string configError;
    if (!WhoisLookupEngine::validateConfig(whoisConfig, configError)) {
        std::cerr << "Invalid WHOIS configuration: " << configError << std::endl;
        return 1;
    }
    WhoisLookupEngine engine(whoisConfig);

    // ======== SESSION ========

    const CheckerConfig& active = ConfigManager::getInstance().getConfig();

    LookupSession::SessionOptions options;
    options.throttle = std::chrono::milliseconds(active.throttle_ms);
    options.useColor = active.use_color;
    options.jsonOutput = ConfigManager::getInstance().isJsonOutput();

    LookupSession session(
        [&engine](const std::string& domain) { return engine.performLookup(domain); },
        std::cout, options);

    SessionState state;
    if (!cmd.domains.empty()) {
        session.runBatch(cmd.domains, state, &interrupted);
    } else {
        session.printBanner();
        session.run(std::cin, state, &interrupted);
    }

    session.printSummary(state);
    return 0;
}
