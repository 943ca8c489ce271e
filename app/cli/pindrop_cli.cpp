#include "Config.h"
#include "EventPrinter.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "NetUtils.h"
#include "NodeConfig.h"
#include "NodeState.h"
#include "PathUtils.h"
#include "PinCode.h"
#include "PinDropNode.h"
#include "Version.h"
#include <any>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace PinDrop;

namespace {

    volatile sig_atomic_t signalReceived = 0;

    void signalHandler(int) {
        signalReceived = 1;
    }

    // Exit codes
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILED = 1;
    constexpr int EXIT_USAGE = 2;

    struct CliOptions {
        std::string command;
        std::vector<std::string> positional;

        std::string configPath;
        std::optional<std::string> logLevel;
        std::optional<std::string> logFile;
        std::optional<int> transferTimeoutSec;
        std::optional<int> connectTimeoutMs;
        std::optional<int> discoveryPort;
        std::optional<std::string> broadcastAddress;
        bool json = false;
        bool noDiscovery = false;
        bool stats = false;

        std::optional<std::string> dir;
        std::optional<std::string> pin;
        std::optional<int> port;
        std::optional<std::string> to;
        int seconds = 10;
        bool announce = false;
    };

    void printUsage(const char* progName) {
        std::cout << "PinDrop - PIN-protected LAN file transfer\n";
        std::cout << "\nUsage: " << progName << " [global options] <command> [command options]\n\n";
        std::cout << "Commands:\n";
        std::cout << "  receive [--dir PATH] [--pin PIN] [--port N]   Receive one file\n";
        std::cout << "  send <file> --to IP --pin PIN [--port N]      Send a file\n";
        std::cout << "  discover [--seconds N] [--announce]           List peers on the LAN\n";
        std::cout << "  announce                                      Broadcast presence once\n";
        std::cout << "  pin                                           Print a new random PIN\n";
        std::cout << "\nGlobal options:\n";
        std::cout << "  --config PATH          Configuration file (default: " << PathUtils::getConfigPath().string() << ")\n";
        std::cout << "  --log-level LEVEL      debug, info, warn, error or critical\n";
        std::cout << "  --log-file PATH        Also write log lines to PATH\n";
        std::cout << "  --timeout SEC          Overall transfer timeout\n";
        std::cout << "  --connect-timeout MS   Connect timeout\n";
        std::cout << "  --discovery-port N     UDP discovery port\n";
        std::cout << "  --broadcast ADDR       Broadcast address for announcements\n";
        std::cout << "  --json                 Emit events and logs as JSON lines\n";
        std::cout << "  --no-discovery         Do not announce while receiving\n";
        std::cout << "  --stats                Print transfer statistics on exit\n";
        std::cout << "  --help                 Show this help message\n";
        std::cout << "  --version              Show version\n";
        std::cout << "\nExamples:\n";
        std::cout << "  " << progName << " receive --dir ~/Downloads\n";
        std::cout << "  " << progName << " send report.pdf --to 192.168.1.20 --pin 123456\n";
    }

    bool parseNumber(const std::string& text, int& out) {
        try {
            size_t consumed = 0;
            out = std::stoi(text, &consumed);
            return consumed == text.size();
        } catch (const std::exception&) {
            return false;
        }
    }

    // Returns an error message, empty on success
    std::string parseArgs(int argc, char* argv[], CliOptions& opts, bool& helpRequested, bool& versionRequested) {
        auto needValue = [&](int& i, const std::string& flag, std::string& value) -> std::string {
            if (i + 1 >= argc) {
                return "Missing value for " + flag;
            }
            value = argv[++i];
            return "";
        };
        auto needInt = [&](int& i, const std::string& flag, int& value) -> std::string {
            std::string text;
            auto err = needValue(i, flag, text);
            if (!err.empty()) return err;
            if (!parseNumber(text, value)) {
                return "Invalid number for " + flag + ": " + text;
            }
            return "";
        };

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string value;
            int number = 0;
            std::string err;

            if (arg == "--help" || arg == "-h") {
                helpRequested = true;
            } else if (arg == "--version") {
                versionRequested = true;
            } else if (arg == "--config") {
                err = needValue(i, arg, opts.configPath);
            } else if (arg == "--log-level") {
                if ((err = needValue(i, arg, value)).empty()) opts.logLevel = value;
            } else if (arg == "--log-file") {
                if ((err = needValue(i, arg, value)).empty()) opts.logFile = value;
            } else if (arg == "--timeout") {
                if ((err = needInt(i, arg, number)).empty()) opts.transferTimeoutSec = number;
            } else if (arg == "--connect-timeout") {
                if ((err = needInt(i, arg, number)).empty()) opts.connectTimeoutMs = number;
            } else if (arg == "--discovery-port") {
                if ((err = needInt(i, arg, number)).empty()) opts.discoveryPort = number;
            } else if (arg == "--broadcast") {
                if ((err = needValue(i, arg, value)).empty()) opts.broadcastAddress = value;
            } else if (arg == "--json") {
                opts.json = true;
            } else if (arg == "--no-discovery") {
                opts.noDiscovery = true;
            } else if (arg == "--stats") {
                opts.stats = true;
            } else if (arg == "--dir") {
                if ((err = needValue(i, arg, value)).empty()) opts.dir = value;
            } else if (arg == "--pin") {
                if ((err = needValue(i, arg, value)).empty()) opts.pin = PinCode::normalize(value);
            } else if (arg == "--port") {
                if ((err = needInt(i, arg, number)).empty()) opts.port = number;
            } else if (arg == "--to") {
                if ((err = needValue(i, arg, value)).empty()) opts.to = value;
            } else if (arg == "--seconds") {
                err = needInt(i, arg, opts.seconds);
            } else if (arg == "--announce") {
                opts.announce = true;
            } else if (arg.size() > 1 && arg[0] == '-') {
                err = "Unknown option '" + arg + "'";
            } else if (opts.command.empty()) {
                opts.command = arg;
            } else {
                opts.positional.push_back(arg);
            }

            if (!err.empty()) {
                return err;
            }
        }
        return "";
    }

    // Sleeps until done() is true or a signal arrives; returns false on signal
    template<typename Pred>
    bool waitUntil(Pred done) {
        while (!done()) {
            if (signalReceived) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return true;
    }

    int runReceive(PinDropNode& node, EventPrinter& printer, const CliOptions& opts) {
        auto& logger = Logger::instance();

        if (opts.pin) {
            auto set = node.state().setPin(*opts.pin);
            if (!set) {
                printer.printError(set.error());
                return EXIT_USAGE;
            }
        }
        printer.printPin(node.currentPin(), node.state().localIp());

        std::string dir = opts.dir ? PathUtils::expandHome(*opts.dir).string() : "";
        auto started = node.startListening(dir, "", opts.port ? *opts.port : -1);
        if (!started) {
            printer.printError(started.error());
            return EXIT_FAILED;
        }

        if (!opts.noDiscovery) {
            auto discovery = node.startDiscovery();
            if (!discovery) {
                logger.log(LogLevel::WARN, "Discovery unavailable: " + discovery.error().message, "Cli");
            }
        }

        if (!waitUntil([&] { return !node.isListening(); })) {
            logger.log(LogLevel::INFO, "Interrupted, stopping listener", "Cli");
            node.stopListening();
        }
        node.stopDiscovery();

        auto result = node.waitForReceive();
        return result ? EXIT_OK : EXIT_FAILED;
    }

    int runSend(PinDropNode& node, EventPrinter& printer, const CliOptions& opts) {
        if (opts.positional.size() != 1 || !opts.to || !opts.pin) {
            std::cerr << "Error: send needs <file> --to IP --pin PIN" << std::endl;
            return EXIT_USAGE;
        }

        auto started = node.send(opts.positional[0], *opts.to, *opts.pin, opts.port ? *opts.port : 0);
        if (!started) {
            printer.printError(started.error());
            return EXIT_FAILED;
        }

        if (!waitUntil([&] { return !node.isSending(); })) {
            Logger::instance().log(LogLevel::INFO, "Interrupted, cancelling send", "Cli");
            node.cancelSend();
        }

        auto result = node.waitForSend();
        return result ? EXIT_OK : EXIT_FAILED;
    }

    int runDiscover(PinDropNode& node, EventPrinter& printer, const CliOptions& opts) {
        if (opts.seconds <= 0) {
            std::cerr << "Error: --seconds must be positive" << std::endl;
            return EXIT_USAGE;
        }

        auto started = opts.announce ? node.startDiscovery() : node.startDiscoveryListener();
        if (!started) {
            printer.printError(started.error());
            return EXIT_FAILED;
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(opts.seconds);
        waitUntil([&] { return std::chrono::steady_clock::now() >= deadline; });
        node.stopDiscovery();

        printer.printPeers(node.getDiscoveredPeers());
        return EXIT_OK;
    }

    int runAnnounce(PinDropNode& node, EventPrinter& printer) {
        printer.printPin(node.currentPin(), node.state().localIp());
        auto sent = node.announceOnce();
        if (!sent) {
            printer.printError(sent.error());
            return EXIT_FAILED;
        }
        return EXIT_OK;
    }

    pd::Result<NodeConfig> loadConfig(const CliOptions& opts) {
        Config fileConfig;
        if (opts.configPath.empty()) {
            auto configPath = PathUtils::getConfigPath().string();
            auto created = NodeConfig::ensureConfigFile(configPath);
            if (!created) {
                // Not fatal: defaults still apply
                Logger::instance().log(LogLevel::WARN, created.error().message, "Cli");
            }
            fileConfig.loadFromFile(configPath);
        } else if (!fileConfig.loadFromFile(opts.configPath)) {
            return pd::Err<NodeConfig>(pd::ErrorCode::ConfigError, "Cannot read config file " + opts.configPath);
        }

        auto loaded = NodeConfig::fromConfig(fileConfig);
        if (!loaded) {
            return loaded;
        }

        NodeConfig config = *loaded;
        if (opts.logLevel) config.logLevel = *opts.logLevel;
        if (opts.logFile) config.logFile = PathUtils::expandHome(*opts.logFile).string();
        if (opts.transferTimeoutSec) config.transferTimeoutSec = *opts.transferTimeoutSec;
        if (opts.connectTimeoutMs) config.connectTimeoutMs = *opts.connectTimeoutMs;
        if (opts.discoveryPort) config.discoveryPort = *opts.discoveryPort;
        if (opts.broadcastAddress) config.broadcastAddress = *opts.broadcastAddress;

        auto valid = config.validate();
        if (!valid) {
            return pd::Err<NodeConfig>(valid.error().code, valid.error().message);
        }
        return config;
    }

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    bool helpRequested = false;
    bool versionRequested = false;

    std::string parseError = parseArgs(argc, argv, opts, helpRequested, versionRequested);
    if (!parseError.empty()) {
        std::cerr << "Error: " << parseError << "\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage information.\n";
        return EXIT_USAGE;
    }
    if (helpRequested) {
        printUsage(argv[0]);
        return EXIT_OK;
    }
    if (versionRequested) {
        std::cout << Version::toString() << std::endl;
        return EXIT_OK;
    }
    if (opts.command.empty()) {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    auto& logger = Logger::instance();
    logger.setComponent("Cli");

    EventPrinter printer(std::cout, opts.json);
    if (opts.json) {
        logger.setConsoleOutput(false);
        logger.setObserver([&printer](LogLevel level, const std::string& component, const std::string& message) {
            printer.onLog(level, component, message);
        });
    }

    auto config = loadConfig(opts);
    if (!config) {
        printer.printError(config.error());
        return EXIT_USAGE;
    }

    // validate() accepted the level, so parseLevel cannot fail here
    logger.setLevel(Logger::parseLevel(config->logLevel).value_or(LogLevel::INFO));
    logger.setMaxFileSize(pd::config::MAX_LOG_FILE_SIZE_MB);
    if (!config->logFile.empty()) {
        logger.setLogFile(config->logFile);
    }

    if (opts.command == "pin") {
        auto pin = PinCode::generate();
        if (!pin) {
            printer.printError(pin.error());
            return EXIT_FAILED;
        }
        printer.printPin(*pin, NetUtils::detectLocalIp());
        return EXIT_OK;
    }

    if (opts.command != "receive" && opts.command != "send" &&
        opts.command != "discover" && opts.command != "announce") {
        std::cerr << "Error: Unknown command '" << opts.command << "'\n";
        std::cerr << "Run '" << argv[0] << " --help' for usage information.\n";
        return EXIT_USAGE;
    }

    auto state = NodeState::create();
    if (!state) {
        printer.printError(state.error());
        return EXIT_FAILED;
    }
    state->setDiscoveryEnabled(!opts.noDiscovery);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int exitCode = EXIT_FAILED;
    {
        PinDropNode node(*state, *config);

        node.eventBus().subscribe(Events::TRANSFER_EVENT, [&printer](const std::any& data) {
            printer.onTransferEvent(std::any_cast<const TransferEvent&>(data));
        });
        node.eventBus().subscribe(Events::PEER_DISCOVERED, [&printer](const std::any& data) {
            printer.onPeerDiscovered(std::any_cast<const PeerAnnouncement&>(data));
        });

        if (opts.command == "receive") {
            exitCode = runReceive(node, printer, opts);
        } else if (opts.command == "send") {
            exitCode = runSend(node, printer, opts);
        } else if (opts.command == "discover") {
            exitCode = runDiscover(node, printer, opts);
        } else {
            exitCode = runAnnounce(node, printer);
        }
    }

    if (opts.stats) {
        (opts.json ? std::cerr : std::cout) << MetricsCollector::instance().getMetricsSummary();
    }

    logger.setObserver(nullptr);
    return exitCode;
}
