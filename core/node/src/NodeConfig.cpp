#include "NodeConfig.h"
#include "Logger.h"
#include "NetUtils.h"
#include "PathUtils.h"
#include <filesystem>
#include <fstream>
#include <unordered_map>

namespace PinDrop {

namespace {

bool parseInt(const std::string& value, long long& out) {
    if (value.empty()) return false;
    try {
        size_t consumed = 0;
        out = std::stoll(value, &consumed);
        return consumed == value.size();
    } catch (const std::exception&) {
        return false;
    }
}

Config::Validator intRange(long long min, long long max) {
    return [min, max](const std::string&, const std::string& value) {
        long long parsed = 0;
        return parseInt(value, parsed) && parsed >= min && parsed <= max;
    };
}

pd::Result<void> invalid(const std::string& message) {
    return pd::Err(pd::ErrorCode::InvalidConfig, message);
}

} // namespace

pd::Result<NodeConfig> NodeConfig::fromConfig(const Config& config) {
    const std::unordered_map<std::string, Config::Validator> schema = {
        {"transfer_port", intRange(0, 65535)},
        {"discovery_port", intRange(0, 65535)},
        {"transfer_timeout_sec", intRange(1, 24 * 3600)},
        {"connect_timeout_ms", intRange(1, 600000)},
        {"handshake_timeout_sec", intRange(1, 3600)},
        {"chunk_size", intRange(static_cast<long long>(pd::config::MIN_CHUNK_SIZE),
                                static_cast<long long>(pd::config::MAX_CHUNK_SIZE))},
        {"discovery_interval_ms", intRange(100, 3600000)},
        {"broadcast_address", [](const std::string&, const std::string& value) {
             return value.empty() || value == "auto" || NetUtils::isValidIpv4(value);
         }},
        {"log_level", [](const std::string&, const std::string& value) {
             return Logger::parseLevel(value).has_value();
         }},
        {"save_directory", nullptr},
        {"log_file", nullptr},
    };

    for (const auto& key : config.unknownKeys(schema)) {
        Logger::instance().log(LogLevel::WARN, "Unknown setting '" + key + "' ignored", "NodeConfig");
    }

    auto checked = config.validate(schema);
    if (!checked) {
        return pd::Err<NodeConfig>(checked.error().code, checked.error().message);
    }

    NodeConfig node;
    node.transferPort = config.getInt("transfer_port", node.transferPort);
    node.discoveryPort = config.getInt("discovery_port", node.discoveryPort);
    node.transferTimeoutSec = config.getInt("transfer_timeout_sec", node.transferTimeoutSec);
    node.connectTimeoutMs = config.getInt("connect_timeout_ms", node.connectTimeoutMs);
    node.handshakeTimeoutSec = config.getInt("handshake_timeout_sec", node.handshakeTimeoutSec);
    node.chunkSize = config.getSize("chunk_size", node.chunkSize);
    node.discoveryIntervalMs = config.getInt("discovery_interval_ms", node.discoveryIntervalMs);

    node.broadcastAddress = config.get("broadcast_address", "");
    if (node.broadcastAddress == "auto") {
        node.broadcastAddress.clear();
    }

    std::string saveDir = config.get("save_directory", "");
    node.saveDirectory = saveDir.empty() ? PathUtils::getDefaultSaveDir().string()
                                         : PathUtils::expandHome(saveDir).string();
    node.logLevel = config.get("log_level", node.logLevel);
    std::string logFile = config.get("log_file", "");
    node.logFile = logFile.empty() ? "" : PathUtils::expandHome(logFile).string();

    auto valid = node.validate();
    if (!valid) {
        return pd::Err<NodeConfig>(valid.error().code, valid.error().message);
    }
    return node;
}

pd::Result<void> NodeConfig::validate() const {
    if (transferPort < 0 || transferPort > 65535) {
        return invalid("transfer_port out of range: " + std::to_string(transferPort));
    }
    if (discoveryPort < 0 || discoveryPort > 65535) {
        return invalid("discovery_port out of range: " + std::to_string(discoveryPort));
    }
    if (transferTimeoutSec <= 0) {
        return invalid("transfer_timeout_sec must be positive");
    }
    if (connectTimeoutMs <= 0) {
        return invalid("connect_timeout_ms must be positive");
    }
    if (handshakeTimeoutSec <= 0) {
        return invalid("handshake_timeout_sec must be positive");
    }
    if (chunkSize < pd::config::MIN_CHUNK_SIZE || chunkSize > pd::config::MAX_CHUNK_SIZE) {
        return invalid("chunk_size must be between " + std::to_string(pd::config::MIN_CHUNK_SIZE) +
                       " and " + std::to_string(pd::config::MAX_CHUNK_SIZE));
    }
    if (discoveryIntervalMs <= 0) {
        return invalid("discovery_interval_ms must be positive");
    }
    if (!broadcastAddress.empty() && !NetUtils::isValidIpv4(broadcastAddress)) {
        return invalid("broadcast_address is not an IPv4 address: " + broadcastAddress);
    }
    if (!Logger::parseLevel(logLevel)) {
        return invalid("Unknown log_level: " + logLevel);
    }
    return pd::Ok();
}

TransferLimits NodeConfig::limits() const {
    TransferLimits limits;
    limits.transferTimeout = std::chrono::seconds(transferTimeoutSec);
    limits.connectTimeout = std::chrono::milliseconds(connectTimeoutMs);
    limits.handshakeTimeout = std::chrono::seconds(handshakeTimeoutSec);
    limits.chunkSize = chunkSize;
    return limits;
}

DiscoveryOptions NodeConfig::discoveryOptions() const {
    DiscoveryOptions options;
    options.port = discoveryPort;
    options.interval = std::chrono::milliseconds(discoveryIntervalMs);
    options.broadcastAddress = broadcastAddress;
    return options;
}

std::string NodeConfig::defaultConfigText() {
    return
        "# PinDrop configuration\n"
        "# Lines are key=value; '#' starts a comment. Command line flags override these.\n"
        "\n"
        "# TCP port the receiver listens on\n"
        "transfer_port=12345\n"
        "\n"
        "# UDP port for peer announcements\n"
        "discovery_port=12346\n"
        "\n"
        "# Whole-transfer deadline, seconds\n"
        "transfer_timeout_sec=300\n"
        "\n"
        "# Connect deadline, milliseconds\n"
        "connect_timeout_ms=5000\n"
        "\n"
        "# Time a new connection has to present its PIN, seconds\n"
        "handshake_timeout_sec=10\n"
        "\n"
        "# Streaming buffer, bytes (1024..16777216)\n"
        "chunk_size=65536\n"
        "\n"
        "# Announcement interval, milliseconds\n"
        "discovery_interval_ms=3000\n"
        "\n"
        "# 'auto' uses the /24 broadcast address of the local IP\n"
        "broadcast_address=auto\n"
        "\n"
        "# Where received files are stored\n"
        "save_directory=~/Downloads\n"
        "\n"
        "# debug, info, warn, error or critical\n"
        "log_level=info\n"
        "\n"
        "# Optional log file; empty logs to the console only\n"
        "log_file=\n";
}

pd::Result<void> NodeConfig::ensureConfigFile(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (fs::exists(path, ec)) {
        return pd::Ok();
    }

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        auto dir = PathUtils::ensureDirectory(parent);
        if (!dir) {
            return pd::Err(pd::ErrorCode::ConfigError, dir.error().message);
        }
    }

    std::ofstream out(path);
    if (!out) {
        return pd::Err(pd::ErrorCode::ConfigError, "Cannot create config file " + path);
    }
    out << defaultConfigText();
    if (!out) {
        return pd::Err(pd::ErrorCode::ConfigError, "Failed to write config file " + path);
    }
    Logger::instance().log(LogLevel::INFO, "Created default configuration at " + path, "NodeConfig");
    return pd::Ok();
}

} // namespace PinDrop
