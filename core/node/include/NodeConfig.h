#pragma once

#include "Config.h"
#include "Constants.h"
#include "Result.h"
#include "TransferTypes.h"
#include "UDPDiscovery.h"
#include <cstddef>
#include <string>

namespace PinDrop {

/**
 * @brief Typed view of the pindrop.conf settings
 *
 * Keys: transfer_port, discovery_port, transfer_timeout_sec,
 * connect_timeout_ms, handshake_timeout_sec, chunk_size,
 * discovery_interval_ms, broadcast_address, save_directory, log_level,
 * log_file. Missing keys keep their defaults.
 */
struct NodeConfig {
    int transferPort = pd::config::DEFAULT_TRANSFER_PORT;
    int discoveryPort = pd::config::DEFAULT_DISCOVERY_PORT;
    int transferTimeoutSec = pd::config::DEFAULT_TRANSFER_TIMEOUT_SEC;
    int connectTimeoutMs = pd::config::DEFAULT_CONNECT_TIMEOUT_MS;
    int handshakeTimeoutSec = pd::config::DEFAULT_HANDSHAKE_TIMEOUT_SEC;
    size_t chunkSize = pd::config::DEFAULT_CHUNK_SIZE;
    int discoveryIntervalMs = pd::config::DEFAULT_DISCOVERY_INTERVAL_MS;
    std::string broadcastAddress;
    std::string saveDirectory;
    std::string logLevel = "info";
    std::string logFile;

    /// Reads and validates every known key; InvalidConfig names the bad key
    static pd::Result<NodeConfig> fromConfig(const Config& config);

    /// Range checks on the values as currently set (e.g. after CLI overrides)
    pd::Result<void> validate() const;

    TransferLimits limits() const;
    DiscoveryOptions discoveryOptions() const;

    /// Commented default file written on first run
    static std::string defaultConfigText();

    /// Writes defaultConfigText() to path unless a file already exists there
    static pd::Result<void> ensureConfigFile(const std::string& path);
};

} // namespace PinDrop
