#pragma once

/**
 * @file Constants.h
 * @brief Centralized configuration constants for PinDrop
 *
 * Defaults used when neither the config file nor the command line
 * overrides a value. Changing the ports or the framing limits breaks
 * compatibility with peers running an older build.
 */

#include <cstddef>
#include <cstdint>

namespace pd::config {

// =============================================================================
// Network Configuration
// =============================================================================

/// Default TCP port for file transfer
constexpr int DEFAULT_TRANSFER_PORT = 12345;

/// Default UDP port for peer discovery
constexpr int DEFAULT_DISCOVERY_PORT = 12346;

/// TCP listen backlog. Queued connections wait until the active one ends.
constexpr int TCP_BACKLOG = 4;

/// Limited broadcast address, used when no directed broadcast can be derived
constexpr const char* LIMITED_BROADCAST_ADDRESS = "255.255.255.255";

/// Address used to pick the outbound interface during local IP detection
constexpr const char* ROUTE_PROBE_ADDRESS = "8.8.8.8";

// =============================================================================
// Timeout Configuration
// =============================================================================

/// Overall transfer deadline (seconds)
constexpr int DEFAULT_TRANSFER_TIMEOUT_SEC = 300;  // 5 minutes

/// Bounded connect (milliseconds)
constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 5000;

/// Time allowed for a fresh connection to present its PIN (seconds)
constexpr int DEFAULT_HANDSHAKE_TIMEOUT_SEC = 10;

/// Slice used by blocking loops before re-checking their stop flag (milliseconds)
constexpr int POLL_SLICE_MS = 200;

/// Discovery announcement interval (milliseconds)
constexpr int DEFAULT_DISCOVERY_INTERVAL_MS = 3000;

/// Discovery receive poll (milliseconds)
constexpr int DISCOVERY_RECV_POLL_MS = 500;

// =============================================================================
// Buffer Sizes
// =============================================================================

/// Chunk size for file streaming (bytes)
constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;  // 64KB

/// Accepted chunk size range for configuration
constexpr std::size_t MIN_CHUNK_SIZE = 1024;
constexpr std::size_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

/// Maximum discovery datagram size (bytes)
constexpr std::size_t MAX_DATAGRAM_SIZE = 512;

/// Maximum log file size (MB)
constexpr std::size_t MAX_LOG_FILE_SIZE_MB = 20;

// =============================================================================
// Protocol Limits
// =============================================================================

/// Number of digits in a PIN
constexpr std::size_t PIN_LENGTH = 6;

/// Upper bound accepted for the PIN frame length field
constexpr std::uint32_t MAX_PIN_FRAME = 16;

/// Upper bound accepted for the filename frame length field
constexpr std::uint32_t MAX_FILENAME_LENGTH = 255;

/// Prefix of every discovery datagram
constexpr const char* DISCOVERY_PREFIX = "DISCOVERY:";

} // namespace pd::config
