#pragma once

#include "Result.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace PinDrop {

// Event bus topics
namespace Events {
    constexpr const char* TRANSFER_EVENT = "TRANSFER_EVENT";
    constexpr const char* PEER_DISCOVERED = "PEER_DISCOVERED";
}

enum class TransferRole {
    Send,
    Receive
};

enum class TransferEventKind {
    StateChanged,
    Progress,
    Completed,
    Failed,
    Rejected
};

enum class ReceiverState {
    Idle,
    Listening,
    Connected,
    Verifying,
    Receiving,
    Done,
    Failed
};

enum class SenderState {
    Idle,
    Connecting,
    SendingPin,
    Streaming,
    Done,
    Failed
};

const char* toString(TransferRole role);
const char* toString(TransferEventKind kind);
const char* toString(ReceiverState state);
const char* toString(SenderState state);

/**
 * @brief Everything published on the TRANSFER_EVENT topic
 *
 * code is Success except for Failed and Rejected. state holds the
 * textual state for StateChanged.
 */
struct TransferEvent {
    TransferRole role{TransferRole::Receive};
    TransferEventKind kind{TransferEventKind::StateChanged};
    pd::ErrorCode code{pd::ErrorCode::Success};
    std::string state;
    std::string message;
    std::string peer;
    std::string path;
    uint64_t bytes{0};
    uint64_t totalBytes{0};
    std::chrono::milliseconds elapsed{0};
};

struct TransferRequest {
    std::string sourcePath;
    std::string destinationAddress;
    int destinationPort{0};
    std::string pin;
};

struct ListenSession {
    int port{0};
    std::string expectedPin;
    std::string destinationDirectory;
};

struct TransferReport {
    TransferRole role{TransferRole::Receive};
    std::string fileName;
    std::string path;
    uint64_t bytes{0};
    std::chrono::milliseconds elapsed{0};
};

/// Limits shared by sender and receiver
struct TransferLimits {
    std::chrono::seconds transferTimeout{300};
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::seconds handshakeTimeout{10};
    std::size_t chunkSize{64 * 1024};
};

} // namespace PinDrop
