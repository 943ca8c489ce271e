#pragma once

#include "EventBus.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "NodeState.h"
#include "Result.h"
#include "SocketGuard.h"
#include "TransferTypes.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace PinDrop {

/**
 * @brief One-shot PIN-gated file receiver
 *
 * Manages:
 * - Binding the transfer port and the accept loop
 * - PIN verification before any file is created
 * - Writing the payload to a part file and committing it
 *
 * Connections are served one at a time; others wait in the listen
 * backlog. A wrong PIN or a broken handshake closes that connection and
 * the session keeps listening. The session ends after the first verified
 * connection, whatever its outcome.
 */
class TransferReceiver {
public:
    /**
     * @brief Constructor
     * @param eventBus Bus receiving TRANSFER_EVENT notifications (may be null)
     * @param state Node state; its PIN is used when a session has none
     * @param limits Timeouts and chunk size
     */
    TransferReceiver(EventBus* eventBus, NodeState& state, TransferLimits limits = TransferLimits{});

    ~TransferReceiver();

    TransferReceiver(const TransferReceiver&) = delete;
    TransferReceiver& operator=(const TransferReceiver&) = delete;

    /**
     * @brief Bind and start accepting in the background
     *
     * Errors: AlreadyRunning, InvalidPin, InvalidArgument,
     * DirectoryCreateFailed, BindError.
     */
    pd::Result<void> startListening(const ListenSession& session);

    /**
     * @brief End the session, aborting any in-flight transfer
     *
     * Safe to call repeatedly and when nothing is running.
     */
    void stopListening();

    /**
     * @brief Block until the current session ends
     * @return Report of the received file, or the error that ended the session
     */
    pd::Result<TransferReport> wait();

    bool isListening() const { return active_.load(); }
    ReceiverState state() const { return state_.load(); }

    /// Bound port of the active session, 0 when idle
    int getListeningPort() const { return listeningPort_.load(); }

    void setLimits(const TransferLimits& limits);

private:
    enum class ConnectionOutcome { KeepListening, SessionOver };

    void listenLoop();
    ConnectionOutcome handleConnection(pd::SocketGuard& client);
    pd::Result<TransferReport> receiveFile(pd::SocketGuard& client, const std::string& peer,
                                           std::chrono::steady_clock::time_point started,
                                           std::chrono::steady_clock::time_point deadline);
    void releaseActiveConnection(pd::SocketGuard& client);
    void finishSession(pd::Result<TransferReport> outcome);

    void setState(ReceiverState state);
    void publish(TransferEvent event);

    EventBus* eventBus_;
    NodeState& nodeState_;

    Logger& logger_{Logger::instance()};
    MetricsCollector& metrics_{MetricsCollector::instance()};

    mutable std::mutex limitsMutex_;
    TransferLimits limits_;

    ListenSession session_;
    std::thread worker_;
    std::atomic<bool> active_{false};
    std::atomic<bool> stopRequested_{false};
    std::atomic<ReceiverState> state_{ReceiverState::Idle};
    std::atomic<int> listeningPort_{0};

    // Guards the sockets that stopListening() shuts down from another thread
    std::mutex socketMutex_;
    pd::SocketGuard listenSocket_;
    int activeFd_{-1};

    std::mutex controlMutex_;
    std::mutex outcomeMutex_;
    std::condition_variable outcomeCv_;
    std::optional<pd::Result<TransferReport>> outcome_;
};

} // namespace PinDrop
