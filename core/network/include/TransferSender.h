#pragma once

#include "EventBus.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "Result.h"
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
 * @brief Sends one file to a listening receiver
 *
 * send() validates the request on the calling thread and streams the file
 * on a worker thread. Progress and the final outcome are published as
 * TRANSFER_EVENT notifications. Only one send may be in flight.
 *
 * There is no acknowledgement on the wire: after the last byte the sender
 * half-closes and waits for the receiver to close. A reset at that point
 * usually means the receiver rejected the PIN.
 */
class TransferSender {
public:
    explicit TransferSender(EventBus* eventBus, TransferLimits limits = TransferLimits{});

    ~TransferSender();

    TransferSender(const TransferSender&) = delete;
    TransferSender& operator=(const TransferSender&) = delete;

    /**
     * @brief Validate the request and start sending in the background
     *
     * Errors: Busy, InvalidPin, InvalidAddress, InvalidArgument,
     * FileNotFound, FileReadError.
     */
    pd::Result<void> send(const TransferRequest& request);

    /// Abort the in-flight send; its outcome becomes Cancelled
    void cancel();

    /**
     * @brief Block until the current send finishes
     * @return Report of the sent file, or the error that ended the send
     */
    pd::Result<TransferReport> wait();

    bool isBusy() const { return busy_.load(); }
    SenderState state() const { return state_.load(); }

    void setLimits(const TransferLimits& limits);

private:
    void run(TransferRequest request, uint64_t size);
    pd::Result<TransferReport> transfer(const TransferRequest& request, uint64_t size);
    void finish(const TransferRequest& request, pd::Result<TransferReport> outcome);

    void setState(SenderState state);
    void publish(TransferEvent event);

    EventBus* eventBus_;

    Logger& logger_{Logger::instance()};
    MetricsCollector& metrics_{MetricsCollector::instance()};

    mutable std::mutex limitsMutex_;
    TransferLimits limits_;

    std::thread worker_;
    std::atomic<bool> busy_{false};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<SenderState> state_{SenderState::Idle};

    std::mutex controlMutex_;
    std::mutex socketMutex_;
    int activeFd_{-1};

    std::mutex outcomeMutex_;
    std::condition_variable outcomeCv_;
    std::optional<pd::Result<TransferReport>> outcome_;
};

} // namespace PinDrop
