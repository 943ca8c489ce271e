#include "TransferSender.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include "NetUtils.h"
#include "PinCode.h"
#include "TransferProtocol.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>
#include <sys/socket.h>

namespace PinDrop {

namespace {

constexpr auto PROGRESS_INTERVAL = std::chrono::milliseconds(250);

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

TransferSender::TransferSender(EventBus* eventBus, TransferLimits limits)
    : eventBus_(eventBus)
    , limits_(limits)
{
}

TransferSender::~TransferSender() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TransferSender::setLimits(const TransferLimits& limits) {
    std::lock_guard<std::mutex> lock(limitsMutex_);
    limits_ = limits;
}

pd::Result<void> TransferSender::send(const TransferRequest& request) {
    namespace fs = std::filesystem;
    std::lock_guard<std::mutex> control(controlMutex_);

    if (busy_) {
        return pd::Err(pd::ErrorCode::Busy);
    }
    if (!PinCode::isValid(request.pin)) {
        return pd::Err(pd::ErrorCode::InvalidPin, "PIN must be exactly 6 digits");
    }
    if (!NetUtils::isValidIpv4(request.destinationAddress)) {
        return pd::Err(pd::ErrorCode::InvalidAddress, "Invalid address: " + request.destinationAddress);
    }
    if (request.destinationPort <= 0 || request.destinationPort > 65535) {
        return pd::Err(pd::ErrorCode::InvalidArgument, "Invalid port " + std::to_string(request.destinationPort));
    }

    std::error_code ec;
    if (!fs::is_regular_file(request.sourcePath, ec)) {
        return pd::Err(pd::ErrorCode::FileNotFound, "Not a regular file: " + request.sourcePath);
    }
    uint64_t size = fs::file_size(request.sourcePath, ec);
    if (ec) {
        return pd::Err(pd::ErrorCode::FileReadError, "Cannot stat " + request.sourcePath + ": " + ec.message());
    }
    if (!std::ifstream(request.sourcePath, std::ios::binary)) {
        return pd::Err(pd::ErrorCode::FileReadError, "Cannot open " + request.sourcePath);
    }
    if (fs::path(request.sourcePath).filename().string().size() > pd::config::MAX_FILENAME_LENGTH) {
        return pd::Err(pd::ErrorCode::InvalidArgument, "File name too long: " + request.sourcePath);
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        outcome_.reset();
        busy_ = true;
    }
    cancelRequested_ = false;

    logger_.log(LogLevel::INFO, "Sending " + request.sourcePath + " (" + std::to_string(size) + " bytes) to " +
                request.destinationAddress + ":" + std::to_string(request.destinationPort), "TransferSender");
    worker_ = std::thread(&TransferSender::run, this, request, size);
    return pd::Ok();
}

void TransferSender::cancel() {
    cancelRequested_ = true;
    std::lock_guard<std::mutex> lock(socketMutex_);
    if (activeFd_ >= 0) {
        ::shutdown(activeFd_, SHUT_RDWR);
    }
}

pd::Result<TransferReport> TransferSender::wait() {
    std::unique_lock<std::mutex> lock(outcomeMutex_);
    outcomeCv_.wait(lock, [this] { return !busy_.load(); });
    if (!outcome_) {
        return pd::Err<TransferReport>(pd::ErrorCode::Cancelled, "No send was started");
    }
    return *outcome_;
}

void TransferSender::run(TransferRequest request, uint64_t size) {
    auto result = transfer(request, size);
    if (!result && cancelRequested_) {
        result = pd::Err<TransferReport>(pd::ErrorCode::Cancelled, "Send cancelled");
    }
    finish(request, std::move(result));
}

pd::Result<TransferReport> TransferSender::transfer(const TransferRequest& request, uint64_t size) {
    namespace fs = std::filesystem;
    SCOPED_TIMER_COMP("Send to " + request.destinationAddress, "TransferSender");

    TransferLimits limits;
    {
        std::lock_guard<std::mutex> lock(limitsMutex_);
        limits = limits_;
    }
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + limits.transferTimeout;
    const std::string peer = request.destinationAddress + ":" + std::to_string(request.destinationPort);

    setState(SenderState::Connecting);
    auto connectTimeout = std::min<std::chrono::milliseconds>(
        limits.connectTimeout, std::chrono::duration_cast<std::chrono::milliseconds>(limits.transferTimeout));
    auto connected = NetUtils::connectWithTimeout(request.destinationAddress, request.destinationPort,
                                                  connectTimeout, &cancelRequested_);
    if (!connected) {
        return pd::Err<TransferReport>(connected.error().code, connected.error().message);
    }

    pd::SocketGuard sock = std::move(*connected);
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        activeFd_ = sock.get();
    }
    // Release the registration on every exit path before the guard closes the socket
    struct Unregister {
        std::mutex& mutex;
        int& fd;
        ~Unregister() {
            std::lock_guard<std::mutex> lock(mutex);
            fd = -1;
        }
    } unregister{socketMutex_, activeFd_};

    if (cancelRequested_) {
        return pd::Err<TransferReport>(pd::ErrorCode::Cancelled, "Send cancelled");
    }
    logger_.log(LogLevel::DEBUG, "Connected to " + peer, "TransferSender");

    setState(SenderState::SendingPin);
    TransferProtocol::FileHeader header;
    header.filename = fs::path(request.sourcePath).filename().string();
    header.size = size;

    std::vector<uint8_t> preamble = TransferProtocol::encodePin(request.pin);
    std::vector<uint8_t> headerFrame = TransferProtocol::encodeHeader(header);
    preamble.insert(preamble.end(), headerFrame.begin(), headerFrame.end());

    auto sent = NetUtils::sendExact(sock.get(), preamble.data(), preamble.size(), deadline, &cancelRequested_);
    if (!sent) {
        return pd::Err<TransferReport>(sent.error().code, sent.error().message);
    }

    setState(SenderState::Streaming);
    std::ifstream in(request.sourcePath, std::ios::binary);
    if (!in) {
        return pd::Err<TransferReport>(pd::ErrorCode::FileReadError, "Cannot open " + request.sourcePath);
    }

    std::vector<char> buffer(limits.chunkSize);
    uint64_t transferred = 0;
    auto lastProgress = started;

    while (transferred < size) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(buffer.size(), size - transferred));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(in.gcount());
        if (got < want) {
            if (in.bad()) {
                return pd::Err<TransferReport>(pd::ErrorCode::FileReadError,
                                               "Read error in " + request.sourcePath);
            }
            return pd::Err<TransferReport>(pd::ErrorCode::SizeMismatch,
                                           request.sourcePath + " shrank to " +
                                           std::to_string(transferred + got) + " of " +
                                           std::to_string(size) + " bytes");
        }

        auto r = NetUtils::sendExact(sock.get(), buffer.data(), got, deadline, &cancelRequested_);
        if (!r) {
            return pd::Err<TransferReport>(r.error().code, "Sent " + std::to_string(transferred) + " of " +
                                                           std::to_string(size) + " bytes: " + r.error().message);
        }
        transferred += got;
        metrics_.addBytesSent(got);

        auto now = std::chrono::steady_clock::now();
        if (now - lastProgress >= PROGRESS_INTERVAL) {
            lastProgress = now;
            TransferEvent event;
            event.kind = TransferEventKind::Progress;
            event.peer = peer;
            event.bytes = transferred;
            event.totalBytes = size;
            event.elapsed = elapsedSince(started);
            publish(event);
        }
    }

    if (in.peek() != std::char_traits<char>::eof()) {
        return pd::Err<TransferReport>(pd::ErrorCode::SizeMismatch,
                                       request.sourcePath + " grew beyond " + std::to_string(size) + " bytes");
    }

    if (::shutdown(sock.get(), SHUT_WR) < 0) {
        return pd::Err<TransferReport>(pd::ErrorCode::ConnectionFailed,
                                       "shutdown failed: " + std::string(strerror(errno)));
    }

    auto closed = NetUtils::waitForPeerClose(sock.get(), deadline, &cancelRequested_);
    if (!closed) {
        return pd::Err<TransferReport>(closed.error().code, closed.error().message);
    }

    TransferReport report;
    report.role = TransferRole::Send;
    report.fileName = header.filename;
    report.path = request.sourcePath;
    report.bytes = size;
    report.elapsed = elapsedSince(started);
    return report;
}

void TransferSender::finish(const TransferRequest& request, pd::Result<TransferReport> outcome) {
    TransferEvent event;
    event.peer = request.destinationAddress + ":" + std::to_string(request.destinationPort);
    event.path = request.sourcePath;

    if (outcome) {
        const auto& report = *outcome;
        logger_.log(LogLevel::INFO, "File sent: " + report.fileName + " (" + std::to_string(report.bytes) +
                    " bytes in " + std::to_string(report.elapsed.count()) + "ms)", "TransferSender");
        metrics_.incrementTransfersCompleted();
        setState(SenderState::Done);

        event.kind = TransferEventKind::Completed;
        event.bytes = report.bytes;
        event.totalBytes = report.bytes;
        event.elapsed = report.elapsed;
        event.message = "Sent " + report.fileName;
    } else {
        const auto& error = outcome.error();
        if (error.code == pd::ErrorCode::Cancelled) {
            logger_.log(LogLevel::INFO, "Send cancelled", "TransferSender");
        } else {
            logger_.log(LogLevel::ERROR, "Send failed: " + error.message, "TransferSender");
            metrics_.incrementTransfersFailed();
        }
        setState(SenderState::Failed);

        event.kind = TransferEventKind::Failed;
        event.code = error.code;
        event.message = error.message;
    }
    publish(event);

    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        outcome_ = std::move(outcome);
        busy_ = false;
    }
    outcomeCv_.notify_all();
}

void TransferSender::setState(SenderState state) {
    state_ = state;
    LOG_DEBUG_COMP_IF(std::string("State -> ") + toString(state), "TransferSender");

    TransferEvent event;
    event.kind = TransferEventKind::StateChanged;
    event.state = toString(state);
    publish(event);
}

void TransferSender::publish(TransferEvent event) {
    event.role = TransferRole::Send;
    if (eventBus_) {
        eventBus_->publish(Events::TRANSFER_EVENT, event);
    }
}

} // namespace PinDrop
