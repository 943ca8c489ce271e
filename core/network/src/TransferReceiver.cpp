#include "TransferReceiver.h"
#include "Constants.h"
#include "LoggerMacros.h"
#include "NetUtils.h"
#include "PathUtils.h"
#include "PinCode.h"
#include "TransferProtocol.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>

namespace PinDrop {

namespace {

constexpr auto PROGRESS_INTERVAL = std::chrono::milliseconds(250);

// Removes the staging name on every exit path; a committed file lives on under its final link
class PartFileGuard {
public:
    explicit PartFileGuard(std::filesystem::path path) : path_(std::move(path)) {}

    ~PartFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    PartFileGuard(const PartFileGuard&) = delete;
    PartFileGuard& operator=(const PartFileGuard&) = delete;

private:
    std::filesystem::path path_;
};

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

TransferReceiver::TransferReceiver(EventBus* eventBus, NodeState& state, TransferLimits limits)
    : eventBus_(eventBus)
    , nodeState_(state)
    , limits_(limits)
{
}

TransferReceiver::~TransferReceiver() {
    stopListening();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TransferReceiver::setLimits(const TransferLimits& limits) {
    std::lock_guard<std::mutex> lock(limitsMutex_);
    limits_ = limits;
}

pd::Result<void> TransferReceiver::startListening(const ListenSession& session) {
    std::lock_guard<std::mutex> control(controlMutex_);

    if (active_) {
        return pd::Err(pd::ErrorCode::AlreadyRunning,
                       "Already listening on port " + std::to_string(listeningPort_.load()));
    }

    // The previous session's worker has already finished; reap it
    if (worker_.joinable()) {
        worker_.join();
    }

    if (!session.expectedPin.empty() && !PinCode::isValid(session.expectedPin)) {
        return pd::Err(pd::ErrorCode::InvalidPin, "PIN must be exactly 6 digits");
    }
    if (session.port < 0 || session.port > 65535) {
        return pd::Err(pd::ErrorCode::InvalidArgument, "Invalid port " + std::to_string(session.port));
    }
    if (session.destinationDirectory.empty()) {
        return pd::Err(pd::ErrorCode::InvalidArgument, "No destination directory");
    }

    auto dirResult = PathUtils::ensureDirectory(session.destinationDirectory);
    if (!dirResult) {
        logger_.log(LogLevel::ERROR, dirResult.error().message, "TransferReceiver");
        return dirResult;
    }

    logger_.log(LogLevel::INFO, "Starting transfer listener on port " + std::to_string(session.port), "TransferReceiver");

    pd::SocketGuard sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock) {
        return pd::Err(pd::ErrorCode::BindError, "Failed to create socket: " + std::string(strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        logger_.log(LogLevel::WARN, "Failed to set SO_REUSEADDR: " + std::string(strerror(errno)), "TransferReceiver");
    }

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(static_cast<uint16_t>(session.port));

    if (bind(sock.get(), (struct sockaddr*)&addr, sizeof(addr)) < 0 ||
        listen(sock.get(), pd::config::TCP_BACKLOG) < 0) {
        std::string message = "Port " + std::to_string(session.port) + " unavailable: " + strerror(errno);
        logger_.log(LogLevel::ERROR, message, "TransferReceiver");

        TransferEvent event;
        event.kind = TransferEventKind::Failed;
        event.code = pd::ErrorCode::BindError;
        event.message = message;
        publish(event);
        return pd::Err(pd::ErrorCode::BindError, message);
    }

    int boundPort = NetUtils::boundPort(sock.get());
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        listenSocket_ = std::move(sock);
        activeFd_ = -1;
    }
    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        outcome_.reset();
        active_ = true;
    }

    session_ = session;
    listeningPort_ = boundPort;
    stopRequested_ = false;
    setState(ReceiverState::Listening);

    logger_.log(LogLevel::INFO, "Listening on port " + std::to_string(boundPort) + "...", "TransferReceiver");
    worker_ = std::thread(&TransferReceiver::listenLoop, this);
    return pd::Ok();
}

void TransferReceiver::stopListening() {
    std::lock_guard<std::mutex> control(controlMutex_);

    stopRequested_ = true;
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        listenSocket_.shutdownBoth();
        if (activeFd_ >= 0) {
            ::shutdown(activeFd_, SHUT_RDWR);
        }
    }

    if (!worker_.joinable()) {
        return;
    }
    // Called from an event callback on the worker itself; it exits on its own
    if (worker_.get_id() == std::this_thread::get_id()) {
        return;
    }
    worker_.join();
}

pd::Result<TransferReport> TransferReceiver::wait() {
    std::unique_lock<std::mutex> lock(outcomeMutex_);
    outcomeCv_.wait(lock, [this] { return !active_.load(); });
    if (!outcome_) {
        return pd::Err<TransferReport>(pd::ErrorCode::Cancelled, "No listen session was started");
    }
    return *outcome_;
}

void TransferReceiver::listenLoop() {
    logger_.log(LogLevel::DEBUG, "Accept loop started", "TransferReceiver");
    const int listenFd = listenSocket_.get();

    while (!stopRequested_) {
        struct pollfd pfd;
        pfd.fd = listenFd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int rc = ::poll(&pfd, 1, pd::config::POLL_SLICE_MS);
        if (rc < 0) {
            if (errno == EINTR) continue;
            std::string message = "poll failed on listening socket: " + std::string(strerror(errno));
            logger_.log(LogLevel::ERROR, message, "TransferReceiver");
            finishSession(pd::Err<TransferReport>(pd::ErrorCode::ConnectionFailed, message));
            return;
        }
        if (rc == 0 || stopRequested_) {
            continue;
        }

        struct sockaddr_in clientAddr;
        socklen_t len = sizeof(clientAddr);
        int clientFd = ::accept(listenFd, (struct sockaddr*)&clientAddr, &len);
        if (clientFd < 0) {
            if (!stopRequested_ && errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                logger_.log(LogLevel::WARN, "accept failed: " + std::string(strerror(errno)), "TransferReceiver");
            }
            continue;
        }

        pd::SocketGuard client(clientFd);
        {
            std::lock_guard<std::mutex> lock(socketMutex_);
            activeFd_ = clientFd;
        }
        metrics_.incrementConnectionsAccepted();

        if (handleConnection(client) == ConnectionOutcome::SessionOver) {
            return;
        }
        releaseActiveConnection(client);
        setState(ReceiverState::Listening);
    }

    finishSession(pd::Err<TransferReport>(pd::ErrorCode::Cancelled, "Listening stopped"));
}

TransferReceiver::ConnectionOutcome TransferReceiver::handleConnection(pd::SocketGuard& client) {
    const std::string peer = NetUtils::peerAddress(client.get());
    const auto started = std::chrono::steady_clock::now();
    TransferLimits limits;
    {
        std::lock_guard<std::mutex> lock(limitsMutex_);
        limits = limits_;
    }

    logger_.log(LogLevel::INFO, "Connection from " + peer, "TransferReceiver");
    setState(ReceiverState::Connected);
    setState(ReceiverState::Verifying);

    auto pin = TransferProtocol::readPin(client.get(), started + limits.handshakeTimeout, &stopRequested_);
    if (!pin) {
        if (pin.error().code == pd::ErrorCode::Cancelled) {
            releaseActiveConnection(client);
            finishSession(pd::Err<TransferReport>(pd::ErrorCode::Cancelled, "Listening stopped"));
            return ConnectionOutcome::SessionOver;
        }
        logger_.log(LogLevel::WARN, "Handshake failed with " + peer + ": " + pin.error().message, "TransferReceiver");
        metrics_.incrementHandshakeFailures();
        return ConnectionOutcome::KeepListening;
    }

    const std::string expected = session_.expectedPin.empty() ? nodeState_.pin() : session_.expectedPin;
    if (!PinCode::verify(*pin, expected)) {
        logger_.log(LogLevel::WARN, "Rejected connection from " + peer + ": PIN mismatch", "TransferReceiver");
        metrics_.incrementPinMismatches();

        TransferEvent event;
        event.kind = TransferEventKind::Rejected;
        event.code = pd::ErrorCode::PinMismatch;
        event.peer = peer;
        event.message = "Wrong PIN from " + peer;
        publish(event);
        return ConnectionOutcome::KeepListening;
    }

    logger_.log(LogLevel::INFO, "PIN verified for " + peer, "TransferReceiver");
    setState(ReceiverState::Receiving);

    auto result = receiveFile(client, peer, started, started + limits.transferTimeout);
    if (!result && stopRequested_) {
        result = pd::Err<TransferReport>(pd::ErrorCode::Cancelled, "Listening stopped");
    }

    // Close before reporting so the sender observes completion first
    releaseActiveConnection(client);
    finishSession(std::move(result));
    return ConnectionOutcome::SessionOver;
}

pd::Result<TransferReport> TransferReceiver::receiveFile(pd::SocketGuard& client, const std::string& peer,
                                                         std::chrono::steady_clock::time_point started,
                                                         std::chrono::steady_clock::time_point deadline) {
    namespace fs = std::filesystem;
    SCOPED_TIMER_COMP("Receive from " + peer, "TransferReceiver");

    auto header = TransferProtocol::readHeader(client.get(), deadline, &stopRequested_);
    if (!header) {
        return pd::Err<TransferReport>(header.error().code, header.error().message);
    }

    size_t chunkSize;
    {
        std::lock_guard<std::mutex> lock(limitsMutex_);
        chunkSize = limits_.chunkSize;
    }

    const std::string name = TransferProtocol::sanitizeFilename(header->filename);
    const uint64_t total = header->size;
    const fs::path dir = session_.destinationDirectory;
    auto staged = TransferProtocol::createPartFile(TransferProtocol::uniqueDestination(dir, name));
    if (!staged) {
        return pd::Err<TransferReport>(staged.error().code, staged.error().message);
    }
    const fs::path partPath = *staged;

    logger_.log(LogLevel::INFO, "Receiving " + name + " (" + std::to_string(total) + " bytes) from " + peer,
                "TransferReceiver");

    PartFileGuard guard(partPath);
    std::ofstream out(partPath, std::ios::binary);
    if (!out) {
        return pd::Err<TransferReport>(pd::ErrorCode::FileWriteError,
                                       "Cannot create " + partPath.string() + ": " + strerror(errno));
    }

    std::vector<char> buffer(chunkSize);
    uint64_t received = 0;
    auto lastProgress = std::chrono::steady_clock::now();

    while (received < total) {
        size_t chunk = static_cast<size_t>(std::min<uint64_t>(buffer.size(), total - received));
        size_t got = 0;
        auto r = NetUtils::recvExact(client.get(), buffer.data(), chunk, deadline, &stopRequested_, &got);
        if (!r) {
            metrics_.addBytesReceived(got);
            received += got;
            pd::ErrorCode code = r.error().code;
            if (code == pd::ErrorCode::ConnectionFailed) {
                code = pd::ErrorCode::IncompleteTransfer;
            }
            return pd::Err<TransferReport>(code, "Received " + std::to_string(received) + " of " +
                                                 std::to_string(total) + " bytes: " + r.error().message);
        }

        out.write(buffer.data(), static_cast<std::streamsize>(chunk));
        if (!out) {
            return pd::Err<TransferReport>(pd::ErrorCode::FileWriteError,
                                           "Write to " + partPath.string() + " failed");
        }
        received += chunk;
        metrics_.addBytesReceived(chunk);

        auto now = std::chrono::steady_clock::now();
        if (now - lastProgress >= PROGRESS_INTERVAL) {
            lastProgress = now;
            TransferEvent event;
            event.kind = TransferEventKind::Progress;
            event.peer = peer;
            event.bytes = received;
            event.totalBytes = total;
            event.elapsed = elapsedSince(started);
            publish(event);
        }
    }

    out.close();
    if (out.fail()) {
        return pd::Err<TransferReport>(pd::ErrorCode::FileWriteError, "Failed to flush " + partPath.string());
    }

    auto committed = TransferProtocol::commitPartFile(partPath, dir, name);
    if (!committed) {
        return pd::Err<TransferReport>(committed.error().code, committed.error().message);
    }
    const fs::path finalPath = *committed;

    TransferReport report;
    report.role = TransferRole::Receive;
    report.fileName = finalPath.filename().string();
    report.path = finalPath.string();
    report.bytes = total;
    report.elapsed = elapsedSince(started);
    return report;
}

void TransferReceiver::releaseActiveConnection(pd::SocketGuard& client) {
    std::lock_guard<std::mutex> lock(socketMutex_);
    activeFd_ = -1;
    client.reset();
}

void TransferReceiver::finishSession(pd::Result<TransferReport> outcome) {
    {
        std::lock_guard<std::mutex> lock(socketMutex_);
        listenSocket_.reset();
        activeFd_ = -1;
    }
    listeningPort_ = 0;

    TransferEvent event;
    if (outcome) {
        const auto& report = *outcome;
        logger_.log(LogLevel::INFO, "File received: " + report.path + " (" + std::to_string(report.bytes) +
                    " bytes in " + std::to_string(report.elapsed.count()) + "ms)", "TransferReceiver");
        metrics_.incrementTransfersCompleted();
        setState(ReceiverState::Done);

        event.kind = TransferEventKind::Completed;
        event.path = report.path;
        event.bytes = report.bytes;
        event.totalBytes = report.bytes;
        event.elapsed = report.elapsed;
        event.message = "Received " + report.fileName;
    } else {
        const auto& error = outcome.error();
        if (error.code == pd::ErrorCode::Cancelled) {
            logger_.log(LogLevel::INFO, "Listen session cancelled", "TransferReceiver");
        } else {
            logger_.log(LogLevel::ERROR, "Receive failed: " + error.message, "TransferReceiver");
            metrics_.incrementTransfersFailed();
        }
        setState(ReceiverState::Failed);

        event.kind = TransferEventKind::Failed;
        event.code = error.code;
        event.message = error.message;
    }
    publish(event);
    setState(ReceiverState::Idle);

    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        outcome_ = std::move(outcome);
        active_ = false;
    }
    outcomeCv_.notify_all();
}

void TransferReceiver::setState(ReceiverState state) {
    state_ = state;
    LOG_DEBUG_COMP_IF(std::string("State -> ") + toString(state), "TransferReceiver");

    TransferEvent event;
    event.kind = TransferEventKind::StateChanged;
    event.state = toString(state);
    publish(event);
}

void TransferReceiver::publish(TransferEvent event) {
    event.role = TransferRole::Receive;
    if (eventBus_) {
        eventBus_->publish(Events::TRANSFER_EVENT, event);
    }
}

} // namespace PinDrop
