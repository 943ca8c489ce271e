#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace PinDrop {

    // Snapshot struct for returning metrics (non-atomic)
    struct TransferMetricsSnapshot {
        uint64_t bytesSent{0};
        uint64_t bytesReceived{0};
        uint64_t transfersCompleted{0};
        uint64_t transfersFailed{0};
        uint64_t pinMismatches{0};
        uint64_t handshakeFailures{0};
        uint64_t connectionsAccepted{0};
    };

    struct DiscoveryMetricsSnapshot {
        uint64_t announcementsSent{0};
        uint64_t announcementsReceived{0};
        uint64_t malformedDatagrams{0};
        uint64_t peersDiscovered{0};
    };

    /**
     * @brief Process-wide counters for transfers and discovery
     *
     * Counters are monotonic until reset(); reading them never blocks a
     * transfer worker.
     */
    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Transfer metrics
        void addBytesSent(uint64_t bytes) { bytesSent_ += bytes; }
        void addBytesReceived(uint64_t bytes) { bytesReceived_ += bytes; }
        void incrementTransfersCompleted() { transfersCompleted_++; }
        void incrementTransfersFailed() { transfersFailed_++; }
        void incrementPinMismatches() { pinMismatches_++; }
        void incrementHandshakeFailures() { handshakeFailures_++; }
        void incrementConnectionsAccepted() { connectionsAccepted_++; }

        // Discovery metrics
        void incrementAnnouncementsSent() { announcementsSent_++; }
        void incrementAnnouncementsReceived() { announcementsReceived_++; }
        void incrementMalformedDatagrams() { malformedDatagrams_++; }
        void incrementPeersDiscovered() { peersDiscovered_++; }

        TransferMetricsSnapshot getTransferMetrics() const;
        DiscoveryMetricsSnapshot getDiscoveryMetrics() const;

        std::string getMetricsSummary() const;

        void reset();

        std::chrono::seconds getUptime() const;

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        std::atomic<uint64_t> bytesSent_{0};
        std::atomic<uint64_t> bytesReceived_{0};
        std::atomic<uint64_t> transfersCompleted_{0};
        std::atomic<uint64_t> transfersFailed_{0};
        std::atomic<uint64_t> pinMismatches_{0};
        std::atomic<uint64_t> handshakeFailures_{0};
        std::atomic<uint64_t> connectionsAccepted_{0};

        std::atomic<uint64_t> announcementsSent_{0};
        std::atomic<uint64_t> announcementsReceived_{0};
        std::atomic<uint64_t> malformedDatagrams_{0};
        std::atomic<uint64_t> peersDiscovered_{0};

        std::chrono::steady_clock::time_point startTime_;
    };

} // namespace PinDrop
