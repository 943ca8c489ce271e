#include "MetricsCollector.h"
#include <iomanip>
#include <sstream>

namespace PinDrop {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::steady_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    TransferMetricsSnapshot MetricsCollector::getTransferMetrics() const {
        TransferMetricsSnapshot snapshot;
        snapshot.bytesSent = bytesSent_.load();
        snapshot.bytesReceived = bytesReceived_.load();
        snapshot.transfersCompleted = transfersCompleted_.load();
        snapshot.transfersFailed = transfersFailed_.load();
        snapshot.pinMismatches = pinMismatches_.load();
        snapshot.handshakeFailures = handshakeFailures_.load();
        snapshot.connectionsAccepted = connectionsAccepted_.load();
        return snapshot;
    }

    DiscoveryMetricsSnapshot MetricsCollector::getDiscoveryMetrics() const {
        DiscoveryMetricsSnapshot snapshot;
        snapshot.announcementsSent = announcementsSent_.load();
        snapshot.announcementsReceived = announcementsReceived_.load();
        snapshot.malformedDatagrams = malformedDatagrams_.load();
        snapshot.peersDiscovered = peersDiscovered_.load();
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        std::stringstream ss;

        auto uptime = getUptime();
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(uptime).count();
        auto seconds = uptime.count() % 60;

        auto transfer = getTransferMetrics();
        auto discovery = getDiscoveryMetrics();

        ss << "=== PinDrop Session Summary ===" << std::endl;
        ss << "Uptime: " << minutes << "m " << seconds << "s" << std::endl << std::endl;

        ss << "--- Transfers ---" << std::endl;
        ss << std::fixed << std::setprecision(2);
        ss << "  Sent: " << transfer.bytesSent / (1024.0 * 1024.0) << " MB" << std::endl;
        ss << "  Received: " << transfer.bytesReceived / (1024.0 * 1024.0) << " MB" << std::endl;
        ss << "  Connections Accepted: " << transfer.connectionsAccepted << std::endl;
        ss << "  Completed: " << transfer.transfersCompleted << std::endl;
        ss << "  Failed: " << transfer.transfersFailed << std::endl;
        ss << "  PIN Mismatches: " << transfer.pinMismatches << std::endl;
        ss << "  Handshake Failures: " << transfer.handshakeFailures << std::endl << std::endl;

        ss << "--- Discovery ---" << std::endl;
        ss << "  Announcements Sent: " << discovery.announcementsSent << std::endl;
        ss << "  Announcements Received: " << discovery.announcementsReceived << std::endl;
        ss << "  Malformed Datagrams: " << discovery.malformedDatagrams << std::endl;
        ss << "  Peers Discovered: " << discovery.peersDiscovered << std::endl;

        return ss.str();
    }

    void MetricsCollector::reset() {
        bytesSent_ = 0;
        bytesReceived_ = 0;
        transfersCompleted_ = 0;
        transfersFailed_ = 0;
        pinMismatches_ = 0;
        handshakeFailures_ = 0;
        connectionsAccepted_ = 0;
        announcementsSent_ = 0;
        announcementsReceived_ = 0;
        malformedDatagrams_ = 0;
        peersDiscovered_ = 0;
        startTime_ = std::chrono::steady_clock::now();
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_);
    }

} // namespace PinDrop
