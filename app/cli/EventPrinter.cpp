#include "EventPrinter.h"
#include "PinCode.h"
#include <chrono>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace PinDrop {

namespace {

int64_t toEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string humanBytes(uint64_t bytes) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (bytes >= 1024ull * 1024 * 1024) {
        ss << bytes / (1024.0 * 1024.0 * 1024.0) << " GB";
    } else if (bytes >= 1024ull * 1024) {
        ss << bytes / (1024.0 * 1024.0) << " MB";
    } else if (bytes >= 1024) {
        ss << bytes / 1024.0 << " KB";
    } else {
        ss.unsetf(std::ios::floatfield);
        ss << bytes << " B";
    }
    return ss.str();
}

} // namespace

EventPrinter::EventPrinter(std::ostream& out, bool json)
    : out_(out)
    , json_(json)
{
}

Json::Value EventPrinter::toJson(const TransferEvent& event) {
    Json::Value value(Json::objectValue);
    value["type"] = "transfer";
    value["role"] = toString(event.role);
    value["kind"] = toString(event.kind);
    if (!event.state.empty()) {
        value["state"] = event.state;
    }
    if (event.kind == TransferEventKind::Failed || event.kind == TransferEventKind::Rejected) {
        value["code"] = pd::errorCodeName(event.code);
    }
    if (!event.message.empty()) {
        value["message"] = event.message;
    }
    if (!event.peer.empty()) {
        value["peer"] = event.peer;
    }
    if (!event.path.empty()) {
        value["path"] = event.path;
    }
    if (event.kind == TransferEventKind::Progress || event.kind == TransferEventKind::Completed) {
        value["bytes"] = Json::UInt64(event.bytes);
        value["total_bytes"] = Json::UInt64(event.totalBytes);
        value["elapsed_ms"] = Json::Int64(event.elapsed.count());
    }
    return value;
}

Json::Value EventPrinter::toJson(const PeerAnnouncement& announcement) {
    Json::Value value(Json::objectValue);
    value["type"] = "peer";
    value["ip"] = announcement.ip;
    value["pin"] = announcement.pin;
    if (!announcement.instanceId.empty()) {
        value["instance_id"] = announcement.instanceId;
    }
    value["received_at_ms"] = Json::Int64(toEpochMs(announcement.receivedAt));
    return value;
}

Json::Value EventPrinter::toJson(const PeerInfo& peer) {
    Json::Value value(Json::objectValue);
    value["ip"] = peer.ip;
    value["pin"] = peer.pin;
    if (!peer.instanceId.empty()) {
        value["instance_id"] = peer.instanceId;
    }
    value["first_seen_ms"] = Json::Int64(toEpochMs(peer.firstSeen));
    value["last_seen_ms"] = Json::Int64(toEpochMs(peer.lastSeen));
    value["announcements"] = Json::UInt64(peer.announcementCount);
    return value;
}

void EventPrinter::writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string line = Json::writeString(builder, value);

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::endl;
}

void EventPrinter::onTransferEvent(const TransferEvent& event) {
    if (json_) {
        writeJson(toJson(event));
        return;
    }

    // Text mode: state changes and failures already appear as log lines
    if (event.kind == TransferEventKind::Progress) {
        int percent = event.totalBytes > 0 ? static_cast<int>(event.bytes * 100 / event.totalBytes) : 100;
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << "  " << (event.role == TransferRole::Send ? "sent " : "received ")
             << humanBytes(event.bytes) << " / " << humanBytes(event.totalBytes)
             << " (" << percent << "%)" << std::endl;
    } else if (event.kind == TransferEventKind::Completed) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ << (event.role == TransferRole::Send ? "Sent " : "Saved ") << event.path
             << " (" << humanBytes(event.totalBytes) << " in " << event.elapsed.count() << " ms)" << std::endl;
    }
}

void EventPrinter::onPeerDiscovered(const PeerAnnouncement& announcement) {
    if (json_) {
        writeJson(toJson(announcement));
    }
}

void EventPrinter::onLog(LogLevel level, const std::string& component, const std::string& message) {
    if (!json_) {
        return;
    }
    Json::Value value(Json::objectValue);
    value["type"] = "log";
    value["level"] = Logger::levelToString(level);
    value["component"] = component;
    value["message"] = message;
    writeJson(value);
}

void EventPrinter::printPin(const std::string& pin, const std::string& localIp) {
    if (json_) {
        Json::Value value(Json::objectValue);
        value["type"] = "pin";
        value["pin"] = pin;
        value["ip"] = localIp;
        writeJson(value);
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "Your IP:  " << localIp << std::endl;
    out_ << "Your PIN: " << PinCode::format(pin) << std::endl;
}

void EventPrinter::printPeers(const std::vector<PeerInfo>& peers) {
    if (json_) {
        Json::Value value(Json::objectValue);
        value["type"] = "peers";
        value["peers"] = Json::Value(Json::arrayValue);
        for (const auto& peer : peers) {
            value["peers"].append(toJson(peer));
        }
        writeJson(value);
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (peers.empty()) {
        out_ << "No peers discovered." << std::endl;
        return;
    }
    out_ << std::left << std::setw(18) << "IP" << std::setw(10) << "PIN" << "SEEN" << std::endl;
    for (const auto& peer : peers) {
        out_ << std::left << std::setw(18) << peer.ip << std::setw(10) << peer.pin
             << peer.announcementCount << "x" << std::endl;
    }
}

void EventPrinter::printError(const pd::Error& error) {
    if (json_) {
        Json::Value value(Json::objectValue);
        value["type"] = "error";
        value["code"] = pd::errorCodeName(error.code);
        value["message"] = error.message;
        writeJson(value);
        return;
    }
    std::cerr << "Error: " << error.message << std::endl;
}

} // namespace PinDrop
