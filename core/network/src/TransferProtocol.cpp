#include "TransferProtocol.h"
#include "Constants.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace PinDrop {

namespace {

constexpr int MAX_NAME_ATTEMPTS = 10000;

} // namespace

void TransferProtocol::putU32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xff));
    }
}

void TransferProtocol::putU64(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xff));
    }
}

uint32_t TransferProtocol::getU32(const uint8_t* in) {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | in[i];
    }
    return value;
}

uint64_t TransferProtocol::getU64(const uint8_t* in) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | in[i];
    }
    return value;
}

std::vector<uint8_t> TransferProtocol::encodePin(const std::string& pin) {
    std::vector<uint8_t> frame;
    frame.reserve(4 + pin.size());
    putU32(frame, static_cast<uint32_t>(pin.size()));
    frame.insert(frame.end(), pin.begin(), pin.end());
    return frame;
}

std::vector<uint8_t> TransferProtocol::encodeHeader(const FileHeader& header) {
    std::vector<uint8_t> frame;
    frame.reserve(4 + header.filename.size() + 8);
    putU32(frame, static_cast<uint32_t>(header.filename.size()));
    frame.insert(frame.end(), header.filename.begin(), header.filename.end());
    putU64(frame, header.size);
    return frame;
}

pd::Result<std::string> TransferProtocol::readPin(int fd, NetUtils::Clock::time_point deadline,
                                                  const std::atomic<bool>* stop) {
    auto fail = [](const pd::Error& error, const std::string& what) {
        if (error.code == pd::ErrorCode::Cancelled) {
            return pd::Err<std::string>(pd::ErrorCode::Cancelled);
        }
        return pd::Err<std::string>(pd::ErrorCode::HandshakeFailed, what + ": " + error.message);
    };

    uint8_t lenBuf[4];
    auto lenResult = NetUtils::recvExact(fd, lenBuf, sizeof(lenBuf), deadline, stop);
    if (!lenResult) {
        return fail(lenResult.error(), "No PIN received");
    }

    uint32_t pinLength = getU32(lenBuf);
    if (pinLength == 0 || pinLength > pd::config::MAX_PIN_FRAME) {
        return pd::Err<std::string>(pd::ErrorCode::HandshakeFailed,
                                    "Invalid PIN frame length " + std::to_string(pinLength));
    }

    std::string pin(pinLength, '\0');
    auto pinResult = NetUtils::recvExact(fd, &pin[0], pinLength, deadline, stop);
    if (!pinResult) {
        return fail(pinResult.error(), "Truncated PIN frame");
    }
    return pin;
}

pd::Result<TransferProtocol::FileHeader> TransferProtocol::readHeader(int fd,
                                                                       NetUtils::Clock::time_point deadline,
                                                                       const std::atomic<bool>* stop) {
    auto fail = [](const pd::Error& error) {
        if (error.code == pd::ErrorCode::IncompleteTransfer) {
            return pd::Err<FileHeader>(pd::ErrorCode::ProtocolError, "Truncated file header: " + error.message);
        }
        return pd::Err<FileHeader>(error.code, error.message);
    };

    uint8_t lenBuf[4];
    auto lenResult = NetUtils::recvExact(fd, lenBuf, sizeof(lenBuf), deadline, stop);
    if (!lenResult) {
        return fail(lenResult.error());
    }

    uint32_t nameLength = getU32(lenBuf);
    if (nameLength > pd::config::MAX_FILENAME_LENGTH) {
        return pd::Err<FileHeader>(pd::ErrorCode::ProtocolError,
                                   "Filename length " + std::to_string(nameLength) + " exceeds limit");
    }

    FileHeader header;
    header.filename.assign(nameLength, '\0');
    if (nameLength > 0) {
        auto nameResult = NetUtils::recvExact(fd, &header.filename[0], nameLength, deadline, stop);
        if (!nameResult) {
            return fail(nameResult.error());
        }
    }

    uint8_t sizeBuf[8];
    auto sizeResult = NetUtils::recvExact(fd, sizeBuf, sizeof(sizeBuf), deadline, stop);
    if (!sizeResult) {
        return fail(sizeResult.error());
    }
    header.size = getU64(sizeBuf);
    return header;
}

std::string TransferProtocol::fallbackFilename(std::time_t now) {
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return std::string("received_file_") + buf;
}

std::string TransferProtocol::sanitizeFilename(const std::string& name, std::time_t now) {
    // Both separators count, a Windows sender may pass "dir\\file"
    std::string base = name;
    auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }

    std::string clean;
    clean.reserve(base.size());
    for (char c : base) {
        if (static_cast<unsigned char>(c) >= 0x20 && c != 0x7f) {
            clean += c;
        }
    }

    if (clean.empty() || clean == "." || clean == "..") {
        return fallbackFilename(now);
    }
    return clean;
}

std::filesystem::path TransferProtocol::uniqueDestination(const std::filesystem::path& dir,
                                                          const std::string& filename) {
    namespace fs = std::filesystem;
    std::error_code ec;

    fs::path candidate = dir / filename;
    if (!fs::exists(candidate, ec)) {
        return candidate;
    }

    fs::path name(filename);
    std::string stem = name.stem().string();
    std::string ext = name.extension().string();

    for (int i = 1;; ++i) {
        candidate = dir / (stem + "_" + std::to_string(i) + ext);
        if (!fs::exists(candidate, ec)) {
            return candidate;
        }
    }
}

pd::Result<std::filesystem::path> TransferProtocol::createPartFile(const std::filesystem::path& finalPath) {
    for (int i = 0; i < MAX_NAME_ATTEMPTS; ++i) {
        std::filesystem::path candidate = finalPath;
        candidate += i == 0 ? std::string(".part") : ".part_" + std::to_string(i);

        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd >= 0) {
            ::close(fd);
            return candidate;
        }
        if (errno != EEXIST) {
            return pd::Err<std::filesystem::path>(pd::ErrorCode::FileWriteError,
                                                  "Cannot create " + candidate.string() + ": " + strerror(errno));
        }
    }
    return pd::Err<std::filesystem::path>(pd::ErrorCode::FileWriteError,
                                          "No free staging name for " + finalPath.string());
}

pd::Result<std::filesystem::path> TransferProtocol::commitPartFile(const std::filesystem::path& partPath,
                                                                   const std::filesystem::path& dir,
                                                                   const std::string& filename) {
    for (int i = 0; i < MAX_NAME_ATTEMPTS; ++i) {
        std::filesystem::path target = uniqueDestination(dir, filename);
        if (::link(partPath.c_str(), target.c_str()) == 0) {
            return target;
        }
        if (errno != EEXIST) {
            return pd::Err<std::filesystem::path>(pd::ErrorCode::FileWriteError,
                                                  "Failed to move " + partPath.string() + " into place: " +
                                                  strerror(errno));
        }
    }
    return pd::Err<std::filesystem::path>(pd::ErrorCode::FileWriteError,
                                          "No free name for " + filename + " in " + dir.string());
}

} // namespace PinDrop
