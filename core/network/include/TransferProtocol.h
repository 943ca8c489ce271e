#pragma once

#include "Result.h"
#include "NetUtils.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace PinDrop {

/**
 * @brief Wire format of a transfer connection
 *
 * All integers are big-endian:
 *   u32 pinLength (1..16) | PIN | u32 nameLength (0..255) | filename | u64 size | payload
 *
 * The receiver closes the connection after the last payload byte or
 * immediately on rejection. There is no acknowledgement frame.
 */
class TransferProtocol {
public:
    struct FileHeader {
        std::string filename;
        uint64_t size{0};
    };

    static std::vector<uint8_t> encodePin(const std::string& pin);
    static std::vector<uint8_t> encodeHeader(const FileHeader& header);

    /**
     * @brief Read the PIN frame
     *
     * A zero or oversized length, a short read or a timeout all yield
     * HandshakeFailed (Cancelled when the stop flag is raised).
     */
    static pd::Result<std::string> readPin(int fd, NetUtils::Clock::time_point deadline,
                                           const std::atomic<bool>* stop = nullptr);

    /// Read the filename and size that follow a verified PIN
    static pd::Result<FileHeader> readHeader(int fd, NetUtils::Clock::time_point deadline,
                                             const std::atomic<bool>* stop = nullptr);

    /**
     * @brief Reduce a received name to a safe final path component
     *
     * Directory parts are dropped, control characters removed. Empty, "."
     * and ".." fall back to received_file_<YYYYmmdd_HHMMSS>.
     */
    static std::string sanitizeFilename(const std::string& name, std::time_t now = std::time(nullptr));

    static std::string fallbackFilename(std::time_t now);

    /// First of name.ext, name_1.ext, name_2.ext, ... that does not exist in dir
    static std::filesystem::path uniqueDestination(const std::filesystem::path& dir,
                                                   const std::string& filename);

    /**
     * @brief Create an empty staging file for finalPath
     *
     * Tries finalPath.part, then finalPath.part_1, ... with O_EXCL so a file
     * already in the directory is never opened or truncated.
     */
    static pd::Result<std::filesystem::path> createPartFile(const std::filesystem::path& finalPath);

    /**
     * @brief Publish a finished staging file under the first free name in dir
     *
     * The part file is hard-linked into place, which fails instead of
     * replacing a file that appeared while the payload was arriving. The
     * next free name is tried on a collision. The part name is left for
     * the caller to remove.
     */
    static pd::Result<std::filesystem::path> commitPartFile(const std::filesystem::path& partPath,
                                                            const std::filesystem::path& dir,
                                                            const std::string& filename);

    static void putU32(std::vector<uint8_t>& out, uint32_t value);
    static void putU64(std::vector<uint8_t>& out, uint64_t value);
    static uint32_t getU32(const uint8_t* in);
    static uint64_t getU64(const uint8_t* in);
};

} // namespace PinDrop
