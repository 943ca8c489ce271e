#include "PinCode.h"
#include "Constants.h"
#include <openssl/rand.h>
#include <vector>
#include <cstdint>

namespace PinDrop {

    pd::Result<std::string> PinCode::generate() {
        std::string pin;
        pin.reserve(pd::config::PIN_LENGTH);

        // Bytes >= 250 are redrawn so every digit is equally likely
        while (pin.size() < pd::config::PIN_LENGTH) {
            unsigned char buf[16];
            if (RAND_bytes(buf, sizeof(buf)) != 1) {
                return pd::Err<std::string>(pd::ErrorCode::InternalError,
                                            "Failed to generate random PIN");
            }
            for (unsigned char b : buf) {
                if (b >= 250) continue;
                pin += static_cast<char>('0' + (b % 10));
                if (pin.size() == pd::config::PIN_LENGTH) break;
            }
        }
        return pin;
    }

    bool PinCode::isValid(const std::string& pin) {
        if (pin.length() != pd::config::PIN_LENGTH) return false;

        for (char c : pin) {
            if (c < '0' || c > '9') return false;
        }

        return true;
    }

    bool PinCode::verify(const std::string& presented, const std::string& expected) {
        unsigned int diff = presented.size() == expected.size() ? 0u : 1u;
        for (size_t i = 0; i < expected.size(); ++i) {
            unsigned char a = i < presented.size() ? static_cast<unsigned char>(presented[i]) : 0;
            diff |= static_cast<unsigned int>(a ^ static_cast<unsigned char>(expected[i]));
        }
        return diff == 0;
    }

    std::string PinCode::format(const std::string& pin) {
        if (pin.length() != pd::config::PIN_LENGTH) return pin;
        return pin.substr(0, 3) + " " + pin.substr(3, 3);
    }

    std::string PinCode::normalize(const std::string& text) {
        std::string normalized;
        for (char c : text) {
            if (c != '-' && c != ' ') {
                normalized += c;
            }
        }
        return normalized;
    }

    pd::Result<std::string> PinCode::randomHex(std::size_t bytes) {
        std::vector<unsigned char> raw(bytes);
        if (bytes > 0 && RAND_bytes(raw.data(), static_cast<int>(bytes)) != 1) {
            return pd::Err<std::string>(pd::ErrorCode::InternalError,
                                        "Failed to generate random identifier");
        }

        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(bytes * 2);
        for (unsigned char b : raw) {
            out += digits[b >> 4];
            out += digits[b & 0x0f];
        }
        return out;
    }

}
