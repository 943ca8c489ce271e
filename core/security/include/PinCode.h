#pragma once

#include "Result.h"
#include <string>
#include <cstddef>

namespace PinDrop {

    /**
     * @brief Six-digit transfer PIN
     *
     * The PIN is a courtesy gate shared out of band between two people; it
     * is not a credential and is compared in plain text.
     */
    class PinCode {
    public:
        // Random 6-digit PIN from the OpenSSL CSPRNG
        static pd::Result<std::string> generate();

        // Exactly 6 ASCII digits
        static bool isValid(const std::string& pin);

        /**
         * @brief Compare a presented PIN against the expected one
         *
         * Byte equality over the full length. Every position of the
         * expected PIN is visited regardless of where the first
         * difference is.
         */
        static bool verify(const std::string& presented, const std::string& expected);

        // Format for display (e.g., 123 456)
        static std::string format(const std::string& pin);

        // Strip spaces and dashes from user input
        static std::string normalize(const std::string& text);

        // Random lowercase hex string of 2 * bytes characters
        static pd::Result<std::string> randomHex(std::size_t bytes);
    };

}
