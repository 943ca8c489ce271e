#pragma once

#include <string>

#define PINDROP_VERSION_MAJOR 0
#define PINDROP_VERSION_MINOR 3
#define PINDROP_VERSION_PATCH 0

namespace PinDrop {
    struct Version {
        static constexpr int MAJOR = PINDROP_VERSION_MAJOR;
        static constexpr int MINOR = PINDROP_VERSION_MINOR;
        static constexpr int PATCH = PINDROP_VERSION_PATCH;
        static constexpr const char* STRING = "0.3.0";

        static std::string toString() {
            return std::string("PinDrop ") + STRING;
        }
    };
}
