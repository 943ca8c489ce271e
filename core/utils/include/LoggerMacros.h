/**
 * @file LoggerMacros.h
 * @brief Debug logging that skips message construction when DEBUG is off
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("Read " + std::to_string(n) + " bytes", "TransferReceiver");
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>
#include <utility>

namespace PinDrop {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::PinDrop::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

// Reports how long a transfer phase took, at DEBUG, when it goes out of scope
class ScopedTimer {
public:
    ScopedTimer(std::string name, std::string component)
        : name_(std::move(name)), component_(std::move(component)), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (!logger.isDebugEnabled()) {
            return;
        }
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
        logger.debug(name_ + ": " + std::to_string(ms) + "ms", component_);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::PinDrop::ScopedTimer timer__(name, component)

} // namespace PinDrop
