#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <functional>
#include <optional>
#include <atomic>

namespace PinDrop {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    class Logger {
    public:
        /// Receives every line that passes the level filter, after formatting
        using Observer = std::function<void(LogLevel level, const std::string& component,
                                            const std::string& message)>;

        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);
        void setObserver(Observer observer);

        bool isDebugEnabled() const { return currentLevel_.load() <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_.load() <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_.load(); }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

        /// "debug", "INFO", "warning", ... ; nullopt for anything else
        static std::optional<LogLevel> parseLevel(const std::string& text);
        static const char* levelToString(LogLevel level);

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "PinDrop";
        size_t maxFileSizeMB_ = 20;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;
        Observer observer_;

        std::string getCurrentTime();
        void rotateLogFileLocked();
        size_t getFileSize();
    };

}
