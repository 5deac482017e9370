#pragma once

#include <string>
#include <mutex>
#include <atomic>
#include <fstream>
#include <iostream>
#include <cstddef>

namespace BehaviorSentinel {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Parse a level name (case-insensitive), falling back when unknown
     */
    LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void closeLogFile();
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

        static const char* levelToString(LogLevel level);

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "Engine";
        std::atomic<bool> consoleOutput_{true};
        std::atomic<size_t> maxFileSizeMB_{100};
        size_t currentFileSize_ = 0;

        std::string currentTime() const;
        void rotateLocked();
        size_t fileSizeOnDisk() const;
    };

}
