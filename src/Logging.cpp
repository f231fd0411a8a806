#include "cuedisplay/Logging.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <deque>
#include <fstream>
#include <iostream>
#include <mutex>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace cuedisplay {
    namespace {
        constexpr size_t MAX_HISTORY = 256;

        struct LoggerState {
            std::mutex mutex;
            LogLevel level = LogLevel::Info;
            std::ofstream file;
            LogSink sink;
            std::deque<std::string> history;
        };

        LoggerState &logger() {
            static LoggerState state;
            return state;
        }

        std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                              now.time_since_epoch()) %
                          1000;
            std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            return fmt::format("{:%H:%M:%S}.{:03d}", fmt::localtime(seconds),
                               static_cast<int>(millis.count()));
        }
    }  // namespace

    void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(logger().mutex);
        logger().level = level;
    }

    LogLevel getLogLevel() {
        std::lock_guard<std::mutex> lock(logger().mutex);
        return logger().level;
    }

    bool isLogEnabled(LogLevel level) {
        if (level <= LogLevel::Warning) {
            return true;
        }
        return level <= getLogLevel();
    }

    bool setLogFile(const std::string &filename) {
        std::lock_guard<std::mutex> lock(logger().mutex);
        if (logger().file.is_open()) {
            logger().file.close();
        }
        if (filename.empty()) {
            return true;
        }

        logger().file.open(filename, std::ios::out | std::ios::app);
        return logger().file.is_open();
    }

    void setLogSink(LogSink sink) {
        std::lock_guard<std::mutex> lock(logger().mutex);
        logger().sink = std::move(sink);
    }

    void logMessage(LogLevel level, const std::string &message) {
        if (!isLogEnabled(level)) {
            return;
        }

        std::string line = fmt::format("[{}] [{}] {}", timestamp(), logLevelName(level), message);

        LogSink sink;
        {
            std::lock_guard<std::mutex> lock(logger().mutex);
            std::cerr << line << std::endl;
            if (logger().file.is_open()) {
                logger().file << line << std::endl;
            }

            logger().history.push_back(line);
            if (logger().history.size() > MAX_HISTORY) {
                logger().history.pop_front();
            }
            sink = logger().sink;
        }

        if (sink) {
            sink(level, line);
        }
    }

    std::vector<std::string> recentLogMessages(size_t maxMessages) {
        std::lock_guard<std::mutex> lock(logger().mutex);
        const auto &history = logger().history;
        size_t count = std::min(maxMessages, history.size());
        return std::vector<std::string>(history.end() - static_cast<std::ptrdiff_t>(count),
                                        history.end());
    }

    void clearLogHistory() {
        std::lock_guard<std::mutex> lock(logger().mutex);
        logger().history.clear();
    }

    std::optional<LogLevel> parseLogLevel(const std::string &text) {
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "error") return LogLevel::Error;
        if (lower == "warning" || lower == "warn") return LogLevel::Warning;
        if (lower == "info") return LogLevel::Info;
        if (lower == "debug") return LogLevel::Debug;
        return std::nullopt;
    }

    const char *logLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Warning:
                return "WARNING";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Debug:
                return "DEBUG";
        }
        return "UNKNOWN";
    }

}  // namespace cuedisplay
