/*
 *  CueDisplay - OSC cue display companion.
 *  Process-wide, thread-safe logging. Call sites build their text with
 *  fmt::format and hand it to one of the Log* functions.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cuedisplay {

    // Log levels
    enum class LogLevel {
        Error = 0,    // Critical errors (always logged)
        Warning = 1,  // Warnings (always logged)
        Info = 2,     // Informational messages
        Debug = 3     // Per-packet diagnostics
    };

    /**
     * @brief Callback receiving every emitted log line (e.g. for an on-screen log)
     */
    using LogSink = std::function<void(LogLevel level, const std::string &line)>;

    /**
     * @brief Set the maximum level to log (Error and Warning are always logged)
     */
    void setLogLevel(LogLevel level);

    LogLevel getLogLevel();

    /**
     * @brief True if a message at @p level would be emitted
     */
    bool isLogEnabled(LogLevel level);

    /**
     * @brief Also append log lines to a file
     *
     * @param filename Path to log file (empty to close the current file)
     * @return false if the file could not be opened
     */
    bool setLogFile(const std::string &filename);

    /**
     * @brief Install a sink called for every emitted line (nullptr to remove)
     *
     * The sink is called outside the logger lock and may itself log.
     */
    void setLogSink(LogSink sink);

    /**
     * @brief Log a message
     *
     * Lines are written to stderr as "[HH:MM:SS.mmm] [LEVEL] message".
     */
    void logMessage(LogLevel level, const std::string &message);

    inline void LogError(const std::string &message) { logMessage(LogLevel::Error, message); }
    inline void LogWarning(const std::string &message) { logMessage(LogLevel::Warning, message); }
    inline void LogInfo(const std::string &message) { logMessage(LogLevel::Info, message); }
    inline void LogDebug(const std::string &message) { logMessage(LogLevel::Debug, message); }

    /**
     * @brief Get the last @p maxMessages emitted lines, oldest first
     */
    std::vector<std::string> recentLogMessages(size_t maxMessages);

    void clearLogHistory();

    /**
     * @brief Parse "error", "warning", "info" or "debug" (case-insensitive)
     */
    std::optional<LogLevel> parseLogLevel(const std::string &text);

    const char *logLevelName(LogLevel level);

}  // namespace cuedisplay
