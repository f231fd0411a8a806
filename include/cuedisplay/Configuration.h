/*
 *  CueDisplay - OSC cue display companion.
 *  Runtime configuration of the display application.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "cuedisplay/Logging.h"

namespace cuedisplay {

    /**
     * @brief Settings for the listener, the logger and the terminal renderer
     *
     * Setters validate their input and throw ConfigurationException on
     * out-of-range values, so a Configuration is always usable as-is.
     */
    class Configuration {
       public:
        static constexpr int DEFAULT_PORT = 53000;
        static constexpr int DEFAULT_POLL_INTERVAL_MS = 100;
        static constexpr int MAX_POLL_INTERVAL_MS = 250;
        static constexpr int DEFAULT_REFRESH_INTERVAL_MS = 100;
        static constexpr double DEFAULT_STALE_AFTER_SECONDS = 5.0;

        Configuration();

        /**
         * @brief Load settings from a JSON file
         *
         * Keys missing from the file keep their current value; unknown keys are
         * ignored.
         *
         * @param filepath Path to the JSON configuration file
         * @return false if the file could not be opened
         * @throws ConfigurationException if the file is not valid JSON or holds
         * invalid values
         */
        bool loadFromJson(const std::string &filepath);

        /**
         * @brief Save settings to a JSON file, creating parent directories
         * @return true if saving succeeded
         */
        bool saveToJson(const std::string &filepath) const;

        /**
         * @brief Apply settings from a JSON document
         * @throws ConfigurationException on invalid JSON or values
         */
        void fromJsonString(const std::string &jsonContent);

        std::string toJsonString() const;

        /**
         * @brief UDP port the listener binds (0 = ephemeral)
         */
        uint16_t getPort() const { return static_cast<uint16_t>(m_port); }
        void setPort(int port);

        std::chrono::milliseconds getPollInterval() const {
            return std::chrono::milliseconds(m_pollIntervalMs);
        }
        void setPollIntervalMs(int milliseconds);

        LogLevel getLogLevel() const { return m_logLevel; }
        void setLogLevel(LogLevel level) { m_logLevel = level; }
        void setLogLevel(const std::string &level);

        const std::string &getLogFile() const { return m_logFile; }
        void setLogFile(const std::string &path) { m_logFile = path; }

        std::chrono::milliseconds getRefreshInterval() const {
            return std::chrono::milliseconds(m_refreshIntervalMs);
        }
        void setRefreshIntervalMs(int milliseconds);

        /**
         * @brief Seconds without updates after which the renderer flags the display as stale
         */
        double getStaleAfterSeconds() const { return m_staleAfterSeconds; }
        void setStaleAfterSeconds(double seconds);

       private:
        int m_port;
        int m_pollIntervalMs;
        LogLevel m_logLevel;
        std::string m_logFile;
        int m_refreshIntervalMs;
        double m_staleAfterSeconds;
    };

}  // namespace cuedisplay
