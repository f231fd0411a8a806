#include "cuedisplay/Configuration.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "cuedisplay/Exceptions.h"

namespace cuedisplay {

    Configuration::Configuration()
        : m_port(DEFAULT_PORT),
          m_pollIntervalMs(DEFAULT_POLL_INTERVAL_MS),
          m_logLevel(LogLevel::Info),
          m_refreshIntervalMs(DEFAULT_REFRESH_INTERVAL_MS),
          m_staleAfterSeconds(DEFAULT_STALE_AFTER_SECONDS) {}

    void Configuration::setPort(int port) {
        if (port < 0 || port > 65535) {
            throw ConfigurationException(fmt::format("Port {} is outside 0-65535", port));
        }
        m_port = port;
    }

    void Configuration::setPollIntervalMs(int milliseconds) {
        if (milliseconds < 1 || milliseconds > MAX_POLL_INTERVAL_MS) {
            throw ConfigurationException(fmt::format(
                "Poll interval {} ms is outside 1-{} ms", milliseconds, MAX_POLL_INTERVAL_MS));
        }
        m_pollIntervalMs = milliseconds;
    }

    void Configuration::setLogLevel(const std::string &level) {
        auto parsed = parseLogLevel(level);
        if (!parsed) {
            throw ConfigurationException(fmt::format(
                "Unknown log level '{}' (expected error, warning, info or debug)", level));
        }
        m_logLevel = *parsed;
    }

    void Configuration::setRefreshIntervalMs(int milliseconds) {
        if (milliseconds < 10 || milliseconds > 10000) {
            throw ConfigurationException(
                fmt::format("Refresh interval {} ms is outside 10-10000 ms", milliseconds));
        }
        m_refreshIntervalMs = milliseconds;
    }

    void Configuration::setStaleAfterSeconds(double seconds) {
        if (!std::isfinite(seconds) || seconds <= 0.0) {
            throw ConfigurationException(
                fmt::format("Stale timeout {} s must be a positive number", seconds));
        }
        m_staleAfterSeconds = seconds;
    }

    bool Configuration::loadFromJson(const std::string &filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            return false;
        }

        std::stringstream content;
        content << file.rdbuf();

        try {
            fromJsonString(content.str());
        } catch (const ConfigurationException &e) {
            throw ConfigurationException(fmt::format("{}: {}", filepath, e.what()));
        }
        return true;
    }

    bool Configuration::saveToJson(const std::string &filepath) const {
        std::error_code ec;
        std::filesystem::path path(filepath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                LogWarning(fmt::format("Cannot create directory {}: {}",
                                       path.parent_path().string(), ec.message()));
                return false;
            }
        }

        std::ofstream file(filepath, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            LogWarning(fmt::format("Cannot write configuration file {}", filepath));
            return false;
        }

        file << toJsonString() << std::endl;
        return file.good();
    }

    void Configuration::fromJsonString(const std::string &jsonContent) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(jsonContent);
        } catch (const nlohmann::json::parse_error &e) {
            throw ConfigurationException(fmt::format("Invalid JSON: {}", e.what()));
        }

        if (!j.is_object()) {
            throw ConfigurationException("Configuration must be a JSON object");
        }

        // Validate into a copy so a bad value leaves this configuration untouched
        Configuration updated(*this);
        try {
            if (j.contains("port")) {
                updated.setPort(j["port"].get<int>());
            }
            if (j.contains("pollIntervalMs")) {
                updated.setPollIntervalMs(j["pollIntervalMs"].get<int>());
            }
            if (j.contains("logLevel")) {
                updated.setLogLevel(j["logLevel"].get<std::string>());
            }
            if (j.contains("logFile")) {
                updated.setLogFile(j["logFile"].get<std::string>());
            }
            if (j.contains("refreshIntervalMs")) {
                updated.setRefreshIntervalMs(j["refreshIntervalMs"].get<int>());
            }
            if (j.contains("staleAfterSeconds")) {
                updated.setStaleAfterSeconds(j["staleAfterSeconds"].get<double>());
            }
        } catch (const nlohmann::json::exception &e) {
            throw ConfigurationException(fmt::format("Invalid configuration value: {}", e.what()));
        }

        *this = updated;
    }

    std::string Configuration::toJsonString() const {
        nlohmann::json j;

        j["port"] = m_port;
        j["pollIntervalMs"] = m_pollIntervalMs;
        j["logLevel"] = logLevelName(m_logLevel);  // parseLogLevel is case-insensitive
        j["logFile"] = m_logFile;
        j["refreshIntervalMs"] = m_refreshIntervalMs;
        j["staleAfterSeconds"] = m_staleAfterSeconds;

        return j.dump(4);
    }

}  // namespace cuedisplay
