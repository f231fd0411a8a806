#include "cuedisplay/ConfigurationParser.h"

#include <cstdlib>
#include <stdexcept>

#include <fmt/format.h>

#include "cuedisplay/Exceptions.h"
#include "cuedisplay/Logging.h"

namespace cuedisplay {
    namespace {
        int parseInteger(const std::string &text, const std::string &option) {
            size_t consumed = 0;
            int value = 0;
            try {
                value = std::stoi(text, &consumed);
            } catch (const std::exception &) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != text.size()) {
                throw ConfigurationException(
                    fmt::format("{} expects an integer, got '{}'", option, text));
            }
            return value;
        }

        double parseNumber(const std::string &text, const std::string &option) {
            size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(text, &consumed);
            } catch (const std::exception &) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != text.size()) {
                throw ConfigurationException(
                    fmt::format("{} expects a number, got '{}'", option, text));
            }
            return value;
        }

        bool isInteger(const std::string &text) {
            return !text.empty() &&
                   text.find_first_not_of("0123456789") == std::string::npos;
        }
    }  // namespace

    std::string ConfigurationParser::defaultConfigPath() {
        if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
            return std::string(xdg) + "/cuedisplay/config.json";
        }
#ifdef _WIN32
        if (const char *appData = std::getenv("APPDATA"); appData && *appData) {
            return std::string(appData) + "\\cuedisplay\\config.json";
        }
#endif
        if (const char *home = std::getenv("HOME"); home && *home) {
            return std::string(home) + "/.config/cuedisplay/config.json";
        }
        return std::string();
    }

    std::string ConfigurationParser::usage(const std::string &programName) {
        return fmt::format(
            "Usage: {} [options] [port]\n"
            "\n"
            "Shows the latest /cue, /description and /color received over OSC/UDP.\n"
            "\n"
            "Options:\n"
            "  --port <n>           UDP port to listen on (default {})\n"
            "  --config <file>      Load settings from a JSON file\n"
            "  --no-config          Do not load the default configuration file\n"
            "  --save-config <file> Write the effective settings to a JSON file\n"
            "  --log-level <level>  error, warning, info or debug (default info)\n"
            "  --log-file <path>    Also append log lines to a file\n"
            "  --poll-ms <n>        Shutdown responsiveness, 1-{} ms (default {})\n"
            "  --refresh-ms <n>     Display refresh interval (default {})\n"
            "  --stale-after <s>    Flag the display as stale after s seconds without updates\n"
            "  --help               Show this help\n",
            programName, Configuration::DEFAULT_PORT, Configuration::MAX_POLL_INTERVAL_MS,
            Configuration::DEFAULT_POLL_INTERVAL_MS, Configuration::DEFAULT_REFRESH_INTERVAL_MS);
    }

    CommandLineResult ConfigurationParser::parseCommandLine(int argc, const char *const argv[],
                                                            Configuration &config) {
        CommandLineResult result;

        // First pass: find the configuration file so the other options can override it
        bool explicitConfig = false;
        bool skipConfig = false;
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--config") {
                if (i + 1 >= argc) {
                    throw ConfigurationException("--config expects a file name");
                }
                result.configFile = argv[++i];
                explicitConfig = true;
            } else if (arg == "--no-config") {
                skipConfig = true;
            }
        }

        if (skipConfig) {
            result.configFile.clear();
        } else if (explicitConfig) {
            if (!config.loadFromJson(result.configFile)) {
                throw ConfigurationException(
                    fmt::format("Cannot open configuration file {}", result.configFile));
            }
        } else {
            result.configFile = defaultConfigPath();
            if (!result.configFile.empty() && config.loadFromJson(result.configFile)) {
                LogDebug(fmt::format("Loaded configuration from {}", result.configFile));
            }
        }

        // Second pass: everything else
        auto requireValue = [&](int &i, const std::string &option) -> std::string {
            if (i + 1 >= argc) {
                throw ConfigurationException(fmt::format("{} expects a value", option));
            }
            return argv[++i];
        };

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                result.helpRequested = true;
            } else if (arg == "--config") {
                ++i;
            } else if (arg == "--no-config") {
                continue;
            } else if (arg == "--port") {
                config.setPort(parseInteger(requireValue(i, arg), arg));
                result.portOverridden = true;
            } else if (arg == "--save-config") {
                result.saveConfigFile = requireValue(i, arg);
            } else if (arg == "--log-level") {
                config.setLogLevel(requireValue(i, arg));
            } else if (arg == "--log-file") {
                config.setLogFile(requireValue(i, arg));
            } else if (arg == "--poll-ms") {
                config.setPollIntervalMs(parseInteger(requireValue(i, arg), arg));
            } else if (arg == "--refresh-ms") {
                config.setRefreshIntervalMs(parseInteger(requireValue(i, arg), arg));
            } else if (arg == "--stale-after") {
                config.setStaleAfterSeconds(parseNumber(requireValue(i, arg), arg));
            } else if (isInteger(arg)) {
                config.setPort(parseInteger(arg, "port"));
                result.portOverridden = true;
            } else {
                throw ConfigurationException(fmt::format("Unknown option '{}'", arg));
            }
        }

        return result;
    }

}  // namespace cuedisplay
