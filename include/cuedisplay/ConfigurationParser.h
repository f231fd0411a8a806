/*
 *  CueDisplay - OSC cue display companion.
 *  Builds a Configuration from the command line and JSON configuration files.
 */

#pragma once

#include <string>

#include "cuedisplay/Configuration.h"

namespace cuedisplay {

    /**
     * @brief What the command line asked for besides configuration values
     */
    struct CommandLineResult {
        bool helpRequested = false;
        bool portOverridden = false;  ///< --port or a positional port was given
        std::string configFile;       ///< File the settings were loaded from (may not exist)
        std::string saveConfigFile;   ///< Target of --save-config, empty if absent
    };

    /**
     * @brief Parser for configuration from the command line and JSON files
     */
    class ConfigurationParser {
       public:
        /**
         * @brief Parse configuration from command line arguments
         *
         * The JSON file named by --config (or the default configuration file when
         * --config is absent) is loaded first; the remaining options override it.
         * A missing default file is not an error.
         *
         * @param argc Argument count
         * @param argv Argument values
         * @param config Configuration to fill
         * @throws ConfigurationException for unknown options, missing or invalid
         * values, or a --config file that cannot be read
         */
        static CommandLineResult parseCommandLine(int argc, const char *const argv[],
                                                  Configuration &config);

        /**
         * @brief Usage text for --help
         */
        static std::string usage(const std::string &programName);

        /**
         * @brief $XDG_CONFIG_HOME/cuedisplay/config.json, falling back to
         * ~/.config/cuedisplay/config.json (empty if neither variable is set)
         */
        static std::string defaultConfigPath();
    };

}  // namespace cuedisplay
