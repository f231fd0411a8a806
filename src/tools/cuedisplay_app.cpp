/*
 *  CueDisplay - OSC cue display companion.
 *  Terminal front end: listens for cue updates and shows the latest state.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#ifdef _WIN32
#include <io.h>
#define CUEDISPLAY_ISATTY _isatty
#define CUEDISPLAY_FILENO _fileno
#else
#include <unistd.h>
#define CUEDISPLAY_ISATTY isatty
#define CUEDISPLAY_FILENO fileno
#endif

#include <fmt/format.h>

#include "cuedisplay/ConfigurationParser.h"
#include "cuedisplay/CueDisplay.h"
#include "cuedisplay/TerminalRenderer.h"

// Global shutdown flag for signal handling
std::atomic<bool> g_shutdown_requested(false);

void signal_handler(int) { g_shutdown_requested.store(true); }

int main(int argc, char *argv[]) {
    using namespace cuedisplay;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    Configuration config;
    CommandLineResult options;
    try {
        options = ConfigurationParser::parseCommandLine(argc, argv, config);
    } catch (const ConfigurationException &e) {
        std::cerr << "Error: " << e.what() << "\n\n" << ConfigurationParser::usage(argv[0]);
        return 2;
    }

    if (options.helpRequested) {
        std::cout << ConfigurationParser::usage(argv[0]);
        return 0;
    }

    setLogLevel(config.getLogLevel());
    if (!config.getLogFile().empty() && !setLogFile(config.getLogFile())) {
        LogWarning(fmt::format("Cannot open log file {}", config.getLogFile()));
    }

    LogInfo(fmt::format("CueDisplay {} starting", getVersionString()));

    if (!options.saveConfigFile.empty()) {
        if (config.saveToJson(options.saveConfigFile)) {
            LogInfo(fmt::format("Configuration saved to {}", options.saveConfigFile));
        } else {
            LogError(fmt::format("Failed to save configuration to {}", options.saveConfigFile));
        }
    }

    // Remember a port given on the command line for the next run
    if (options.portOverridden && !options.configFile.empty() &&
        options.configFile == ConfigurationParser::defaultConfigPath() &&
        !config.saveToJson(options.configFile)) {
        LogWarning(fmt::format("Could not remember port {} in {}", config.getPort(),
                               options.configFile));
    }

    auto state = std::make_shared<SharedDisplayState>();
    ListenerHandle listener;
    try {
        ListenerOptions listenerOptions;
        listenerOptions.pollInterval = config.getPollInterval();
        listener = Listener::start(config.getPort(), state, listenerOptions);
    } catch (const StartupException &e) {
        LogError(e.what());
        std::cerr << fmt::format("Cannot listen on UDP port {}: {}\n", config.getPort(), e.what());
        return 1;
    }

    std::cout << fmt::format("Listening for OSC on UDP port {} (Ctrl+C to quit)\n",
                             listener->port());

    bool ansi = CUEDISPLAY_ISATTY(CUEDISPLAY_FILENO(stdout)) != 0;
    TerminalRenderer renderer(std::cout, config.getStaleAfterSeconds(), ansi);

    while (!g_shutdown_requested.load()) {
        renderer.render(state->snapshot(), listener->stats().lastPacket,
                        std::chrono::steady_clock::now());

        if (!listener->isRunning()) {
            LogError(fmt::format("Listener stopped: {}", listener->lastError()));
            break;
        }
        std::this_thread::sleep_for(config.getRefreshInterval());
    }

    listener->stop();

    ListenerStats stats = listener->stats();
    std::cout << fmt::format(
        "\nPackets received: {}, updates applied: {}, malformed: {}, unsupported: {}, "
        "ignored: {}\n",
        stats.packetsReceived, stats.updatesApplied, stats.malformedPackets,
        stats.unsupportedPackets, stats.ignoredMessages);

    setLogFile(std::string());
    return listener->lastError().empty() ? 0 : 1;
}
