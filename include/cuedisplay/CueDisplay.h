/*
 *  CueDisplay - OSC cue display companion.
 *
 *  Receives show-control updates over OSC/UDP and keeps the latest cue,
 *  description and color for a display.
 */

#pragma once

/**
 * @file CueDisplay.h
 * @brief Main include file for the CueDisplay library
 *
 * Example usage:
 *
 * ```cpp
 * auto state = std::make_shared<cuedisplay::SharedDisplayState>();
 * auto listener = cuedisplay::Listener::start(53000, state);
 *
 * // Renderer loop
 * cuedisplay::DisplayState snapshot = state->snapshot();
 * std::cout << snapshot.cue << " " << snapshot.description << "\n";
 *
 * listener->stop();
 * ```
 */

#include <string>

#include "cuedisplay/Configuration.h"
#include "cuedisplay/DisplayState.h"
#include "cuedisplay/Exceptions.h"
#include "cuedisplay/FieldMapper.h"
#include "cuedisplay/Listener.h"
#include "cuedisplay/Logging.h"
#include "cuedisplay/Message.h"
#include "cuedisplay/PacketSource.h"
#include "cuedisplay/Types.h"

// Version information
#define CUEDISPLAY_VERSION_MAJOR 1
#define CUEDISPLAY_VERSION_MINOR 0
#define CUEDISPLAY_VERSION_PATCH 0
#define CUEDISPLAY_VERSION_STRING "1.0.0"

namespace cuedisplay {

    /**
     * @brief Get the library version as a string
     * @return Version string in format "major.minor.patch"
     */
    inline std::string getVersionString() { return CUEDISPLAY_VERSION_STRING; }

}  // namespace cuedisplay
