/*
 *  CueDisplay - OSC cue display companion.
 *  Text rendering of the display state for a terminal.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "cuedisplay/DisplayState.h"

namespace cuedisplay {

    /**
     * @brief Draws DisplayState snapshots to a stream
     *
     * With ANSI output enabled the screen is cleared before each frame and the
     * color is shown as a swatch; otherwise a frame is printed only when the
     * revision or the stale flag changes.
     */
    class TerminalRenderer {
       public:
        TerminalRenderer(std::ostream &out, double staleAfterSeconds, bool ansi);

        using TimePoint = std::chrono::steady_clock::time_point;

        /**
         * @brief Draw a frame if anything visible changed
         * @param lastPacket Arrival of the last decoded packet (ListenerStats::lastPacket)
         * @return true if a frame was written
         */
        bool render(const DisplayState &state, std::optional<TimePoint> lastPacket, TimePoint now);

        /**
         * @brief Plain-text frame, one field per line
         *
         * "Last OSC" is the age of the newer of @p lastPacket and the state's last
         * update, so keepalive traffic on unmapped addresses keeps it fresh.
         */
        static std::string formatFrame(const DisplayState &state,
                                       std::optional<TimePoint> lastPacket, TimePoint now,
                                       double staleAfterSeconds);

       private:
        std::ostream &out_;
        double staleAfterSeconds_;
        bool ansi_;
        std::string lastKey_;
    };

}  // namespace cuedisplay
