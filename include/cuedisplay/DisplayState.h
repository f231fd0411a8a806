/*
 *  CueDisplay - OSC cue display companion.
 *  This header declares the display snapshot and the shared cell that carries
 *  it from the listener thread to the renderer.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "cuedisplay/FieldMapper.h"
#include "cuedisplay/Types.h"

namespace cuedisplay {

    /**
     * @brief Point-in-time copy of the displayed fields
     */
    struct DisplayState {
        std::string cue;
        std::string description;
        std::optional<RGBAColor> color;

        uint64_t revision = 0;  ///< Number of updates applied so far
        std::optional<std::chrono::steady_clock::time_point> lastUpdate;
    };

    /**
     * @brief The single shared cell holding the latest display fields
     *
     * One writer (the listener loop) and any number of readers. Every access
     * takes a short lock around a copy of the fields, so readers never see a
     * torn string and the writer never waits on a slow reader beyond that copy.
     * There is no history: the latest write wins.
     */
    class SharedDisplayState {
       public:
        SharedDisplayState() = default;

        SharedDisplayState(const SharedDisplayState &) = delete;
        SharedDisplayState &operator=(const SharedDisplayState &) = delete;

        /**
         * @brief Apply one field update
         *
         * Fields not named by the update keep their value.
         */
        void apply(const FieldUpdate &update);

        /**
         * @brief Consistent copy of the current state; never blocks for long
         */
        DisplayState snapshot() const;

        /**
         * @brief Cheap check used by renderers to skip redraws
         */
        uint64_t revision() const;

        /**
         * @brief Return to the initial empty state
         */
        void reset();

       private:
        mutable std::mutex mutex_;
        DisplayState state_;
    };

}  // namespace cuedisplay
