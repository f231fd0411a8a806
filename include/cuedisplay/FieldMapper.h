/*
 *  CueDisplay - OSC cue display companion.
 *  This header declares the FieldMapper, which turns decoded OSC messages on the
 *  recognized addresses into display field updates.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "cuedisplay/Message.h"
#include "cuedisplay/Types.h"

namespace cuedisplay {

    // Recognized address patterns (exact, case-sensitive)
    constexpr const char *CUE_ADDRESS = "/cue";
    constexpr const char *DESCRIPTION_ADDRESS = "/description";
    constexpr const char *COLOR_ADDRESS = "/color";
    constexpr const char *CUE_FIRED_ADDRESS = "/cuefired";

    struct CueUpdate {
        std::string cue;
    };

    struct DescriptionUpdate {
        std::string description;
    };

    struct ColorUpdate {
        RGBAColor color;
    };

    /**
     * @brief Combined update carried by "/cuefired" (cue, optional text, optional color)
     *
     * color is unset when the message has no color or one that is not hex.
     */
    struct CueFiredUpdate {
        std::string cue;
        std::string description;
        std::optional<RGBAColor> color;
    };

    using FieldUpdate = std::variant<CueUpdate, DescriptionUpdate, ColorUpdate, CueFiredUpdate>;

    /**
     * @brief Maps decoded OSC messages to display field updates
     *
     * Messages on other addresses, or with an argument shape the address does
     * not accept, map to std::nullopt. That is not an error: unrelated OSC
     * traffic on the same port is expected.
     *
     * Accepted shapes:
     * - "/cue", "/description": exactly one string ('s' or 'S')
     * - "/color": one 'r'; one 'i' packed as 0xRRGGBBAA; one "#RRGGBB[AA]" string;
     *   three or four integer components in 0-255 or three or four float
     *   components in 0.0-1.0 (a fourth component is alpha)
     * - "/cuefired": always maps; string arguments in positions 0-2 give the cue,
     *   the description and a "#RRGGBB[AA]" color, other arguments are skipped
     */
    class FieldMapper {
       public:
        static std::optional<FieldUpdate> map(const Message &message);

        /**
         * @brief Convert the argument list of a "/color" message
         * @return The color, or std::nullopt for unsupported or ambiguous shapes
         */
        static std::optional<RGBAColor> colorFromArguments(const std::vector<Value> &args);
    };

    /**
     * @brief Short human-readable description of an update, for logging
     */
    std::string describeUpdate(const FieldUpdate &update);

}  // namespace cuedisplay
