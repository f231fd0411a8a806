#include "cuedisplay/TerminalRenderer.h"

#include <algorithm>

#include <fmt/format.h>

namespace cuedisplay {
    namespace {
        const char *orDash(const std::string &text) { return text.empty() ? "-" : text.c_str(); }

        std::optional<TerminalRenderer::TimePoint> lastActivity(
            const DisplayState &state, std::optional<TerminalRenderer::TimePoint> lastPacket) {
            if (!state.lastUpdate) {
                return lastPacket;
            }
            if (!lastPacket) {
                return state.lastUpdate;
            }
            return std::max(*state.lastUpdate, *lastPacket);
        }

        // Seconds since @p since, never negative
        double ageSeconds(TerminalRenderer::TimePoint since, TerminalRenderer::TimePoint now) {
            double age = std::chrono::duration<double>(now - since).count();
            return age < 0.0 ? 0.0 : age;
        }
    }  // namespace

    TerminalRenderer::TerminalRenderer(std::ostream &out, double staleAfterSeconds, bool ansi)
        : out_(out), staleAfterSeconds_(staleAfterSeconds), ansi_(ansi) {}

    std::string TerminalRenderer::formatFrame(const DisplayState &state,
                                              std::optional<TimePoint> lastPacket, TimePoint now,
                                              double staleAfterSeconds) {
        std::string lastOsc = "n/a";
        if (auto activity = lastActivity(state, lastPacket)) {
            double age = ageSeconds(*activity, now);
            lastOsc = fmt::format("{:.1f}s ago{}", age, age > staleAfterSeconds ? " [STALE]" : "");
        }

        return fmt::format(
            "Cue:         {}\n"
            "Description: {}\n"
            "Color:       {}\n"
            "Last OSC:    {}\n",
            orDash(state.cue), orDash(state.description),
            state.color ? state.color->toHexString() : std::string("-"), lastOsc);
    }

    bool TerminalRenderer::render(const DisplayState &state, std::optional<TimePoint> lastPacket,
                                  TimePoint now) {
        std::string frame = formatFrame(state, lastPacket, now, staleAfterSeconds_);

        auto activity = lastActivity(state, lastPacket);
        bool stale = activity && ageSeconds(*activity, now) > staleAfterSeconds_;
        std::string key = ansi_ ? frame : fmt::format("{}:{}", state.revision, stale);
        if (key == lastKey_) {
            return false;
        }
        lastKey_ = key;

        if (ansi_) {
            // Clear screen, cursor home
            out_ << "\x1b[2J\x1b[H" << frame;
            if (state.color) {
                out_ << fmt::format("             \x1b[48;2;{};{};{}m        \x1b[0m\n",
                                    state.color->r, state.color->g, state.color->b);
            }
        } else {
            out_ << frame << "\n";
        }
        out_.flush();
        return true;
    }

}  // namespace cuedisplay
