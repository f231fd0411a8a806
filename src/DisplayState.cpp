#include "cuedisplay/DisplayState.h"

namespace cuedisplay {
    namespace {
        struct ApplyVisitor {
            DisplayState &state;

            void operator()(const CueUpdate &u) const { state.cue = u.cue; }
            void operator()(const DescriptionUpdate &u) const { state.description = u.description; }
            void operator()(const ColorUpdate &u) const { state.color = u.color; }
            void operator()(const CueFiredUpdate &u) const {
                state.cue = u.cue;
                state.description = u.description;
                if (u.color) {
                    state.color = u.color;
                }
            }
        };
    }  // namespace

    void SharedDisplayState::apply(const FieldUpdate &update) {
        auto now = std::chrono::steady_clock::now();

        std::lock_guard<std::mutex> lock(mutex_);
        std::visit(ApplyVisitor{state_}, update);
        state_.revision++;
        state_.lastUpdate = now;
    }

    DisplayState SharedDisplayState::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    uint64_t SharedDisplayState::revision() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.revision;
    }

    void SharedDisplayState::reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = DisplayState{};
    }

}  // namespace cuedisplay
