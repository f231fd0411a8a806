#include <gtest/gtest.h>

#include <atomic>
#include <sstream>
#include <string>
#include <thread>

#include "cuedisplay/DisplayState.h"
#include "cuedisplay/TerminalRenderer.h"

using namespace cuedisplay;

TEST(DisplayState, StartsEmpty) {
    SharedDisplayState shared;
    DisplayState state = shared.snapshot();

    EXPECT_EQ(state.cue, "");
    EXPECT_EQ(state.description, "");
    EXPECT_FALSE(state.color);
    EXPECT_EQ(state.revision, 0u);
    EXPECT_FALSE(state.lastUpdate);
}

TEST(DisplayState, UpdatesOnlyTheNamedField) {
    SharedDisplayState shared;
    shared.apply(CueUpdate{"Q1"});
    shared.apply(DescriptionUpdate{"Preset"});
    shared.apply(ColorUpdate{RGBAColor(255, 0, 0)});
    shared.apply(CueUpdate{"Q2"});

    DisplayState state = shared.snapshot();
    EXPECT_EQ(state.cue, "Q2");
    EXPECT_EQ(state.description, "Preset");
    ASSERT_TRUE(state.color);
    EXPECT_EQ(*state.color, RGBAColor(255, 0, 0, 255));
    EXPECT_EQ(state.revision, 4u);
    EXPECT_TRUE(state.lastUpdate);
}

TEST(DisplayState, CueFiredKeepsColorWhenAbsent) {
    SharedDisplayState shared;
    shared.apply(ColorUpdate{RGBAColor(0, 0, 255)});
    shared.apply(CueFiredUpdate{"Q5", "Walk-in", std::nullopt});

    DisplayState state = shared.snapshot();
    EXPECT_EQ(state.cue, "Q5");
    EXPECT_EQ(state.description, "Walk-in");
    ASSERT_TRUE(state.color);
    EXPECT_EQ(*state.color, RGBAColor(0, 0, 255, 255));
}

TEST(DisplayState, Reset) {
    SharedDisplayState shared;
    shared.apply(CueUpdate{"Q1"});
    shared.reset();

    EXPECT_EQ(shared.revision(), 0u);
    EXPECT_EQ(shared.snapshot().cue, "");
}

TEST(DisplayState, ConcurrentReadersNeverSeeTornValues) {
    SharedDisplayState shared;
    const std::string first(64, 'A');
    const std::string second(64, 'B');
    constexpr int UPDATES = 10000;

    std::atomic<bool> done(false);
    std::atomic<int> badReads(0);
    std::atomic<int> reads(0);

    std::thread reader([&] {
        uint64_t lastRevision = 0;
        while (!done.load()) {
            DisplayState state = shared.snapshot();
            if (!state.cue.empty() && state.cue != first && state.cue != second) {
                badReads++;
            }
            if (state.revision < lastRevision) {
                badReads++;
            }
            lastRevision = state.revision;
            reads++;
        }
    });

    for (int i = 0; i < UPDATES; ++i) {
        shared.apply(CueUpdate{i % 2 == 0 ? first : second});
    }
    done.store(true);
    reader.join();

    EXPECT_EQ(badReads.load(), 0);
    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(shared.revision(), static_cast<uint64_t>(UPDATES));
    EXPECT_EQ(shared.snapshot().cue, second);
}

TEST(TerminalRenderer, FrameBeforeAnyUpdate) {
    DisplayState state;
    std::string frame =
        TerminalRenderer::formatFrame(state, std::nullopt, std::chrono::steady_clock::now(), 5.0);

    EXPECT_NE(frame.find("Cue:         -"), std::string::npos);
    EXPECT_NE(frame.find("Color:       -"), std::string::npos);
    EXPECT_NE(frame.find("Last OSC:    n/a"), std::string::npos);
}

TEST(TerminalRenderer, FrameShowsFieldsAndAge) {
    auto now = std::chrono::steady_clock::now();
    DisplayState state;
    state.cue = "Act1Scene2";
    state.description = "Storm";
    state.color = RGBAColor(0xFF, 0x80, 0x00);
    state.revision = 3;
    state.lastUpdate = now - std::chrono::milliseconds(1500);

    std::string frame = TerminalRenderer::formatFrame(state, std::nullopt, now, 5.0);
    EXPECT_NE(frame.find("Act1Scene2"), std::string::npos);
    EXPECT_NE(frame.find("Storm"), std::string::npos);
    EXPECT_NE(frame.find("#FF8000FF"), std::string::npos);
    EXPECT_NE(frame.find("1.5s ago"), std::string::npos);
    EXPECT_EQ(frame.find("[STALE]"), std::string::npos);

    std::string stale = TerminalRenderer::formatFrame(state, std::nullopt,
                                                      now + std::chrono::seconds(10), 5.0);
    EXPECT_NE(stale.find("[STALE]"), std::string::npos);
}

TEST(TerminalRenderer, PlainOutputRedrawsOnRevisionChange) {
    std::ostringstream out;
    TerminalRenderer renderer(out, 5.0, false);
    auto now = std::chrono::steady_clock::now();

    DisplayState state;
    EXPECT_TRUE(renderer.render(state, std::nullopt, now));
    EXPECT_FALSE(renderer.render(state, std::nullopt, now + std::chrono::milliseconds(100)));

    state.cue = "Q1";
    state.revision = 1;
    state.lastUpdate = now;
    EXPECT_TRUE(renderer.render(state, std::nullopt, now));
    EXPECT_FALSE(renderer.render(state, std::nullopt, now + std::chrono::seconds(1)));

    // Crossing the stale threshold redraws once
    EXPECT_TRUE(renderer.render(state, std::nullopt, now + std::chrono::seconds(6)));
    EXPECT_FALSE(renderer.render(state, std::nullopt, now + std::chrono::seconds(7)));

    EXPECT_NE(out.str().find("Q1"), std::string::npos);
}

TEST(TerminalRenderer, RecentPacketKeepsDisplayFresh) {
    auto now = std::chrono::steady_clock::now();
    DisplayState state;
    state.cue = "Q1";
    state.revision = 1;
    state.lastUpdate = now - std::chrono::seconds(6);

    // Keepalive traffic on an unmapped address one second ago
    std::string frame =
        TerminalRenderer::formatFrame(state, now - std::chrono::seconds(1), now, 5.0);
    EXPECT_NE(frame.find("1.0s ago"), std::string::npos);
    EXPECT_EQ(frame.find("[STALE]"), std::string::npos);

    // Only a packet, no field update yet
    DisplayState empty;
    frame = TerminalRenderer::formatFrame(empty, now - std::chrono::milliseconds(500), now, 5.0);
    EXPECT_NE(frame.find("0.5s ago"), std::string::npos);
}
