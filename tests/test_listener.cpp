#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#ifndef _WIN32
#include <sys/resource.h>
#include <sys/select.h>
#include <unistd.h>
#endif

#include "TestUtils.h"
#include "cuedisplay/Exceptions.h"
#include "cuedisplay/Listener.h"
#include "cuedisplay/Message.h"
#include "cuedisplay/PacketSource.h"

using namespace cuedisplay;
using cuedisplay::test::bytesOf;
using cuedisplay::test::sendUdp;
using cuedisplay::test::waitFor;

namespace {
    std::vector<std::byte> cueMessage(const std::string &cue) {
        Message msg("/cue");
        msg.addString(cue);
        return msg.serialize();
    }

    ListenerOptions fastPolling() {
        ListenerOptions options;
        options.pollInterval = std::chrono::milliseconds(20);
        return options;
    }
}  // namespace

TEST(ListenerPipeline, AppliesRecognizedMessage) {
    SharedDisplayState state;
    ListenerStats stats;
    RawPacket packet{cueMessage("Act1Scene2"), "127.0.0.1:9000"};

    EXPECT_TRUE(Listener::processPacket(packet, state, stats));
    EXPECT_EQ(state.snapshot().cue, "Act1Scene2");
    EXPECT_EQ(stats.packetsReceived, 1u);
    EXPECT_EQ(stats.updatesApplied, 1u);
}

TEST(ListenerPipeline, CountsBadAndUnrelatedPackets) {
    SharedDisplayState state;
    ListenerStats stats;

    Message meter("/1/vumeters");
    meter.addFloat(0.25f);

    EXPECT_FALSE(Listener::processPacket({meter.serialize(), "a"}, state, stats));
    EXPECT_FALSE(Listener::processPacket({bytesOf(std::string("/cue\0\0", 6)), "b"}, state, stats));
    EXPECT_FALSE(Listener::processPacket(
        {bytesOf(std::string("#bundle\0\0\0\0\0\0\0\0\x01", 16)), "c"}, state, stats));

    EXPECT_EQ(stats.packetsReceived, 3u);
    EXPECT_EQ(stats.ignoredMessages, 1u);
    EXPECT_EQ(stats.malformedPackets, 1u);
    EXPECT_EQ(stats.unsupportedPackets, 1u);
    EXPECT_EQ(stats.updatesApplied, 0u);
    EXPECT_EQ(state.revision(), 0u);
}

TEST(ListenerPipeline, KeepaliveRecordsPacketTimeOnly) {
    SharedDisplayState state;
    ListenerStats stats;
    EXPECT_FALSE(stats.lastPacket);

    ASSERT_TRUE(Listener::processPacket({cueMessage("Q1"), "desk"}, state, stats));
    ASSERT_TRUE(stats.lastPacket);
    auto afterCue = *stats.lastPacket;
    DisplayState before = state.snapshot();

    EXPECT_FALSE(Listener::processPacket({Message("/thump").serialize(), "desk"}, state, stats));
    ASSERT_TRUE(stats.lastPacket);
    EXPECT_TRUE(*stats.lastPacket >= afterCue);
    EXPECT_TRUE(*stats.lastPacket >= *before.lastUpdate);

    DisplayState after = state.snapshot();
    EXPECT_EQ(after.revision, before.revision);
    EXPECT_TRUE(after.lastUpdate == before.lastUpdate);
    EXPECT_EQ(stats.ignoredMessages, 1u);
    EXPECT_EQ(after.cue, "Q1");
}

TEST(ListenerPipeline, BadPacketsDoNotCountAsActivity) {
    SharedDisplayState state;
    ListenerStats stats;

    EXPECT_FALSE(Listener::processPacket({bytesOf(std::string("garbage", 7)), "x"}, state, stats));
    EXPECT_FALSE(Listener::processPacket(
        {bytesOf(std::string("#bundle\0\0\0\0\0\0\0\0\x01", 16)), "x"}, state, stats));
    EXPECT_EQ(stats.packetsReceived, 2u);
    EXPECT_FALSE(stats.lastPacket);
}

TEST(Listener, RequiresDisplayState) {
    EXPECT_THROW(Listener::start(0, nullptr), InvalidArgumentException);
}

TEST(Listener, ReceivesCueOverUdp) {
    auto state = std::make_shared<SharedDisplayState>();
    auto listener = Listener::start(0, state, fastPolling());

    ASSERT_NE(listener->port(), 0);
    EXPECT_TRUE(listener->isRunning());

    ASSERT_TRUE(sendUdp(listener->port(), cueMessage("Act1Scene2")));
    ASSERT_TRUE(waitFor([&] { return state->revision() > 0; }));
    EXPECT_EQ(state->snapshot().cue, "Act1Scene2");

    listener->stop();
    EXPECT_EQ(listener->state(), ListenerState::Stopped);
    EXPECT_EQ(listener->stats().updatesApplied, 1u);
    EXPECT_TRUE(listener->lastError().empty());
}

TEST(Listener, SurvivesMalformedPackets) {
    auto state = std::make_shared<SharedDisplayState>();
    auto listener = Listener::start(0, state, fastPolling());

    ASSERT_TRUE(sendUdp(listener->port(), bytesOf(std::string("garbage", 7))));
    ASSERT_TRUE(sendUdp(listener->port(), bytesOf(std::string("/cue\0\0\0\0,x\0\0", 12))));
    ASSERT_TRUE(sendUdp(listener->port(), cueMessage("Q9")));

    ASSERT_TRUE(waitFor([&] { return state->revision() > 0; }));
    EXPECT_EQ(state->snapshot().cue, "Q9");
    EXPECT_TRUE(listener->isRunning());

    ASSERT_TRUE(waitFor([&] { return listener->stats().packetsReceived == 3; }));
    EXPECT_EQ(listener->stats().malformedPackets, 2u);
}

TEST(Listener, LatestWriteWins) {
    auto state = std::make_shared<SharedDisplayState>();
    auto listener = Listener::start(0, state, fastPolling());

    for (int i = 1; i <= 20; ++i) {
        ASSERT_TRUE(sendUdp(listener->port(), cueMessage("Q" + std::to_string(i))));
    }

    ASSERT_TRUE(waitFor([&] { return state->snapshot().cue == "Q20"; }));
}

TEST(Listener, StopWhileIdleReturnsPromptly) {
    auto state = std::make_shared<SharedDisplayState>();
    ListenerOptions options;
    options.pollInterval = std::chrono::milliseconds(250);
    auto listener = Listener::start(0, state, options);

    // Let the loop block in receive
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto before = std::chrono::steady_clock::now();
    listener->stop();
    auto elapsed = std::chrono::steady_clock::now() - before;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_EQ(listener->state(), ListenerState::Stopped);

    // Idempotent
    listener->stop();
    EXPECT_EQ(listener->state(), ListenerState::Stopped);
}

TEST(Listener, SamePortCanBeReboundAfterStop) {
    auto state = std::make_shared<SharedDisplayState>();
    auto first = Listener::start(0, state, fastPolling());
    uint16_t port = first->port();
    first->stop();

    auto second = Listener::start(port, state, fastPolling());
    EXPECT_EQ(second->port(), port);

    ASSERT_TRUE(sendUdp(port, cueMessage("Again")));
    ASSERT_TRUE(waitFor([&] { return state->snapshot().cue == "Again"; }));
}

TEST(Listener, PortInUseFailsAtStartup) {
    auto state = std::make_shared<SharedDisplayState>();
    auto first = Listener::start(0, state, fastPolling());

    try {
        Listener::start(first->port(), state, fastPolling());
        FAIL() << "second bind on the same port succeeded";
    } catch (const StartupException &e) {
        EXPECT_EQ(e.code(), CueDisplayException::ErrorCode::StartupError);
    }
    EXPECT_TRUE(first->isRunning());
}

TEST(PacketSource, CloseReleasesSocket) {
    PacketSource source(0, std::chrono::milliseconds(10));
    uint16_t port = source.port();
    ASSERT_TRUE(source.isOpen());

    source.close();
    EXPECT_FALSE(source.isOpen());
    EXPECT_THROW(source.receive(), SocketException);

    // Port is free again
    PacketSource again(port, std::chrono::milliseconds(10));
    EXPECT_EQ(again.port(), port);
}

#ifndef _WIN32
TEST(PacketSource, RejectsDescriptorAboveSelectLimit) {
    rlimit limit{};
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &limit), 0);
    rlim_t wanted = FD_SETSIZE + 16;
    if (limit.rlim_cur < wanted) {
        if (limit.rlim_max != RLIM_INFINITY && limit.rlim_max < wanted) {
            GTEST_SKIP() << "file descriptor limit too low";
        }
        rlimit raised = limit;
        raised.rlim_cur = wanted;
        if (setrlimit(RLIMIT_NOFILE, &raised) != 0) {
            GTEST_SKIP() << "cannot raise file descriptor limit";
        }
    }

    // Occupy every descriptor below FD_SETSIZE so the next socket lands above it
    std::vector<int> filler;
    int fd = 0;
    while ((fd = ::dup(STDERR_FILENO)) >= 0) {
        filler.push_back(fd);
        if (fd >= FD_SETSIZE - 1) {
            break;
        }
    }
    bool filled = fd >= FD_SETSIZE - 1;

    if (filled) {
        EXPECT_THROW(PacketSource(0), StartupException);
    }

    for (int descriptor : filler) {
        ::close(descriptor);
    }
    setrlimit(RLIMIT_NOFILE, &limit);

    if (!filled) {
        GTEST_SKIP() << "could not fill descriptors up to FD_SETSIZE";
    }
}
#endif

TEST(Listener, StateNames) {
    EXPECT_STREQ(listenerStateName(ListenerState::Running), "running");
    EXPECT_STREQ(listenerStateName(ListenerState::Stopped), "stopped");
}
