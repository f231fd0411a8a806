/*
 *  CueDisplay - OSC cue display companion.
 *  This header declares the Listener, which runs the receive/decode/map/apply
 *  loop on a dedicated thread.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "cuedisplay/DisplayState.h"
#include "cuedisplay/PacketSource.h"

namespace cuedisplay {

    /**
     * @brief Lifecycle of a Listener
     */
    enum class ListenerState { Starting, Running, Stopping, Stopped };

    const char *listenerStateName(ListenerState state);

    /**
     * @brief Per-listener packet counters
     */
    struct ListenerStats {
        uint64_t packetsReceived = 0;
        uint64_t updatesApplied = 0;
        uint64_t malformedPackets = 0;
        uint64_t unsupportedPackets = 0;
        uint64_t ignoredMessages = 0;  ///< Decoded but not mapped to a field

        /// When the last packet that decoded arrived, whatever its address
        std::optional<std::chrono::steady_clock::time_point> lastPacket;
    };

    struct ListenerOptions {
        std::chrono::milliseconds pollInterval = PacketSource::DEFAULT_POLL_INTERVAL;
    };

    class Listener;

    /**
     * @brief Owning handle returned by Listener::start
     */
    using ListenerHandle = std::unique_ptr<Listener>;

    /**
     * @brief Background OSC listener feeding a SharedDisplayState
     *
     * The listener is the only writer of the display state it is given. Bad
     * packets are counted and logged; they never stop the loop. Only a bind
     * failure at start() or a socket failure while running ends it.
     */
    class Listener {
       public:
        /**
         * @brief Bind @p port and start the listener thread
         * @param port UDP port, 0 for an ephemeral port
         * @param state Display state to publish into
         * @param options Loop tuning
         * @return Handle owning the running listener
         * @throws StartupException if the port cannot be bound
         */
        static ListenerHandle start(uint16_t port, std::shared_ptr<SharedDisplayState> state,
                                    ListenerOptions options = ListenerOptions());

        /**
         * @brief Stops the listener if it is still running
         */
        ~Listener();

        Listener(const Listener &) = delete;
        Listener &operator=(const Listener &) = delete;

        /**
         * @brief Stop the loop, join the thread and release the socket
         *
         * Returns within about one poll interval. Idempotent.
         */
        void stop();

        ListenerState state() const;

        bool isRunning() const;

        /**
         * @brief The bound UDP port
         */
        uint16_t port() const;

        ListenerStats stats() const;

        /**
         * @brief Socket error that ended the loop, empty if none
         */
        std::string lastError() const;

        /**
         * @brief Run one packet through decode, map and apply
         *
         * Used by the loop for every datagram; exposed so the pipeline can be
         * driven without a socket.
         * @return true if the display state was updated
         */
        static bool processPacket(const RawPacket &packet, SharedDisplayState &state,
                                  ListenerStats &stats);

       private:
        Listener(std::unique_ptr<PacketSource> source, std::shared_ptr<SharedDisplayState> state);

        void run();
        void setState(ListenerState state);

        std::unique_ptr<PacketSource> source_;
        std::shared_ptr<SharedDisplayState> displayState_;
        uint16_t port_;
        std::thread thread_;
        std::atomic<ListenerState> state_;

        std::mutex stopMutex_;
        mutable std::mutex mutex_;  ///< Guards stats_ and lastError_
        ListenerStats stats_;
        std::string lastError_;
    };

}  // namespace cuedisplay
