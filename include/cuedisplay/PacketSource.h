/*
 *  CueDisplay - OSC cue display companion.
 *  This header declares the PacketSource class, which owns the listening UDP
 *  socket and hands out raw datagrams.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cuedisplay/Types.h"

namespace cuedisplay {

    /**
     * @brief One received datagram and the address it came from ("host:port")
     */
    struct RawPacket {
        std::vector<std::byte> data;
        std::string sender;
    };

    /**
     * @brief Blocking, cancellable UDP receiver bound to one port
     *
     * receive() waits in slices of at most the poll interval and checks the
     * cancellation flag between slices, so cancel() from another thread makes a
     * pending receive() return within one slice.
     */
    class PacketSource {
       public:
        static constexpr size_t MAX_PACKET_SIZE = 65536;
        static constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{100};
        static constexpr std::chrono::milliseconds MAX_POLL_INTERVAL{250};

        /**
         * @brief Create the socket and bind it to INADDR_ANY:port
         * @param port UDP port, 0 for an ephemeral port
         * @param pollInterval Cancellation check interval, clamped to 1-250 ms
         * @throws StartupException if the socket cannot be created or bound
         */
        explicit PacketSource(uint16_t port,
                              std::chrono::milliseconds pollInterval = DEFAULT_POLL_INTERVAL);

        ~PacketSource();

        PacketSource(const PacketSource &) = delete;
        PacketSource &operator=(const PacketSource &) = delete;

        /**
         * @brief The bound port (resolved when constructed with port 0)
         */
        uint16_t port() const;

        std::chrono::milliseconds pollInterval() const;

        /**
         * @brief Block until a datagram arrives or the source is cancelled
         * @return The packet, or std::nullopt once cancelled
         * @throws SocketException if the socket is closed or fails
         */
        std::optional<RawPacket> receive();

        /**
         * @brief Ask a pending or future receive() to return; thread-safe
         */
        void cancel();

        bool isCancelled() const;

        /**
         * @brief Release the socket. Must not race with receive().
         */
        void close();

        bool isOpen() const;

       private:
        bool waitReadable();

        SOCKET_TYPE socket_;
        uint16_t port_;
        std::chrono::milliseconds pollInterval_;
        std::atomic<bool> cancelled_;
        std::vector<std::byte> buffer_;
    };

}  // namespace cuedisplay
