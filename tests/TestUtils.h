/*
 *  CueDisplay - OSC cue display companion.
 *  Helpers shared by the test executables.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "cuedisplay/Types.h"

namespace cuedisplay {
    namespace test {

        /**
         * @brief Bytes of a string literal, embedded NULs included
         */
        inline std::vector<std::byte> bytesOf(const std::string &text) {
            std::vector<std::byte> bytes;
            bytes.reserve(text.size());
            for (char c : text) {
                bytes.push_back(static_cast<std::byte>(c));
            }
            return bytes;
        }

        /**
         * @brief Send one datagram to 127.0.0.1:port
         * @return true if the whole datagram was handed to the kernel
         */
        inline bool sendUdp(uint16_t port, const std::vector<std::byte> &data) {
            SOCKET_TYPE sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
            if (sock == CUEDISPLAY_INVALID_SOCKET) {
                return false;
            }

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_port = htons(port);
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

            auto sent = sendto(sock, reinterpret_cast<const char *>(data.data()),
                               static_cast<int>(data.size()), 0,
                               reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
            CUEDISPLAY_CLOSE_SOCKET(sock);
            return sent >= 0 && static_cast<size_t>(sent) == data.size();
        }

        /**
         * @brief Poll @p condition until it holds or @p timeout passes
         */
        inline bool waitFor(const std::function<bool()> &condition,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
            auto deadline = std::chrono::steady_clock::now() + timeout;
            while (std::chrono::steady_clock::now() < deadline) {
                if (condition()) {
                    return true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return condition();
        }

    }  // namespace test
}  // namespace cuedisplay
