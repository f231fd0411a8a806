/*
 *  CueDisplay - OSC cue display companion.
 *  One-shot sender for testing a display:
 *
 *    cuedisplay-send <host> <port> <address> [args...]
 *
 *  Arguments are sent as int32 if they parse as integers, as float32 if they
 *  parse as numbers, and as strings otherwise.
 */

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include <fmt/format.h>

#include "cuedisplay/CueDisplay.h"

namespace {
    using namespace cuedisplay;

    void addArgument(Message &message, const std::string &text) {
        const char *begin = text.c_str();
        char *end = nullptr;

        errno = 0;
        long long integer = std::strtoll(begin, &end, 10);
        if (!text.empty() && *end == '\0' && errno == 0 && integer >= INT32_MIN &&
            integer <= INT32_MAX) {
            message.addInt32(static_cast<int32_t>(integer));
            return;
        }

        errno = 0;
        float number = std::strtof(begin, &end);
        if (!text.empty() && *end == '\0' && errno == 0) {
            message.addFloat(number);
            return;
        }

        message.addString(text);
    }

    void sendDatagram(const std::string &host, uint16_t port, const std::vector<std::byte> &data) {
        SOCKET_TYPE sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        if (sock == CUEDISPLAY_INVALID_SOCKET) {
            throw SocketException("Failed to create socket");
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
            CUEDISPLAY_CLOSE_SOCKET(sock);
            throw InvalidArgumentException(fmt::format("Not an IPv4 address: {}", host));
        }

        auto sent = sendto(sock, reinterpret_cast<const char *>(data.data()),
                           static_cast<int>(data.size()), 0,
                           reinterpret_cast<const sockaddr *>(&addr), sizeof(addr));
        CUEDISPLAY_CLOSE_SOCKET(sock);
        if (sent < 0 || static_cast<size_t>(sent) != data.size()) {
            throw SocketException(fmt::format("Failed to send to {}:{}", host, port));
        }
    }
}  // namespace

int main(int argc, char *argv[]) {
    if (argc < 4) {
        std::cerr << fmt::format("Usage: {} <host> <port> <address> [args...]\n", argv[0]);
        return 2;
    }

    try {
        int port = std::stoi(argv[2]);
        if (port <= 0 || port > 65535) {
            throw InvalidArgumentException(fmt::format("Invalid port {}", argv[2]));
        }

        Message message(argv[3]);
        for (int i = 4; i < argc; i++) {
            addArgument(message, argv[i]);
        }

        sendDatagram(argv[1], static_cast<uint16_t>(port), message.serialize());
        std::cout << fmt::format("Sent {} ,{} to {}:{}\n", message.getPath(),
                                 message.getTypeTags(), argv[1], port);
    } catch (const CueDisplayException &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
