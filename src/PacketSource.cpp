#include "cuedisplay/PacketSource.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <system_error>

#include <fmt/format.h>

#ifndef _WIN32
#include <sys/select.h>
#endif

#include "cuedisplay/Logging.h"

#ifdef _WIN32
// Define ssize_t for Windows
#ifdef _WIN64
typedef __int64 ssize_t;
#else
typedef int ssize_t;
#endif
#endif

namespace cuedisplay {
    namespace {
        int getLastSocketError() {
#ifdef _WIN32
            return WSAGetLastError();
#else
            return errno;
#endif
        }

        bool isInterrupted(int error) {
#ifdef _WIN32
            return error == WSAEINTR;
#else
            return error == EINTR;
#endif
        }

        bool isWouldBlock(int error) {
#ifdef _WIN32
            return error == WSAEWOULDBLOCK;
#else
            return error == EAGAIN || error == EWOULDBLOCK;
#endif
        }

        std::string socketErrorText(int error) {
            return fmt::format("{} (error {})", std::system_category().message(error), error);
        }

        // Platform-specific networking initialization
        void initializeNetworking() {
#ifdef _WIN32
            static std::once_flag once;
            static int startupResult = 0;
            std::call_once(once, [] {
                WSADATA wsaData;
                startupResult = WSAStartup(MAKEWORD(2, 2), &wsaData);
            });
            if (startupResult != 0) {
                throw StartupException(
                    fmt::format("Failed to initialize Windows networking (WSAStartup): {}",
                                startupResult));
            }
#endif
        }

        std::string formatSender(const sockaddr_storage &address) {
            char host[INET6_ADDRSTRLEN] = {0};
            if (address.ss_family == AF_INET) {
                const auto *in = reinterpret_cast<const sockaddr_in *>(&address);
                inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
                return fmt::format("{}:{}", host, ntohs(in->sin_port));
            }
            if (address.ss_family == AF_INET6) {
                const auto *in6 = reinterpret_cast<const sockaddr_in6 *>(&address);
                inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
                return fmt::format("[{}]:{}", host, ntohs(in6->sin6_port));
            }
            return "unknown";
        }
    }  // namespace

    PacketSource::PacketSource(uint16_t port, std::chrono::milliseconds pollInterval)
        : socket_(CUEDISPLAY_INVALID_SOCKET),
          port_(port),
          pollInterval_(std::clamp(pollInterval, std::chrono::milliseconds(1), MAX_POLL_INTERVAL)),
          cancelled_(false),
          buffer_(MAX_PACKET_SIZE) {
        initializeNetworking();

        socket_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
        if (socket_ == CUEDISPLAY_INVALID_SOCKET) {
            throw StartupException(
                fmt::format("Failed to create UDP socket: {}", socketErrorText(getLastSocketError())));
        }

#ifndef _WIN32
        // select() cannot watch descriptors at or above FD_SETSIZE
        if (socket_ >= FD_SETSIZE) {
            int descriptor = socket_;
            close();
            throw StartupException(fmt::format(
                "UDP socket descriptor {} exceeds the select() limit of {}", descriptor, FD_SETSIZE));
        }
#endif

        // No SO_REUSEADDR: binding a port that is already in use must fail.
        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_ANY);

        if (bind(socket_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
            int error = getLastSocketError();
            close();
            throw StartupException(
                fmt::format("Failed to bind UDP port {}: {}", port, socketErrorText(error)));
        }

        sockaddr_in bound;
        socklen_t boundLen = sizeof(bound);
        if (getsockname(socket_, reinterpret_cast<sockaddr *>(&bound), &boundLen) == 0) {
            port_ = ntohs(bound.sin_port);
        }

        LogDebug(fmt::format("UDP socket bound to port {}", port_));
    }

    PacketSource::~PacketSource() { close(); }

    uint16_t PacketSource::port() const { return port_; }

    std::chrono::milliseconds PacketSource::pollInterval() const { return pollInterval_; }

    void PacketSource::cancel() { cancelled_.store(true); }

    bool PacketSource::isCancelled() const { return cancelled_.load(); }

    bool PacketSource::isOpen() const { return socket_ != CUEDISPLAY_INVALID_SOCKET; }

    void PacketSource::close() {
        if (socket_ != CUEDISPLAY_INVALID_SOCKET) {
            CUEDISPLAY_CLOSE_SOCKET(socket_);
            socket_ = CUEDISPLAY_INVALID_SOCKET;
        }
    }

    // Wait up to one poll interval for the socket to become readable
    bool PacketSource::waitReadable() {
        fd_set readfds;
        FD_ZERO(&readfds);
        FD_SET(socket_, &readfds);

        timeval tv;
        tv.tv_sec = static_cast<long>(pollInterval_.count() / 1000);
        tv.tv_usec = static_cast<long>((pollInterval_.count() % 1000) * 1000);

        int result = select(static_cast<int>(socket_ + 1), &readfds, nullptr, nullptr, &tv);
        if (result == CUEDISPLAY_SOCKET_ERROR) {
            int error = getLastSocketError();
            if (isInterrupted(error)) {
                return false;
            }
            throw SocketException(fmt::format("Error waiting for UDP data: {}", socketErrorText(error)));
        }

        return result > 0;
    }

    std::optional<RawPacket> PacketSource::receive() {
        while (!cancelled_.load()) {
            if (socket_ == CUEDISPLAY_INVALID_SOCKET) {
                throw SocketException("Receive on a closed UDP socket");
            }

            if (!waitReadable()) {
                continue;
            }

            sockaddr_storage senderAddr;
            socklen_t senderAddrLen = sizeof(senderAddr);
            ssize_t bytesReceived =
                recvfrom(socket_, reinterpret_cast<char *>(buffer_.data()), buffer_.size(), 0,
                         reinterpret_cast<sockaddr *>(&senderAddr), &senderAddrLen);

            if (bytesReceived < 0) {
                int error = getLastSocketError();
                if (isInterrupted(error) || isWouldBlock(error)) {
                    continue;
                }
                throw SocketException(
                    fmt::format("Error receiving UDP datagram: {}", socketErrorText(error)));
            }

            RawPacket packet;
            packet.data.assign(buffer_.begin(), buffer_.begin() + bytesReceived);
            packet.sender = formatSender(senderAddr);
            return packet;
        }

        return std::nullopt;
    }

}  // namespace cuedisplay
