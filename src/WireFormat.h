/*
 *  CueDisplay - OSC cue display companion.
 *  Low-level helpers for the OSC 1.0 binary encoding: 4-byte alignment,
 *  big-endian integers and null-terminated, zero-padded strings.
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "cuedisplay/Exceptions.h"

namespace cuedisplay {
    namespace wire {

        // Helper function to pad to 4-byte boundary
        inline size_t padSize(size_t size) { return (size + 3) & ~static_cast<size_t>(3); }

        inline void appendUint32(std::vector<std::byte> &out, uint32_t value) {
            out.push_back(static_cast<std::byte>((value >> 24) & 0xFF));
            out.push_back(static_cast<std::byte>((value >> 16) & 0xFF));
            out.push_back(static_cast<std::byte>((value >> 8) & 0xFF));
            out.push_back(static_cast<std::byte>(value & 0xFF));
        }

        inline void appendUint64(std::vector<std::byte> &out, uint64_t value) {
            appendUint32(out, static_cast<uint32_t>(value >> 32));
            appendUint32(out, static_cast<uint32_t>(value & 0xFFFFFFFF));
        }

        // Writes the string, its null terminator and zero padding up to 4 bytes
        inline void appendPaddedString(std::vector<std::byte> &out, const std::string &value) {
            const std::byte *bytes = reinterpret_cast<const std::byte *>(value.data());
            out.insert(out.end(), bytes, bytes + value.size());
            out.resize(out.size() + (padSize(value.size() + 1) - value.size()), std::byte{0});
        }

        inline uint32_t readUint32(const std::byte *&data, size_t &remainingSize,
                                   const char *what) {
            if (remainingSize < 4) {
                throw MalformedPacketException(
                    fmt::format("Not enough data for {} ({} bytes left)", what, remainingSize));
            }
            uint32_t value = (std::to_integer<uint32_t>(data[0]) << 24) |
                             (std::to_integer<uint32_t>(data[1]) << 16) |
                             (std::to_integer<uint32_t>(data[2]) << 8) |
                             std::to_integer<uint32_t>(data[3]);
            data += 4;
            remainingSize -= 4;
            return value;
        }

        inline uint64_t readUint64(const std::byte *&data, size_t &remainingSize,
                                   const char *what) {
            if (remainingSize < 8) {
                throw MalformedPacketException(
                    fmt::format("Not enough data for {} ({} bytes left)", what, remainingSize));
            }
            uint64_t high = readUint32(data, remainingSize, what);
            uint64_t low = readUint32(data, remainingSize, what);
            return (high << 32) | low;
        }

        /**
         * @brief Read an OSC string: text, null terminator, zero padding to 4 bytes
         * @throws MalformedPacketException if the terminator is missing, the
         * padding runs past the end of the buffer or a pad byte is non-zero
         */
        inline std::string readPaddedString(const std::byte *&data, size_t &remainingSize,
                                            const char *what) {
            const std::byte *end = data + remainingSize;
            const std::byte *nullByte = std::find(data, end, std::byte{0});
            if (nullByte == end) {
                throw MalformedPacketException(fmt::format("Missing null terminator in {}", what));
            }

            size_t length = static_cast<size_t>(nullByte - data);
            size_t paddedSize = padSize(length + 1);
            if (paddedSize > remainingSize) {
                throw MalformedPacketException(
                    fmt::format("Padding of {} runs past the end of the packet", what));
            }
            for (size_t i = length + 1; i < paddedSize; ++i) {
                if (data[i] != std::byte{0}) {
                    throw MalformedPacketException(fmt::format("Non-zero padding after {}", what));
                }
            }

            std::string text(reinterpret_cast<const char *>(data), length);
            data += paddedSize;
            remainingSize -= paddedSize;
            return text;
        }

    }  // namespace wire
}  // namespace cuedisplay
