/*
 *  CueDisplay - OSC cue display companion.
 *  This header file defines core types used throughout the CueDisplay library.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "cuedisplay/Exceptions.h"

// Socket type definitions for cross-platform compatibility
#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <WS2tcpip.h>
#include <WinSock2.h>
#define CUEDISPLAY_INVALID_SOCKET INVALID_SOCKET
#define CUEDISPLAY_SOCKET_ERROR SOCKET_ERROR
#define CUEDISPLAY_CLOSE_SOCKET closesocket
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#define CUEDISPLAY_INVALID_SOCKET -1
#define CUEDISPLAY_SOCKET_ERROR -1
#define CUEDISPLAY_CLOSE_SOCKET ::close
#endif

namespace cuedisplay {

#ifdef _WIN32
    using SOCKET_TYPE = SOCKET;
#else
    using SOCKET_TYPE = int;
#endif

    /**
     * @brief Class representing an OSC Blob
     *
     * OSC Blobs are binary data with a specified size.
     */
    class Blob {
       public:
        Blob() = default;

        /**
         * @brief Construct from data
         * @param data Binary data
         */
        explicit Blob(std::vector<std::byte> data);

        /**
         * @brief Construct from raw data
         * @param data Pointer to data
         * @param size Size of data in bytes
         */
        Blob(const void *data, size_t size);

        const std::vector<std::byte> &data() const;
        size_t size() const;
        const std::byte *bytes() const;

        bool operator==(const Blob &other) const { return data_ == other.data_; }

       private:
        std::vector<std::byte> data_;
    };

    /**
     * @brief Structure for MIDI message (OSC type 'm')
     */
    struct MIDIMessage {
        std::array<uint8_t, 4> bytes;

        MIDIMessage() : bytes{0, 0, 0, 0} {}
        MIDIMessage(uint8_t port, uint8_t status, uint8_t data1, uint8_t data2)
            : bytes{port, status, data1, data2} {}

        bool operator==(const MIDIMessage &other) const { return bytes == other.bytes; }
    };

    /**
     * @brief Structure for RGBA color (OSC type 'r')
     *
     * Also the color representation of the display state.
     */
    struct RGBAColor {
        uint8_t r, g, b, a;

        RGBAColor() : r(0), g(0), b(0), a(0) {}
        RGBAColor(uint8_t red, uint8_t green, uint8_t blue, uint8_t alpha = 255)
            : r(red), g(green), b(blue), a(alpha) {}

        /**
         * @brief Build a color from its packed big-endian form 0xRRGGBBAA
         */
        static RGBAColor fromPacked(uint32_t rgba);

        /**
         * @brief Parse "#RRGGBB" or "#RRGGBBAA" (the '#' is optional)
         * @return The color, or std::nullopt if the text is not a hex color
         */
        static std::optional<RGBAColor> fromHexString(const std::string &text);

        /**
         * @brief Packed form 0xRRGGBBAA
         */
        uint32_t packed() const;

        /**
         * @brief Format as "#RRGGBBAA"
         */
        std::string toHexString() const;

        bool operator==(const RGBAColor &other) const {
            return r == other.r && g == other.g && b == other.b && a == other.a;
        }
        bool operator!=(const RGBAColor &other) const { return !(*this == other); }
    };

    /**
     * @brief OSC Symbol (type 'S'), kept distinct from a plain string
     */
    struct Symbol {
        std::string text;

        bool operator==(const Symbol &other) const { return text == other.text; }
    };

    struct Nil {
        bool operator==(const Nil &) const { return true; }
    };

    struct Infinitum {
        bool operator==(const Infinitum &) const { return true; }
    };

    /**
     * @brief A single decoded OSC argument
     *
     * The set of alternatives is closed; every type tag the decoder accepts
     * maps to exactly one alternative.
     */
    class Value {
       public:
        // Type tag constants
        static constexpr char INT32_TAG = 'i';
        static constexpr char INT64_TAG = 'h';
        static constexpr char FLOAT_TAG = 'f';
        static constexpr char DOUBLE_TAG = 'd';
        static constexpr char STRING_TAG = 's';
        static constexpr char SYMBOL_TAG = 'S';
        static constexpr char BLOB_TAG = 'b';
        static constexpr char TRUE_TAG = 'T';
        static constexpr char FALSE_TAG = 'F';
        static constexpr char NIL_TAG = 'N';
        static constexpr char INFINITUM_TAG = 'I';
        static constexpr char CHAR_TAG = 'c';
        static constexpr char RGBA_TAG = 'r';
        static constexpr char MIDI_TAG = 'm';

        // Recognized by the decoder but not supported
        static constexpr char TIMETAG_TAG = 't';
        static constexpr char ARRAY_BEGIN_TAG = '[';
        static constexpr char ARRAY_END_TAG = ']';

        // Type definitions
        using Int32 = int32_t;
        using Int64 = int64_t;
        using Float = float;
        using Double = double;
        using String = std::string;
        using Bool = bool;
        using Char = char;

        using Variant = std::variant<Nil,          // N
                                     Bool,         // T, F
                                     Int32,        // i
                                     Int64,        // h
                                     Float,        // f
                                     Double,       // d
                                     String,       // s
                                     Symbol,       // S
                                     Blob,         // b
                                     Char,         // c
                                     RGBAColor,    // r
                                     MIDIMessage,  // m
                                     Infinitum     // I
                                     >;

        // Default constructor (creates Nil value)
        Value() : value_(Nil{}) {}

        explicit Value(Variant value) : value_(std::move(value)) {}

        explicit Value(Int32 value);
        explicit Value(Int64 value);
        explicit Value(Float value);
        explicit Value(Double value);
        explicit Value(const char *value);
        explicit Value(String value);
        explicit Value(Symbol value);
        explicit Value(Blob value);
        explicit Value(Char value);
        explicit Value(RGBAColor value);
        explicit Value(MIDIMessage value);
        explicit Value(Bool value);

        static Value nil();
        static Value infinitum();

        // Type checking
        bool isInt32() const;
        bool isInt64() const;
        bool isFloat() const;
        bool isDouble() const;
        bool isString() const;
        bool isSymbol() const;
        bool isBlob() const;
        bool isChar() const;
        bool isRGBA() const;
        bool isMIDI() const;
        bool isBool() const;
        bool isNil() const;
        bool isInfinitum() const;

        /**
         * @brief True for 's' and 'S' arguments
         */
        bool isText() const;

        // Value accessors; throw TypeMismatchException on the wrong type
        Int32 asInt32() const;
        Int64 asInt64() const;
        Float asFloat() const;
        Double asDouble() const;
        const String &asString() const;
        const Symbol &asSymbol() const;
        const Blob &asBlob() const;
        Char asChar() const;
        RGBAColor asRGBA() const;
        MIDIMessage asMIDI() const;
        Bool asBool() const;

        /**
         * @brief Text of an 's' or 'S' argument
         */
        const std::string &asText() const;

        // Get the type tag for this value
        char typeTag() const;

        const Variant &variant() const;

        bool operator==(const Value &other) const { return value_ == other.value_; }

        /**
         * @brief Append the binary payload of this value (nothing for T, F, N, I)
         */
        void serialize(std::vector<std::byte> &buffer) const;

        /**
         * @brief Decode one argument of the given type tag
         *
         * Advances @p data and decrements @p remainingSize by the bytes consumed.
         * @throws MalformedPacketException on truncation or bad padding
         * @throws UnsupportedPacketException for 't', '[' and ']'
         */
        static Value deserialize(const std::byte *&data, size_t &remainingSize, char typeTag);

       private:
        Variant value_;
    };

}  // namespace cuedisplay
