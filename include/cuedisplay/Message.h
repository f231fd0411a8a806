/*
 *  CueDisplay - OSC cue display companion.
 *  This header file declares the Message class, which represents a decoded OSC
 *  message: its address pattern and typed arguments.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "cuedisplay/Types.h"

namespace cuedisplay {
    /**
     * @brief The Message class represents an OSC message.
     */
    class Message {
       public:
        /**
         * @brief Construct a new OSC Message object
         * @param path The OSC address path (must start with '/')
         * @throws InvalidArgumentException if the path does not start with '/'
         */
        explicit Message(const std::string &path);

        /**
         * @brief Get the OSC address path
         */
        const std::string &getPath() const;

        /**
         * @brief Get the arguments in this message
         */
        const std::vector<Value> &getArguments() const;

        /**
         * @brief Get one argument
         * @throws InvalidArgumentException if @p index is out of range
         */
        const Value &getArgument(size_t index) const;

        size_t getArgumentCount() const;

        /**
         * @brief Type tag string without the leading ',' (e.g. "sif")
         */
        std::string getTypeTags() const;

        Message &addInt32(int32_t value);
        Message &addInt64(int64_t value);
        Message &addFloat(float value);
        Message &addDouble(double value);
        Message &addString(const std::string &value);
        Message &addSymbol(const std::string &value);
        Message &addBlob(const void *data, size_t size);
        Message &addChar(char value);

        /**
         * @brief Add a RGBA Color argument (type tag 'r')
         * @param value The color packed as 0xRRGGBBAA
         */
        Message &addColor(uint32_t value);
        Message &addColor(const RGBAColor &value);

        Message &addMidi(uint8_t port, uint8_t status, uint8_t data1, uint8_t data2);
        Message &addBool(bool value);
        Message &addNil();
        Message &addInfinitum();
        Message &addValue(const Value &value);

        /**
         * @brief Serialize the message to the OSC 1.0 binary format
         * @return Vector of bytes representing the serialized message
         */
        std::vector<std::byte> serialize() const;

        /**
         * @brief Decode a message from the OSC 1.0 binary format
         *
         * Either the whole packet decodes or an exception is thrown; no
         * partially decoded message is ever returned.
         *
         * @param data Pointer to the binary data
         * @param size Size of the binary data in bytes
         * @return The decoded Message object
         * @throws MalformedPacketException for any structural violation
         * @throws UnsupportedPacketException for bundles, time tags and arrays
         */
        static Message deserialize(const std::byte *data, size_t size);

        /**
         * @brief True if the buffer starts with the "#bundle" marker
         */
        static bool isBundle(const std::byte *data, size_t size);

       private:
        std::string path_;
        std::vector<Value> arguments_;
    };

    /**
     * @brief Decode a whole UDP payload into a Message
     * @see Message::deserialize
     */
    inline Message decode(const std::vector<std::byte> &bytes) {
        return Message::deserialize(bytes.data(), bytes.size());
    }

}  // namespace cuedisplay
