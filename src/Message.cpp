#include "cuedisplay/Message.h"

#include <cstring>

#include <fmt/format.h>

#include "WireFormat.h"

namespace cuedisplay {
    namespace {
        constexpr char BUNDLE_MARKER[] = "#bundle";  // 8 bytes with the terminator
    }

    // Constructor for Message class with address path validation
    Message::Message(const std::string &path) : path_(path) {
        if (path.empty() || path[0] != '/') {
            throw InvalidArgumentException("Invalid OSC address pattern (must start with '/')");
        }
    }

    const std::string &Message::getPath() const { return path_; }

    const std::vector<Value> &Message::getArguments() const { return arguments_; }

    const Value &Message::getArgument(size_t index) const {
        if (index >= arguments_.size()) {
            throw InvalidArgumentException(fmt::format(
                "Argument index {} out of range ({} arguments)", index, arguments_.size()));
        }
        return arguments_[index];
    }

    size_t Message::getArgumentCount() const { return arguments_.size(); }

    std::string Message::getTypeTags() const {
        std::string tags;
        tags.reserve(arguments_.size());
        for (const auto &arg : arguments_) {
            tags += arg.typeTag();
        }
        return tags;
    }

    Message &Message::addInt32(int32_t value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addInt64(int64_t value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addFloat(float value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addDouble(double value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addString(const std::string &value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addSymbol(const std::string &value) {
        arguments_.emplace_back(Symbol{value});
        return *this;
    }

    Message &Message::addBlob(const void *data, size_t size) {
        arguments_.emplace_back(Blob(data, size));
        return *this;
    }

    Message &Message::addChar(char value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addColor(uint32_t value) { return addColor(RGBAColor::fromPacked(value)); }

    Message &Message::addColor(const RGBAColor &value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addMidi(uint8_t port, uint8_t status, uint8_t data1, uint8_t data2) {
        arguments_.emplace_back(MIDIMessage(port, status, data1, data2));
        return *this;
    }

    Message &Message::addBool(bool value) {
        arguments_.emplace_back(value);
        return *this;
    }

    Message &Message::addNil() {
        arguments_.push_back(Value::nil());
        return *this;
    }

    Message &Message::addInfinitum() {
        arguments_.push_back(Value::infinitum());
        return *this;
    }

    Message &Message::addValue(const Value &value) {
        arguments_.push_back(value);
        return *this;
    }

    // Serialize the message to OSC format
    std::vector<std::byte> Message::serialize() const {
        std::vector<std::byte> result;
        result.reserve(wire::padSize(path_.size() + 1) + wire::padSize(arguments_.size() + 2) +
                       arguments_.size() * 8);

        // 1. Address Pattern (null-terminated, padded to 4-byte boundary)
        wire::appendPaddedString(result, path_);

        // 2. Type Tag String (starts with ',', null-terminated, padded)
        wire::appendPaddedString(result, "," + getTypeTags());

        // 3. Argument Data
        for (const auto &arg : arguments_) {
            arg.serialize(result);
        }

        return result;
    }

    bool Message::isBundle(const std::byte *data, size_t size) {
        return data && size >= sizeof(BUNDLE_MARKER) &&
               std::memcmp(data, BUNDLE_MARKER, sizeof(BUNDLE_MARKER)) == 0;
    }

    // Deserialize a message from binary data
    Message Message::deserialize(const std::byte *data, size_t size) {
        if (!data || size == 0) {
            throw MalformedPacketException("Empty packet");
        }

        if (isBundle(data, size)) {
            throw UnsupportedPacketException("OSC bundles are not supported");
        }

        if (size % 4 != 0) {
            throw MalformedPacketException(
                fmt::format("Packet size {} is not a multiple of 4", size));
        }

        const std::byte *pos = data;
        size_t remaining = size;

        // 1. Address Pattern
        if (static_cast<char>(*pos) != '/') {
            throw MalformedPacketException("Address pattern must start with '/'");
        }
        Message message(wire::readPaddedString(pos, remaining, "address pattern"));

        // 2. Type Tag String
        if (remaining == 0) {
            throw MalformedPacketException("Missing type tag string");
        }
        if (static_cast<char>(*pos) != ',') {
            throw MalformedPacketException("Type tag string must start with ','");
        }
        std::string typeTags = wire::readPaddedString(pos, remaining, "type tag string");

        // 3. Arguments, one per declared type tag
        message.arguments_.reserve(typeTags.size() - 1);
        for (size_t i = 1; i < typeTags.size(); ++i) {
            message.arguments_.push_back(Value::deserialize(pos, remaining, typeTags[i]));
        }

        if (remaining != 0) {
            throw MalformedPacketException(
                fmt::format("{} trailing bytes after the last argument", remaining));
        }

        return message;
    }

}  // namespace cuedisplay
