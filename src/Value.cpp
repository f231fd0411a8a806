/*
 * Implementation of the Value class and the small helper types declared in
 * Types.h (Blob, RGBAColor).
 */

#include <algorithm>
#include <cctype>
#include <cstring>

#include <fmt/format.h>

#include "cuedisplay/Types.h"
#include "WireFormat.h"

namespace cuedisplay {

    // Blob

    Blob::Blob(std::vector<std::byte> data) : data_(std::move(data)) {}

    Blob::Blob(const void *data, size_t size) {
        const std::byte *bytes = static_cast<const std::byte *>(data);
        data_.assign(bytes, bytes + size);
    }

    const std::vector<std::byte> &Blob::data() const { return data_; }

    size_t Blob::size() const { return data_.size(); }

    const std::byte *Blob::bytes() const { return data_.data(); }

    // RGBAColor

    RGBAColor RGBAColor::fromPacked(uint32_t rgba) {
        return RGBAColor(static_cast<uint8_t>((rgba >> 24) & 0xFF),
                         static_cast<uint8_t>((rgba >> 16) & 0xFF),
                         static_cast<uint8_t>((rgba >> 8) & 0xFF),
                         static_cast<uint8_t>(rgba & 0xFF));
    }

    std::optional<RGBAColor> RGBAColor::fromHexString(const std::string &text) {
        std::string digits = text;
        if (!digits.empty() && digits[0] == '#') {
            digits.erase(0, 1);
        }

        if (digits.size() != 6 && digits.size() != 8) {
            return std::nullopt;
        }
        if (!std::all_of(digits.begin(), digits.end(),
                         [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; })) {
            return std::nullopt;
        }

        uint32_t value = static_cast<uint32_t>(std::stoul(digits, nullptr, 16));
        if (digits.size() == 6) {
            value = (value << 8) | 0xFF;
        }
        return fromPacked(value);
    }

    uint32_t RGBAColor::packed() const {
        return (static_cast<uint32_t>(r) << 24) | (static_cast<uint32_t>(g) << 16) |
               (static_cast<uint32_t>(b) << 8) | static_cast<uint32_t>(a);
    }

    std::string RGBAColor::toHexString() const { return fmt::format("#{:08X}", packed()); }

    // Value constructors

    Value::Value(Int32 value) : value_(std::in_place_type<Int32>, value) {}

    Value::Value(Int64 value) : value_(std::in_place_type<Int64>, value) {}

    Value::Value(Float value) : value_(std::in_place_type<Float>, value) {}

    Value::Value(Double value) : value_(std::in_place_type<Double>, value) {}

    Value::Value(const char *value) : value_(std::in_place_type<String>, value) {}

    Value::Value(String value) : value_(std::in_place_type<String>, std::move(value)) {}

    Value::Value(Symbol value) : value_(std::in_place_type<Symbol>, std::move(value)) {}

    Value::Value(Blob value) : value_(std::in_place_type<Blob>, std::move(value)) {}

    Value::Value(Char value) : value_(std::in_place_type<Char>, value) {}

    Value::Value(RGBAColor value) : value_(std::in_place_type<RGBAColor>, value) {}

    Value::Value(MIDIMessage value) : value_(std::in_place_type<MIDIMessage>, value) {}

    Value::Value(Bool value) : value_(std::in_place_type<Bool>, value) {}

    Value Value::nil() { return Value(Variant(std::in_place_type<Nil>)); }

    Value Value::infinitum() { return Value(Variant(std::in_place_type<Infinitum>)); }

    // Type checking

    bool Value::isInt32() const { return std::holds_alternative<Int32>(value_); }
    bool Value::isInt64() const { return std::holds_alternative<Int64>(value_); }
    bool Value::isFloat() const { return std::holds_alternative<Float>(value_); }
    bool Value::isDouble() const { return std::holds_alternative<Double>(value_); }
    bool Value::isString() const { return std::holds_alternative<String>(value_); }
    bool Value::isSymbol() const { return std::holds_alternative<Symbol>(value_); }
    bool Value::isBlob() const { return std::holds_alternative<Blob>(value_); }
    bool Value::isChar() const { return std::holds_alternative<Char>(value_); }
    bool Value::isRGBA() const { return std::holds_alternative<RGBAColor>(value_); }
    bool Value::isMIDI() const { return std::holds_alternative<MIDIMessage>(value_); }
    bool Value::isBool() const { return std::holds_alternative<Bool>(value_); }
    bool Value::isNil() const { return std::holds_alternative<Nil>(value_); }
    bool Value::isInfinitum() const { return std::holds_alternative<Infinitum>(value_); }

    bool Value::isText() const { return isString() || isSymbol(); }

    // Accessors

    namespace {
        template <typename T>
        const T &checkedGet(const Value::Variant &value, const char *expected, char actualTag) {
            if (const T *ptr = std::get_if<T>(&value)) {
                return *ptr;
            }
            throw TypeMismatchException(
                fmt::format("Value is not {} (type tag '{}')", expected, actualTag));
        }
    }  // namespace

    Value::Int32 Value::asInt32() const { return checkedGet<Int32>(value_, "Int32", typeTag()); }

    Value::Int64 Value::asInt64() const { return checkedGet<Int64>(value_, "Int64", typeTag()); }

    Value::Float Value::asFloat() const { return checkedGet<Float>(value_, "Float", typeTag()); }

    Value::Double Value::asDouble() const {
        return checkedGet<Double>(value_, "Double", typeTag());
    }

    const Value::String &Value::asString() const {
        return checkedGet<String>(value_, "String", typeTag());
    }

    const Symbol &Value::asSymbol() const {
        return checkedGet<Symbol>(value_, "Symbol", typeTag());
    }

    const Blob &Value::asBlob() const { return checkedGet<Blob>(value_, "Blob", typeTag()); }

    Value::Char Value::asChar() const { return checkedGet<Char>(value_, "Char", typeTag()); }

    RGBAColor Value::asRGBA() const { return checkedGet<RGBAColor>(value_, "RGBA", typeTag()); }

    MIDIMessage Value::asMIDI() const {
        return checkedGet<MIDIMessage>(value_, "MIDI", typeTag());
    }

    Value::Bool Value::asBool() const { return checkedGet<Bool>(value_, "Bool", typeTag()); }

    const std::string &Value::asText() const {
        if (const Symbol *symbol = std::get_if<Symbol>(&value_)) {
            return symbol->text;
        }
        return checkedGet<String>(value_, "text", typeTag());
    }

    const Value::Variant &Value::variant() const { return value_; }

    // Type tag of the held alternative
    char Value::typeTag() const {
        struct TagVisitor {
            char operator()(const Nil &) const { return NIL_TAG; }
            char operator()(Bool b) const { return b ? TRUE_TAG : FALSE_TAG; }
            char operator()(Int32) const { return INT32_TAG; }
            char operator()(Int64) const { return INT64_TAG; }
            char operator()(Float) const { return FLOAT_TAG; }
            char operator()(Double) const { return DOUBLE_TAG; }
            char operator()(const String &) const { return STRING_TAG; }
            char operator()(const Symbol &) const { return SYMBOL_TAG; }
            char operator()(const Blob &) const { return BLOB_TAG; }
            char operator()(Char) const { return CHAR_TAG; }
            char operator()(const RGBAColor &) const { return RGBA_TAG; }
            char operator()(const MIDIMessage &) const { return MIDI_TAG; }
            char operator()(const Infinitum &) const { return INFINITUM_TAG; }
        };
        return std::visit(TagVisitor{}, value_);
    }

    // Serialization

    void Value::serialize(std::vector<std::byte> &buffer) const {
        struct SerializeVisitor {
            std::vector<std::byte> &out;

            void operator()(const Nil &) const {}
            void operator()(Bool) const {}
            void operator()(const Infinitum &) const {}
            void operator()(Int32 v) const { wire::appendUint32(out, static_cast<uint32_t>(v)); }
            void operator()(Int64 v) const { wire::appendUint64(out, static_cast<uint64_t>(v)); }
            void operator()(Float v) const {
                uint32_t bits;
                std::memcpy(&bits, &v, sizeof(bits));
                wire::appendUint32(out, bits);
            }
            void operator()(Double v) const {
                uint64_t bits;
                std::memcpy(&bits, &v, sizeof(bits));
                wire::appendUint64(out, bits);
            }
            void operator()(const String &v) const { wire::appendPaddedString(out, v); }
            void operator()(const Symbol &v) const { wire::appendPaddedString(out, v.text); }
            void operator()(const Blob &v) const {
                wire::appendUint32(out, static_cast<uint32_t>(v.size()));
                out.insert(out.end(), v.data().begin(), v.data().end());
                out.resize(out.size() + (wire::padSize(v.size()) - v.size()), std::byte{0});
            }
            void operator()(Char v) const {
                wire::appendUint32(out, static_cast<uint32_t>(static_cast<unsigned char>(v)));
            }
            void operator()(const RGBAColor &v) const { wire::appendUint32(out, v.packed()); }
            void operator()(const MIDIMessage &v) const {
                for (uint8_t b : v.bytes) {
                    out.push_back(static_cast<std::byte>(b));
                }
            }
        };
        std::visit(SerializeVisitor{buffer}, value_);
    }

    // Deserialization

    Value Value::deserialize(const std::byte *&data, size_t &remainingSize, char typeTag) {
        if (!data && remainingSize > 0) {
            throw InvalidArgumentException("Null data pointer in Value::deserialize");
        }

        switch (typeTag) {
            case INT32_TAG:
                return Value(static_cast<Int32>(wire::readUint32(data, remainingSize, "Int32")));
            case INT64_TAG:
                return Value(static_cast<Int64>(wire::readUint64(data, remainingSize, "Int64")));
            case FLOAT_TAG: {
                uint32_t bits = wire::readUint32(data, remainingSize, "Float");
                Float val;
                std::memcpy(&val, &bits, sizeof(val));
                return Value(val);
            }
            case DOUBLE_TAG: {
                uint64_t bits = wire::readUint64(data, remainingSize, "Double");
                Double val;
                std::memcpy(&val, &bits, sizeof(val));
                return Value(val);
            }
            case STRING_TAG:
                return Value(wire::readPaddedString(data, remainingSize, "string argument"));
            case SYMBOL_TAG:
                return Value(Symbol{wire::readPaddedString(data, remainingSize, "symbol argument")});
            case BLOB_TAG: {
                uint32_t rawSize = wire::readUint32(data, remainingSize, "blob size");
                if (static_cast<int32_t>(rawSize) < 0) {
                    throw MalformedPacketException("Negative blob size");
                }

                size_t blobSize = rawSize;
                size_t paddedSize = wire::padSize(blobSize);
                if (remainingSize < paddedSize) {
                    throw MalformedPacketException(
                        fmt::format("Blob of {} bytes exceeds the {} bytes left in the packet",
                                    blobSize, remainingSize));
                }
                for (size_t i = blobSize; i < paddedSize; ++i) {
                    if (data[i] != std::byte{0}) {
                        throw MalformedPacketException("Non-zero padding after blob data");
                    }
                }

                Blob blob(data, blobSize);
                data += paddedSize;
                remainingSize -= paddedSize;
                return Value(std::move(blob));
            }
            case CHAR_TAG:
                return Value(static_cast<Char>(wire::readUint32(data, remainingSize, "Char") & 0xFF));
            case RGBA_TAG:
                return Value(RGBAColor::fromPacked(wire::readUint32(data, remainingSize, "RGBA")));
            case MIDI_TAG: {
                uint32_t raw = wire::readUint32(data, remainingSize, "MIDI");
                return Value(MIDIMessage(static_cast<uint8_t>(raw >> 24),
                                         static_cast<uint8_t>(raw >> 16),
                                         static_cast<uint8_t>(raw >> 8),
                                         static_cast<uint8_t>(raw)));
            }
            case TRUE_TAG:
                return Value(true);
            case FALSE_TAG:
                return Value(false);
            case NIL_TAG:
                return Value::nil();
            case INFINITUM_TAG:
                return Value::infinitum();
            case TIMETAG_TAG:
                throw UnsupportedPacketException("Time tag arguments are not supported");
            case ARRAY_BEGIN_TAG:
            case ARRAY_END_TAG:
                throw UnsupportedPacketException("Array arguments are not supported");
            default:
                throw MalformedPacketException(
                    fmt::format("Unknown type tag '{}' (0x{:02X})", typeTag,
                                static_cast<unsigned>(static_cast<unsigned char>(typeTag))));
        }
    }
}  // namespace cuedisplay
