#include "cuedisplay/FieldMapper.h"

#include <array>
#include <cmath>

#include <fmt/format.h>

namespace cuedisplay {
    namespace {
        std::optional<std::string> singleText(const std::vector<Value> &args) {
            if (args.size() != 1 || !args[0].isText()) {
                return std::nullopt;
            }
            return args[0].asText();
        }

        // Integer components must all be in 0-255
        std::optional<uint8_t> integerComponent(const Value &value) {
            int64_t raw;
            if (value.isInt32()) {
                raw = value.asInt32();
            } else if (value.isInt64()) {
                raw = value.asInt64();
            } else {
                return std::nullopt;
            }
            if (raw < 0 || raw > 255) {
                return std::nullopt;
            }
            return static_cast<uint8_t>(raw);
        }

        // Floating components must all be finite and in 0.0-1.0
        std::optional<uint8_t> floatComponent(const Value &value) {
            double raw;
            if (value.isFloat()) {
                raw = value.asFloat();
            } else if (value.isDouble()) {
                raw = value.asDouble();
            } else {
                return std::nullopt;
            }
            if (!std::isfinite(raw) || raw < 0.0 || raw > 1.0) {
                return std::nullopt;
            }
            return static_cast<uint8_t>(std::lround(raw * 255.0));
        }

        std::optional<RGBAColor> colorFromComponents(const std::vector<Value> &args) {
            bool integers = args[0].isInt32() || args[0].isInt64();
            std::array<uint8_t, 4> channels{0, 0, 0, 255};

            for (size_t i = 0; i < args.size(); ++i) {
                auto component = integers ? integerComponent(args[i]) : floatComponent(args[i]);
                if (!component) {
                    return std::nullopt;
                }
                channels[i] = *component;
            }
            return RGBAColor(channels[0], channels[1], channels[2], channels[3]);
        }

        // Each position is taken on its own: a non-text argument leaves that field
        // empty and a color that is not "#RRGGBB[AA]" leaves the color unset.
        FieldUpdate mapCueFired(const std::vector<Value> &args) {
            auto textAt = [&args](size_t index) -> const std::string * {
                if (index < args.size() && args[index].isText()) {
                    return &args[index].asText();
                }
                return nullptr;
            };

            CueFiredUpdate update;
            if (const std::string *cue = textAt(0)) {
                update.cue = *cue;
            }
            if (const std::string *description = textAt(1)) {
                update.description = *description;
            }
            if (const std::string *color = textAt(2)) {
                update.color = RGBAColor::fromHexString(*color);
            }
            return FieldUpdate(std::move(update));
        }
    }  // namespace

    std::optional<RGBAColor> FieldMapper::colorFromArguments(const std::vector<Value> &args) {
        if (args.size() == 1) {
            const Value &arg = args[0];
            if (arg.isRGBA()) {
                return arg.asRGBA();
            }
            if (arg.isInt32()) {
                return RGBAColor::fromPacked(static_cast<uint32_t>(arg.asInt32()));
            }
            if (arg.isText()) {
                return RGBAColor::fromHexString(arg.asText());
            }
            return std::nullopt;
        }

        if (args.size() == 3 || args.size() == 4) {
            return colorFromComponents(args);
        }

        return std::nullopt;
    }

    std::optional<FieldUpdate> FieldMapper::map(const Message &message) {
        const std::string &path = message.getPath();
        const auto &args = message.getArguments();

        if (path == CUE_ADDRESS) {
            if (auto text = singleText(args)) {
                return FieldUpdate(CueUpdate{std::move(*text)});
            }
        } else if (path == DESCRIPTION_ADDRESS) {
            if (auto text = singleText(args)) {
                return FieldUpdate(DescriptionUpdate{std::move(*text)});
            }
        } else if (path == COLOR_ADDRESS) {
            if (auto color = colorFromArguments(args)) {
                return FieldUpdate(ColorUpdate{*color});
            }
        } else if (path == CUE_FIRED_ADDRESS) {
            return mapCueFired(args);
        }

        return std::nullopt;
    }

    std::string describeUpdate(const FieldUpdate &update) {
        struct DescribeVisitor {
            std::string operator()(const CueUpdate &u) const {
                return fmt::format("cue = \"{}\"", u.cue);
            }
            std::string operator()(const DescriptionUpdate &u) const {
                return fmt::format("description = \"{}\"", u.description);
            }
            std::string operator()(const ColorUpdate &u) const {
                return fmt::format("color = {}", u.color.toHexString());
            }
            std::string operator()(const CueFiredUpdate &u) const {
                return fmt::format("cue fired \"{}\" \"{}\" {}", u.cue, u.description,
                                   u.color ? u.color->toHexString() : "(no color)");
            }
        };
        return std::visit(DescribeVisitor{}, update);
    }

}  // namespace cuedisplay
