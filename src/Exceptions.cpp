#include <unordered_map>

#include "cuedisplay/Exceptions.h"

namespace cuedisplay {
    // Static method to get a description for an error code
    std::string CueDisplayException::getErrorDescription(ErrorCode code) {
        static const std::unordered_map<ErrorCode, std::string> descriptions = {
            {ErrorCode::None, "No error"},
            {ErrorCode::StartupError, "Listener startup failed"},
            {ErrorCode::SocketError, "Socket error"},
            {ErrorCode::MalformedPacket, "Malformed OSC packet"},
            {ErrorCode::UnsupportedPacket, "Unsupported OSC construct"},
            {ErrorCode::TypeMismatch, "OSC type mismatch"},
            {ErrorCode::InvalidArgument, "Invalid argument"},
            {ErrorCode::ConfigurationError, "Invalid configuration"}};

        auto it = descriptions.find(code);
        if (it != descriptions.end()) {
            return it->second;
        }

        return "Unknown error";
    }
}  // namespace cuedisplay
