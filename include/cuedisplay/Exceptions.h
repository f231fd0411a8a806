/*
 *  CueDisplay - OSC cue display companion.
 *  This file defines exceptions used throughout the CueDisplay library.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace cuedisplay {
    /**
     * @brief Base exception class for all CueDisplay errors
     */
    class CueDisplayException : public std::runtime_error {
       public:
        /**
         * @brief Error codes for CueDisplay exceptions
         */
        enum class ErrorCode {
            None = 0,
            StartupError,       ///< Socket could not be created or bound
            SocketError,        ///< Socket failed after startup
            MalformedPacket,    ///< Packet does not conform to the OSC 1.0 binary format
            UnsupportedPacket,  ///< Well-formed OSC construct that is not implemented
            TypeMismatch,       ///< Value accessed as the wrong type
            InvalidArgument,    ///< Invalid function argument
            ConfigurationError  ///< Invalid configuration input
        };

        /**
         * @brief Construct a new CueDisplay Exception
         * @param message Error message
         * @param code Error code
         */
        CueDisplayException(const std::string &message, ErrorCode code = ErrorCode::None)
            : std::runtime_error(message), code_(code) {}

        /**
         * @brief Get the error code
         * @return ErrorCode
         */
        ErrorCode code() const { return code_; }

        /**
         * @brief Get a description for an error code
         * @param code The error code
         * @return std::string The description
         */
        static std::string getErrorDescription(ErrorCode code);

       private:
        ErrorCode code_;
    };

    /**
     * @brief Fatal error raised while binding the listening socket
     */
    class StartupException : public CueDisplayException {
       public:
        StartupException(const std::string &message)
            : CueDisplayException(message, ErrorCode::StartupError) {}
    };

    /**
     * @brief Exception for socket failures after startup
     */
    class SocketException : public CueDisplayException {
       public:
        SocketException(const std::string &message)
            : CueDisplayException(message, ErrorCode::SocketError) {}
    };

    /**
     * @brief Common base for packet decoding failures
     *
     * Decoding failures are recoverable: the packet is dropped and the
     * listener continues with the next one.
     */
    class DecodeException : public CueDisplayException {
       public:
        DecodeException(const std::string &message, ErrorCode code)
            : CueDisplayException(message, code) {}
    };

    /**
     * @brief Exception for packets that violate the OSC binary format
     */
    class MalformedPacketException : public DecodeException {
       public:
        MalformedPacketException(const std::string &message)
            : DecodeException(message, ErrorCode::MalformedPacket) {}
    };

    /**
     * @brief Exception for well-formed OSC constructs this library does not handle
     * (bundles, time tags, arrays)
     */
    class UnsupportedPacketException : public DecodeException {
       public:
        UnsupportedPacketException(const std::string &message)
            : DecodeException(message, ErrorCode::UnsupportedPacket) {}
    };

    /**
     * @brief Exception for type mismatches
     */
    class TypeMismatchException : public CueDisplayException {
       public:
        TypeMismatchException(const std::string &message)
            : CueDisplayException(message, ErrorCode::TypeMismatch) {}
    };

    /**
     * @brief Exception for invalid arguments
     */
    class InvalidArgumentException : public CueDisplayException {
       public:
        InvalidArgumentException(const std::string &message)
            : CueDisplayException(message, ErrorCode::InvalidArgument) {}
    };

    /**
     * @brief Exception for invalid configuration values
     */
    class ConfigurationException : public CueDisplayException {
       public:
        ConfigurationException(const std::string &message)
            : CueDisplayException(message, ErrorCode::ConfigurationError) {}
    };

}  // namespace cuedisplay
