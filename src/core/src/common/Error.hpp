/**
 * @file Error.hpp
 * @brief Failure taxonomy shared by the codec, transports and the brick engine
 */

#pragma once

#include "../protocol/DeviceError.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace nxt {

/**
 * Error kinds
 */
enum class ErrorCode : uint16_t {
    NONE = 0,

    // Discovery (100-199)
    NO_BRICK = 100,

    // Transport (200-299)
    TRANSPORT = 200,
    WRITE,

    // Parse / serialise (300-399)
    PARSE = 300,
    SERIALISE,
    INVALID_STRING,
    INT_OUT_OF_RANGE,

    // Device reported (400-499)
    DEVICE = 400,

    // Protocol consistency (500-599)
    REPLY_MISMATCH = 500,
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:             return "NONE";
        case ErrorCode::NO_BRICK:         return "NO_BRICK";
        case ErrorCode::TRANSPORT:        return "TRANSPORT";
        case ErrorCode::WRITE:            return "WRITE";
        case ErrorCode::PARSE:            return "PARSE";
        case ErrorCode::SERIALISE:        return "SERIALISE";
        case ErrorCode::INVALID_STRING:   return "INVALID_STRING";
        case ErrorCode::INT_OUT_OF_RANGE: return "INT_OUT_OF_RANGE";
        case ErrorCode::DEVICE:           return "DEVICE";
        case ErrorCode::REPLY_MISMATCH:   return "REPLY_MISMATCH";
        default:                          return "UNKNOWN_ERROR";
    }
}

/**
 * Exception thrown by every brick operation.
 *
 * Device failures additionally carry the status byte the brick reported.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(toString(code) + ": " + message),
          m_code(code) {}

    explicit Error(protocol::DeviceError status)
        : std::runtime_error("DEVICE: " + protocol::deviceErrorToString(status)),
          m_code(ErrorCode::DEVICE),
          m_status(status) {}

    ErrorCode code() const { return m_code; }

    bool isDevice() const { return m_code == ErrorCode::DEVICE; }

    /// Status reported by the brick; empty unless isDevice()
    std::optional<protocol::DeviceError> deviceError() const { return m_status; }

private:
    ErrorCode m_code;
    std::optional<protocol::DeviceError> m_status;
};

} // namespace nxt
