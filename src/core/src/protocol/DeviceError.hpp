/**
 * @file DeviceError.hpp
 * @brief Status byte table reported by the brick in every reply
 *
 * 0x00 is success. Every other listed value names one failure. A byte
 * outside the table is not a DeviceError at all: deviceErrorFromByte()
 * returns an empty optional and the codec reports a parse failure.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace nxt {
namespace protocol {

enum class DeviceError : uint8_t {
    NONE                  = 0x00,
    IN_PROGRESS           = 0x20,
    QUEUE_EMPTY           = 0x40,
    NO_MORE_HANDLES       = 0x81,
    NO_SPACE              = 0x82,
    NO_MORE_FILES         = 0x83,
    EOF_EXPECTED          = 0x84,
    END_OF_FILE           = 0x85,
    NOT_A_LINEAR_FILE     = 0x86,
    FILE_NOT_FOUND        = 0x87,
    HANDLE_ALREADY_CLOSED = 0x88,
    NO_LINEAR_SPACE       = 0x89,
    UNDEFINED             = 0x8A,
    FILE_BUSY             = 0x8B,
    NO_WRITE_BUFFERS      = 0x8C,
    APPEND_NOT_POSSIBLE   = 0x8D,
    FILE_IS_FULL          = 0x8E,
    FILE_EXISTS           = 0x8F,
    MODULE_NOT_FOUND      = 0x90,
    OUT_OF_BOUNDS         = 0x91,
    ILLEGAL_NAME          = 0x92,
    ILLEGAL_HANDLE        = 0x93,
    REQUEST_FAILED        = 0xBD,
    UNKNOWN_COMMAND       = 0xBE,
    INSANE_PACKET         = 0xBF,
    VALUE_OUT_OF_RANGE    = 0xC0,
    BUS_ERROR             = 0xDD,
    BUFFER_FULL           = 0xDE,
    INVALID_CHANNEL       = 0xDF,
    UNCONFIGURED_CHANNEL  = 0xE0,
    NO_ACTIVE_PROGRAM     = 0xEC,
    ILLEGAL_SIZE          = 0xED,
    ILLEGAL_QUEUE_ID      = 0xEE,
    INVALID_FIELD         = 0xEF,
    BAD_INPUT_OR_OUTPUT   = 0xF0,
    INSUFFICIENT_MEMORY   = 0xFB,
    BAD_ARGUMENTS         = 0xFF,
};

namespace detail {

constexpr std::array<DeviceError, 37> kDeviceErrors = {
    DeviceError::NONE, DeviceError::IN_PROGRESS, DeviceError::QUEUE_EMPTY,
    DeviceError::NO_MORE_HANDLES, DeviceError::NO_SPACE, DeviceError::NO_MORE_FILES,
    DeviceError::EOF_EXPECTED, DeviceError::END_OF_FILE, DeviceError::NOT_A_LINEAR_FILE,
    DeviceError::FILE_NOT_FOUND, DeviceError::HANDLE_ALREADY_CLOSED,
    DeviceError::NO_LINEAR_SPACE, DeviceError::UNDEFINED, DeviceError::FILE_BUSY,
    DeviceError::NO_WRITE_BUFFERS, DeviceError::APPEND_NOT_POSSIBLE,
    DeviceError::FILE_IS_FULL, DeviceError::FILE_EXISTS, DeviceError::MODULE_NOT_FOUND,
    DeviceError::OUT_OF_BOUNDS, DeviceError::ILLEGAL_NAME, DeviceError::ILLEGAL_HANDLE,
    DeviceError::REQUEST_FAILED, DeviceError::UNKNOWN_COMMAND, DeviceError::INSANE_PACKET,
    DeviceError::VALUE_OUT_OF_RANGE, DeviceError::BUS_ERROR, DeviceError::BUFFER_FULL,
    DeviceError::INVALID_CHANNEL, DeviceError::UNCONFIGURED_CHANNEL,
    DeviceError::NO_ACTIVE_PROGRAM, DeviceError::ILLEGAL_SIZE,
    DeviceError::ILLEGAL_QUEUE_ID, DeviceError::INVALID_FIELD,
    DeviceError::BAD_INPUT_OR_OUTPUT, DeviceError::INSUFFICIENT_MEMORY,
    DeviceError::BAD_ARGUMENTS,
};

/// 256-entry membership table over the status byte domain
constexpr std::array<bool, 256> makeStatusTable() {
    std::array<bool, 256> table{};
    for (DeviceError e : kDeviceErrors) {
        table[static_cast<uint8_t>(e)] = true;
    }
    return table;
}

constexpr std::array<bool, 256> kKnownStatus = makeStatusTable();

} // namespace detail

/**
 * Map a status byte to its named condition.
 * @return empty if the byte is not an assigned status
 */
inline std::optional<DeviceError> deviceErrorFromByte(uint8_t code) {
    if (!detail::kKnownStatus[code]) {
        return std::nullopt;
    }
    return static_cast<DeviceError>(code);
}

inline std::string deviceErrorToString(DeviceError error) {
    switch (error) {
        case DeviceError::NONE:                  return "none";
        case DeviceError::IN_PROGRESS:           return "pending communication transaction in progress";
        case DeviceError::QUEUE_EMPTY:           return "specified mailbox queue is empty";
        case DeviceError::NO_MORE_HANDLES:       return "no more handles";
        case DeviceError::NO_SPACE:              return "no space";
        case DeviceError::NO_MORE_FILES:         return "no more files";
        case DeviceError::EOF_EXPECTED:          return "end of file expected";
        case DeviceError::END_OF_FILE:           return "end of file";
        case DeviceError::NOT_A_LINEAR_FILE:     return "not a linear file";
        case DeviceError::FILE_NOT_FOUND:        return "file not found";
        case DeviceError::HANDLE_ALREADY_CLOSED: return "handle already closed";
        case DeviceError::NO_LINEAR_SPACE:       return "no linear space";
        case DeviceError::UNDEFINED:             return "undefined error";
        case DeviceError::FILE_BUSY:             return "file is busy";
        case DeviceError::NO_WRITE_BUFFERS:      return "no write buffers";
        case DeviceError::APPEND_NOT_POSSIBLE:   return "append not possible";
        case DeviceError::FILE_IS_FULL:          return "file is full";
        case DeviceError::FILE_EXISTS:           return "file exists";
        case DeviceError::MODULE_NOT_FOUND:      return "module not found";
        case DeviceError::OUT_OF_BOUNDS:         return "out of bounds";
        case DeviceError::ILLEGAL_NAME:          return "illegal file name";
        case DeviceError::ILLEGAL_HANDLE:        return "illegal handle";
        case DeviceError::REQUEST_FAILED:        return "request failed";
        case DeviceError::UNKNOWN_COMMAND:       return "unknown command opcode";
        case DeviceError::INSANE_PACKET:         return "insane packet";
        case DeviceError::VALUE_OUT_OF_RANGE:    return "data contains out-of-range values";
        case DeviceError::BUS_ERROR:             return "communication bus error";
        case DeviceError::BUFFER_FULL:           return "no free memory in communication buffer";
        case DeviceError::INVALID_CHANNEL:       return "specified channel/connection is not valid";
        case DeviceError::UNCONFIGURED_CHANNEL:  return "specified channel/connection not configured or busy";
        case DeviceError::NO_ACTIVE_PROGRAM:     return "no active program";
        case DeviceError::ILLEGAL_SIZE:          return "illegal size specified";
        case DeviceError::ILLEGAL_QUEUE_ID:      return "illegal mailbox queue ID specified";
        case DeviceError::INVALID_FIELD:         return "attempted to access invalid field of a structure";
        case DeviceError::BAD_INPUT_OR_OUTPUT:   return "bad input or output specified";
        case DeviceError::INSUFFICIENT_MEMORY:   return "insufficient memory available";
        case DeviceError::BAD_ARGUMENTS:         return "bad arguments";
        default:                                 return "unknown status";
    }
}

} // namespace protocol
} // namespace nxt
