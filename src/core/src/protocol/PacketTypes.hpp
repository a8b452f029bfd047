/**
 * @file PacketTypes.hpp
 * @brief Packet type tags and the closed opcode set
 *
 * Request : [type:u8][opcode:u8][payload...]
 * Reply   : [type:u8][opcode:u8][status:u8][payload...]
 *
 * Opcodes with bit 0x80 set are system calls, the rest are direct commands.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace nxt {
namespace protocol {

// ============================================================================
// Packet Types
// ============================================================================

enum class PacketType : uint8_t {
    DIRECT          = 0x00,
    SYSTEM          = 0x01,
    REPLY           = 0x02,
    DIRECT_NO_REPLY = 0x80,
    SYSTEM_NO_REPLY = 0x81,
};

inline std::optional<PacketType> packetTypeFromByte(uint8_t code) {
    switch (code) {
        case 0x00: return PacketType::DIRECT;
        case 0x01: return PacketType::SYSTEM;
        case 0x02: return PacketType::REPLY;
        case 0x80: return PacketType::DIRECT_NO_REPLY;
        case 0x81: return PacketType::SYSTEM_NO_REPLY;
        default:   return std::nullopt;
    }
}

// ============================================================================
// Opcodes
// ============================================================================

enum class Opcode : uint8_t {
    // Direct commands
    DIRECT_START_PROGRAM        = 0x00,
    DIRECT_STOP_PROGRAM         = 0x01,
    DIRECT_PLAY_SOUND_FILE      = 0x02,
    DIRECT_PLAY_TONE            = 0x03,
    DIRECT_SET_OUT_STATE        = 0x04,
    DIRECT_SET_IN_MODE          = 0x05,
    DIRECT_GET_OUT_STATE        = 0x06,
    DIRECT_GET_IN_VALS          = 0x07,
    DIRECT_RESET_IN_VAL         = 0x08,
    DIRECT_MESSAGE_WRITE        = 0x09,
    DIRECT_RESET_POSITION       = 0x0A,
    DIRECT_GET_BATT_LEVEL       = 0x0B,
    DIRECT_STOP_SOUND           = 0x0C,
    DIRECT_KEEP_ALIVE           = 0x0D,
    DIRECT_LS_GET_STATUS        = 0x0E,
    DIRECT_LS_WRITE             = 0x0F,
    DIRECT_LS_READ              = 0x10,
    DIRECT_GET_CURR_PROGRAM     = 0x11,
    DIRECT_GET_BUTTON_STATE     = 0x12,
    DIRECT_MESSAGE_READ         = 0x13,
    DIRECT_DATALOG_READ         = 0x19,
    DIRECT_DATALOG_SET_TIMES    = 0x1A,
    DIRECT_BT_GET_CONTACT_COUNT = 0x1B,
    DIRECT_BT_GET_CONTACT_NAME  = 0x1C,
    DIRECT_BT_GET_CONN_COUNT    = 0x1D,
    DIRECT_BT_GET_CONN_NAME     = 0x1E,
    DIRECT_SET_PROPERTY         = 0x1F,
    DIRECT_GET_PROPERTY         = 0x20,
    DIRECT_UPDATE_RESET_COUNT   = 0x21,

    // System calls
    SYSTEM_OPEN_READ            = 0x80,
    SYSTEM_OPEN_WRITE           = 0x81,
    SYSTEM_READ                 = 0x82,
    SYSTEM_WRITE                = 0x83,
    SYSTEM_CLOSE                = 0x84,
    SYSTEM_DELETE               = 0x85,
    SYSTEM_FIND_FIRST           = 0x86,
    SYSTEM_FIND_NEXT            = 0x87,
    SYSTEM_VERSIONS             = 0x88,
    SYSTEM_OPEN_WRITE_LINEAR    = 0x89,
    SYSTEM_OPEN_READ_LINEAR     = 0x8A,
    SYSTEM_OPEN_WRITE_DATA      = 0x8B,
    SYSTEM_OPEN_APPEND_DATA     = 0x8C,
    SYSTEM_CROP_DATA_FILE       = 0x8D,
    SYSTEM_FIND_FIRST_MODULE    = 0x90,
    SYSTEM_FIND_NEXT_MODULE     = 0x91,
    SYSTEM_CLOSE_MOD_HANDLE     = 0x92,
    SYSTEM_IOMAP_READ           = 0x94,
    SYSTEM_IOMAP_WRITE          = 0x95,
    SYSTEM_BOOT_CMD             = 0x97,
    SYSTEM_SET_BRICK_NAME       = 0x98,
    SYSTEM_BT_GET_ADDR          = 0x9A,
    SYSTEM_DEVICE_INFO          = 0x9B,
    SYSTEM_DELETE_USER_FLASH    = 0xA0,
    SYSTEM_POLL_CMD_LEN         = 0xA1,
    SYSTEM_POLL_CMD             = 0xA2,
    SYSTEM_RENAME_FILE          = 0xA3,
    SYSTEM_BT_FACTORY_RESET     = 0xA4,
    SYSTEM_RESIZE_DATA_FILE     = 0xD0,
    SYSTEM_SEEK_FROM_START      = 0xD1,
    SYSTEM_SEEK_FROM_CURRENT    = 0xD2,
    SYSTEM_SEEK_FROM_END        = 0xD3,
};

/// True for system calls (bit 0x80 set), false for direct commands
constexpr bool isSystem(Opcode opcode) {
    return (static_cast<uint8_t>(opcode) & 0x80) != 0;
}

constexpr std::array<Opcode, 61> kAllOpcodes = {
    Opcode::DIRECT_START_PROGRAM, Opcode::DIRECT_STOP_PROGRAM,
    Opcode::DIRECT_PLAY_SOUND_FILE, Opcode::DIRECT_PLAY_TONE,
    Opcode::DIRECT_SET_OUT_STATE, Opcode::DIRECT_SET_IN_MODE,
    Opcode::DIRECT_GET_OUT_STATE, Opcode::DIRECT_GET_IN_VALS,
    Opcode::DIRECT_RESET_IN_VAL, Opcode::DIRECT_MESSAGE_WRITE,
    Opcode::DIRECT_RESET_POSITION, Opcode::DIRECT_GET_BATT_LEVEL,
    Opcode::DIRECT_STOP_SOUND, Opcode::DIRECT_KEEP_ALIVE,
    Opcode::DIRECT_LS_GET_STATUS, Opcode::DIRECT_LS_WRITE,
    Opcode::DIRECT_LS_READ, Opcode::DIRECT_GET_CURR_PROGRAM,
    Opcode::DIRECT_GET_BUTTON_STATE, Opcode::DIRECT_MESSAGE_READ,
    Opcode::DIRECT_DATALOG_READ, Opcode::DIRECT_DATALOG_SET_TIMES,
    Opcode::DIRECT_BT_GET_CONTACT_COUNT, Opcode::DIRECT_BT_GET_CONTACT_NAME,
    Opcode::DIRECT_BT_GET_CONN_COUNT, Opcode::DIRECT_BT_GET_CONN_NAME,
    Opcode::DIRECT_SET_PROPERTY, Opcode::DIRECT_GET_PROPERTY,
    Opcode::DIRECT_UPDATE_RESET_COUNT,
    Opcode::SYSTEM_OPEN_READ, Opcode::SYSTEM_OPEN_WRITE, Opcode::SYSTEM_READ,
    Opcode::SYSTEM_WRITE, Opcode::SYSTEM_CLOSE, Opcode::SYSTEM_DELETE,
    Opcode::SYSTEM_FIND_FIRST, Opcode::SYSTEM_FIND_NEXT, Opcode::SYSTEM_VERSIONS,
    Opcode::SYSTEM_OPEN_WRITE_LINEAR, Opcode::SYSTEM_OPEN_READ_LINEAR,
    Opcode::SYSTEM_OPEN_WRITE_DATA, Opcode::SYSTEM_OPEN_APPEND_DATA,
    Opcode::SYSTEM_CROP_DATA_FILE, Opcode::SYSTEM_FIND_FIRST_MODULE,
    Opcode::SYSTEM_FIND_NEXT_MODULE, Opcode::SYSTEM_CLOSE_MOD_HANDLE,
    Opcode::SYSTEM_IOMAP_READ, Opcode::SYSTEM_IOMAP_WRITE, Opcode::SYSTEM_BOOT_CMD,
    Opcode::SYSTEM_SET_BRICK_NAME, Opcode::SYSTEM_BT_GET_ADDR,
    Opcode::SYSTEM_DEVICE_INFO, Opcode::SYSTEM_DELETE_USER_FLASH,
    Opcode::SYSTEM_POLL_CMD_LEN, Opcode::SYSTEM_POLL_CMD,
    Opcode::SYSTEM_RENAME_FILE, Opcode::SYSTEM_BT_FACTORY_RESET,
    Opcode::SYSTEM_RESIZE_DATA_FILE, Opcode::SYSTEM_SEEK_FROM_START,
    Opcode::SYSTEM_SEEK_FROM_CURRENT, Opcode::SYSTEM_SEEK_FROM_END,
};

namespace detail {

constexpr std::array<bool, 256> makeOpcodeTable() {
    std::array<bool, 256> table{};
    for (Opcode op : kAllOpcodes) {
        table[static_cast<uint8_t>(op)] = true;
    }
    return table;
}

constexpr std::array<bool, 256> kKnownOpcode = makeOpcodeTable();

} // namespace detail

/**
 * Map a byte to an opcode.
 * @return empty for bytes outside the closed set
 */
inline std::optional<Opcode> opcodeFromByte(uint8_t code) {
    if (!detail::kKnownOpcode[code]) {
        return std::nullopt;
    }
    return static_cast<Opcode>(code);
}

// ============================================================================
// String Conversions
// ============================================================================

inline std::string packetTypeToString(PacketType type) {
    switch (type) {
        case PacketType::DIRECT:          return "DIRECT";
        case PacketType::SYSTEM:          return "SYSTEM";
        case PacketType::REPLY:           return "REPLY";
        case PacketType::DIRECT_NO_REPLY: return "DIRECT_NO_REPLY";
        case PacketType::SYSTEM_NO_REPLY: return "SYSTEM_NO_REPLY";
        default:                          return "UNKNOWN_TYPE";
    }
}

inline std::string opcodeToString(Opcode opcode) {
    switch (opcode) {
        case Opcode::DIRECT_START_PROGRAM:        return "DIRECT_START_PROGRAM";
        case Opcode::DIRECT_STOP_PROGRAM:         return "DIRECT_STOP_PROGRAM";
        case Opcode::DIRECT_PLAY_SOUND_FILE:      return "DIRECT_PLAY_SOUND_FILE";
        case Opcode::DIRECT_PLAY_TONE:            return "DIRECT_PLAY_TONE";
        case Opcode::DIRECT_SET_OUT_STATE:        return "DIRECT_SET_OUT_STATE";
        case Opcode::DIRECT_SET_IN_MODE:          return "DIRECT_SET_IN_MODE";
        case Opcode::DIRECT_GET_OUT_STATE:        return "DIRECT_GET_OUT_STATE";
        case Opcode::DIRECT_GET_IN_VALS:          return "DIRECT_GET_IN_VALS";
        case Opcode::DIRECT_RESET_IN_VAL:         return "DIRECT_RESET_IN_VAL";
        case Opcode::DIRECT_MESSAGE_WRITE:        return "DIRECT_MESSAGE_WRITE";
        case Opcode::DIRECT_RESET_POSITION:       return "DIRECT_RESET_POSITION";
        case Opcode::DIRECT_GET_BATT_LEVEL:       return "DIRECT_GET_BATT_LEVEL";
        case Opcode::DIRECT_STOP_SOUND:           return "DIRECT_STOP_SOUND";
        case Opcode::DIRECT_KEEP_ALIVE:           return "DIRECT_KEEP_ALIVE";
        case Opcode::DIRECT_LS_GET_STATUS:        return "DIRECT_LS_GET_STATUS";
        case Opcode::DIRECT_LS_WRITE:             return "DIRECT_LS_WRITE";
        case Opcode::DIRECT_LS_READ:              return "DIRECT_LS_READ";
        case Opcode::DIRECT_GET_CURR_PROGRAM:     return "DIRECT_GET_CURR_PROGRAM";
        case Opcode::DIRECT_GET_BUTTON_STATE:     return "DIRECT_GET_BUTTON_STATE";
        case Opcode::DIRECT_MESSAGE_READ:         return "DIRECT_MESSAGE_READ";
        case Opcode::DIRECT_DATALOG_READ:         return "DIRECT_DATALOG_READ";
        case Opcode::DIRECT_DATALOG_SET_TIMES:    return "DIRECT_DATALOG_SET_TIMES";
        case Opcode::DIRECT_BT_GET_CONTACT_COUNT: return "DIRECT_BT_GET_CONTACT_COUNT";
        case Opcode::DIRECT_BT_GET_CONTACT_NAME:  return "DIRECT_BT_GET_CONTACT_NAME";
        case Opcode::DIRECT_BT_GET_CONN_COUNT:    return "DIRECT_BT_GET_CONN_COUNT";
        case Opcode::DIRECT_BT_GET_CONN_NAME:     return "DIRECT_BT_GET_CONN_NAME";
        case Opcode::DIRECT_SET_PROPERTY:         return "DIRECT_SET_PROPERTY";
        case Opcode::DIRECT_GET_PROPERTY:         return "DIRECT_GET_PROPERTY";
        case Opcode::DIRECT_UPDATE_RESET_COUNT:   return "DIRECT_UPDATE_RESET_COUNT";
        case Opcode::SYSTEM_OPEN_READ:            return "SYSTEM_OPEN_READ";
        case Opcode::SYSTEM_OPEN_WRITE:           return "SYSTEM_OPEN_WRITE";
        case Opcode::SYSTEM_READ:                 return "SYSTEM_READ";
        case Opcode::SYSTEM_WRITE:                return "SYSTEM_WRITE";
        case Opcode::SYSTEM_CLOSE:                return "SYSTEM_CLOSE";
        case Opcode::SYSTEM_DELETE:               return "SYSTEM_DELETE";
        case Opcode::SYSTEM_FIND_FIRST:           return "SYSTEM_FIND_FIRST";
        case Opcode::SYSTEM_FIND_NEXT:            return "SYSTEM_FIND_NEXT";
        case Opcode::SYSTEM_VERSIONS:             return "SYSTEM_VERSIONS";
        case Opcode::SYSTEM_OPEN_WRITE_LINEAR:    return "SYSTEM_OPEN_WRITE_LINEAR";
        case Opcode::SYSTEM_OPEN_READ_LINEAR:     return "SYSTEM_OPEN_READ_LINEAR";
        case Opcode::SYSTEM_OPEN_WRITE_DATA:      return "SYSTEM_OPEN_WRITE_DATA";
        case Opcode::SYSTEM_OPEN_APPEND_DATA:     return "SYSTEM_OPEN_APPEND_DATA";
        case Opcode::SYSTEM_CROP_DATA_FILE:       return "SYSTEM_CROP_DATA_FILE";
        case Opcode::SYSTEM_FIND_FIRST_MODULE:    return "SYSTEM_FIND_FIRST_MODULE";
        case Opcode::SYSTEM_FIND_NEXT_MODULE:     return "SYSTEM_FIND_NEXT_MODULE";
        case Opcode::SYSTEM_CLOSE_MOD_HANDLE:     return "SYSTEM_CLOSE_MOD_HANDLE";
        case Opcode::SYSTEM_IOMAP_READ:           return "SYSTEM_IOMAP_READ";
        case Opcode::SYSTEM_IOMAP_WRITE:          return "SYSTEM_IOMAP_WRITE";
        case Opcode::SYSTEM_BOOT_CMD:             return "SYSTEM_BOOT_CMD";
        case Opcode::SYSTEM_SET_BRICK_NAME:       return "SYSTEM_SET_BRICK_NAME";
        case Opcode::SYSTEM_BT_GET_ADDR:          return "SYSTEM_BT_GET_ADDR";
        case Opcode::SYSTEM_DEVICE_INFO:          return "SYSTEM_DEVICE_INFO";
        case Opcode::SYSTEM_DELETE_USER_FLASH:    return "SYSTEM_DELETE_USER_FLASH";
        case Opcode::SYSTEM_POLL_CMD_LEN:         return "SYSTEM_POLL_CMD_LEN";
        case Opcode::SYSTEM_POLL_CMD:             return "SYSTEM_POLL_CMD";
        case Opcode::SYSTEM_RENAME_FILE:          return "SYSTEM_RENAME_FILE";
        case Opcode::SYSTEM_BT_FACTORY_RESET:     return "SYSTEM_BT_FACTORY_RESET";
        case Opcode::SYSTEM_RESIZE_DATA_FILE:     return "SYSTEM_RESIZE_DATA_FILE";
        case Opcode::SYSTEM_SEEK_FROM_START:      return "SYSTEM_SEEK_FROM_START";
        case Opcode::SYSTEM_SEEK_FROM_CURRENT:    return "SYSTEM_SEEK_FROM_CURRENT";
        case Opcode::SYSTEM_SEEK_FROM_END:        return "SYSTEM_SEEK_FROM_END";
        default:                                  return "UNKNOWN_OPCODE";
    }
}

} // namespace protocol
} // namespace nxt
