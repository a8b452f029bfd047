/**
 * @file MotorTypes.hpp
 * @brief Type definitions for output (motor) commands
 */

#pragma once

#include "../common/Error.hpp"
#include <cstdint>
#include <string>

namespace nxt {

/// Tacho limit meaning "run until told otherwise"
constexpr uint32_t RUN_FOREVER = 0;

/**
 * @brief Output ports and port combinations
 *
 * Some commands accept any combination, others a single port only.
 */
enum class OutPort : uint8_t {
    A   = 0,
    B   = 1,
    C   = 2,
    AB  = 3,
    AC  = 4,
    BC  = 5,
    ABC = 6,
    ALL = 0xFF   // Protocol-defined "every port"
};

/**
 * @brief Output mode bit flags
 */
struct OutMode {
    uint8_t bits = 0;

    static constexpr uint8_t IDLE      = 0x00;  // Do not turn the motor
    static constexpr uint8_t ON        = 0x01;  // Power the motor
    static constexpr uint8_t BRAKE     = 0x02;  // Brake instead of coasting at zero power
    static constexpr uint8_t REGULATED = 0x04;  // Apply the RegulationMode

    constexpr OutMode() = default;
    constexpr OutMode(uint8_t value) : bits(value) {}

    constexpr OutMode operator|(OutMode other) const { return OutMode(bits | other.bits); }
    constexpr bool has(uint8_t flag) const { return (bits & flag) == flag; }
    constexpr bool operator==(OutMode other) const { return bits == other.bits; }
    constexpr bool operator!=(OutMode other) const { return bits != other.bits; }
};

/**
 * @brief Power regulation applied when OutMode::REGULATED is set
 */
enum class RegulationMode : uint8_t {
    IDLE  = 0,   // Send the commanded power as is
    SPEED = 1,   // Hold a constant angular velocity
    SYNC  = 2    // Keep two motors synchronised
};

/**
 * @brief Motor run state
 */
enum class RunState : uint8_t {
    IDLE      = 0x00,
    RAMP_UP   = 0x10,
    RUNNING   = 0x20,
    RAMP_DOWN = 0x40
};

/**
 * @brief Reply of GET_OUTPUT_STATE: commanded settings plus rotation counters
 */
struct OutputState {
    OutPort port = OutPort::A;
    int8_t power = 0;
    OutMode mode;
    RegulationMode regulationMode = RegulationMode::IDLE;
    int8_t turnRatio = 0;
    RunState runState = RunState::IDLE;
    uint32_t tachoLimit = 0;
    int32_t tachoCount = 0;
    int32_t blockTachoCount = 0;
    int32_t rotationCount = 0;
};

// ============================================================================
// Byte conversions (PARSE on values outside the closed sets)
// ============================================================================

inline OutPort outPortFromByte(uint8_t code) {
    if (code <= 6 || code == 0xFF) {
        return static_cast<OutPort>(code);
    }
    throw Error(ErrorCode::PARSE, "Invalid OutPort");
}

inline RegulationMode regulationModeFromByte(uint8_t code) {
    if (code <= 2) {
        return static_cast<RegulationMode>(code);
    }
    throw Error(ErrorCode::PARSE, "Invalid RegulationMode");
}

inline RunState runStateFromByte(uint8_t code) {
    switch (code) {
        case 0x00: return RunState::IDLE;
        case 0x10: return RunState::RAMP_UP;
        case 0x20: return RunState::RUNNING;
        case 0x40: return RunState::RAMP_DOWN;
        default:   throw Error(ErrorCode::PARSE, "Invalid RunState");
    }
}

inline std::string outPortToString(OutPort port) {
    switch (port) {
        case OutPort::A:   return "A";
        case OutPort::B:   return "B";
        case OutPort::C:   return "C";
        case OutPort::AB:  return "AB";
        case OutPort::AC:  return "AC";
        case OutPort::BC:  return "BC";
        case OutPort::ABC: return "ABC";
        case OutPort::ALL: return "ALL";
        default:           return "UNKNOWN";
    }
}

inline std::string regulationModeToString(RegulationMode mode) {
    switch (mode) {
        case RegulationMode::IDLE:  return "IDLE";
        case RegulationMode::SPEED: return "SPEED";
        case RegulationMode::SYNC:  return "SYNC";
        default:                    return "UNKNOWN";
    }
}

inline std::string runStateToString(RunState state) {
    switch (state) {
        case RunState::IDLE:      return "IDLE";
        case RunState::RAMP_UP:   return "RAMP_UP";
        case RunState::RUNNING:   return "RUNNING";
        case RunState::RAMP_DOWN: return "RAMP_DOWN";
        default:                  return "UNKNOWN";
    }
}

} // namespace nxt
