/**
 * @file SensorTypes.hpp
 * @brief Type definitions for input (sensor) commands
 */

#pragma once

#include <cstdint>
#include <string>

namespace nxt {

enum class InPort : uint8_t {
    S1 = 0,
    S2 = 1,
    S3 = 2,
    S4 = 3
};

enum class SensorType : uint8_t {
    NONE           = 0,
    SWITCH         = 1,
    TEMPERATURE    = 2,
    REFLECTION     = 3,
    ANGLE          = 4,
    LIGHT_ACTIVE   = 5,
    LIGHT_INACTIVE = 6,
    SOUND_DB       = 7,
    SOUND_DBA      = 8,
    CUSTOM         = 9,
    LOW_SPEED      = 10,   // I2C
    LOW_SPEED_9V   = 11,   // I2C with 9V supply
    HIGH_SPEED     = 12,
    COLOUR_FULL    = 13,
    COLOUR_RED     = 14,
    COLOUR_GREEN   = 15,
    COLOUR_BLUE    = 16,
    COLOUR_NONE    = 17,
    COLOUR_EXIT    = 18
};

/**
 * @brief How the brick scales the raw reading
 */
enum class SensorMode : uint8_t {
    RAW         = 0x00,
    BOOL        = 0x20,
    EDGE        = 0x40,   // Count transitions
    PULSE       = 0x60,   // Count periods
    PERCENT     = 0x80,
    CELSIUS     = 0xA0,
    FAHRENHEIT  = 0xC0,
    ROTATION    = 0xE0
};

/**
 * @brief Reply of GET_INPUT_VALUES
 */
struct InputValues {
    InPort port = InPort::S1;
    bool valid = false;
    bool calibrated = false;
    SensorType sensorType = SensorType::NONE;
    SensorMode sensorMode = SensorMode::RAW;
    uint16_t rawValue = 0;
    uint16_t normalisedValue = 0;
    int16_t scaledValue = 0;
    int16_t calibratedValue = 0;

    /// Reading formatted for the sensor mode; "..." while not valid
    std::string toString() const;
};

InPort inPortFromByte(uint8_t code);
SensorType sensorTypeFromByte(uint8_t code);
SensorMode sensorModeFromByte(uint8_t code);

std::string inPortToString(InPort port);
std::string sensorTypeToString(SensorType type);
std::string sensorModeToString(SensorMode mode);

} // namespace nxt
