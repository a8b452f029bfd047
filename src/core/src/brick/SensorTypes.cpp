/**
 * @file SensorTypes.cpp
 * @brief Sensor type conversions and formatting
 */

#include "SensorTypes.hpp"
#include "../common/Error.hpp"

namespace nxt {

std::string InputValues::toString() const {
    if (!valid) {
        return "...";
    }

    switch (sensorMode) {
        case SensorMode::RAW:        return std::to_string(rawValue);
        case SensorMode::BOOL:       return scaledValue != 0 ? "true" : "false";
        case SensorMode::EDGE:
        case SensorMode::PULSE:      return std::to_string(scaledValue);
        case SensorMode::PERCENT:    return std::to_string(scaledValue) + "%";
        case SensorMode::CELSIUS:    return std::to_string(scaledValue) + "°C";
        case SensorMode::FAHRENHEIT: return std::to_string(scaledValue) + "°F";
        case SensorMode::ROTATION:   return std::to_string(scaledValue) + " ticks";
        default:                     return std::to_string(rawValue);
    }
}

InPort inPortFromByte(uint8_t code) {
    if (code <= 3) {
        return static_cast<InPort>(code);
    }
    throw Error(ErrorCode::PARSE, "Invalid InPort");
}

SensorType sensorTypeFromByte(uint8_t code) {
    if (code <= static_cast<uint8_t>(SensorType::COLOUR_EXIT)) {
        return static_cast<SensorType>(code);
    }
    throw Error(ErrorCode::PARSE, "Invalid SensorType");
}

SensorMode sensorModeFromByte(uint8_t code) {
    // Modes occupy the top three bits only
    if ((code & 0x1F) == 0) {
        return static_cast<SensorMode>(code);
    }
    throw Error(ErrorCode::PARSE, "Invalid SensorMode");
}

std::string inPortToString(InPort port) {
    switch (port) {
        case InPort::S1: return "S1";
        case InPort::S2: return "S2";
        case InPort::S3: return "S3";
        case InPort::S4: return "S4";
        default:         return "UNKNOWN";
    }
}

std::string sensorTypeToString(SensorType type) {
    switch (type) {
        case SensorType::NONE:           return "NONE";
        case SensorType::SWITCH:         return "SWITCH";
        case SensorType::TEMPERATURE:    return "TEMPERATURE";
        case SensorType::REFLECTION:     return "REFLECTION";
        case SensorType::ANGLE:          return "ANGLE";
        case SensorType::LIGHT_ACTIVE:   return "LIGHT_ACTIVE";
        case SensorType::LIGHT_INACTIVE: return "LIGHT_INACTIVE";
        case SensorType::SOUND_DB:       return "SOUND_DB";
        case SensorType::SOUND_DBA:      return "SOUND_DBA";
        case SensorType::CUSTOM:         return "CUSTOM";
        case SensorType::LOW_SPEED:      return "LOW_SPEED";
        case SensorType::LOW_SPEED_9V:   return "LOW_SPEED_9V";
        case SensorType::HIGH_SPEED:     return "HIGH_SPEED";
        case SensorType::COLOUR_FULL:    return "COLOUR_FULL";
        case SensorType::COLOUR_RED:     return "COLOUR_RED";
        case SensorType::COLOUR_GREEN:   return "COLOUR_GREEN";
        case SensorType::COLOUR_BLUE:    return "COLOUR_BLUE";
        case SensorType::COLOUR_NONE:    return "COLOUR_NONE";
        case SensorType::COLOUR_EXIT:    return "COLOUR_EXIT";
        default:                         return "UNKNOWN";
    }
}

std::string sensorModeToString(SensorMode mode) {
    switch (mode) {
        case SensorMode::RAW:        return "RAW";
        case SensorMode::BOOL:       return "BOOL";
        case SensorMode::EDGE:       return "EDGE";
        case SensorMode::PULSE:      return "PULSE";
        case SensorMode::PERCENT:    return "PERCENT";
        case SensorMode::CELSIUS:    return "CELSIUS";
        case SensorMode::FAHRENHEIT: return "FAHRENHEIT";
        case SensorMode::ROTATION:   return "ROTATION";
        default:                     return "UNKNOWN";
    }
}

} // namespace nxt
