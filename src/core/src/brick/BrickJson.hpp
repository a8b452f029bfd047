/**
 * @file BrickJson.hpp
 * @brief JSON serialization for brick replies
 */

#pragma once

#include "MotorTypes.hpp"
#include "SensorTypes.hpp"
#include "SystemTypes.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <string>

namespace nxt {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FileHandle, handle, len)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(FindFileHandle, handle, name, len)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ModuleHandle, handle, name, id, len, iomapLen)

/// "00:16:53:0a:0b:0c"
inline std::string btAddrToString(const std::array<uint8_t, 6>& addr) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  addr[0], addr[1], addr[2], addr[3], addr[4], addr[5]);
    return buf;
}

inline void to_json(nlohmann::json& j, const FwVersion& v) {
    j = {
        {"protocol", std::to_string(v.protMajor) + "." + std::to_string(v.protMinor)},
        {"firmware", std::to_string(v.fwMajor) + "." + std::to_string(v.fwMinor)}
    };
}

inline void to_json(nlohmann::json& j, const DeviceInfo& info) {
    j = {
        {"name", info.name},
        {"bt_addr", btAddrToString(info.btAddr)},
        {"signal_strength", info.signalStrength},
        {"flash", info.flash}
    };
}

inline void to_json(nlohmann::json& j, const OutputState& s) {
    j = {
        {"port", outPortToString(s.port)},
        {"power", s.power},
        {"mode", s.mode.bits},
        {"regulation_mode", regulationModeToString(s.regulationMode)},
        {"turn_ratio", s.turnRatio},
        {"run_state", runStateToString(s.runState)},
        {"tacho_limit", s.tachoLimit},
        {"tacho_count", s.tachoCount},
        {"block_tacho_count", s.blockTachoCount},
        {"rotation_count", s.rotationCount}
    };
}

inline void to_json(nlohmann::json& j, const InputValues& v) {
    j = {
        {"port", inPortToString(v.port)},
        {"valid", v.valid},
        {"calibrated", v.calibrated},
        {"sensor_type", sensorTypeToString(v.sensorType)},
        {"sensor_mode", sensorModeToString(v.sensorMode)},
        {"raw", v.rawValue},
        {"normalised", v.normalisedValue},
        {"scaled", v.scaledValue},
        {"calibrated_value", v.calibratedValue},
        {"display", v.toString()}
    };
}

} // namespace nxt
