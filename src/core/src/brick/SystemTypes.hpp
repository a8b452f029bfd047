/**
 * @file SystemTypes.hpp
 * @brief Handle resources and device information returned by system calls
 *
 * Handles are brick-assigned identifiers. They only mean something on
 * the connection that produced them.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace nxt {

/**
 * @brief Open file; valid until fileClose()
 */
struct FileHandle {
    uint8_t handle = 0;
    uint32_t len = 0;   // File size, or free space for append
};

/**
 * @brief One step of a file search; each find-next returns a new handle
 */
struct FindFileHandle {
    uint8_t handle = 0;
    std::string name;
    uint32_t len = 0;
};

/**
 * @brief One step of a module search
 */
struct ModuleHandle {
    uint8_t handle = 0;
    std::string name;
    uint32_t id = 0;
    uint32_t len = 0;
    uint16_t iomapLen = 0;
};

struct FwVersion {
    uint8_t protMajor = 0;
    uint8_t protMinor = 0;
    uint8_t fwMajor = 0;
    uint8_t fwMinor = 0;
};

struct DeviceInfo {
    std::string name;
    std::array<uint8_t, 6> btAddr{};
    std::array<uint8_t, 4> signalStrength{};
    uint32_t flash = 0;   // Free user flash in bytes
};

/**
 * @brief Command buffer polled by pollCommandLength()/pollCommand()
 */
enum class BufType : uint8_t {
    USB        = 0,
    HIGH_SPEED = 1
};

} // namespace nxt
