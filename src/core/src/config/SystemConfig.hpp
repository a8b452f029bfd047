/**
 * @file SystemConfig.hpp
 * @brief System configuration data structures
 */

#pragma once

#include <cstdint>
#include <string>

namespace nxt {
namespace config {

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/nxt.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool console_enabled = true;
    bool file_enabled = false;
};

/**
 * USB bulk-transfer link
 */
struct UsbConfig {
    uint16_t vendor_id = 0x0694;
    uint16_t product_id = 0x0002;
    int interface_number = 0;
    uint8_t out_endpoint = 0x01;
    uint8_t in_endpoint = 0x82;
    int timeout_ms = 500;
};

/**
 * Bluetooth RFCOMM link (bound tty, e.g. `rfcomm bind 0 <addr> 1`)
 */
struct BluetoothConfig {
    std::string device = "/dev/rfcomm0";
    int timeout_ms = 2000;
};

enum class TransportKind { Usb, Bluetooth };

/**
 * Complete system configuration
 */
struct SystemConfig {
    std::string version = "1.0.0";
    TransportKind transport = TransportKind::Usb;
    LoggingConfig logging;
    UsbConfig usb;
    BluetoothConfig bluetooth;
};

inline std::string transportKindToString(TransportKind kind) {
    return kind == TransportKind::Bluetooth ? "bluetooth" : "usb";
}

} // namespace config
} // namespace nxt
