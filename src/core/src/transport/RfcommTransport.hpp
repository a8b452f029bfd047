/**
 * @file RfcommTransport.hpp
 * @brief Bluetooth transport over a bound RFCOMM tty
 *
 * Discovery and pairing are left to the host Bluetooth stack, e.g.
 *   rfcomm bind 0 00:16:53:xx:xx:xx 1
 * creates /dev/rfcomm0 for the brick's serial port profile on channel 1.
 */

#pragma once

#include "StreamTransport.hpp"
#include "../config/SystemConfig.hpp"
#include <boost/asio/serial_port.hpp>
#include <memory>

namespace nxt {
namespace transport {

/// Class of Device advertised by the brick
constexpr uint32_t BRICK_DEVICE_CLASS = 0x804;

/**
 * Filter for external discovery code: true if a device's Class of Device
 * identifies it as a brick
 */
inline bool isBrickDeviceClass(uint32_t deviceClass, uint32_t expected = BRICK_DEVICE_CLASS) {
    return deviceClass == expected;
}

class RfcommTransport : public StreamTransport<boost::asio::serial_port> {
public:
    /**
     * Open the tty named by cfg.device on the shared Bluetooth adapter.
     * Throws NO_BRICK if the device cannot be opened.
     */
    static std::shared_ptr<RfcommTransport> open(const config::BluetoothConfig& cfg = {});

    RfcommTransport(boost::asio::serial_port port, const config::BluetoothConfig& cfg);
};

} // namespace transport
} // namespace nxt
