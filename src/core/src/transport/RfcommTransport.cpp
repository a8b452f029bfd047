/**
 * @file RfcommTransport.cpp
 * @brief Bluetooth RFCOMM transport implementation
 */

#include "RfcommTransport.hpp"
#include "BluetoothAdapter.hpp"
#include "../logging/Logger.hpp"

namespace nxt {
namespace transport {

RfcommTransport::RfcommTransport(boost::asio::serial_port port, const config::BluetoothConfig& cfg)
    : StreamTransport<boost::asio::serial_port>(
          std::move(port),
          std::chrono::milliseconds(cfg.timeout_ms),
          "rfcomm:" + cfg.device) {}

std::shared_ptr<RfcommTransport> RfcommTransport::open(const config::BluetoothConfig& cfg) {
    auto& adapter = BluetoothAdapter::instance();

    boost::asio::serial_port port(adapter.ioContext());
    boost::system::error_code ec;
    // Asio puts the tty into raw mode on open
    port.open(cfg.device, ec);
    if (ec) {
        LOG_ERROR("Cannot open RFCOMM device {}: {}", cfg.device, ec.message());
        throw Error(ErrorCode::NO_BRICK, "Cannot open " + cfg.device + ": " + ec.message());
    }

    LOG_INFO("Opened RFCOMM device {}", cfg.device);
    return std::make_shared<RfcommTransport>(std::move(port), cfg);
}

} // namespace transport
} // namespace nxt
