/**
 * @file BluetoothAdapter.cpp
 * @brief Shared Bluetooth I/O context implementation
 */

#include "BluetoothAdapter.hpp"
#include "../logging/Logger.hpp"

namespace nxt {
namespace transport {

BluetoothAdapter& BluetoothAdapter::instance() {
    // Never destroyed: the worker thread runs until the process exits
    static BluetoothAdapter* adapter = new BluetoothAdapter();
    return *adapter;
}

BluetoothAdapter::BluetoothAdapter()
    : m_workGuard(boost::asio::make_work_guard(m_ioContext)) {
    m_ioThread = std::thread([this]() {
        for (;;) {
            try {
                m_ioContext.run();
                return;
            } catch (const std::exception& e) {
                LOG_ERROR("Bluetooth IO error: {}", e.what());
            }
        }
    });
    m_ioThread.detach();
    LOG_INFO("Bluetooth adapter initialized");
}

} // namespace transport
} // namespace nxt
