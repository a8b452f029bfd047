/**
 * @file BluetoothAdapter.hpp
 * @brief Process-wide I/O context shared by every Bluetooth stream
 */

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>

namespace nxt {
namespace transport {

/**
 * Created on first use and kept for the lifetime of the process.
 *
 * Concurrent first calls to instance() race safely; exactly one adapter
 * is created. There is no shutdown hook.
 */
class BluetoothAdapter {
public:
    static BluetoothAdapter& instance();

    BluetoothAdapter(const BluetoothAdapter&) = delete;
    BluetoothAdapter& operator=(const BluetoothAdapter&) = delete;

    boost::asio::io_context& ioContext() { return m_ioContext; }

private:
    BluetoothAdapter();
    ~BluetoothAdapter() = default;

    boost::asio::io_context m_ioContext;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_workGuard;
    std::thread m_ioThread;
};

} // namespace transport
} // namespace nxt
