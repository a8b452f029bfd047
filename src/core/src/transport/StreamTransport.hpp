/**
 * @file StreamTransport.hpp
 * @brief Length-prefixed message framing over a byte stream
 *
 * Frame format:
 * ┌──────────────┬──────────────┐
 * │ LEN (2, LE)  │ PAYLOAD (LEN)│
 * └──────────────┴──────────────┘
 *
 * The stream has no message boundaries of its own (RFCOMM), so every
 * message carries its length.
 */

#pragma once

#include "ITransport.hpp"
#include "../common/Error.hpp"
#include "../logging/Logger.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>
#include <array>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <utility>

namespace nxt {
namespace transport {

constexpr size_t LENGTH_PREFIX_SIZE = 2;

/**
 * @tparam Stream Asio AsyncReadStream/AsyncWriteStream whose executor is
 *         run by another thread (see BluetoothAdapter)
 */
template <typename Stream>
class StreamTransport : public ITransport {
public:
    StreamTransport(Stream stream, std::chrono::milliseconds timeout, std::string name)
        : m_stream(std::move(stream)),
          m_timeout(timeout),
          m_name(std::move(name)) {}

    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;

    size_t send(const uint8_t* data, size_t length) override {
        if (length > 0xFFFF) {
            throw Error(ErrorCode::INT_OUT_OF_RANGE,
                        "Message of " + std::to_string(length) + " bytes exceeds length prefix");
        }

        std::lock_guard<std::mutex> lock(m_mutex);

        const std::array<uint8_t, LENGTH_PREFIX_SIZE> prefix = {
            static_cast<uint8_t>(length & 0xFF),
            static_cast<uint8_t>((length >> 8) & 0xFF)
        };
        const std::array<boost::asio::const_buffer, 2> buffers = {
            boost::asio::buffer(prefix),
            boost::asio::buffer(data, length)
        };

        auto written = awaitResult(
            boost::asio::async_write(m_stream, buffers, boost::asio::use_future), "write");
        if (written != length + LENGTH_PREFIX_SIZE) {
            throw Error(ErrorCode::WRITE, "Short write on " + m_name);
        }
        return length;
    }

    size_t recv(uint8_t* buffer, size_t length) override {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::array<uint8_t, LENGTH_PREFIX_SIZE> prefix{};
        awaitResult(boost::asio::async_read(m_stream, boost::asio::buffer(prefix),
                                            boost::asio::use_future),
                    "read length");

        const size_t expected = static_cast<size_t>(prefix[0]) |
                                (static_cast<size_t>(prefix[1]) << 8);
        if (expected > length) {
            LOG_DEBUG("{}: declared length {} exceeds buffer of {}", m_name, expected, length);
            throw Error(ErrorCode::PARSE,
                        "Declared message length " + std::to_string(expected) +
                        " exceeds buffer of " + std::to_string(length));
        }

        if (expected > 0) {
            awaitResult(boost::asio::async_read(m_stream, boost::asio::buffer(buffer, expected),
                                                boost::asio::use_future),
                        "read payload");
        }
        return expected;
    }

    std::string name() const override { return m_name; }

private:
    /// Wait for an async operation; cancel the stream and throw TRANSPORT on timeout
    size_t awaitResult(std::future<size_t> result, const char* what) {
        bool timedOut = false;
        if (result.wait_for(m_timeout) != std::future_status::ready) {
            timedOut = true;
            // Cancel on the I/O thread and wait until it has run
            std::promise<void> cancelled;
            boost::asio::post(m_stream.get_executor(), [this, &cancelled]() {
                boost::system::error_code ignored;
                m_stream.cancel(ignored);
                cancelled.set_value();
            });
            cancelled.get_future().wait();
        }

        try {
            return result.get();
        } catch (const boost::system::system_error& e) {
            std::string reason = timedOut ? std::string("timed out") : std::string(e.what());
            LOG_DEBUG("{}: {} failed: {}", m_name, what, reason);
            throw Error(ErrorCode::TRANSPORT, m_name + ": " + what + " " + reason);
        }
    }

    Stream m_stream;
    std::chrono::milliseconds m_timeout;
    std::string m_name;
    std::mutex m_mutex;
};

} // namespace transport
} // namespace nxt
