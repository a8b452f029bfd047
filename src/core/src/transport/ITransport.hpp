/**
 * @file ITransport.hpp
 * @brief Abstract byte-message channel to a brick (USB bulk or Bluetooth stream)
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace nxt {
namespace transport {

/**
 * One message per send() and one message per recv().
 *
 * Implementations hold an exclusive lock for the duration of a single
 * send() or recv(); a request/reply pair is NOT atomic. Every failure is
 * thrown as nxt::Error.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * Transmit one message
     * @return number of payload bytes written
     */
    virtual size_t send(const uint8_t* data, size_t length) = 0;

    /**
     * Receive one message into buffer
     * @return number of bytes filled (the prefix of buffer holding the message)
     */
    virtual size_t recv(uint8_t* buffer, size_t length) = 0;

    /// Human-readable description for logging
    virtual std::string name() const = 0;
};

} // namespace transport
} // namespace nxt
