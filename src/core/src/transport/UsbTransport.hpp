/**
 * @file UsbTransport.hpp
 * @brief USB bulk-transfer transport (libusb-1.0)
 *
 * One send() is one bulk OUT transfer, one recv() is one bulk IN
 * transfer; message boundaries are the transfer boundaries. Each
 * transfer blocks for at most UsbConfig::timeout_ms.
 */

#pragma once

#include "ITransport.hpp"
#include "../config/SystemConfig.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace nxt {
namespace transport {

class UsbTransport : public ITransport {
public:
    /**
     * Open the first device matching cfg.vendor_id/product_id and claim
     * its interface. Throws NO_BRICK if none is attached.
     */
    static std::shared_ptr<UsbTransport> first(const config::UsbConfig& cfg = {});

    /**
     * Open every matching device. Throws NO_BRICK if none is attached;
     * a device that fails to open aborts the whole call.
     */
    static std::vector<std::shared_ptr<UsbTransport>> all(const config::UsbConfig& cfg = {});

    ~UsbTransport() override;

    // Non-copyable
    UsbTransport(const UsbTransport&) = delete;
    UsbTransport& operator=(const UsbTransport&) = delete;

    size_t send(const uint8_t* data, size_t length) override;
    size_t recv(uint8_t* buffer, size_t length) override;
    std::string name() const override;

private:
    struct Impl;
    explicit UsbTransport(std::unique_ptr<Impl> impl);

    static std::vector<std::shared_ptr<UsbTransport>> open(const config::UsbConfig& cfg,
                                                           bool firstOnly);

    std::unique_ptr<Impl> m_impl;
    std::mutex m_mutex;
};

} // namespace transport
} // namespace nxt
