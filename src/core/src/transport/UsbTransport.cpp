/**
 * @file UsbTransport.cpp
 * @brief USB bulk-transfer transport implementation
 */

#include "UsbTransport.hpp"
#include "../common/Error.hpp"
#include "../logging/Logger.hpp"
#include <libusb.h>
#include <cstdio>

namespace nxt {
namespace transport {

namespace {

using ContextPtr = std::shared_ptr<libusb_context>;

ContextPtr makeContext() {
    libusb_context* ctx = nullptr;
    int rc = libusb_init(&ctx);
    if (rc != LIBUSB_SUCCESS) {
        throw Error(ErrorCode::TRANSPORT,
                    std::string("libusb_init failed: ") + libusb_error_name(rc));
    }
    return ContextPtr(ctx, [](libusb_context* c) { libusb_exit(c); });
}

Error usbError(const char* what, int rc) {
    return Error(ErrorCode::TRANSPORT, std::string(what) + ": " + libusb_error_name(rc));
}

} // namespace

// ============================================================================
// Impl (pimpl - owns the libusb handle)
// ============================================================================

struct UsbTransport::Impl {
    ContextPtr context;
    libusb_device_handle* handle = nullptr;
    config::UsbConfig cfg;
    uint8_t bus = 0;
    uint8_t address = 0;
    bool claimed = false;

    ~Impl() {
        if (handle) {
            if (claimed) {
                libusb_release_interface(handle, cfg.interface_number);
            }
            libusb_close(handle);
        }
    }
};

// ============================================================================
// Discovery
// ============================================================================

std::shared_ptr<UsbTransport> UsbTransport::first(const config::UsbConfig& cfg) {
    return open(cfg, true).front();
}

std::vector<std::shared_ptr<UsbTransport>> UsbTransport::all(const config::UsbConfig& cfg) {
    return open(cfg, false);
}

std::vector<std::shared_ptr<UsbTransport>> UsbTransport::open(const config::UsbConfig& cfg,
                                                              bool firstOnly) {
    ContextPtr context = makeContext();

    libusb_device** list = nullptr;
    ssize_t count = libusb_get_device_list(context.get(), &list);
    if (count < 0) {
        throw usbError("libusb_get_device_list", static_cast<int>(count));
    }

    // Frees the list (and unreferences its devices) on every exit path
    std::unique_ptr<libusb_device*, void (*)(libusb_device**)> listGuard(
        list, [](libusb_device** l) { libusb_free_device_list(l, 1); });

    std::vector<std::shared_ptr<UsbTransport>> result;

    for (ssize_t i = 0; i < count; ++i) {
        libusb_device* device = list[i];
        libusb_device_descriptor desc{};
        if (libusb_get_device_descriptor(device, &desc) != LIBUSB_SUCCESS) {
            continue;
        }
        if (desc.idVendor != cfg.vendor_id || desc.idProduct != cfg.product_id) {
            continue;
        }

        auto impl = std::make_unique<Impl>();
        impl->context = context;
        impl->cfg = cfg;
        impl->bus = libusb_get_bus_number(device);
        impl->address = libusb_get_device_address(device);

        int rc = libusb_open(device, &impl->handle);
        if (rc != LIBUSB_SUCCESS) {
            LOG_ERROR("Cannot open brick at bus {} address {}: {}",
                      impl->bus, impl->address, libusb_error_name(rc));
            throw usbError("libusb_open", rc);
        }

        rc = libusb_claim_interface(impl->handle, cfg.interface_number);
        if (rc != LIBUSB_SUCCESS) {
            LOG_ERROR("Cannot claim interface {} on bus {} address {}: {}",
                      cfg.interface_number, impl->bus, impl->address, libusb_error_name(rc));
            throw usbError("libusb_claim_interface", rc);
        }
        impl->claimed = true;

        std::shared_ptr<UsbTransport> transport(new UsbTransport(std::move(impl)));
        LOG_INFO("Opened {}", transport->name());
        result.push_back(std::move(transport));

        if (firstOnly) {
            break;
        }
    }

    if (result.empty()) {
        throw Error(ErrorCode::NO_BRICK, "No brick found on USB");
    }
    return result;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

UsbTransport::UsbTransport(std::unique_ptr<Impl> impl)
    : m_impl(std::move(impl)) {}

UsbTransport::~UsbTransport() {
    LOG_INFO("Closing {}", name());
}

// ============================================================================
// Transfers
// ============================================================================

size_t UsbTransport::send(const uint8_t* data, size_t length) {
    std::lock_guard<std::mutex> lock(m_mutex);

    int transferred = 0;
    // libusb takes a non-const buffer for both directions; OUT transfers only read it
    int rc = libusb_bulk_transfer(m_impl->handle, m_impl->cfg.out_endpoint,
                                  const_cast<uint8_t*>(data), static_cast<int>(length),
                                  &transferred, static_cast<unsigned int>(m_impl->cfg.timeout_ms));
    if (rc != LIBUSB_SUCCESS) {
        LOG_DEBUG("{}: bulk OUT failed: {}", name(), libusb_error_name(rc));
        throw usbError("bulk OUT", rc);
    }
    if (static_cast<size_t>(transferred) != length) {
        throw Error(ErrorCode::WRITE, "Short write: " + std::to_string(transferred) +
                                      " of " + std::to_string(length) + " bytes");
    }
    return static_cast<size_t>(transferred);
}

size_t UsbTransport::recv(uint8_t* buffer, size_t length) {
    std::lock_guard<std::mutex> lock(m_mutex);

    int transferred = 0;
    int rc = libusb_bulk_transfer(m_impl->handle, m_impl->cfg.in_endpoint,
                                  buffer, static_cast<int>(length),
                                  &transferred, static_cast<unsigned int>(m_impl->cfg.timeout_ms));
    if (rc != LIBUSB_SUCCESS) {
        LOG_DEBUG("{}: bulk IN failed: {}", name(), libusb_error_name(rc));
        throw usbError("bulk IN", rc);
    }
    return static_cast<size_t>(transferred);
}

std::string UsbTransport::name() const {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "usb:%03u:%03u %04x:%04x",
                  static_cast<unsigned>(m_impl->bus), static_cast<unsigned>(m_impl->address),
                  static_cast<unsigned>(m_impl->cfg.vendor_id),
                  static_cast<unsigned>(m_impl->cfg.product_id));
    return buf;
}

} // namespace transport
} // namespace nxt
