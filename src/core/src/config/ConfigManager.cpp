/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace nxt {
namespace config {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

/// Accepts decimal or 0x-prefixed hex (USB ids, endpoints) that fits T
template <typename T>
T readUnsigned(const YAML::Node& node, T fallback) {
    if (!node) {
        return fallback;
    }
    const std::string text = node.as<std::string>();
    if (text.find('-') != std::string::npos) {
        throw std::invalid_argument("not an unsigned integer: " + text);
    }
    size_t used = 0;
    unsigned long value = std::stoul(text, &used, 0);
    if (used != text.size()) {
        throw std::invalid_argument("not an unsigned integer: " + text);
    }
    if (value > std::numeric_limits<T>::max()) {
        throw std::out_of_range("value out of range: " + text);
    }
    return static_cast<T>(value);
}

SystemConfig parseSystemConfig(const YAML::Node& root) {
    YAML::Node system = root["system"];
    if (!system) {
        throw std::runtime_error("Missing 'system' section in config");
    }

    SystemConfig cfg;
    cfg.version = system["version"].as<std::string>(cfg.version);

    std::string transport = system["transport"].as<std::string>("usb");
    if (transport == "usb") {
        cfg.transport = TransportKind::Usb;
    } else if (transport == "bluetooth") {
        cfg.transport = TransportKind::Bluetooth;
    } else {
        throw std::runtime_error("Unknown transport '" + transport + "'");
    }

    // Logging settings
    if (system["logging"]) {
        auto logging = system["logging"];
        cfg.logging.level = logging["level"].as<std::string>(cfg.logging.level);
        cfg.logging.file = logging["file"].as<std::string>(cfg.logging.file);
        cfg.logging.max_size_mb = logging["max_size_mb"].as<int>(cfg.logging.max_size_mb);
        cfg.logging.max_files = logging["max_files"].as<int>(cfg.logging.max_files);
        cfg.logging.console_enabled = logging["console_enabled"].as<bool>(cfg.logging.console_enabled);
        cfg.logging.file_enabled = logging["file_enabled"].as<bool>(cfg.logging.file_enabled);
    }

    // USB settings
    if (system["usb"]) {
        auto usb = system["usb"];
        cfg.usb.vendor_id = readUnsigned<uint16_t>(usb["vendor_id"], cfg.usb.vendor_id);
        cfg.usb.product_id = readUnsigned<uint16_t>(usb["product_id"], cfg.usb.product_id);
        cfg.usb.interface_number = usb["interface"].as<int>(cfg.usb.interface_number);
        cfg.usb.out_endpoint = readUnsigned<uint8_t>(usb["out_endpoint"], cfg.usb.out_endpoint);
        cfg.usb.in_endpoint = readUnsigned<uint8_t>(usb["in_endpoint"], cfg.usb.in_endpoint);
        cfg.usb.timeout_ms = usb["timeout_ms"].as<int>(cfg.usb.timeout_ms);
    }

    // Bluetooth settings
    if (system["bluetooth"]) {
        auto bt = system["bluetooth"];
        cfg.bluetooth.device = bt["device"].as<std::string>(cfg.bluetooth.device);
        cfg.bluetooth.timeout_ms = bt["timeout_ms"].as<int>(cfg.bluetooth.timeout_ms);
    }

    if (cfg.usb.timeout_ms <= 0 || cfg.bluetooth.timeout_ms <= 0) {
        throw std::runtime_error("timeout_ms must be positive");
    }

    return cfg;
}

} // namespace

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadSystemConfig(const std::string& filepath) {
    if (!fs::exists(filepath)) {
        LOG_ERROR("System config file not found: {}", filepath);
        return false;
    }

    LOG_INFO("Loading system config from: {}", filepath);

    try {
        SystemConfig cfg = parseSystemConfig(YAML::LoadFile(filepath));

        std::lock_guard<std::mutex> lock(m_mutex);
        m_system_config = cfg;
        m_loaded = true;
        LOG_INFO("System config loaded: version {}, transport {}",
                 cfg.version, transportKindToString(cfg.transport));
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in system config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading system config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadSystemConfigFromString(const std::string& yaml) {
    try {
        SystemConfig cfg = parseSystemConfig(YAML::Load(yaml));

        std::lock_guard<std::mutex> lock(m_mutex);
        m_system_config = cfg;
        m_loaded = true;
        return true;

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in system config: {}", e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading system config: {}", e.what());
        return false;
    }
}

bool ConfigManager::loadAll(const std::string& config_dir) {
    return loadSystemConfig(config_dir + "/system_config.yaml");
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_system_config = SystemConfig{};
    m_loaded = false;
}

std::string ConfigManager::systemConfigToJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    json j;
    j["version"] = m_system_config.version;
    j["transport"] = transportKindToString(m_system_config.transport);

    j["logging"] = {
        {"level", m_system_config.logging.level},
        {"file", m_system_config.logging.file},
        {"max_size_mb", m_system_config.logging.max_size_mb},
        {"max_files", m_system_config.logging.max_files},
        {"console_enabled", m_system_config.logging.console_enabled},
        {"file_enabled", m_system_config.logging.file_enabled}
    };

    j["usb"] = {
        {"vendor_id", m_system_config.usb.vendor_id},
        {"product_id", m_system_config.usb.product_id},
        {"interface", m_system_config.usb.interface_number},
        {"out_endpoint", m_system_config.usb.out_endpoint},
        {"in_endpoint", m_system_config.usb.in_endpoint},
        {"timeout_ms", m_system_config.usb.timeout_ms}
    };

    j["bluetooth"] = {
        {"device", m_system_config.bluetooth.device},
        {"timeout_ms", m_system_config.bluetooth.timeout_ms}
    };

    return j.dump(2);
}

} // namespace config
} // namespace nxt
