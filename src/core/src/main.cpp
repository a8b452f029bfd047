/**
 * @file main.cpp
 * @brief nxtinfo - print brick status as JSON
 *
 * Usage: nxtinfo [config_dir]
 */

#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "logging/Logger.hpp"
#include "config/ConfigManager.hpp"
#include "brick/Brick.hpp"
#include "brick/BrickJson.hpp"
#include "transport/RfcommTransport.hpp"
#include "transport/UsbTransport.hpp"

using namespace nxt;
using namespace nxt::config;

namespace {

std::shared_ptr<transport::ITransport> openTransport(const SystemConfig& cfg) {
    if (cfg.transport == TransportKind::Bluetooth) {
        return transport::RfcommTransport::open(cfg.bluetooth);
    }
    return transport::UsbTransport::first(cfg.usb);
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_dir = "config";
    if (argc > 1) {
        config_dir = argv[1];
    }

    // Quiet console logging until the configuration is read
    Logger::init("", "warn");

    auto& config = ConfigManager::instance();
    if (!config.loadAll(config_dir)) {
        LOG_WARN("Using built-in defaults (no system_config.yaml in {})", config_dir);
    }

    const auto& logConfig = config.systemConfig().logging;
    Logger::init(
        logConfig.file_enabled ? logConfig.file : "",
        logConfig.level,
        static_cast<size_t>(logConfig.max_size_mb) * 1024 * 1024,
        static_cast<size_t>(logConfig.max_files),
        logConfig.console_enabled
    );

    try {
        Brick brick = Brick::connect(openTransport(config.systemConfig()));

        nlohmann::json out;
        out["transport"] = brick.transport().name();
        out["name"] = brick.name();
        out["battery_mv"] = brick.getBatteryLevel();
        out["versions"] = brick.getFirmwareVersion();
        out["device_info"] = brick.getDeviceInfo();
        out["files"] = brick.listFiles("*.*");
        out["modules"] = brick.listModules("*.*");

        std::cout << out.dump(2) << std::endl;

    } catch (const Error& e) {
        LOG_ERROR("{}", e.what());
        std::cerr << "nxtinfo: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
