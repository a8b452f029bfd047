/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include <string>
#include <mutex>
#include "SystemConfig.hpp"

namespace nxt {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Thread-safe for reading after initialization.
 */
class ConfigManager {
public:
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load system configuration from YAML file
     * @param filepath Path to system_config.yaml
     * @return true if loaded successfully; on failure the previous
     *         configuration is kept
     */
    bool loadSystemConfig(const std::string& filepath);

    /**
     * Load system configuration from a YAML document held in memory
     */
    bool loadSystemConfigFromString(const std::string& yaml);

    /**
     * Load all configuration files from a directory
     * @param config_dir Path to config directory
     */
    bool loadAll(const std::string& config_dir = "config");

    /**
     * Restore built-in defaults
     */
    void reset();

    const SystemConfig& systemConfig() const { return m_system_config; }

    bool isLoaded() const { return m_loaded; }

    /**
     * Get configuration as JSON
     */
    std::string systemConfigToJson() const;

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    SystemConfig m_system_config;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace nxt
