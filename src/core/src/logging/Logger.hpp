/**
 * @file Logger.hpp
 * @brief Logging framework wrapper using spdlog
 */

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <mutex>
#include <string>

namespace nxt {

class Logger {
public:
    /**
     * Initialize (or re-initialize) the logging system
     * @param log_file Path to log file; empty disables the file sink
     * @param level Log level (trace, debug, info, warn, error, off)
     * @param max_size Maximum file size in bytes (default 10MB)
     * @param max_files Maximum number of rotated files
     * @param console Whether to log to stdout
     */
    static void init(const std::string& log_file = "",
                     const std::string& level = "info",
                     size_t max_size = 10 * 1024 * 1024,
                     size_t max_files = 5,
                     bool console = true);

    /**
     * Get the logger instance, creating a console logger on first use
     */
    static std::shared_ptr<spdlog::logger> get();

private:
    static std::shared_ptr<spdlog::logger> s_logger;
    static std::mutex s_mutex;
};

} // namespace nxt

// Convenience macros
#define LOG_TRACE(...) ::nxt::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::nxt::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...)  ::nxt::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...)  ::nxt::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ::nxt::Logger::get()->error(__VA_ARGS__)
