/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "Logger.hpp"
#include <filesystem>
#include <iostream>
#include <vector>

namespace nxt {

std::shared_ptr<spdlog::logger> Logger::s_logger = nullptr;
std::mutex Logger::s_mutex;

namespace {

std::shared_ptr<spdlog::logger> makeConsoleLogger() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    auto logger = std::make_shared<spdlog::logger>("nxt", console_sink);
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace

void Logger::init(const std::string& log_file,
                  const std::string& level,
                  size_t max_size,
                  size_t max_files,
                  bool console) {
    std::lock_guard<std::mutex> lock(s_mutex);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (console) {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (!log_file.empty()) {
            std::filesystem::path log_path(log_file);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, max_size, max_files);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [tid %t] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("nxt", sinks.begin(), sinks.end());

        // Unknown names map to "off" in spdlog; keep info as the fallback
        auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off") {
            parsed = spdlog::level::info;
        }
        logger->set_level(parsed);
        logger->flush_on(spdlog::level::warn);

        s_logger = logger;
        spdlog::set_default_logger(s_logger);

    } catch (const std::exception& ex) {
        std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        if (!s_logger) {
            s_logger = makeConsoleLogger();
        }
    }
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_logger) {
        s_logger = makeConsoleLogger();
    }
    return s_logger;
}

} // namespace nxt
