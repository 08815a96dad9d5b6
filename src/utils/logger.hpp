#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace securand::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical, off)
     * @param log_to_file Whether to log to file in addition to console
     * @param log_file Rotating log file path, used when log_to_file is set
     * @throws spdlog::spdlog_ex if the log file cannot be opened
     */
    static void init(const std::string& level = "info", bool log_to_file = false,
                     const std::string& log_file = "securand.log");

    /**
     * Get the logger instance, creating a console logger on first use
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Map a level name to an spdlog level; unknown names map to info
     */
    static spdlog::level::level_enum parse_level(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::mutex mutex_;
};

} // namespace securand::utils

// Convenience macros
#define SECURAND_LOG_TRACE(...)    securand::utils::Logger::get()->trace(__VA_ARGS__)
#define SECURAND_LOG_DEBUG(...)    securand::utils::Logger::get()->debug(__VA_ARGS__)
#define SECURAND_LOG_INFO(...)     securand::utils::Logger::get()->info(__VA_ARGS__)
#define SECURAND_LOG_WARN(...)     securand::utils::Logger::get()->warn(__VA_ARGS__)
#define SECURAND_LOG_ERROR(...)    securand::utils::Logger::get()->error(__VA_ARGS__)
#define SECURAND_LOG_CRITICAL(...) securand::utils::Logger::get()->critical(__VA_ARGS__)
