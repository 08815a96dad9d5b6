#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace securand::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;
std::mutex Logger::mutex_;

namespace {

std::shared_ptr<spdlog::logger> make_logger(const std::string& level, bool log_to_file, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink on stderr, stdout carries generated values
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    sinks.push_back(console_sink);

    if (log_to_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file,
            1024 * 1024 * 10,  // 10MB
            3                   // 3 rotating files
        );
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("securand", sinks.begin(), sinks.end());
    logger->set_level(Logger::parse_level(level));
    logger->flush_on(spdlog::level::err);
    return logger;
}

} // namespace

spdlog::level::level_enum Logger::parse_level(const std::string& level) {
    if (level == "trace") {
        return spdlog::level::trace;
    } else if (level == "debug") {
        return spdlog::level::debug;
    } else if (level == "info") {
        return spdlog::level::info;
    } else if (level == "warn") {
        return spdlog::level::warn;
    } else if (level == "error") {
        return spdlog::level::err;
    } else if (level == "critical") {
        return spdlog::level::critical;
    } else if (level == "off") {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

void Logger::init(const std::string& level, bool log_to_file, const std::string& log_file) {
    std::lock_guard<std::mutex> lock(mutex_);
    logger_ = make_logger(level, log_to_file, log_file);
    spdlog::set_default_logger(logger_);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_) {
        logger_ = make_logger("info", false, "");
        spdlog::set_default_logger(logger_);
    }
    return logger_;
}

} // namespace securand::utils
