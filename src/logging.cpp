#include "rangedl/logging.hpp"

#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rangedl {

void initLogging(const std::filesystem::path& log_file, spdlog::level::level_enum level) {
    spdlog::drop("rangedl");
    std::shared_ptr<spdlog::logger> logger;
    try {
        logger = spdlog::basic_logger_mt("rangedl", log_file.string());
    } catch (const spdlog::spdlog_ex& ex) {
        logger = spdlog::stderr_color_mt("rangedl");
        logger->warn("Cannot open log file {}: {}", log_file.string(), ex.what());
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace rangedl
