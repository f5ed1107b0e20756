#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rplayer {

void init_logging(bool debug, const std::string& log_file) {
    std::shared_ptr<spdlog::logger> logger;
    if (!log_file.empty()) {
        try {
            logger = spdlog::basic_logger_mt("rplayer", log_file);
        } catch (const spdlog::spdlog_ex& e) {
            logger = spdlog::stderr_color_mt("rplayer");
            logger->warn("cannot open log file {}: {}", log_file, e.what());
        }
    } else {
        logger = spdlog::stderr_color_mt("rplayer");
    }

    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace rplayer
