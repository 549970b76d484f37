#include "logging.hpp"

#include <cstdio>
#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

namespace worktime {

bool init_logging(const DashboardConfig& cfg) {
    std::shared_ptr<spdlog::logger> logger;
    bool to_file = true;
    try {
        logger = spdlog::basic_logger_mt("worktime", cfg.debug_log_path.string());
    } catch (const spdlog::spdlog_ex& e) {
        std::fprintf(stderr, "worktime: diagnostics disabled: %s\n", e.what());
        logger = std::make_shared<spdlog::logger>("worktime", std::make_shared<spdlog::sinks::null_sink_mt>());
        to_file = false;
    }

    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
    logger->set_level(spdlog::level::from_str(cfg.log_level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    return to_file;
}

} // namespace worktime
