#include "logging.hpp"
#include "spdlog/sinks/stdout_color_sinks.h"

void init_logging()
{
    auto logger { spdlog::get("curmap") };
    if (!logger)
        logger = spdlog::stderr_color_mt("curmap");
    spdlog::set_default_logger(logger);
}

void apply_log_level()
{
    spdlog::set_level(spdlog::level::from_str(config().log.level));
}
