#pragma once
#include "global/globals.hpp"

#include "spdlog/spdlog.h"

// Installs the stderr logger as default logger. Must run before the
// configuration is parsed, stdout only carries command output.
void init_logging();

// applies config().log.level to the default logger
void apply_log_level();

template <typename... Args>
inline void log_registry(spdlog::format_string_t<Args...> fmt, Args&&... args)
{
    if (config().log.registry)
        spdlog::info(fmt, std::forward<Args>(args)...);
}
