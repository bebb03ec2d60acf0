#pragma once
#include "config/config.hpp"
#include <optional>

struct Global {
    std::optional<Config> conf;
};

// default constructed Config until set_config was called
const Config& config();
void set_config(Config);
