#include "globals.hpp"

namespace {
Global globalinstance;
const Config defaultConfig {};
}

const Config& config()
{
    if (globalinstance.conf)
        return *globalinstance.conf;
    return defaultConfig;
}

void set_config(Config c)
{
    globalinstance.conf = std::move(c);
}
