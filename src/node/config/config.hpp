#pragma once

#include "registry/metadata_source.hpp"
#include <string>
#include <string_view>
#include <vector>

struct Config {
    struct Data {
        std::string registrydb; // empty: keep the registry in memory
    } data;
    struct Log {
        std::string level { "info" };
        bool registry { true }; // log every new registration
    } log;
    std::vector<Erc20Declaration> erc20;

    std::string dump() const;

    // throw std::runtime_error on malformed input
    static Config from_file(const std::string& path);
    static Config from_string(std::string_view toml);
};
