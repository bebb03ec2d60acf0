#include "config.hpp"
#include "general/errors.hpp"
#include "spdlog/spdlog.h"
#include "toml++/toml.hpp"
#include <limits>
#include <sstream>

using namespace std;

namespace {
std::runtime_error failed_convert(const toml::node& n)
{
    return std::runtime_error("Cannot parse configuration value starting at line "s + std::to_string(n.source().begin.line) + ", column "s + std::to_string(n.source().begin.column) + ".");
}

template <typename T>
T config_convert(const toml::node& n)
{
    if (auto val = n.value<T>()) {
        return val.value();
    }
    throw failed_convert(n);
}

template <>
EvmAddress config_convert<EvmAddress>(const toml::node& n)
{
    if (auto sv { n.value<std::string_view>() }) {
        if (auto a { EvmAddress::parse(*sv) })
            return *a;
    }
    throw failed_convert(n);
}

template <>
uint8_t config_convert<uint8_t>(const toml::node& n)
{
    if (auto v { n.value<int64_t>() }) {
        if (*v >= 0 && *v <= std::numeric_limits<uint8_t>::max())
            return uint8_t(*v);
    }
    throw failed_convert(n);
}

std::string config_convert_level(const toml::node& n)
{
    auto level { config_convert<std::string>(n) };
    if (spdlog::level::from_str(level) == spdlog::level::off && level != "off")
        throw failed_convert(n);
    return level;
}

const toml::node& required(const toml::table& t, std::string_view key)
{
    if (auto n { t.get(key) })
        return *n;
    throw std::runtime_error("Missing configuration key '"s + std::string(key) + "' in table starting at line "s + std::to_string(t.source().begin.line) + ".");
}

Erc20Declaration parse_declaration(const toml::node& n)
{
    auto t { n.as_table() };
    if (!t)
        throw failed_convert(n);
    Erc20Declaration d {
        .address { config_convert<EvmAddress>(required(*t, "address")) },
        .metadata {
            .name { config_convert<std::string>(required(*t, "name")) },
            .symbol { config_convert<std::string>(required(*t, "symbol")) },
            .decimals = config_convert<uint8_t>(required(*t, "decimals")) }
    };
    if (d.metadata.symbol.empty())
        throw std::runtime_error("Empty ERC20 symbol at line "s + std::to_string(n.source().begin.line) + ".");
    return d;
}

Config from_table(const toml::table& tbl)
{
    Config c;
    for (auto& [key, val] : tbl) {
        if (key == "data") {
            auto t { val.as_table() };
            if (!t)
                throw failed_convert(val);
            for (auto& [k, v] : *t) {
                if (k == "registrydb")
                    c.data.registrydb = config_convert<std::string>(v);
                else
                    spdlog::warn("Unknown configuration key data.{}", k.str());
            }
        } else if (key == "log") {
            auto t { val.as_table() };
            if (!t)
                throw failed_convert(val);
            for (auto& [k, v] : *t) {
                if (k == "level")
                    c.log.level = config_convert_level(v);
                else if (k == "registry")
                    c.log.registry = config_convert<bool>(v);
                else
                    spdlog::warn("Unknown configuration key log.{}", k.str());
            }
        } else if (key == "erc20") {
            auto a { val.as_array() };
            if (!a)
                throw failed_convert(val);
            for (auto& e : *a)
                c.erc20.push_back(parse_declaration(e));
        } else {
            spdlog::warn("Unknown configuration key {}", key.str());
        }
    }
    return c;
}

std::runtime_error parse_failed(const toml::parse_error& e)
{
    std::ostringstream ss;
    ss << "Cannot parse configuration: " << e.description() << " (line " << e.source().begin.line << ", column " << e.source().begin.column << ").";
    return std::runtime_error(ss.str());
}
}

Config Config::from_file(const std::string& path)
{
    try {
        return from_table(toml::parse_file(path));
    } catch (const toml::parse_error& e) {
        throw parse_failed(e);
    }
}

Config Config::from_string(std::string_view toml)
{
    try {
        return from_table(toml::parse(toml));
    } catch (const toml::parse_error& e) {
        throw parse_failed(e);
    }
}

std::string Config::dump() const
{
    toml::array contracts;
    for (auto& d : erc20) {
        contracts.push_back(toml::table {
            { "address", d.address.to_string() },
            { "name", d.metadata.name },
            { "symbol", d.metadata.symbol },
            { "decimals", int64_t(d.metadata.decimals) } });
    }
    toml::table t {
        { "data", toml::table { { "registrydb", data.registrydb } } },
        { "log", toml::table { { "level", log.level }, { "registry", log.registry } } },
        { "erc20", std::move(contracts) }
    };
    std::ostringstream ss;
    ss << t;
    return ss.str();
}
