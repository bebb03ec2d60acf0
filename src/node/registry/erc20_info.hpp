#pragma once
#include "crypto/evm_address.hpp"
#include "general/params.hpp"
#include <string>

struct Erc20Info {
    EvmAddress address;
    uint32_t id; // RESERVED_OFFSET + registration sequence
    std::string name;
    std::string symbol;
    uint8_t decimals;
    uint32_t sequence() const { return id - RESERVED_OFFSET; }
    bool operator==(const Erc20Info&) const = default;
};
