#include "evm_address.hpp"
#include "general/errors.hpp"
#include "general/hex.hpp"

EvmAddress::EvmAddress(std::string_view s)
    : byte_arr(std::array<uint8_t, 20> {})
{
    if (!parse_hex(strip_hex_prefix(s), data(), size()))
        throw Error(EBADADDRESS);
}

std::optional<EvmAddress> EvmAddress::parse(std::string_view s)
{
    std::array<uint8_t, 20> bytes;
    if (!parse_hex(strip_hex_prefix(s), bytes))
        return {};
    return EvmAddress { bytes };
}

std::string EvmAddress::to_string() const
{
    return serialize_prefixed_hex(data(), size());
}
