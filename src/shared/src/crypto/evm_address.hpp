#pragma once
#include "general/params.hpp"
#include <array>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace curmap {
template <size_t N>
struct byte_arr : public std::array<uint8_t, N> {
    using parent = std::array<uint8_t, N>;
    constexpr byte_arr(parent a)
        : parent(std::move(a))
    {
    }
    using parent::size;
};
}

// 20 byte account or contract address of the EVM
class EvmAddress : public curmap::byte_arr<EVM_ADDRESS_SIZE> {
public:
    // accepts 40 hex digits with optional "0x" prefix, throws Error(EBADADDRESS)
    explicit EvmAddress(std::string_view);
    static std::optional<EvmAddress> parse(std::string_view);

    constexpr EvmAddress(std::array<uint8_t, 20> arr)
        : byte_arr(arr) { };
    std::string to_string() const;
    bool operator==(const EvmAddress&) const = default;
    auto operator<=>(const EvmAddress&) const = default;
};
