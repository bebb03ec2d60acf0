#pragma once
#include "general/params.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

////////////////////////////////////
// NATIVE TOKEN TABLE             //
////////////////////////////////////
// Ids are dense, start at 0 and must stay below RESERVED_OFFSET.
// Never renumber an existing entry, ids are part of the slot format.
#define TOKEN_SYMBOL_MAP(XX)                              \
    XX(0, ACA, "Acala", 12)                               \
    XX(1, AUSD, "Acala Dollar", 12)                       \
    XX(2, DOT, "Polkadot", 10)                            \
    XX(3, LDOT, "Liquid DOT", 10)                         \
    XX(4, XBTC, "ChainX BTC", 8)                          \
    XX(5, RENBTC, "Ren Protocol BTC", 8)                  \
    XX(6, POLKABTC, "PolkaBTC", 8)                        \
    XX(7, PLM, "Plasm", 18)                               \
    XX(8, PHA, "Phala Native Token", 18)                  \
    XX(9, HDT, "HydraDX", 18)                             \
    XX(10, KAR, "Karura", 12)                             \
    XX(11, KUSD, "Karura Dollar", 12)                     \
    XX(12, KSM, "Kusama", 12)                             \
    XX(13, LKSM, "Liquid KSM", 12)

#define TOKEN_ENUM_GEN(id, symbol, name, decimals) symbol = id,
enum class TokenSymbol : uint32_t {
    TOKEN_SYMBOL_MAP(TOKEN_ENUM_GEN)
};
#undef TOKEN_ENUM_GEN

struct TokenInfo {
    TokenSymbol symbol;
    std::string_view symbolStr;
    std::string_view name;
    uint8_t decimals;
    constexpr uint32_t id() const { return static_cast<uint32_t>(symbol); }
};

#define TOKEN_INFO_GEN(id, symbol, name, decimals) TokenInfo { TokenSymbol::symbol, #symbol, name, decimals },
inline constexpr std::array tokenTable {
    TOKEN_SYMBOL_MAP(TOKEN_INFO_GEN)
};
#undef TOKEN_INFO_GEN

namespace token_table_check {
constexpr bool dense_and_reserved()
{
    for (size_t i = 0; i < tokenTable.size(); ++i) {
        if (tokenTable[i].id() != i || tokenTable[i].id() >= RESERVED_OFFSET)
            return false;
    }
    return true;
}
static_assert(dense_and_reserved(), "native token ids must be dense and below RESERVED_OFFSET");
}

[[nodiscard]] constexpr uint32_t token_id(TokenSymbol s) { return static_cast<uint32_t>(s); }
[[nodiscard]] constexpr const TokenInfo& token_info(TokenSymbol s) { return tokenTable[token_id(s)]; }
[[nodiscard]] constexpr uint8_t token_decimals(TokenSymbol s) { return token_info(s).decimals; }
[[nodiscard]] constexpr std::string_view token_name(TokenSymbol s) { return token_info(s).name; }
[[nodiscard]] constexpr std::string_view token_symbol_str(TokenSymbol s) { return token_info(s).symbolStr; }

// empty for ids that do not name a native token, in particular for all ids >= RESERVED_OFFSET
[[nodiscard]] std::optional<TokenSymbol> token_from_id(uint32_t id);
[[nodiscard]] std::optional<TokenSymbol> token_from_string(std::string_view symbol);
inline std::span<const TokenInfo> all_tokens() { return tokenTable; }
