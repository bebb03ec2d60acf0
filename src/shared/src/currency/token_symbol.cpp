#include "token_symbol.hpp"
#include <algorithm>

std::optional<TokenSymbol> token_from_id(uint32_t id)
{
    if (id >= RESERVED_OFFSET || id >= tokenTable.size())
        return {};
    return tokenTable[id].symbol;
}

std::optional<TokenSymbol> token_from_string(std::string_view symbol)
{
    auto iter { std::ranges::find(tokenTable, symbol, &TokenInfo::symbolStr) };
    if (iter == tokenTable.end())
        return {};
    return iter->symbol;
}
