#include "currency_id.hpp"

namespace {
std::string token_string(TokenSymbol s)
{
    return std::string(token_symbol_str(s));
}
}

std::string DexShareLeg::to_string() const
{
    return visit_overload(
        [](TokenSymbol s) { return token_string(s); },
        [](const EvmAddress& a) { return a.to_string(); });
}

std::string DexShare::to_string() const
{
    return "DexShare(" + left.to_string() + ", " + right.to_string() + ")";
}

std::string CurrencyId::to_string() const
{
    return visit_overload(
        [](TokenSymbol s) { return token_string(s); },
        [](const EvmAddress& a) { return a.to_string(); },
        [](const DexShare& d) { return d.to_string(); });
}
