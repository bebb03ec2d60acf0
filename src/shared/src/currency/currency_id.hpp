#pragma once
#include "crypto/evm_address.hpp"
#include "currency/token_symbol.hpp"
#include "tools/variant.hpp"
#include <string>

// One side of a dex share, cannot itself be a dex share.
struct DexShareLeg : public curmap::variant<TokenSymbol, EvmAddress> {
    using curmap::variant<TokenSymbol, EvmAddress>::variant;
    [[nodiscard]] bool is_token() const { return holds<TokenSymbol>(); }
    [[nodiscard]] bool is_erc20() const { return holds<EvmAddress>(); }
    std::string to_string() const;
    bool operator==(const DexShareLeg&) const = default;
};

struct DexShare {
    DexShareLeg left;
    DexShareLeg right;
    std::string to_string() const;
    bool operator==(const DexShare&) const = default;
};

// Currency identity as seen by the EVM: a native token, an ERC20
// contract, or the liquidity share of a trading pair.
struct CurrencyId : public curmap::variant<TokenSymbol, EvmAddress, DexShare> {
    using curmap::variant<TokenSymbol, EvmAddress, DexShare>::variant;
    CurrencyId(DexShareLeg leg)
        : CurrencyId(leg.visit([](auto& v) { return CurrencyId(v); }))
    {
    }
    [[nodiscard]] bool is_token() const { return holds<TokenSymbol>(); }
    [[nodiscard]] bool is_erc20() const { return holds<EvmAddress>(); }
    [[nodiscard]] bool is_dex_share() const { return holds<DexShare>(); }
    std::string to_string() const;
    bool operator==(const CurrencyId&) const = default;
};
