#pragma once
#include "currency/currency_id.hpp"
#include "general/errors.hpp"
#include "nlohmann/json.hpp"
#include "registry/currency_mapping.hpp"

namespace jsonmsg {
using namespace nlohmann;

json to_json(const Error&);
json to_json(const EvmAddress&);
json to_json(const DexShareLeg&);
json to_json(const CurrencyId&);
json to_json(const CurrencySlot&);
json to_json(const Erc20Info&);
json to_json(const TokenInfo&);

// all native tokens and registered contracts with their slot encodings
json to_json(const Erc20Registry&, const CurrencyIdMapping&);
inline json to_json(const json& j) { return j; }

template <typename T>
inline json to_json(const std::optional<T>& o)
{
    if (!o)
        return nullptr;
    return to_json(*o);
}
}
