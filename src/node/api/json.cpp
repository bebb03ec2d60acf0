#include "json.hpp"
#include "general/hex.hpp"

using namespace nlohmann;

namespace jsonmsg {
namespace {
json token_json(TokenSymbol s)
{
    return json {
        { "type", "token" },
        { "symbol", token_symbol_str(s) },
        { "id", token_id(s) }
    };
}
json erc20_json(const EvmAddress& a)
{
    return json {
        { "type", "erc20" },
        { "address", a.to_string() }
    };
}
}

json to_json(const Error& e)
{
    return json {
        { "code", e.code },
        { "name", e.err_name() },
        { "error", e.strerror() }
    };
}

json to_json(const EvmAddress& a)
{
    return a.to_string();
}

json to_json(const DexShareLeg& leg)
{
    return leg.visit_overload(
        [](TokenSymbol s) { return token_json(s); },
        [](const EvmAddress& a) { return erc20_json(a); });
}

json to_json(const CurrencyId& c)
{
    return c.visit_overload(
        [](TokenSymbol s) { return token_json(s); },
        [](const EvmAddress& a) { return erc20_json(a); },
        [](const DexShare& d) {
            return json {
                { "type", "dexShare" },
                { "left", to_json(d.left) },
                { "right", to_json(d.right) }
            };
        });
}

json to_json(const CurrencySlot& slot)
{
    return serialize_prefixed_hex(slot.data(), slot.size());
}

json to_json(const Erc20Info& info)
{
    return json {
        { "address", info.address.to_string() },
        { "id", info.id },
        { "name", info.name },
        { "symbol", info.symbol },
        { "decimals", info.decimals }
    };
}

json to_json(const TokenInfo& t)
{
    return json {
        { "id", t.id() },
        { "symbol", t.symbolStr },
        { "name", t.name },
        { "decimals", t.decimals }
    };
}

json to_json(const Erc20Registry& registry, const CurrencyIdMapping& mapping)
{
    json tokens = json::array();
    for (auto& t : all_tokens()) {
        json j = to_json(t);
        j["slot"] = to_json(mapping.encode_currency_id(t.symbol));
        tokens.push_back(std::move(j));
    }
    json erc20 = json::array();
    for (auto& info : registry.entries()) {
        json j = to_json(info);
        j["slot"] = to_json(mapping.encode_currency_id(info.address));
        erc20.push_back(std::move(j));
    }
    return json {
        { "tokens", tokens },
        { "erc20", erc20 }
    };
}
}
