#include "currency_mapping.hpp"
#include "general/reader.hpp"
#include "general/writer.hpp"
#include "spdlog/spdlog.h"

namespace {
enum SlotKind : uint8_t {
    SINGLE = 0,
    DEXSHARE = 1
};
}

EvmAddress placeholder_address(uint32_t erc20Id)
{
    std::array<uint8_t, EVM_ADDRESS_SIZE> a {};
    a[0] = PLACEHOLDER_MARKER;
    writeuint32(a.data() + EVM_ADDRESS_SIZE - 4, erc20Id - RESERVED_OFFSET);
    return a;
}

std::optional<uint32_t> CurrencyIdMapping::numeric_id(const DexShareLeg& leg) const
{
    return leg.visit_overload(
        [](TokenSymbol s) -> std::optional<uint32_t> { return token_id(s); },
        [&](const EvmAddress& a) { return registry.id_of(a); });
}

std::optional<uint32_t> CurrencyIdMapping::numeric_id(const CurrencyId& c) const
{
    return c.visit_overload(
        [](TokenSymbol s) -> std::optional<uint32_t> { return token_id(s); },
        [&](const EvmAddress& a) { return registry.id_of(a); },
        [](const DexShare&) -> std::optional<uint32_t> { return {}; });
}

std::optional<CurrencySlot> CurrencyIdMapping::encode_currency_id(const CurrencyId& c) const
{
    CurrencySlot slot {};
    Writer w(slot);
    w.zeros(SLOT_DISCRIMINANT);
    bool encoded { c.visit_overload(
        [&](TokenSymbol s) {
            w << uint8_t(SINGLE) << token_id(s);
            return true;
        },
        [&](const EvmAddress& a) {
            w << uint8_t(SINGLE) << static_cast<const std::array<uint8_t, EVM_ADDRESS_SIZE>&>(a);
            return true;
        },
        [&](const DexShare& d) {
            auto left { numeric_id(d.left) };
            auto right { numeric_id(d.right) };
            if (!left || !right)
                return false;
            w << uint8_t(DEXSHARE) << *left << *right;
            return true;
        }) };
    if (!encoded)
        return {};
    return slot;
}

std::optional<DexShareLeg> CurrencyIdMapping::decode_leg(uint32_t id) const
{
    if (id >= RESERVED_OFFSET)
        return placeholder_address(id);
    if (auto s { token_from_id(id) })
        return *s;
    return {};
}

std::optional<CurrencyId> CurrencyIdMapping::decode_currency_id(const CurrencySlot& slot) const
{
    Reader r(slot);
    if (!r.peek_zero(SLOT_DISCRIMINANT)) {
        spdlog::debug("Cannot decode slot, reserved bytes are not zero");
        return {};
    }
    r.skip(SLOT_DISCRIMINANT);
    switch (r.uint8()) {
    case SINGLE: {
        // zero tail: compressed token id, ids >= RESERVED_OFFSET stay addresses
        auto id { r.uint32() };
        if (id < RESERVED_OFFSET && r.peek_zero(r.remaining())) {
            if (auto s { token_from_id(id) })
                return CurrencyId(*s);
            spdlog::debug("Cannot decode slot, unknown token id {}", id);
            return {};
        }
        std::array<uint8_t, EVM_ADDRESS_SIZE> a;
        std::copy(slot.begin() + SLOT_PAYLOAD, slot.end(), a.begin());
        return CurrencyId(EvmAddress(a));
    }
    case DEXSHARE: {
        auto left { decode_leg(r.uint32()) };
        auto right { decode_leg(r.uint32()) };
        if (!left || !right) {
            spdlog::debug("Cannot decode dex share slot, unknown token id");
            return {};
        }
        if (!r.peek_zero(r.remaining())) {
            spdlog::debug("Cannot decode dex share slot, trailing bytes are not zero");
            return {};
        }
        return CurrencyId(DexShare { std::move(*left), std::move(*right) });
    }
    default:
        return {};
    }
}

std::optional<CurrencyId> CurrencyIdMapping::decode_currency_id(std::span<const uint8_t> s) const
{
    if (s.size() != SLOT_SIZE)
        return {};
    CurrencySlot slot;
    std::copy(s.begin(), s.end(), slot.begin());
    return decode_currency_id(slot);
}

std::optional<EvmAddress> CurrencyIdMapping::get_evm_address(const CurrencyId& c) const
{
    if (auto a { c.get_if<EvmAddress>() }; a && registry.id_of(*a))
        return *a;
    return {};
}

std::optional<EvmAddress> CurrencyIdMapping::get_evm_address(uint32_t currencyId) const
{
    return registry.address_of(currencyId);
}

std::optional<uint8_t> CurrencyIdMapping::decimals(const CurrencyId& c) const
{
    return c.visit_overload(
        [](TokenSymbol s) -> std::optional<uint8_t> { return token_decimals(s); },
        [&](const EvmAddress& a) { return registry.decimals_of(a); },
        [](const DexShare&) -> std::optional<uint8_t> { return {}; });
}

std::optional<std::string> CurrencyIdMapping::leg_name(const DexShareLeg& leg) const
{
    return leg.visit_overload(
        [](TokenSymbol s) -> std::optional<std::string> { return std::string(token_name(s)); },
        [&](const EvmAddress& a) -> std::optional<std::string> {
            if (auto i { registry.info(a) })
                return std::move(i->name);
            return {};
        });
}

std::optional<std::string> CurrencyIdMapping::leg_symbol(const DexShareLeg& leg) const
{
    return leg.visit_overload(
        [](TokenSymbol s) -> std::optional<std::string> { return std::string(token_symbol_str(s)); },
        [&](const EvmAddress& a) -> std::optional<std::string> {
            if (auto i { registry.info(a) })
                return std::move(i->symbol);
            return {};
        });
}

std::optional<std::string> CurrencyIdMapping::name(const CurrencyId& c) const
{
    return c.visit_overload(
        [&](TokenSymbol s) { return leg_name(s); },
        [&](const EvmAddress& a) { return leg_name(a); },
        [&](const DexShare& d) -> std::optional<std::string> {
            auto left { leg_name(d.left) };
            auto right { leg_name(d.right) };
            if (!left || !right)
                return {};
            return "LP " + *left + " - " + *right;
        });
}

std::optional<std::string> CurrencyIdMapping::symbol(const CurrencyId& c) const
{
    return c.visit_overload(
        [&](TokenSymbol s) { return leg_symbol(s); },
        [&](const EvmAddress& a) { return leg_symbol(a); },
        [&](const DexShare& d) -> std::optional<std::string> {
            auto left { leg_symbol(d.left) };
            auto right { leg_symbol(d.right) };
            if (!left || !right)
                return {};
            return "LP_" + *left + "_" + *right;
        });
}
