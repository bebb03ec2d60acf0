#pragma once
#include "currency/currency_id.hpp"
#include "erc20_registry.hpp"
#include <array>
#include <optional>
#include <span>
#include <string>

using CurrencySlot = std::array<uint8_t, SLOT_SIZE>;

// Address reconstructed from the registry id of an ERC20 dex share leg:
// PLACEHOLDER_MARKER, 15 zero bytes, big endian (id - RESERVED_OFFSET).
// It is stable per id but not the deployed contract address. The first
// registered contract has sequence 0 and therefore yields 0x2000..0000,
// not 0x2000..0001 as registries counting from 1 would produce.
[[nodiscard]] EvmAddress placeholder_address(uint32_t erc20Id);

// Converts currency identities to and from the 32 byte slot and the
// 20 byte address representations used inside the EVM.
//
// Slot layout:
//   bytes 0-10   zero
//   byte  11     0 = single currency, 1 = dex share
//   bytes 12-31  single currency: token id (u32, rest zero) or ERC20 address
//                dex share: left id (u32), right id (u32), rest zero
// Slots that deviate from this layout do not decode.
class CurrencyIdMapping {
public:
    explicit CurrencyIdMapping(const Erc20Registry& registry)
        : registry(registry)
    {
    }

    // Empty if a dex share leg references an unregistered contract.
    [[nodiscard]] std::optional<CurrencySlot> encode_currency_id(const CurrencyId&) const;

    // Empty for malformed slots: non-zero reserved bytes, discriminant
    // other than 0 or 1, non-zero bytes after the dex share legs, or a
    // token id that is not in the native token table. Single currency
    // slots whose bytes 16-31 are zero are read as token ids, so an ERC20
    // address ending in 16 zero bytes cannot be represented.
    [[nodiscard]] std::optional<CurrencyId> decode_currency_id(const CurrencySlot&) const;
    [[nodiscard]] std::optional<CurrencyId> decode_currency_id(std::span<const uint8_t>) const;

    [[nodiscard]] std::optional<EvmAddress> get_evm_address(const CurrencyId&) const;
    [[nodiscard]] std::optional<EvmAddress> get_evm_address(uint32_t currencyId) const;

    [[nodiscard]] std::optional<uint8_t> decimals(const CurrencyId&) const;
    [[nodiscard]] std::optional<std::string> name(const CurrencyId&) const;
    [[nodiscard]] std::optional<std::string> symbol(const CurrencyId&) const;

    [[nodiscard]] std::optional<uint32_t> numeric_id(const DexShareLeg&) const;
    [[nodiscard]] std::optional<uint32_t> numeric_id(const CurrencyId&) const;

private:
    std::optional<DexShareLeg> decode_leg(uint32_t id) const;
    std::optional<std::string> leg_name(const DexShareLeg&) const;
    std::optional<std::string> leg_symbol(const DexShareLeg&) const;

    const Erc20Registry& registry;
};
