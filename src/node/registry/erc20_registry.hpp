#pragma once
#include "erc20_info.hpp"
#include "general/result.hpp"
#include "metadata_source.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <vector>

class RegistryDB;

// Append-only mapping between ERC20 contract addresses and the numeric
// currency ids assigned to them. Entries are never modified or removed,
// ids are never reused.
class Erc20Registry {
public:
    explicit Erc20Registry(const Erc20MetadataSource& source);

    // in memory registry accepting at most capacity entries
    Erc20Registry(const Erc20MetadataSource& source, size_t capacity);

    // loads existing entries from db and persists every new registration
    Erc20Registry(const Erc20MetadataSource& source, RegistryDB& db);
    Erc20Registry(const Erc20Registry&) = delete;
    Erc20Registry& operator=(const Erc20Registry&) = delete;

    // Idempotent for already registered addresses. Fails with
    // EINVALIDERC20 when the metadata cannot be queried, with
    // ECURRENCYIDEXISTED when another contract already uses the symbol and
    // with EREGISTRYFULL when no id is left. The metadata query runs
    // without the lock held, the uniqueness checks and the commit run
    // under it. Exceptions thrown by the database leave the registry
    // unchanged.
    [[nodiscard]] Result<void> register_erc20(const EvmAddress& address);

    [[nodiscard]] std::optional<EvmAddress> address_of(uint32_t id) const;
    [[nodiscard]] std::optional<uint32_t> id_of(const EvmAddress&) const;
    [[nodiscard]] std::optional<uint8_t> decimals_of(const EvmAddress&) const;
    [[nodiscard]] std::optional<Erc20Info> info(const EvmAddress&) const;
    [[nodiscard]] std::optional<Erc20Info> info(uint32_t id) const;
    std::vector<Erc20Info> entries() const;
    size_t size() const;

private:
    const Erc20Info* lookup(const EvmAddress&) const;
    const Erc20Info* lookup(uint32_t id) const;
    void insert_cached(Erc20Info);

private:
    mutable std::mutex m;
    const Erc20MetadataSource& source;
    RegistryDB* db { nullptr };
    size_t capacity { MAX_ERC20_ENTRIES };
    std::vector<Erc20Info> rows; // index is the registration sequence
    std::map<EvmAddress, size_t> byAddress;
    std::map<std::string, size_t, std::less<>> bySymbol;
};
