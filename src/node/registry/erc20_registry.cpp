#include "erc20_registry.hpp"
#include "db/registry_db.hpp"
#include "general/logging.hpp"
#include <algorithm>

Erc20Registry::Erc20Registry(const Erc20MetadataSource& source)
    : source(source)
{
}

Erc20Registry::Erc20Registry(const Erc20MetadataSource& source, size_t capacity)
    : source(source)
    , capacity(std::min(capacity, MAX_ERC20_ENTRIES))
{
}

Erc20Registry::Erc20Registry(const Erc20MetadataSource& source, RegistryDB& db)
    : source(source)
    , db(&db)
{
    for (auto& info : db.load())
        insert_cached(std::move(info));
    spdlog::info("Loaded {} ERC20 registry entries", rows.size());
}

void Erc20Registry::insert_cached(Erc20Info info)
{
    auto index { rows.size() };
    if (!byAddress.emplace(info.address, index).second
        || !bySymbol.emplace(info.symbol, index).second)
        throw std::runtime_error("Registry inconsistent, duplicate entry for " + info.address.to_string() + ".");
    rows.push_back(std::move(info));
}

Result<void> Erc20Registry::register_erc20(const EvmAddress& address)
{
    {
        std::lock_guard l(m);
        if (byAddress.contains(address))
            return {};
    }

    // the source may call back into the registry, query without holding the lock
    auto metadata { source.query(address) };
    if (!metadata) {
        spdlog::warn("Cannot register {}: {}", address.to_string(), metadata.error().format());
        return Error(EINVALIDERC20);
    }
    if (metadata->symbol.empty()) {
        spdlog::warn("Cannot register {}: empty symbol", address.to_string());
        return Error(EINVALIDERC20);
    }

    std::lock_guard l(m);
    if (byAddress.contains(address))
        return {}; // registered concurrently

    if (auto iter { bySymbol.find(metadata->symbol) }; iter != bySymbol.end()) {
        spdlog::warn("Cannot register {}: symbol {} already used by {}",
            address.to_string(), metadata->symbol, rows[iter->second].address.to_string());
        return Error(ECURRENCYIDEXISTED);
    }

    if (rows.size() >= capacity)
        return Error(EREGISTRYFULL);

    Erc20Info info {
        .address { address },
        .id = RESERVED_OFFSET + uint32_t(rows.size()),
        .name { std::move(metadata->name) },
        .symbol { std::move(metadata->symbol) },
        .decimals = metadata->decimals
    };
    if (db)
        db->insert(info);
    log_registry("Registered ERC20 {} ({}) as currency id {:#x}, {} decimals",
        info.address.to_string(), info.symbol, info.id, info.decimals);
    insert_cached(std::move(info));
    return {};
}

const Erc20Info* Erc20Registry::lookup(const EvmAddress& address) const
{
    auto iter { byAddress.find(address) };
    if (iter == byAddress.end())
        return nullptr;
    return &rows[iter->second];
}

const Erc20Info* Erc20Registry::lookup(uint32_t id) const
{
    if (id < RESERVED_OFFSET)
        return nullptr;
    size_t sequence { id - RESERVED_OFFSET };
    if (sequence >= rows.size())
        return nullptr;
    return &rows[sequence];
}

std::optional<EvmAddress> Erc20Registry::address_of(uint32_t id) const
{
    std::lock_guard l(m);
    if (auto p { lookup(id) })
        return p->address;
    return {};
}

std::optional<uint32_t> Erc20Registry::id_of(const EvmAddress& address) const
{
    std::lock_guard l(m);
    if (auto p { lookup(address) })
        return p->id;
    return {};
}

std::optional<uint8_t> Erc20Registry::decimals_of(const EvmAddress& address) const
{
    std::lock_guard l(m);
    if (auto p { lookup(address) })
        return p->decimals;
    return {};
}

std::optional<Erc20Info> Erc20Registry::info(const EvmAddress& address) const
{
    std::lock_guard l(m);
    if (auto p { lookup(address) })
        return *p;
    return {};
}

std::optional<Erc20Info> Erc20Registry::info(uint32_t id) const
{
    std::lock_guard l(m);
    if (auto p { lookup(id) })
        return *p;
    return {};
}

std::vector<Erc20Info> Erc20Registry::entries() const
{
    std::lock_guard l(m);
    return rows;
}

size_t Erc20Registry::size() const
{
    std::lock_guard l(m);
    return rows.size();
}
