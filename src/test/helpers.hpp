#pragma once
#include "registry/metadata_source.hpp"
#include <atomic>
#include <cassert>
#include <map>
#include <string>

inline EvmAddress address_of_byte(uint8_t b)
{
    std::array<uint8_t, EVM_ADDRESS_SIZE> a;
    a.fill(b);
    return a;
}

// metadata source with counters, contracts missing from the map fail to query
class MockMetadataSource : public Erc20MetadataSource {
public:
    void add(const EvmAddress& a, std::string name, std::string symbol, uint8_t decimals)
    {
        contracts.insert_or_assign(a, Erc20Metadata { std::move(name), std::move(symbol), decimals });
    }
    Result<Erc20Metadata> query(const EvmAddress& a) const override
    {
        queries += 1;
        auto iter { contracts.find(a) };
        if (iter == contracts.end())
            return Error(ENOTFOUND);
        return iter->second;
    }
    mutable std::atomic<size_t> queries { 0 };

private:
    std::map<EvmAddress, Erc20Metadata> contracts;
};
