#pragma once
#include "crypto/evm_address.hpp"
#include "general/result.hpp"
#include <map>
#include <string>
#include <vector>

// Metadata reported by an ERC20 contract. The symbol is the identity
// label, no two registered contracts may share it.
struct Erc20Metadata {
    std::string name;
    std::string symbol;
    uint8_t decimals;
};

struct Erc20Declaration {
    EvmAddress address;
    Erc20Metadata metadata;
};

// Reads name, symbol and decimals of a deployed contract. Implemented by
// the host execution environment.
class Erc20MetadataSource {
public:
    virtual ~Erc20MetadataSource() = default;
    [[nodiscard]] virtual Result<Erc20Metadata> query(const EvmAddress&) const = 0;
};

// Serves metadata of a fixed set of contracts, for hosts that declare
// their contracts in the configuration file.
class StaticMetadataSource : public Erc20MetadataSource {
public:
    StaticMetadataSource() = default;
    StaticMetadataSource(const std::vector<Erc20Declaration>&);
    void add(Erc20Declaration);
    [[nodiscard]] Result<Erc20Metadata> query(const EvmAddress&) const override;

private:
    std::map<EvmAddress, Erc20Metadata> contracts;
};
