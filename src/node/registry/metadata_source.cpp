#include "metadata_source.hpp"

StaticMetadataSource::StaticMetadataSource(const std::vector<Erc20Declaration>& declarations)
{
    for (auto& d : declarations)
        add(d);
}

void StaticMetadataSource::add(Erc20Declaration d)
{
    contracts.insert_or_assign(d.address, std::move(d.metadata));
}

Result<Erc20Metadata> StaticMetadataSource::query(const EvmAddress& address) const
{
    auto iter { contracts.find(address) };
    if (iter == contracts.end())
        return Error(EINVALIDERC20);
    return iter->second;
}
