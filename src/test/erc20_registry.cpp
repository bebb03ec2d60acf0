#include "helpers.hpp"
#include "registry/erc20_registry.hpp"
#include <iostream>
#include <thread>
#include <vector>
using namespace std;

void test_register()
{
    MockMetadataSource source;
    auto a { address_of_byte(1) };
    source.add(a, "Token A", "TKA", 17);
    Erc20Registry registry(source);
    assert(registry.size() == 0);
    assert(!registry.id_of(a));

    assert(registry.register_erc20(a).has_value());
    assert(registry.size() == 1);
    assert(registry.id_of(a) == RESERVED_OFFSET);
    assert(registry.address_of(RESERVED_OFFSET) == a);
    assert(registry.decimals_of(a) == 17);
    auto info { registry.info(a).value() };
    assert(info.name == "Token A" && info.symbol == "TKA" && info.sequence() == 0);
    assert(registry.info(RESERVED_OFFSET) == info);
    assert(!registry.address_of(0));
    assert(!registry.address_of(RESERVED_OFFSET + 1));
}

void test_idempotent()
{
    MockMetadataSource source;
    auto a { address_of_byte(1) };
    source.add(a, "Token A", "TKA", 17);
    Erc20Registry registry(source);
    assert(registry.register_erc20(a).has_value());
    auto before { registry.entries() };
    assert(registry.register_erc20(a).has_value());
    assert(registry.entries() == before);
    assert(source.queries == 1);
}

void test_symbol_collision()
{
    MockMetadataSource source;
    auto a { address_of_byte(1) };
    auto b { address_of_byte(2) };
    source.add(a, "Token A", "TKA", 17);
    source.add(b, "Other token", "TKA", 8);
    Erc20Registry registry(source);
    assert(registry.register_erc20(a).has_value());
    auto r { registry.register_erc20(b) };
    assert(!r.has_value());
    assert(r.error().code == ECURRENCYIDEXISTED);
    assert(registry.size() == 1);
    assert(!registry.id_of(b));
}

void test_invalid_contract()
{
    MockMetadataSource source;
    auto a { address_of_byte(1) };
    auto b { address_of_byte(2) };
    source.add(b, "No symbol", "", 18);
    Erc20Registry registry(source);
    auto r { registry.register_erc20(a) };
    assert(!r.has_value() && r.error().code == EINVALIDERC20);
    r = registry.register_erc20(b);
    assert(!r.has_value() && r.error().code == EINVALIDERC20);
    assert(registry.size() == 0);

    // a failed registration does not consume an id
    source.add(a, "Token A", "TKA", 17);
    assert(registry.register_erc20(a).has_value());
    assert(registry.id_of(a) == RESERVED_OFFSET);
}

void test_sequence()
{
    MockMetadataSource source;
    Erc20Registry registry(source);
    for (uint8_t i = 1; i <= 10; ++i) {
        auto a { address_of_byte(i) };
        source.add(a, "Token", "TK" + std::to_string(i), i);
        assert(registry.register_erc20(a).has_value());
        assert(registry.id_of(a) == RESERVED_OFFSET + i - 1);
    }
    auto entries { registry.entries() };
    assert(entries.size() == 10);
    for (size_t i = 0; i < entries.size(); ++i)
        assert(entries[i].sequence() == i);
}

void test_concurrent_registration()
{
    MockMetadataSource source;
    std::vector<EvmAddress> addresses;
    for (uint8_t i = 1; i <= 40; ++i) {
        addresses.push_back(address_of_byte(i));
        source.add(addresses.back(), "Token", "TK" + std::to_string(i), 18);
    }
    Erc20Registry registry(source);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (auto& a : addresses)
                assert(registry.register_erc20(a).has_value());
        });
    }
    for (auto& t : threads)
        t.join();
    assert(registry.size() == addresses.size());
    std::vector<bool> seen(addresses.size());
    for (auto& a : addresses) {
        auto sequence { registry.id_of(a).value() - RESERVED_OFFSET };
        assert(sequence < seen.size() && !seen[sequence]);
        seen[sequence] = true;
    }
}

namespace {
// reads the registry from inside the metadata query, like contract code
// executed by the EVM during registration would
class ReentrantSource : public MockMetadataSource {
public:
    Result<Erc20Metadata> query(const EvmAddress& a) const override
    {
        assert(registry);
        sizeDuringQuery = registry->size();
        assert(!registry->id_of(a));
        return MockMetadataSource::query(a);
    }
    const Erc20Registry* registry { nullptr };
    mutable size_t sizeDuringQuery { 0 };
};
}

void test_reentrant_source()
{
    ReentrantSource source;
    auto a { address_of_byte(1) };
    auto b { address_of_byte(2) };
    source.add(a, "Token A", "TKA", 17);
    source.add(b, "Token B", "TKB", 6);
    Erc20Registry registry(source);
    source.registry = &registry;
    assert(registry.register_erc20(a).has_value());
    assert(source.sizeDuringQuery == 0);
    assert(registry.register_erc20(b).has_value());
    assert(source.sizeDuringQuery == 1);
    assert(registry.size() == 2);
}

void test_registry_full()
{
    MockMetadataSource source;
    Erc20Registry registry(source, 2);
    for (uint8_t i = 1; i <= 3; ++i)
        source.add(address_of_byte(i), "Token", "TK" + std::to_string(i), 18);
    assert(registry.register_erc20(address_of_byte(1)).has_value());
    assert(registry.register_erc20(address_of_byte(2)).has_value());
    auto r { registry.register_erc20(address_of_byte(3)) };
    assert(!r.has_value() && r.error().code == EREGISTRYFULL);
    assert(registry.size() == 2);
    assert(!registry.id_of(address_of_byte(3)));

    // already registered contracts still succeed
    assert(registry.register_erc20(address_of_byte(1)).has_value());
}

int main()
{
    test_register();
    test_idempotent();
    test_symbol_collision();
    test_invalid_contract();
    test_sequence();
    test_concurrent_registration();
    test_reentrant_source();
    test_registry_full();
    cout << "registry tests passed" << endl;
}
