#include "db/registry_db.hpp"
#include "helpers.hpp"
#include "registry/erc20_registry.hpp"
#include <filesystem>
#include <iostream>
using namespace std;

namespace {
struct TempFile {
    TempFile(std::string name)
        : path((std::filesystem::temp_directory_path() / name).string())
    {
        std::filesystem::remove(path);
    }
    ~TempFile()
    {
        std::filesystem::remove(path);
    }
    std::string path;
};
}

void test_persistence()
{
    TempFile f("curmap_registry_test.db3");
    MockMetadataSource source;
    auto a { address_of_byte(1) };
    auto b { address_of_byte(2) };
    auto c { address_of_byte(3) };
    source.add(a, "Token A", "TKA", 17);
    source.add(b, "Token B", "TKB", 6);
    source.add(c, "Token C", "TKC", 0);
    std::vector<Erc20Info> before;
    {
        RegistryDB db(f.path);
        Erc20Registry registry(source, db);
        assert(registry.register_erc20(a).has_value());
        assert(registry.register_erc20(b).has_value());
        before = registry.entries();
    }
    {
        RegistryDB db(f.path);
        assert(db.load() == before);
        Erc20Registry registry(source, db);
        assert(registry.entries() == before);
        assert(registry.id_of(b) == RESERVED_OFFSET + 1);
        assert(registry.decimals_of(b) == 6);

        // ids continue after reload
        assert(registry.register_erc20(c).has_value());
        assert(registry.id_of(c) == RESERVED_OFFSET + 2);

        // no second row for an already stored contract
        assert(registry.register_erc20(a).has_value());
        assert(registry.size() == 3);
    }
    {
        RegistryDB db(f.path);
        auto rows { db.load() };
        assert(rows.size() == 3);
        assert(rows[2].address == c && rows[2].symbol == "TKC" && rows[2].decimals == 0);
    }
}

void test_corrupted_sequence()
{
    TempFile f("curmap_registry_gap.db3");
    {
        RegistryDB db(f.path);
        db.insert(Erc20Info {
            .address { address_of_byte(1) },
            .id = RESERVED_OFFSET + 1,
            .name { "Token A" },
            .symbol { "TKA" },
            .decimals = 18 });
    }
    RegistryDB db(f.path);
    bool thrown { false };
    try {
        db.load();
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}

void test_failed_insert()
{
    TempFile f("curmap_registry_insert.db3");
    MockMetadataSource source;
    auto a { address_of_byte(1) };
    auto b { address_of_byte(2) };
    source.add(a, "Token A", "TKA", 17);
    RegistryDB db(f.path);
    Erc20Registry registry(source, db);

    // row written behind the registry's back takes the next id
    db.insert(Erc20Info {
        .address { b },
        .id = RESERVED_OFFSET,
        .name { "Token B" },
        .symbol { "TKB" },
        .decimals = 6 });

    bool thrown { false };
    try {
        [[maybe_unused]] auto r { registry.register_erc20(a) };
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
    assert(registry.size() == 0);
    assert(!registry.id_of(a));
    assert(!registry.address_of(RESERVED_OFFSET));

    // the insert statement is usable again
    db.insert(Erc20Info {
        .address { a },
        .id = RESERVED_OFFSET + 1,
        .name { "Token A" },
        .symbol { "TKA" },
        .decimals = 17 });
    assert(db.load().size() == 2);
}

int main()
{
    test_persistence();
    test_corrupted_sequence();
    test_failed_insert();
    cout << "registry database tests passed" << endl;
}
