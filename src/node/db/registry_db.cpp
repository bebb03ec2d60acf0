#include "registry_db.hpp"
#include "db/sqlite.hpp"
#include "spdlog/spdlog.h"

RegistryDB::CreateTables::CreateTables(SQLite::Database& db)
{
    db.exec("CREATE TABLE IF NOT EXISTS `Erc20` ( `id` INTEGER NOT NULL PRIMARY KEY, "
            "`address` BLOB NOT NULL UNIQUE, `name` TEXT NOT NULL, "
            "`symbol` TEXT NOT NULL UNIQUE, `decimals` INTEGER NOT NULL)");
}

RegistryDB::RegistryDB(const std::string& path)
    : db(path, SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE)
    , createTables(db)
    , stmtInsert(db, "INSERT INTO `Erc20` (`id`, `address`, `name`, `symbol`, `decimals`) VALUES (?,?,?,?,?)")
    , stmtSelectAll(db, "SELECT `id`, `address`, `name`, `symbol`, `decimals` FROM `Erc20` ORDER BY `id` ASC")
{
    spdlog::debug("Opened registry database {}", path);
}

std::vector<Erc20Info> RegistryDB::load() const
{
    std::vector<Erc20Info> out;
    stmtSelectAll.for_each([&](const sqlite::Row& r) {
        Erc20Info info {
            .address { r.get<EvmAddress>(1) },
            .id = r.get<uint32_t>(0),
            .name { r.get<std::string>(2) },
            .symbol { r.get<std::string>(3) },
            .decimals = r.get<uint8_t>(4)
        };
        if (info.id != RESERVED_OFFSET + out.size())
            throw std::runtime_error("Database corrupted. Expected ERC20 id "
                + std::to_string(RESERVED_OFFSET + out.size()) + ", found " + std::to_string(info.id) + ".");
        out.push_back(std::move(info));
    });
    return out;
}

void RegistryDB::insert(const Erc20Info& info)
{
    stmtInsert.run(info.id, info.address, info.name, info.symbol, info.decimals);
}
