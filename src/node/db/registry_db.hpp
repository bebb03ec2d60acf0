#pragma once

#include "SQLiteCpp/SQLiteCpp.h"
#include "db/sqlite_fwd.hpp"
#include "registry/erc20_info.hpp"
#include <string>
#include <vector>

// SQLite persistence of the ERC20 registry table.
class RegistryDB {
public:
    RegistryDB(const std::string& path);

    // rows in id order, verifies that ids are contiguous from RESERVED_OFFSET
    std::vector<Erc20Info> load() const;
    void insert(const Erc20Info&);

private:
    struct CreateTables {
        CreateTables(SQLite::Database&);
    };

private:
    SQLite::Database db;
    CreateTables createTables;
    mutable sqlite::Statement stmtInsert;
    mutable sqlite::Statement stmtSelectAll;
};
