#include "api/json.hpp"
#include "db/registry_db.hpp"
#include "general/logging.hpp"
#include "global/globals.hpp"
#include "registry/currency_mapping.hpp"
#include "registry/erc20_registry.hpp"
#include "registry/metadata_source.hpp"
#include "spdlog/spdlog.h"
#include <iostream>
#include <memory>

int main(int argc, char** argv)
{
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config.toml>" << std::endl;
        return 1;
    }
    init_logging();
    try {
        set_config(Config::from_file(argv[1]));
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    apply_log_level();

    try {
        StaticMetadataSource source(config().erc20);
        std::unique_ptr<RegistryDB> db;
        std::unique_ptr<Erc20Registry> registry;
        if (config().data.registrydb.empty()) {
            spdlog::info("Using in-memory ERC20 registry");
            registry = std::make_unique<Erc20Registry>(source);
        } else {
            db = std::make_unique<RegistryDB>(config().data.registrydb);
            registry = std::make_unique<Erc20Registry>(source, *db);
        }

        size_t failed { 0 };
        for (auto& d : config().erc20) {
            if (auto r { registry->register_erc20(d.address) }; !r) {
                spdlog::error("Registration of {} ({}) failed: {}",
                    d.address.to_string(), d.metadata.symbol, r.error().format());
                failed += 1;
            }
        }
        spdlog::info("{} ERC20 contracts registered, {} failed", registry->size(), failed);

        CurrencyIdMapping mapping(*registry);
        std::cout << jsonmsg::to_json(*registry, mapping).dump(1) << std::endl;
        return failed == 0 ? 0 : 2;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}
