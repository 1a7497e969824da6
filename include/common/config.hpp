#pragma once

#include "common/types.hpp"
#include "common/logger.hpp"
#include <string>

namespace canonical {

/// Typed-hash domain. Changing any field changes every order hash.
struct DomainConfig {
    std::string name = "CanonicalOrders";
    std::string version = "1.1";
    Uint256 chain_id = 1;
    Address verifying_contract{};
};

struct EngineConfig {
    DomainConfig domain;

    // Identities
    Address ledger_address{};   // Trusted caller of the fill and delegated entry points
    Address owner_address{};    // Admin switch owner

    bool start_operational = true;

    // Logging
    bool enable_logging = true;
    LogLevel log_level = LogLevel::Info;

    // Demo runner
    uint32_t demo_orders = 8;
    uint32_t demo_fills_per_order = 4;

    std::string config_path;
};

EngineConfig load_config(const std::string& path);
EngineConfig default_config();

} // namespace canonical
