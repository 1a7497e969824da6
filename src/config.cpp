#include "common/config.hpp"
#include "common/utils.hpp"
#include <fstream>

namespace canonical {

// Simple JSON-like parser (no external dependency for core config)
// Supports: {"key": value, "key": "string", "key": true}
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

bool parse_uint256(const std::string& s, Uint256& out) {
    if (s.empty()) return false;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        std::vector<uint8_t> bytes;
        if (!from_hex(s, bytes) || bytes.size() > WORD_BYTES) return false;
        Uint256 value = 0;
        for (uint8_t b : bytes) {
            value <<= 8;
            value |= b;
        }
        out = value;
        return true;
    }
    if (s.size() > 78) return false;   // 2^256 has 78 decimal digits
    Uint512 value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    if ((value >> 256) != 0) return false;
    out = static_cast<Uint256>(value);
    return true;
}

} // anonymous namespace

EngineConfig default_config() {
    EngineConfig config;

    parse_address("0x00000000000000000000000000000000000c0de5", config.domain.verifying_contract);
    parse_address("0x0000000000000000000000000000000000001ed6", config.ledger_address);
    parse_address("0x000000000000000000000000000000000000ad51", config.owner_address);

    return config;
}

EngineConfig load_config(const std::string& path) {
    EngineConfig config = default_config();

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("config %s not found, using defaults", path.c_str());
        return config;
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    // Minimal key-value extraction from JSON
    auto extract_value = [&](const std::string& key) -> std::string {
        std::string search_key = "\"" + key + "\"";
        size_t pos = content.find(search_key);
        if (pos == std::string::npos) return "";
        pos = content.find(':', pos);
        if (pos == std::string::npos) return "";
        pos++;
        while (pos < content.size() && (content[pos] == ' ' || content[pos] == '\t')) pos++;
        if (pos >= content.size()) return "";

        if (content[pos] == '"') {
            size_t end = content.find('"', pos + 1);
            if (end == std::string::npos) return "";
            return content.substr(pos + 1, end - pos - 1);
        }

        size_t end = content.find_first_of(",}\n", pos);
        if (end == std::string::npos) end = content.size();
        return trim(content.substr(pos, end - pos));
    };

    auto try_string = [&](const std::string& key, std::string& target) {
        std::string val = extract_value(key);
        if (!val.empty()) target = val;
    };

    auto try_bool = [&](const std::string& key, bool& target) {
        std::string val = extract_value(key);
        if (val == "true") target = true;
        else if (val == "false") target = false;
        else if (!val.empty()) LOG_WARN("config key %s: expected boolean, got '%s'", key.c_str(), val.c_str());
    };

    auto try_uint32 = [&](const std::string& key, uint32_t& target) {
        std::string val = extract_value(key);
        Uint256 parsed;
        if (val.empty()) return;
        if (parse_uint256(val, parsed) && parsed <= UINT32_MAX) {
            target = static_cast<uint32_t>(parsed);
        } else {
            LOG_WARN("config key %s: invalid value '%s'", key.c_str(), val.c_str());
        }
    };

    auto try_uint256 = [&](const std::string& key, Uint256& target) {
        std::string val = extract_value(key);
        if (val.empty()) return;
        if (!parse_uint256(val, target)) {
            LOG_WARN("config key %s: invalid value '%s'", key.c_str(), val.c_str());
        }
    };

    auto try_address = [&](const std::string& key, Address& target) {
        std::string val = extract_value(key);
        if (val.empty()) return;
        if (!parse_address(val, target)) {
            LOG_WARN("config key %s: invalid address '%s'", key.c_str(), val.c_str());
        }
    };

    // Domain
    try_string("domain_name", config.domain.name);
    try_string("domain_version", config.domain.version);
    try_uint256("chain_id", config.domain.chain_id);
    try_address("verifying_contract", config.domain.verifying_contract);

    // Identities
    try_address("ledger_address", config.ledger_address);
    try_address("owner_address", config.owner_address);
    try_bool("start_operational", config.start_operational);

    // Logging
    try_bool("enable_logging", config.enable_logging);
    {
        std::string val = extract_value("log_level");
        if (!val.empty() && !parse_log_level(val, config.log_level)) {
            LOG_WARN("config key log_level: unknown level '%s'", val.c_str());
        }
    }

    // Demo runner
    try_uint32("demo_orders", config.demo_orders);
    try_uint32("demo_fills_per_order", config.demo_fills_per_order);

    config.config_path = path;
    return config;
}

} // namespace canonical
