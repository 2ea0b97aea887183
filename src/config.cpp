// =============================================================================
// config.cpp - JSON Configuration Loading
// =============================================================================

#include "synx/config.hpp"
#include "synx/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace synx {

using json = nlohmann::json;

namespace {

void read_u64(const json& obj, const char* key, uint64_t& out) {
    auto it = obj.find(key);
    if (it == obj.end()) return;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        throw ConfigError(std::string("protocol.") + key + " must be a non-negative integer");
    }
    out = it->get<uint64_t>();
}

void read_params(const json& obj, ProtocolParams& p) {
    read_u64(obj, "min_collateral_ratio", p.min_collateral_ratio);
    read_u64(obj, "liquidation_threshold", p.liquidation_threshold);
    read_u64(obj, "liquidation_bonus", p.liquidation_bonus);
    read_u64(obj, "liquidation_penalty", p.liquidation_penalty);
    read_u64(obj, "minting_fee_bps", p.minting_fee_bps);
    read_u64(obj, "cooldown_blocks", p.cooldown_blocks);
    read_u64(obj, "oracle_staleness_limit", p.oracle_staleness_limit);
    read_u64(obj, "min_oracle_confidence", p.min_oracle_confidence);
    read_u64(obj, "max_position_percentage", p.max_position_percentage);
    read_u64(obj, "max_basket_assets", p.max_basket_assets);
    read_u64(obj, "min_avg_risk_score", p.min_avg_risk_score);
    read_u64(obj, "initial_credibility", p.initial_credibility);
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("Malformed config: ") + e.what());
    }

    if (!root.is_object()) {
        throw ConfigError("Config root must be an object");
    }

    try {
        if (auto it = root.find("general"); it != root.end()) {
            const json& general = *it;
            if (general.contains("log_level")) {
                config.general.log_level = general.at("log_level").get<std::string>();
            }
            if (general.contains("log_file")) {
                config.general.log_file = general.at("log_file").get<std::string>();
            }
            if (general.contains("audit_events")) {
                config.general.audit_events = general.at("audit_events").get<bool>();
            }
        }

        if (auto it = root.find("protocol"); it != root.end()) {
            const json& protocol = *it;
            if (!protocol.is_object()) {
                throw ConfigError("protocol section must be an object");
            }
            read_params(protocol, config.protocol);
            if (protocol.contains("admin")) {
                config.admin = Identity(protocol.at("admin").get<std::string>());
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid config value: ") + e.what());
    }

    return config;
}

void Config::validate() const {
    const auto& p = protocol;

    if (admin.empty()) {
        throw ConfigError("admin identity is required");
    }
    if (p.min_collateral_ratio <= DIVERSIFICATION_BONUS_BROAD) {
        throw ConfigError("min_collateral_ratio must exceed the diversification bonus of " +
                          std::to_string(DIVERSIFICATION_BONUS_BROAD));
    }
    if (p.liquidation_threshold >= p.min_collateral_ratio) {
        throw ConfigError("liquidation_threshold must be below min_collateral_ratio");
    }
    if (p.oracle_staleness_limit == 0) {
        throw ConfigError("oracle_staleness_limit must be positive");
    }
    if (p.min_oracle_confidence > 100) {
        throw ConfigError("min_oracle_confidence cannot exceed 100");
    }
    if (p.minting_fee_bps > 10000) {
        throw ConfigError("minting_fee_bps cannot exceed 10000");
    }
    if (p.max_basket_assets < 2) {
        throw ConfigError("max_basket_assets must allow at least two assets");
    }
    if (!parse_log_level(general.log_level)) {
        throw ConfigError("unknown log_level: " + general.log_level);
    }
}

std::string Config::to_json() const {
    json out;
    out["general"]["log_level"] = general.log_level;
    if (general.log_file) out["general"]["log_file"] = *general.log_file;
    out["general"]["audit_events"] = general.audit_events;

    json& p = out["protocol"];
    p["admin"] = admin.str();
    p["min_collateral_ratio"] = protocol.min_collateral_ratio;
    p["liquidation_threshold"] = protocol.liquidation_threshold;
    p["liquidation_bonus"] = protocol.liquidation_bonus;
    p["liquidation_penalty"] = protocol.liquidation_penalty;
    p["minting_fee_bps"] = protocol.minting_fee_bps;
    p["cooldown_blocks"] = protocol.cooldown_blocks;
    p["oracle_staleness_limit"] = protocol.oracle_staleness_limit;
    p["min_oracle_confidence"] = protocol.min_oracle_confidence;
    p["max_position_percentage"] = protocol.max_position_percentage;
    p["max_basket_assets"] = protocol.max_basket_assets;
    p["min_avg_risk_score"] = protocol.min_avg_risk_score;
    p["initial_credibility"] = protocol.initial_credibility;

    return out.dump(2);
}

} // namespace synx
