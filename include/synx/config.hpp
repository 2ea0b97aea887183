#ifndef SYNX_CONFIG_HPP
#define SYNX_CONFIG_HPP

// Builder pattern for fluent configuration

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "types.hpp"

namespace synx {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// =============================================================================
// Protocol Parameters
// =============================================================================

struct ProtocolParams {
    uint64_t min_collateral_ratio = 150;     // percent required to mint
    uint64_t liquidation_threshold = 120;    // percent below which liquidation opens
    uint64_t liquidation_bonus = 10;         // percent paid on top of seized value
    uint64_t liquidation_penalty = 5;        // percent burned from the position
    uint64_t minting_fee_bps = 50;           // 0.5%
    uint64_t cooldown_blocks = 10;
    uint64_t oracle_staleness_limit = 100;   // blocks
    uint64_t min_oracle_confidence = 60;     // percent
    uint64_t max_position_percentage = 10;   // share of global collateral
    uint64_t max_basket_assets = 5;
    uint64_t min_avg_risk_score = 50;
    uint64_t initial_credibility = 100;
};

// General settings
struct GeneralConfig {
    std::string log_level = "info";
    std::optional<std::string> log_file;
    bool audit_events = true;
};

// =============================================================================
// Config
// =============================================================================

class Config {
public:
    GeneralConfig general;
    ProtocolParams protocol;
    Identity admin;

    Config() = default;

    // Load from JSON file
    static Config from_file(std::string_view path);

    // Load from JSON string
    static Config from_json(std::string_view content);

    // Throws ConfigError on inconsistent parameters
    void validate() const;

    std::string to_json() const;

    // Builder methods
    Config& with_admin(Identity id) {
        admin = std::move(id);
        return *this;
    }

    Config& with_params(const ProtocolParams& params) {
        protocol = params;
        return *this;
    }

    Config& set_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& set_log_file(std::string_view path) {
        general.log_file = std::string(path);
        return *this;
    }

    Config& enable_audit_events(bool enabled = true) {
        general.audit_events = enabled;
        return *this;
    }

    Config& set_cooldown_blocks(uint64_t blocks) {
        protocol.cooldown_blocks = blocks;
        return *this;
    }

    Config& set_staleness_limit(uint64_t blocks) {
        protocol.oracle_staleness_limit = blocks;
        return *this;
    }
};

} // namespace synx

#endif // SYNX_CONFIG_HPP
