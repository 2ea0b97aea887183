#ifndef SYNX_TYPES_HPP
#define SYNX_TYPES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace synx {

// =============================================================================
// Fixed-Point Scalars
// =============================================================================

using Amount = unsigned __int128;   // token units, debt units, 8-decimal prices
using BlockHeight = uint64_t;       // logical clock

constexpr Amount PRICE_ONE = 100000000;        // 1.0 at 8 decimals
constexpr Amount PERCENT = 100;                // 100 = 100%
constexpr Amount BPS_DENOMINATOR = 10000;
constexpr Amount RATIO_SCALE = 1000000;        // PRICE_ONE / PERCENT

constexpr uint64_t HEALTH_SENTINEL = 999999;   // legacy "no debt" encoding

// Percentage points taken off the minimum ratio for basket positions
constexpr uint64_t DIVERSIFICATION_BONUS_BROAD = 10;    // more than two assets
constexpr uint64_t DIVERSIFICATION_BONUS_NARROW = 5;

// =============================================================================
// Identity (Principal)
// =============================================================================

struct Identity {
    std::string principal;

    Identity() = default;
    Identity(std::string p) : principal(std::move(p)) {}
    Identity(const char* p) : principal(p) {}

    bool empty() const { return principal.empty(); }
    const std::string& str() const { return principal; }

    bool operator==(const Identity& other) const { return principal == other.principal; }
    bool operator!=(const Identity& other) const { return principal != other.principal; }
    bool operator<(const Identity& other) const { return principal < other.principal; }
};

struct IdentityHash {
    size_t operator()(const Identity& id) const noexcept {
        return std::hash<std::string>{}(id.principal);
    }
};

// =============================================================================
// Error Kinds
// =============================================================================

enum class Errc : uint8_t {
    NotAuthorized = 0,
    InsufficientCollateral = 1,
    InvalidAmount = 2,
    PositionNotFound = 3,
    StalePrice = 4,
    LiquidationNotAllowed = 5,
    ContractPaused = 6,
    OracleNotRegistered = 7,
    ExceedsMaxPosition = 8,
    ArithmeticError = 9,
    TransferFailed = 10
};

inline constexpr const char* to_string(Errc e) noexcept {
    switch (e) {
        case Errc::NotAuthorized: return "not-authorized";
        case Errc::InsufficientCollateral: return "insufficient-collateral";
        case Errc::InvalidAmount: return "invalid-amount";
        case Errc::PositionNotFound: return "position-not-found";
        case Errc::StalePrice: return "stale-price";
        case Errc::LiquidationNotAllowed: return "liquidation-not-allowed";
        case Errc::ContractPaused: return "contract-paused";
        case Errc::OracleNotRegistered: return "oracle-not-registered";
        case Errc::ExceedsMaxPosition: return "exceeds-max-position";
        case Errc::ArithmeticError: return "arithmetic-error";
        case Errc::TransferFailed: return "transfer-failed";
    }
    return "unknown";
}

// Stable integer codes for embedding hosts
namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t NOT_AUTHORIZED = -40;
constexpr int32_t INSUFFICIENT_COLLATERAL = -11;
constexpr int32_t INVALID_AMOUNT = -10;
constexpr int32_t POSITION_NOT_FOUND = -12;
constexpr int32_t STALE_PRICE = -20;
constexpr int32_t LIQUIDATION_NOT_ALLOWED = -15;
constexpr int32_t CONTRACT_PAUSED = -41;
constexpr int32_t ORACLE_NOT_REGISTERED = -21;
constexpr int32_t EXCEEDS_MAX_POSITION = -16;
constexpr int32_t ARITHMETIC_ERROR = -30;
constexpr int32_t TRANSFER_FAILED = -31;
}

inline constexpr int32_t error_code(Errc e) noexcept {
    switch (e) {
        case Errc::NotAuthorized: return errors::NOT_AUTHORIZED;
        case Errc::InsufficientCollateral: return errors::INSUFFICIENT_COLLATERAL;
        case Errc::InvalidAmount: return errors::INVALID_AMOUNT;
        case Errc::PositionNotFound: return errors::POSITION_NOT_FOUND;
        case Errc::StalePrice: return errors::STALE_PRICE;
        case Errc::LiquidationNotAllowed: return errors::LIQUIDATION_NOT_ALLOWED;
        case Errc::ContractPaused: return errors::CONTRACT_PAUSED;
        case Errc::OracleNotRegistered: return errors::ORACLE_NOT_REGISTERED;
        case Errc::ExceedsMaxPosition: return errors::EXCEEDS_MAX_POSITION;
        case Errc::ArithmeticError: return errors::ARITHMETIC_ERROR;
        case Errc::TransferFailed: return errors::TRANSFER_FAILED;
    }
    return errors::INVALID_AMOUNT;
}

// Protocol rule violation. Thrown before any state is touched.
class SXError : public std::runtime_error {
public:
    SXError(Errc code, const std::string& msg)
        : std::runtime_error(std::string(to_string(code)) + ": " + msg), code_(code) {}
    explicit SXError(Errc code)
        : std::runtime_error(to_string(code)), code_(code) {}

    Errc code() const noexcept { return code_; }

private:
    Errc code_;
};

// =============================================================================
// Health (Ratio | Unbounded)
// =============================================================================

class Health {
public:
    static Health unbounded() { return Health(Unbounded{}); }
    static Health ratio(Amount pct) { return Health(pct); }

    bool is_unbounded() const noexcept { return std::holds_alternative<Unbounded>(value_); }

    std::optional<Amount> value() const noexcept {
        if (is_unbounded()) return std::nullopt;
        return std::get<Amount>(value_);
    }

    // Unbounded health is never below any threshold
    bool below(Amount threshold) const noexcept {
        return !is_unbounded() && std::get<Amount>(value_) < threshold;
    }

    bool at_least(Amount threshold) const noexcept { return !below(threshold); }

    // Legacy encoding for export only; never compare against thresholds.
    Amount encoded() const noexcept {
        return is_unbounded() ? Amount(HEALTH_SENTINEL) : std::get<Amount>(value_);
    }

    bool operator==(const Health& other) const { return value_ == other.value_; }
    bool operator!=(const Health& other) const { return value_ != other.value_; }

private:
    struct Unbounded {
        bool operator==(const Unbounded&) const { return true; }
    };

    explicit Health(Unbounded u) : value_(u) {}
    explicit Health(Amount pct) : value_(pct) {}

    std::variant<Unbounded, Amount> value_;
};

// =============================================================================
// Position
// =============================================================================

struct Position {
    Amount collateral_deposited = 0;
    Amount synthetic_minted = 0;
    BlockHeight last_interaction_block = 0;
    Health position_health = Health::unbounded();
    bool liquidation_protected = false;

    bool operator==(const Position& other) const {
        return collateral_deposited == other.collateral_deposited &&
               synthetic_minted == other.synthetic_minted &&
               last_interaction_block == other.last_interaction_block &&
               position_health == other.position_health &&
               liquidation_protected == other.liquidation_protected;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

// =============================================================================
// Oracle & Price Submission
// =============================================================================

struct Oracle {
    bool is_active = true;
    uint64_t total_submissions = 0;
    uint64_t credibility_score = 100;
};

struct PriceSubmission {
    Identity oracle;
    Amount price = 0;          // 8-decimal fixed point
    uint8_t confidence = 0;    // percent
    BlockHeight timestamp = 0;
};

// =============================================================================
// Liquidation Record
// =============================================================================

struct LiquidationRecord {
    Identity liquidated;
    Identity liquidator;
    Amount collateral_seized = 0;
    Amount debt_covered = 0;
    Amount reward = 0;
    BlockHeight block_height = 0;
};

// =============================================================================
// Global State
// =============================================================================

struct GlobalState {
    Amount total_collateral = 0;
    Amount total_synthetic_supply = 0;
    Amount current_price = 0;
    BlockHeight last_price_update = 0;
    bool paused = false;
    uint64_t submission_nonce = 0;
    uint64_t liquidation_nonce = 0;

    bool operator==(const GlobalState& other) const {
        return total_collateral == other.total_collateral &&
               total_synthetic_supply == other.total_synthetic_supply &&
               current_price == other.current_price &&
               last_price_update == other.last_price_update &&
               paused == other.paused &&
               submission_nonce == other.submission_nonce &&
               liquidation_nonce == other.liquidation_nonce;
    }
    bool operator!=(const GlobalState& other) const { return !(*this == other); }
};

} // namespace synx

#endif // SYNX_TYPES_HPP
