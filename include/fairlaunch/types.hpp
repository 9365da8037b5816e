#ifndef FAIRLAUNCH_TYPES_HPP
#define FAIRLAUNCH_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>

#include "uint256.hpp"

namespace fairlaunch {

// =============================================================================
// Addresses (20-byte owners)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Big-endian id in the last 8 bytes
constexpr Address from_u64(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

// Application accounts carry this tag in the first byte
constexpr uint8_t APPLICATION_TAG = 0xA0;

constexpr Address application(uint64_t actor_id) {
    Address addr = from_u64(actor_id);
    addr[0] = APPLICATION_TAG;
    return addr;
}

std::string to_hex(const Address& addr);
std::optional<Address> from_hex(std::string_view text);

} // namespace addresses

// =============================================================================
// Identifiers
// =============================================================================

using ChainId = uint64_t;
using ActorId = uint64_t;
using LaunchId = uint64_t;
using PoolId = uint64_t;
using Timestamp = uint64_t;  // microseconds since epoch

// Native currency unit (custody works in 128-bit amounts)
using Amount = U128;

// =============================================================================
// Account
// =============================================================================

struct Account {
    ChainId chain_id;
    Address owner;

    Account() : chain_id(0), owner{} {}
    Account(ChainId chain, const Address& addr) : chain_id(chain), owner(addr) {}

    // Custody account holding an actor's pooled funds
    static Account application(ActorId actor) {
        return Account(0, addresses::application(actor));
    }

    // "<chain_id>:0x<40 hex>"
    std::string to_string() const;
    static std::optional<Account> parse(std::string_view text);

    bool operator==(const Account& other) const {
        return chain_id == other.chain_id && owner == other.owner;
    }
    bool operator!=(const Account& other) const { return !(*this == other); }
    bool operator<(const Account& other) const {
        if (chain_id != other.chain_id) return chain_id < other.chain_id;
        return owner < other.owner;
    }
};

// =============================================================================
// Launch Parameters
// =============================================================================

struct TokenMetadata {
    std::string name;
    std::string symbol;
    std::string description;
    std::optional<std::string> image_url;
    std::optional<std::string> twitter;
    std::optional<std::string> telegram;
    std::optional<std::string> website;

    bool operator==(const TokenMetadata& other) const {
        return name == other.name && symbol == other.symbol &&
               description == other.description && image_url == other.image_url &&
               twitter == other.twitter && telegram == other.telegram &&
               website == other.website;
    }
};

struct CurveConfig {
    U256 k;              // Price coefficient
    U256 scale;          // Supply normalizer
    U256 target_raise;   // Informational graduation target
    U256 max_supply;     // Graduation cap
    uint16_t creator_fee_bps;

    static CurveConfig defaults() {
        CurveConfig cfg;
        cfg.k = U256(1000);
        cfg.scale = U256(1000000);
        cfg.target_raise = U256(69000);
        cfg.max_supply = U256(1000000000);
        cfg.creator_fee_bps = 300;
        return cfg;
    }

    bool operator==(const CurveConfig& other) const {
        return k == other.k && scale == other.scale &&
               target_raise == other.target_raise &&
               max_supply == other.max_supply &&
               creator_fee_bps == other.creator_fee_bps;
    }
};

constexpr uint16_t BPS_DENOMINATOR = 10000;

// =============================================================================
// Trades and Positions
// =============================================================================

struct TradeId {
    Timestamp timestamp;
    uint64_t sequence;

    std::string to_string() const {
        return std::to_string(timestamp) + "-" + std::to_string(sequence);
    }

    bool operator==(const TradeId& other) const {
        return timestamp == other.timestamp && sequence == other.sequence;
    }
    bool operator<(const TradeId& other) const {
        if (timestamp != other.timestamp) return timestamp < other.timestamp;
        return sequence < other.sequence;
    }
};

struct Trade {
    TradeId id;
    LaunchId launch_id;
    Account trader;
    bool is_buy;
    U256 token_amount;
    U256 currency_amount;
    U256 fee_amount;
    U256 price_after;
    Timestamp timestamp;
};

struct UserPosition {
    U256 balance;
    U256 total_invested;
    uint64_t trades_count = 0;
};

// =============================================================================
// Launch
// =============================================================================

struct Launch {
    LaunchId id = 0;
    Account creator;
    TokenMetadata metadata;
    CurveConfig curve_config;
    U256 current_supply;
    U256 total_raised;
    bool graduated = false;
    std::optional<PoolId> pool_id;
    Timestamp created_at = 0;
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t INVALID_CURVE_CONFIG = -2;
constexpr int32_t INVALID_METADATA = -3;
constexpr int32_t SLIPPAGE_EXCEEDED = -10;
constexpr int32_t EXCEEDS_MAX_SUPPLY = -11;
constexpr int32_t INSUFFICIENT_BALANCE = -12;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -13;
constexpr int32_t INSUFFICIENT_FUNDS = -14;
constexpr int32_t POOL_LOCKED = -15;
constexpr int32_t AMOUNT_CONVERSION = -20;
constexpr int32_t NOT_INITIALIZED = -30;
constexpr int32_t ALREADY_INITIALIZED = -31;
constexpr int32_t ALREADY_GRADUATED = -32;
constexpr int32_t CURVE_INCOMPLETE = -33;
constexpr int32_t LAUNCH_NOT_FOUND = -40;
constexpr int32_t POOL_NOT_FOUND = -41;
constexpr int32_t ACTOR_NOT_FOUND = -50;
constexpr int32_t MALFORMED_MESSAGE = -51;
constexpr int32_t UNAUTHORIZED = -60;
}

const char* error_name(int32_t code);

} // namespace fairlaunch

#endif // FAIRLAUNCH_TYPES_HPP
