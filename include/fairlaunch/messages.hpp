#ifndef FAIRLAUNCH_MESSAGES_HPP
#define FAIRLAUNCH_MESSAGES_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace fairlaunch {

// =============================================================================
// Inter-Actor Messages
// =============================================================================

// Registry -> Ledger
struct TokenCreated {
    LaunchId launch_id;
    Account creator;
    TokenMetadata metadata;
    CurveConfig curve_config;
};

// Ledger -> Registry (informational)
struct TradeExecuted {
    LaunchId launch_id;
    Account trader;
    bool is_buy;
    U256 token_amount;
    U256 currency_amount;
    U256 new_price;
    U256 current_supply;
    U256 total_raised;
};

// Ledger -> Pool
struct GraduateToken {
    LaunchId launch_id;
    U256 total_supply;
    U256 total_raised;
};

// Pool -> Ledger, Registry
struct PoolCreated {
    LaunchId launch_id;
    PoolId pool_id;
};

// Registry -> subscribers
struct NewLaunch {
    LaunchId launch_id;
    TokenMetadata metadata;
    Account creator;
};

using Message = std::variant<TokenCreated, TradeExecuted, GraduateToken, PoolCreated, NewLaunch>;

const char* message_type(const Message& msg);

// =============================================================================
// Wire Codec
//
// {"type": "<MessageName>", ...fields}. U256 values travel as decimal strings,
// accounts as "<chain_id>:0x<40 hex>".
// =============================================================================

namespace wire {

nlohmann::json to_json(const Message& msg);
std::optional<Message> from_json(const nlohmann::json& j);

// Throws nlohmann::json::type_error if a string is not valid UTF-8
std::string encode(const Message& msg);

// Empty on invalid JSON, unknown type, or missing/mistyped fields
std::optional<Message> decode(std::string_view payload);

nlohmann::json metadata_to_json(const TokenMetadata& metadata);
std::optional<TokenMetadata> metadata_from_json(const nlohmann::json& j);

nlohmann::json curve_to_json(const CurveConfig& config);
std::optional<CurveConfig> curve_from_json(const nlohmann::json& j);

} // namespace wire

} // namespace fairlaunch

#endif // FAIRLAUNCH_MESSAGES_HPP
