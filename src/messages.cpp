// =============================================================================
// messages.cpp - Message wire codec (nlohmann/json)
// =============================================================================

#include "fairlaunch/messages.hpp"

#include <nlohmann/json.hpp>

namespace fairlaunch {

using json = nlohmann::json;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// -----------------------------------------------------------------------------
// Field readers: empty result on missing or mistyped fields
// -----------------------------------------------------------------------------

std::optional<U256> get_u256(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return U256::from_string(it->get_ref<const std::string&>());
}

std::optional<uint64_t> get_u64(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned()) return std::nullopt;
    return it->get<uint64_t>();
}

std::optional<bool> get_bool(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) return std::nullopt;
    return it->get<bool>();
}

std::optional<std::string> get_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<Account> get_account(const json& j, const char* key) {
    auto text = get_string(j, key);
    if (!text) return std::nullopt;
    return Account::parse(*text);
}

// Optional field: absent or null -> nullopt; false when mistyped
bool get_optional_string(const json& j, const char* key, std::optional<std::string>& out) {
    out.reset();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

void put_optional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) j[key] = *value;
}

} // anonymous namespace

const char* message_type(const Message& msg) {
    return std::visit(overloaded{
        [](const TokenCreated&) { return "TokenCreated"; },
        [](const TradeExecuted&) { return "TradeExecuted"; },
        [](const GraduateToken&) { return "GraduateToken"; },
        [](const PoolCreated&) { return "PoolCreated"; },
        [](const NewLaunch&) { return "NewLaunch"; },
    }, msg);
}

namespace wire {

// =============================================================================
// Shared Payloads
// =============================================================================

json metadata_to_json(const TokenMetadata& metadata) {
    json j;
    j["name"] = metadata.name;
    j["symbol"] = metadata.symbol;
    j["description"] = metadata.description;
    put_optional(j, "image_url", metadata.image_url);
    put_optional(j, "twitter", metadata.twitter);
    put_optional(j, "telegram", metadata.telegram);
    put_optional(j, "website", metadata.website);
    return j;
}

std::optional<TokenMetadata> metadata_from_json(const json& j) {
    if (!j.is_object()) return std::nullopt;

    auto name = get_string(j, "name");
    auto symbol = get_string(j, "symbol");
    auto description = get_string(j, "description");
    if (!name || !symbol || !description) return std::nullopt;

    TokenMetadata metadata;
    metadata.name = *name;
    metadata.symbol = *symbol;
    metadata.description = *description;
    if (!get_optional_string(j, "image_url", metadata.image_url) ||
        !get_optional_string(j, "twitter", metadata.twitter) ||
        !get_optional_string(j, "telegram", metadata.telegram) ||
        !get_optional_string(j, "website", metadata.website)) {
        return std::nullopt;
    }
    return metadata;
}

json curve_to_json(const CurveConfig& config) {
    json j;
    j["k"] = config.k.to_string();
    j["scale"] = config.scale.to_string();
    j["target_raise"] = config.target_raise.to_string();
    j["max_supply"] = config.max_supply.to_string();
    j["creator_fee_bps"] = config.creator_fee_bps;
    return j;
}

std::optional<CurveConfig> curve_from_json(const json& j) {
    if (!j.is_object()) return std::nullopt;

    auto k = get_u256(j, "k");
    auto scale = get_u256(j, "scale");
    auto target = get_u256(j, "target_raise");
    auto max_supply = get_u256(j, "max_supply");
    auto fee = get_u64(j, "creator_fee_bps");
    if (!k || !scale || !target || !max_supply || !fee) return std::nullopt;
    if (*fee > 0xFFFF) return std::nullopt;

    CurveConfig config;
    config.k = *k;
    config.scale = *scale;
    config.target_raise = *target;
    config.max_supply = *max_supply;
    config.creator_fee_bps = static_cast<uint16_t>(*fee);
    return config;
}

// =============================================================================
// Messages
// =============================================================================

json to_json(const Message& msg) {
    json j = std::visit(overloaded{
        [](const TokenCreated& m) {
            json o;
            o["launch_id"] = m.launch_id;
            o["creator"] = m.creator.to_string();
            o["metadata"] = metadata_to_json(m.metadata);
            o["curve_config"] = curve_to_json(m.curve_config);
            return o;
        },
        [](const TradeExecuted& m) {
            json o;
            o["launch_id"] = m.launch_id;
            o["trader"] = m.trader.to_string();
            o["is_buy"] = m.is_buy;
            o["token_amount"] = m.token_amount.to_string();
            o["currency_amount"] = m.currency_amount.to_string();
            o["new_price"] = m.new_price.to_string();
            o["current_supply"] = m.current_supply.to_string();
            o["total_raised"] = m.total_raised.to_string();
            return o;
        },
        [](const GraduateToken& m) {
            json o;
            o["launch_id"] = m.launch_id;
            o["total_supply"] = m.total_supply.to_string();
            o["total_raised"] = m.total_raised.to_string();
            return o;
        },
        [](const PoolCreated& m) {
            json o;
            o["launch_id"] = m.launch_id;
            o["pool_id"] = m.pool_id;
            return o;
        },
        [](const NewLaunch& m) {
            json o;
            o["launch_id"] = m.launch_id;
            o["metadata"] = metadata_to_json(m.metadata);
            o["creator"] = m.creator.to_string();
            return o;
        },
    }, msg);
    j["type"] = message_type(msg);
    return j;
}

std::optional<Message> from_json(const json& j) {
    if (!j.is_object()) return std::nullopt;
    auto type = get_string(j, "type");
    if (!type) return std::nullopt;

    auto launch_id = get_u64(j, "launch_id");
    if (!launch_id) return std::nullopt;

    if (*type == "TokenCreated") {
        auto creator = get_account(j, "creator");
        auto mit = j.find("metadata");
        auto cit = j.find("curve_config");
        if (!creator || mit == j.end() || cit == j.end()) return std::nullopt;
        auto metadata = metadata_from_json(*mit);
        auto curve = curve_from_json(*cit);
        if (!metadata || !curve) return std::nullopt;
        return Message{TokenCreated{*launch_id, *creator, *metadata, *curve}};
    }

    if (*type == "TradeExecuted") {
        auto trader = get_account(j, "trader");
        auto is_buy = get_bool(j, "is_buy");
        auto tokens = get_u256(j, "token_amount");
        auto currency = get_u256(j, "currency_amount");
        auto price = get_u256(j, "new_price");
        auto supply = get_u256(j, "current_supply");
        auto raised = get_u256(j, "total_raised");
        if (!trader || !is_buy || !tokens || !currency || !price || !supply || !raised) {
            return std::nullopt;
        }
        return Message{TradeExecuted{*launch_id, *trader, *is_buy, *tokens, *currency,
                                     *price, *supply, *raised}};
    }

    if (*type == "GraduateToken") {
        auto supply = get_u256(j, "total_supply");
        auto raised = get_u256(j, "total_raised");
        if (!supply || !raised) return std::nullopt;
        return Message{GraduateToken{*launch_id, *supply, *raised}};
    }

    if (*type == "PoolCreated") {
        auto pool_id = get_u64(j, "pool_id");
        if (!pool_id) return std::nullopt;
        return Message{PoolCreated{*launch_id, *pool_id}};
    }

    if (*type == "NewLaunch") {
        auto creator = get_account(j, "creator");
        auto mit = j.find("metadata");
        if (!creator || mit == j.end()) return std::nullopt;
        auto metadata = metadata_from_json(*mit);
        if (!metadata) return std::nullopt;
        return Message{NewLaunch{*launch_id, *metadata, *creator}};
    }

    return std::nullopt;
}

std::string encode(const Message& msg) {
    return to_json(msg).dump();
}

std::optional<Message> decode(std::string_view payload) {
    json j = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    return from_json(j);
}

} // namespace wire

} // namespace fairlaunch
