// =============================================================================
// types.cpp - Account text form and error names
// =============================================================================

#include "fairlaunch/types.hpp"

namespace fairlaunch {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace addresses {

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) return std::nullopt;

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int high = hex_value(text[2 * i]);
        int low = hex_value(text[2 * i + 1]);
        if (high < 0 || low < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((high << 4) | low);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Account
// =============================================================================

std::string Account::to_string() const {
    return std::to_string(chain_id) + ":" + addresses::to_hex(owner);
}

std::optional<Account> Account::parse(std::string_view text) {
    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;

    ChainId chain = 0;
    for (char c : text.substr(0, colon)) {
        if (c < '0' || c > '9') return std::nullopt;
        ChainId next = chain * 10 + static_cast<ChainId>(c - '0');
        if (next / 10 != chain) return std::nullopt;
        chain = next;
    }

    auto owner = addresses::from_hex(text.substr(colon + 1));
    if (!owner) return std::nullopt;
    return Account(chain, *owner);
}

// =============================================================================
// Error Names
// =============================================================================

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case errors::INVALID_CURVE_CONFIG: return "INVALID_CURVE_CONFIG";
        case errors::INVALID_METADATA: return "INVALID_METADATA";
        case errors::SLIPPAGE_EXCEEDED: return "SLIPPAGE_EXCEEDED";
        case errors::EXCEEDS_MAX_SUPPLY: return "EXCEEDS_MAX_SUPPLY";
        case errors::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case errors::INSUFFICIENT_ALLOWANCE: return "INSUFFICIENT_ALLOWANCE";
        case errors::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case errors::POOL_LOCKED: return "POOL_LOCKED";
        case errors::AMOUNT_CONVERSION: return "AMOUNT_CONVERSION";
        case errors::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case errors::ALREADY_INITIALIZED: return "ALREADY_INITIALIZED";
        case errors::ALREADY_GRADUATED: return "ALREADY_GRADUATED";
        case errors::CURVE_INCOMPLETE: return "CURVE_INCOMPLETE";
        case errors::LAUNCH_NOT_FOUND: return "LAUNCH_NOT_FOUND";
        case errors::POOL_NOT_FOUND: return "POOL_NOT_FOUND";
        case errors::ACTOR_NOT_FOUND: return "ACTOR_NOT_FOUND";
        case errors::MALFORMED_MESSAGE: return "MALFORMED_MESSAGE";
        case errors::UNAUTHORIZED: return "UNAUTHORIZED";
        default: return "UNKNOWN";
    }
}

} // namespace fairlaunch
