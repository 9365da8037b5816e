// =============================================================================
// registry.cpp - FLRegistry launch factory
// =============================================================================

#include "fairlaunch/registry.hpp"
#include "fairlaunch/curve.hpp"
#include "fairlaunch/ledger.hpp"
#include "fairlaunch/log.hpp"

#include <algorithm>
#include <cctype>

namespace fairlaunch {

namespace {

unsigned long long ull(uint64_t v) { return static_cast<unsigned long long>(v); }

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

bool starts_with(const std::string& s, std::string_view prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Well-formed UTF-8: no overlongs, surrogates or code points above U+10FFFF
bool is_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > s.size()) return false;
        for (size_t j = 1; j < len; ++j) {
            auto cc = static_cast<unsigned char>(s[i + j]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000)) {
            return false;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // anonymous namespace

int32_t validate_metadata(const TokenMetadata& metadata, const RegistryLimits& limits) {
    if (is_blank(metadata.name) || is_blank(metadata.symbol)) {
        return errors::INVALID_METADATA;
    }
    if (!is_utf8(metadata.name) || !is_utf8(metadata.symbol) ||
        !is_utf8(metadata.description) ||
        (metadata.image_url && !is_utf8(*metadata.image_url)) ||
        (metadata.website && !is_utf8(*metadata.website))) {
        return errors::INVALID_METADATA;
    }
    if (metadata.name.size() > limits.max_name_length ||
        metadata.symbol.size() > limits.max_symbol_length ||
        metadata.description.size() > limits.max_description_length) {
        return errors::INVALID_METADATA;
    }

    if (metadata.image_url) {
        const std::string& url = *metadata.image_url;
        if (!starts_with(url, "http://") && !starts_with(url, "https://") &&
            !starts_with(url, "ipfs://")) {
            return errors::INVALID_METADATA;
        }
    }
    if (metadata.website) {
        const std::string& url = *metadata.website;
        if (!starts_with(url, "http://") && !starts_with(url, "https://")) {
            return errors::INVALID_METADATA;
        }
    }
    return errors::OK;
}

// =============================================================================
// Constructor
// =============================================================================

FLRegistry::FLRegistry(Runtime& runtime, ActorId id, ICustody& custody,
                       CurveConfig default_curve, RegistryLimits limits)
    : Actor(runtime, id), custody_(custody), default_curve_(default_curve), limits_(limits) {}

// =============================================================================
// Launch Creation
// =============================================================================

CreateTokenResult FLRegistry::create_token(const Account& caller, const TokenMetadata& metadata,
                                           const std::optional<CurveConfig>& curve_config) {
    CreateTokenResult result;

    const CurveConfig& curve = curve_config ? *curve_config : default_curve_;
    result.status = bonding_curve::validate(curve);
    if (result.status != errors::OK) return result;

    result.status = validate_metadata(metadata, limits_);
    if (result.status != errors::OK) return result;

    if (pool_ == 0) {
        result.status = errors::ACTOR_NOT_FOUND;
        return result;
    }

    LaunchId launch_id = next_launch_id_++;
    FLLedger& ledger = runtime_.spawn<FLLedger>(id(), pool_, custody_);

    LaunchEntry entry;
    entry.launch.id = launch_id;
    entry.launch.creator = caller;
    entry.launch.metadata = metadata;
    entry.launch.curve_config = curve;
    entry.launch.created_at = now();
    entry.ledger = ledger.id();

    launches_.emplace(launch_id, entry);
    creation_order_.push_back(launch_id);
    by_creator_.emplace(caller, launch_id);
    ledger_to_launch_[ledger.id()] = launch_id;

    send(ledger.id(), TokenCreated{launch_id, caller, metadata, curve});
    for (ActorId subscriber : subscribers_) {
        send(subscriber, NewLaunch{launch_id, metadata, caller});
    }

    log::info("launch %llu (%s) created by %s on ledger %llu", ull(launch_id),
              metadata.symbol.c_str(), caller.to_string().c_str(), ull(ledger.id()));

    result.launch_id = launch_id;
    result.ledger = ledger.id();
    return result;
}

int32_t FLRegistry::subscribe(ActorId subscriber) {
    if (!runtime_.has_actor(subscriber)) {
        return errors::ACTOR_NOT_FOUND;
    }
    subscribers_.insert(subscriber);
    return errors::OK;
}

int32_t FLRegistry::unsubscribe(ActorId subscriber) {
    if (subscribers_.erase(subscriber) == 0) {
        return errors::ACTOR_NOT_FOUND;
    }
    return errors::OK;
}

// =============================================================================
// Message Handling
// =============================================================================

void FLRegistry::on_message(ActorId from, const Message& msg) {
    if (auto* trade = std::get_if<TradeExecuted>(&msg)) {
        handle(from, *trade);
    } else if (auto* pool_created = std::get_if<PoolCreated>(&msg)) {
        handle(from, *pool_created);
    } else {
        log::debug("registry ignoring %s from %llu", message_type(msg), ull(from));
    }
}

void FLRegistry::handle(ActorId from, const TradeExecuted& msg) {
    auto owner = ledger_to_launch_.find(from);
    if (owner == ledger_to_launch_.end() || owner->second != msg.launch_id) {
        log::warn("registry: TradeExecuted for launch %llu from %llu rejected (%s)",
                  ull(msg.launch_id), ull(from), error_name(errors::UNAUTHORIZED));
        return;
    }

    Launch& launch = launches_.at(msg.launch_id).launch;
    launch.current_supply = msg.current_supply;
    launch.total_raised = msg.total_raised;
}

void FLRegistry::handle(ActorId from, const PoolCreated& msg) {
    if (from != pool_) {
        log::warn("registry: PoolCreated from %llu rejected (%s)", ull(from),
                  error_name(errors::UNAUTHORIZED));
        return;
    }

    auto it = launches_.find(msg.launch_id);
    if (it == launches_.end()) {
        log::warn("registry: PoolCreated for unknown launch %llu (%s)", ull(msg.launch_id),
                  error_name(errors::LAUNCH_NOT_FOUND));
        return;
    }

    Launch& launch = it->second.launch;
    if (launch.pool_id) {
        if (*launch.pool_id != msg.pool_id) {
            log::warn("registry: launch %llu already in pool %llu, ignoring pool %llu",
                      ull(launch.id), ull(*launch.pool_id), ull(msg.pool_id));
        }
        return;
    }

    launch.graduated = true;
    launch.pool_id = msg.pool_id;
    log::info("registry: launch %llu graduated into pool %llu", ull(launch.id),
              ull(msg.pool_id));
}

// =============================================================================
// Queries
// =============================================================================

std::optional<LaunchEntry> FLRegistry::launch(LaunchId launch_id) const {
    auto it = launches_.find(launch_id);
    if (it == launches_.end()) return std::nullopt;
    return it->second;
}

std::optional<ActorId> FLRegistry::ledger_of(LaunchId launch_id) const {
    auto it = launches_.find(launch_id);
    if (it == launches_.end()) return std::nullopt;
    return it->second.ledger;
}

std::vector<LaunchEntry> FLRegistry::tokens(size_t offset, size_t limit) const {
    std::vector<LaunchEntry> result;
    for (size_t i = offset; i < creation_order_.size() && result.size() < limit; ++i) {
        result.push_back(launches_.at(creation_order_[i]));
    }
    return result;
}

std::vector<LaunchEntry> FLRegistry::tokens_by_creator(const Account& creator) const {
    std::vector<LaunchEntry> result;
    for (auto it = by_creator_.lower_bound({creator, 0});
         it != by_creator_.end() && it->first == creator; ++it) {
        result.push_back(launches_.at(it->second));
    }
    return result;
}

std::vector<LaunchEntry> FLRegistry::search(std::string_view text, size_t limit) const {
    std::vector<LaunchEntry> result;
    std::string needle = lowercase(text);

    for (LaunchId launch_id : creation_order_) {
        if (result.size() >= limit) break;
        const LaunchEntry& entry = launches_.at(launch_id);
        if (lowercase(entry.launch.metadata.name).find(needle) != std::string::npos ||
            lowercase(entry.launch.metadata.symbol).find(needle) != std::string::npos) {
            result.push_back(entry);
        }
    }
    return result;
}

FLRegistry::Stats FLRegistry::get_stats() const {
    Stats stats{launches_.size(), 0, 0, U256(), subscribers_.size()};
    for (const auto& [launch_id, entry] : launches_) {
        if (entry.launch.graduated) {
            stats.graduated_launches++;
        } else {
            stats.active_launches++;
        }
        stats.total_raised += entry.launch.total_raised;
    }
    return stats;
}

} // namespace fairlaunch
