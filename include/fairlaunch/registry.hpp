#ifndef FAIRLAUNCH_REGISTRY_HPP
#define FAIRLAUNCH_REGISTRY_HPP

#include <map>
#include <set>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "types.hpp"
#include "custody.hpp"
#include "runtime.hpp"

namespace fairlaunch {

// =============================================================================
// Metadata Limits
// =============================================================================

struct RegistryLimits {
    size_t max_name_length = 100;
    size_t max_symbol_length = 20;
    size_t max_description_length = 1000;
};

// OK or INVALID_METADATA
int32_t validate_metadata(const TokenMetadata& metadata, const RegistryLimits& limits);

// =============================================================================
// Registry Entries
// =============================================================================

struct LaunchEntry {
    Launch launch;   // Cached view, refreshed from the ledger's trade reports
    ActorId ledger;
};

struct CreateTokenResult {
    int32_t status = errors::OK;
    LaunchId launch_id = 0;
    ActorId ledger = 0;

    bool ok() const { return status == errors::OK; }
};

// =============================================================================
// FLRegistry - Launch factory and index
// =============================================================================

class FLRegistry : public Actor {
public:
    FLRegistry(Runtime& runtime, ActorId id, ICustody& custody,
               CurveConfig default_curve = CurveConfig::defaults(),
               RegistryLimits limits = {});
    ~FLRegistry() override = default;

    const char* kind() const override { return "registry"; }
    void on_message(ActorId from, const Message& msg) override;

    // Pool actor that graduated launches hand off to; set once during wiring
    void set_pool(ActorId pool) { pool_ = pool; }
    ActorId pool() const { return pool_; }

    // =========================================================================
    // Launch Creation
    // =========================================================================

    CreateTokenResult create_token(const Account& caller, const TokenMetadata& metadata,
                                   const std::optional<CurveConfig>& curve_config = std::nullopt);

    int32_t subscribe(ActorId subscriber);
    int32_t unsubscribe(ActorId subscriber);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<LaunchEntry> launch(LaunchId launch_id) const;
    std::optional<ActorId> ledger_of(LaunchId launch_id) const;
    size_t token_count() const { return launches_.size(); }

    // Creation order
    std::vector<LaunchEntry> tokens(size_t offset, size_t limit) const;
    std::vector<LaunchEntry> tokens_by_creator(const Account& creator) const;

    // Case-insensitive substring match over name and symbol
    std::vector<LaunchEntry> search(std::string_view text, size_t limit) const;

    const CurveConfig& default_curve() const { return default_curve_; }
    const RegistryLimits& limits() const { return limits_; }

    struct Stats {
        uint64_t total_launches;
        uint64_t graduated_launches;
        uint64_t active_launches;
        U256 total_raised;
        uint64_t subscribers;
    };
    Stats get_stats() const;

private:
    ICustody& custody_;
    CurveConfig default_curve_;
    RegistryLimits limits_;
    ActorId pool_{0};

    std::map<LaunchId, LaunchEntry> launches_;
    std::vector<LaunchId> creation_order_;
    std::set<std::pair<Account, LaunchId>> by_creator_;
    std::map<ActorId, LaunchId> ledger_to_launch_;
    std::set<ActorId> subscribers_;
    LaunchId next_launch_id_{1};

    void handle(ActorId from, const TradeExecuted& msg);
    void handle(ActorId from, const PoolCreated& msg);
};

} // namespace fairlaunch

#endif // FAIRLAUNCH_REGISTRY_HPP
