#ifndef FAIRLAUNCH_CONFIG_HPP
#define FAIRLAUNCH_CONFIG_HPP

// Engine configuration
// Builder pattern for fluent configuration

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "registry.hpp"
#include "runtime.hpp"

namespace fairlaunch {

// General engine settings
struct GeneralConfig {
    std::string log_level = "info";
    std::string log_file;           // Empty: stderr
    size_t worker_threads = 1;
    bool duplicate_delivery = false;
};

// Main configuration
class Config {
public:
    GeneralConfig general;
    CurveConfig curve = CurveConfig::defaults();
    RegistryLimits registry;

    Config() = default;

    // Load from file; ".json" is parsed as JSON, anything else as TOML
    static Config from_file(std::string_view path);

    // Load from TOML string
    static Config from_toml(std::string_view content);

    // Load from JSON string
    static Config from_json(std::string_view content);

    nlohmann::json to_json() const;

    RuntimeConfig runtime_config() const {
        RuntimeConfig rc;
        rc.worker_threads = general.worker_threads;
        rc.duplicate_delivery = general.duplicate_delivery;
        return rc;
    }

    // Throws std::invalid_argument on an unusable combination
    void validate() const;

    // Builder methods
    Config& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& with_log_file(std::string_view path) {
        general.log_file = std::string(path);
        return *this;
    }

    Config& with_worker_threads(size_t threads) {
        general.worker_threads = threads;
        return *this;
    }

    Config& with_duplicate_delivery(bool enabled = true) {
        general.duplicate_delivery = enabled;
        return *this;
    }

    Config& with_curve(const CurveConfig& cfg) {
        curve = cfg;
        return *this;
    }

    Config& with_creator_fee_bps(uint16_t bps) {
        curve.creator_fee_bps = bps;
        return *this;
    }

    Config& with_registry_limits(const RegistryLimits& limits) {
        registry = limits;
        return *this;
    }
};

} // namespace fairlaunch

#endif // FAIRLAUNCH_CONFIG_HPP
