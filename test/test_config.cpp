// Fair Launch - Configuration Tests

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>
#include "test_helpers.hpp"

#include <stdexcept>

using namespace fairlaunch;

TEST_CASE("Config defaults", "[config]") {
    Config config;
    REQUIRE(config.general.log_level == "info");
    REQUIRE(config.general.log_file.empty());
    REQUIRE(config.general.worker_threads == 1);
    REQUIRE_FALSE(config.general.duplicate_delivery);
    REQUIRE(config.curve == CurveConfig::defaults());
    REQUIRE(config.registry.max_symbol_length == 20);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config builder", "[config]") {
    Config config;
    config.with_log_level("debug")
          .with_worker_threads(4)
          .with_duplicate_delivery()
          .with_creator_fee_bps(150)
          .with_registry_limits(RegistryLimits{10, 5, 50});

    REQUIRE(config.general.log_level == "debug");
    REQUIRE(config.curve.creator_fee_bps == 150);
    REQUIRE(config.registry.max_name_length == 10);

    RuntimeConfig rc = config.runtime_config();
    REQUIRE(rc.worker_threads == 4);
    REQUIRE(rc.duplicate_delivery);
}

TEST_CASE("Config from TOML", "[config]") {
    SECTION("All sections") {
        auto config = Config::from_toml(R"(
# comment line
[general]
log_level = "warn"
log_file = "/tmp/fl.log"   # trailing comment
worker_threads = 3
duplicate_delivery = true

[curve]
k = 2_000
scale = 1_000_000
target_raise = 69000
max_supply = 5_000_000_000_000
creator_fee_bps = 250

[registry]
max_name_length = 64
max_symbol_length = 10
max_description_length = 500

[unknown]
ignored = 1
)");
        REQUIRE(config.general.log_level == "warn");
        REQUIRE(config.general.log_file == "/tmp/fl.log");
        REQUIRE(config.general.worker_threads == 3);
        REQUIRE(config.general.duplicate_delivery);
        REQUIRE(config.curve.k == U256(2000));
        REQUIRE(config.curve.max_supply == U256(5000000000000ULL));
        REQUIRE(config.curve.creator_fee_bps == 250);
        REQUIRE(config.registry.max_name_length == 64);
        REQUIRE(config.registry.max_description_length == 500);
    }

    SECTION("Missing keys keep defaults") {
        auto config = Config::from_toml("[curve]\ncreator_fee_bps = 0\n");
        REQUIRE(config.curve.creator_fee_bps == 0);
        REQUIRE(config.curve.k == U256(1000));
        REQUIRE(config.general.worker_threads == 1);
    }

    SECTION("Bad values are rejected") {
        REQUIRE_THROWS_AS(Config::from_toml("[general]\nworker_threads = many\n"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_toml("[general]\nworker_threads = 0\n"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_toml("[general]\nduplicate_delivery = yes\n"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_toml("[general]\nlog_level = \"loud\"\n"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_toml("[curve]\ncreator_fee_bps = 10001\n"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_toml("[curve]\nscale = 0\n"), std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_toml(
                              "[curve]\nmax_supply = 340282366920938463463374607431768211456\n"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_toml("[curve\nk = 1\n"), std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_toml("[curve]\nk\n"), std::invalid_argument);
    }
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("Numbers and decimal strings") {
        auto config = Config::from_json(R"({
            "general": {"log_level": "error", "worker_threads": 2},
            "curve": {"k": "1000", "max_supply": 5000000, "creator_fee_bps": 100}
        })");
        REQUIRE(config.general.log_level == "error");
        REQUIRE(config.general.worker_threads == 2);
        REQUIRE(config.curve.max_supply == U256(5000000));
        REQUIRE(config.curve.creator_fee_bps == 100);
    }

    SECTION("Round trip through to_json") {
        Config saved;
        saved.with_log_level("trace").with_creator_fee_bps(42);
        auto restored = Config::from_json(saved.to_json().dump());
        REQUIRE(restored.general.log_level == "trace");
        REQUIRE(restored.curve == saved.curve);
        REQUIRE(restored.registry.max_name_length == saved.registry.max_name_length);
    }

    SECTION("Bad documents") {
        REQUIRE_THROWS_AS(Config::from_json("{"), std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_json("[]"), std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_json(R"({"curve": 5})"), std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_json(R"({"curve": {"k": -5}})"), std::invalid_argument);
        REQUIRE_THROWS_AS(Config::from_json(R"({"curve": {"k": [1]}})"), std::invalid_argument);
    }
}

TEST_CASE("Config from file", "[config]") {
    auto config = Config::from_file(std::string(FAIRLAUNCH_SOURCE_DIR) + "/config/fairlaunch.toml");
    REQUIRE(config.general.worker_threads == 2);
    REQUIRE(config.curve == CurveConfig::defaults());
    REQUIRE(config.registry.max_description_length == 1000);

    REQUIRE_THROWS_AS(Config::from_file("/nonexistent/fairlaunch.toml"), std::runtime_error);
}
