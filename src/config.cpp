// Engine configuration: TOML subset and JSON loaders

#include "fairlaunch/config.hpp"
#include "fairlaunch/curve.hpp"
#include "fairlaunch/log.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fairlaunch {

// Simple TOML parser (handles basic cases)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// Drop a trailing "# comment" that is not inside quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

U256 parse_u256(const std::string& key, const std::string& value) {
    // Allow 1_000_000 digit grouping
    std::string digits;
    for (char c : value) {
        if (c != '_') digits.push_back(c);
    }
    auto parsed = U256::from_string(digits);
    if (!parsed) {
        throw std::invalid_argument("Invalid integer for " + key + ": " + value);
    }
    return *parsed;
}

uint64_t parse_u64(const std::string& key, const std::string& value) {
    U256 parsed = parse_u256(key, value);
    if (parsed > U256(UINT64_MAX)) {
        throw std::invalid_argument("Value out of range for " + key + ": " + value);
    }
    return static_cast<uint64_t>(parsed.lo);
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw std::invalid_argument("Invalid boolean for " + key + ": " + value);
}

uint16_t parse_bps(const std::string& key, uint64_t value) {
    if (value > BPS_DENOMINATOR) {
        throw std::invalid_argument("Basis points out of range for " + key);
    }
    return static_cast<uint16_t>(value);
}

// JSON scalars may be numbers or decimal strings
std::string json_scalar(const nlohmann::json& j, const std::string& key) {
    if (j.is_string()) return j.get<std::string>();
    if (j.is_number_unsigned()) return std::to_string(j.get<uint64_t>());
    if (j.is_boolean()) return j.get<bool>() ? "true" : "false";
    throw std::invalid_argument("Invalid value for " + key);
}

}  // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (path_str.size() >= 5 && path_str.compare(path_str.size() - 5, 5, ".json") == 0) {
        return from_json(buffer.str());
    }
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        // Skip empty lines and comments
        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw std::invalid_argument("Malformed section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        // Key-value pair
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Expected key = value: " + line);
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        // Parse based on section
        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "log_file") config.general.log_file = value;
            else if (key == "worker_threads") config.general.worker_threads = parse_u64(key, value);
            else if (key == "duplicate_delivery") config.general.duplicate_delivery = parse_bool(key, value);
        }
        else if (current_section == "curve") {
            if (key == "k") config.curve.k = parse_u256(key, value);
            else if (key == "scale") config.curve.scale = parse_u256(key, value);
            else if (key == "target_raise") config.curve.target_raise = parse_u256(key, value);
            else if (key == "max_supply") config.curve.max_supply = parse_u256(key, value);
            else if (key == "creator_fee_bps") config.curve.creator_fee_bps = parse_bps(key, parse_u64(key, value));
        }
        else if (current_section == "registry") {
            if (key == "max_name_length") config.registry.max_name_length = parse_u64(key, value);
            else if (key == "max_symbol_length") config.registry.max_symbol_length = parse_u64(key, value);
            else if (key == "max_description_length") config.registry.max_description_length = parse_u64(key, value);
        }
    }

    config.validate();
    return config;
}

Config Config::from_json(std::string_view content) {
    nlohmann::json root = nlohmann::json::parse(content.begin(), content.end(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        throw std::invalid_argument("Invalid JSON configuration");
    }

    Config config;
    auto section = [&root](const char* name) -> const nlohmann::json* {
        auto it = root.find(name);
        if (it == root.end()) return nullptr;
        if (!it->is_object()) {
            throw std::invalid_argument(std::string("Section is not an object: ") + name);
        }
        return &*it;
    };

    if (const auto* general = section("general")) {
        for (const auto& [key, j] : general->items()) {
            std::string value = json_scalar(j, key);
            if (key == "log_level") config.general.log_level = value;
            else if (key == "log_file") config.general.log_file = value;
            else if (key == "worker_threads") config.general.worker_threads = parse_u64(key, value);
            else if (key == "duplicate_delivery") config.general.duplicate_delivery = parse_bool(key, value);
        }
    }

    if (const auto* curve = section("curve")) {
        for (const auto& [key, j] : curve->items()) {
            std::string value = json_scalar(j, key);
            if (key == "k") config.curve.k = parse_u256(key, value);
            else if (key == "scale") config.curve.scale = parse_u256(key, value);
            else if (key == "target_raise") config.curve.target_raise = parse_u256(key, value);
            else if (key == "max_supply") config.curve.max_supply = parse_u256(key, value);
            else if (key == "creator_fee_bps") config.curve.creator_fee_bps = parse_bps(key, parse_u64(key, value));
        }
    }

    if (const auto* registry = section("registry")) {
        for (const auto& [key, j] : registry->items()) {
            std::string value = json_scalar(j, key);
            if (key == "max_name_length") config.registry.max_name_length = parse_u64(key, value);
            else if (key == "max_symbol_length") config.registry.max_symbol_length = parse_u64(key, value);
            else if (key == "max_description_length") config.registry.max_description_length = parse_u64(key, value);
        }
    }

    config.validate();
    return config;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["general"] = {
        {"log_level", general.log_level},
        {"log_file", general.log_file},
        {"worker_threads", general.worker_threads},
        {"duplicate_delivery", general.duplicate_delivery},
    };
    j["curve"] = {
        {"k", curve.k.to_string()},
        {"scale", curve.scale.to_string()},
        {"target_raise", curve.target_raise.to_string()},
        {"max_supply", curve.max_supply.to_string()},
        {"creator_fee_bps", curve.creator_fee_bps},
    };
    j["registry"] = {
        {"max_name_length", registry.max_name_length},
        {"max_symbol_length", registry.max_symbol_length},
        {"max_description_length", registry.max_description_length},
    };
    return j;
}

void Config::validate() const {
    if (!log::parse_level(general.log_level)) {
        throw std::invalid_argument("Unknown log level: " + general.log_level);
    }
    if (general.worker_threads == 0) {
        throw std::invalid_argument("worker_threads must be at least 1");
    }
    if (bonding_curve::validate(curve) != errors::OK) {
        throw std::invalid_argument("Invalid default curve configuration");
    }
}

}  // namespace fairlaunch
