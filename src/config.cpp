#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace decaf {

nlohmann::json Config::defaults_json() {
    return {
        {"interval_ms", kDefaultIntervalMs},
        {"verbose", false},
        {"agent_command", nlohmann::json::array()}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string Config::config_path() {
    if (const char* v = std::getenv("DECAF_CONFIG")) {
        if (*v) return expand_home(v);
    }
    return expand_home("~/.decaf/config.json");
}

Config Config::load() {
    Config cfg;

    std::string path = config_path();
    nlohmann::json j = defaults_json();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            if (original.is_object()) {
                j = merge_defaults(original, defaults_json());
            } else {
                std::cerr << "[config] Ignoring " << path << ": not a JSON object\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << path << ": " << e.what() << "\n";
        }
    }

    // Parse JSON into Config struct
    if (j["interval_ms"].is_number_unsigned() && j["interval_ms"].get<uint64_t>() > 0 &&
        j["interval_ms"].get<uint64_t>() <= UINT32_MAX) {
        cfg.interval_ms = j["interval_ms"].get<uint32_t>();
    } else if (!j["interval_ms"].is_null()) {
        std::cerr << "[config] interval_ms must be a positive integer, using "
                  << cfg.interval_ms << "\n";
    }
    if (j["verbose"].is_boolean())
        cfg.verbose = j["verbose"].get<bool>();
    if (j["agent_command"].is_array()) {
        for (const auto& arg : j["agent_command"]) {
            if (arg.is_string()) cfg.agent_command.push_back(arg.get<std::string>());
        }
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("DECAF_INTERVAL_MS")) {
        if (!parse_positive_uint(v, cfg.interval_ms)) {
            std::cerr << "[config] Ignoring invalid DECAF_INTERVAL_MS: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("DECAF_VERBOSE")) {
        std::string s = trim(v);
        cfg.verbose = !(s.empty() || s == "0" || s == "false");
    }

    return cfg;
}

} // namespace decaf
