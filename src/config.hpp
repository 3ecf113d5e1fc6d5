#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace decaf {

constexpr uint32_t kDefaultIntervalMs = 100;

struct Config {
    uint32_t interval_ms = kDefaultIntervalMs;  // flush period
    bool verbose = false;                       // log every flush to stderr
    std::vector<std::string> agent_command;     // argv of the downstream agent

    // Load from ~/.decaf/config.json (or $DECAF_CONFIG) + env vars.
    // A missing file means defaults; the file is never created.
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Path load() reads: $DECAF_CONFIG if set, else ~/.decaf/config.json
    static std::string config_path();

    std::chrono::milliseconds interval() const {
        return std::chrono::milliseconds(interval_ms);
    }
};

} // namespace decaf
