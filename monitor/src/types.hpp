#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

struct ServiceEntry {
    std::string name;
    std::string url;
};

// Result of a single probe against one service
struct CheckOutcome {
    std::string service_name;
    std::string url;
    bool is_healthy = false;
    std::optional<int> status_code;   // absent when no response arrived
    double response_time_ms = 0.0;
    std::optional<std::string> error_message;
    std::chrono::system_clock::time_point checked_at;

    nlohmann::json to_json() const;
};

// One refresh cycle: outcomes in registry order
struct ResultBatch {
    std::vector<CheckOutcome> results;
    std::chrono::system_clock::time_point produced_at;

    size_t healthy_count() const;
};
