#pragma once
#include "types.hpp"
#include <string>
#include <vector>
#include <stdexcept>

class Config {
public:
    // Service info
    std::string app_name = "Service Health Monitor";
    std::string service_name = "svcmon";
    std::string version = "0.1.0";
    std::string log_level = "info";
    bool debug = false;

    // Health check settings
    int check_interval_seconds = 60;
    int request_timeout_seconds = 10;

    // Cached batches younger than this are served without probing.
    // Fixed, not read from the environment.
    int freshness_window_ms = 5000;

    // Services to monitor, "name=url,name2=url2"
    std::string services_config = "github=https://api.github.com,google=https://www.google.com";
    std::vector<ServiceEntry> services;

    // HTTP API
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8000;

    static Config from_env();
    void validate() const;

    // Throws std::runtime_error naming the offending item
    static std::vector<ServiceEntry> parse_services(const std::string& services_config);
};
