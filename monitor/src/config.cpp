#include "config.hpp"
#include "util.hpp"
#include <algorithm>
#include <iterator>
#include <spdlog/spdlog.h>

Config Config::from_env() {
    Config config;

    // Service
    config.app_name = util::get_env_var("APP_NAME", config.app_name);
    config.service_name = util::get_env_var("SERVICE_NAME", config.service_name);
    config.log_level = util::get_env_var("LOG_LEVEL", config.log_level);
    config.debug = util::get_env_bool("DEBUG", false);
    if (config.debug) {
        config.log_level = "debug";
    }

    // Timing
    config.check_interval_seconds = util::get_env_int("CHECK_INTERVAL_SECONDS", config.check_interval_seconds);
    config.request_timeout_seconds = util::get_env_int("REQUEST_TIMEOUT_SECONDS", config.request_timeout_seconds);

    // Services
    config.services_config = util::get_env_var("SERVICES_CONFIG", config.services_config);
    config.services = parse_services(config.services_config);

    // HTTP
    config.listen_addr = util::get_env_var("LISTEN_ADDR", config.listen_addr);
    config.listen_port = util::get_env_int("LISTEN_PORT", config.listen_port);

    return config;
}

void Config::validate() const {
    if (services.empty()) {
        throw std::runtime_error("SERVICES_CONFIG must name at least one service");
    }

    if (check_interval_seconds <= 0) {
        throw std::runtime_error("CHECK_INTERVAL_SECONDS must be positive");
    }

    if (request_timeout_seconds <= 0) {
        throw std::runtime_error("REQUEST_TIMEOUT_SECONDS must be positive");
    }

    if (freshness_window_ms < 0) {
        throw std::runtime_error("Freshness window cannot be negative");
    }

    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }

    static const char* levels[] = {"trace", "debug", "info", "warn", "warning", "error", "critical", "off"};
    if (std::find(std::begin(levels), std::end(levels), log_level) == std::end(levels)) {
        throw std::runtime_error("Unknown LOG_LEVEL: " + log_level);
    }

    spdlog::info("Configuration validated successfully");
}

std::vector<ServiceEntry> Config::parse_services(const std::string& services_config) {
    if (util::trim(services_config).empty()) {
        throw std::runtime_error("SERVICES_CONFIG cannot be empty");
    }

    std::vector<ServiceEntry> services;
    for (const auto& item : util::split_string(services_config, ',')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Invalid format in SERVICES_CONFIG: '" + item + "'. Expected 'name=url'");
        }

        std::string name = util::trim(item.substr(0, eq));
        std::string url = util::trim(item.substr(eq + 1));
        if (name.empty() || url.empty()) {
            throw std::runtime_error("Empty name or URL in: '" + item + "'");
        }

        // A repeated name keeps its first position and takes the latest url
        auto existing = std::find_if(services.begin(), services.end(),
            [&name](const ServiceEntry& entry) { return entry.name == name; });
        if (existing != services.end()) {
            spdlog::warn("Service '{}' listed more than once, using {}", name, url);
            existing->url = url;
        } else {
            services.push_back({name, url});
        }
    }

    return services;
}
