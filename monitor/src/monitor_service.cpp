#include "monitor_service.hpp"
#include <spdlog/spdlog.h>
#include <thread>
#include <chrono>

namespace {

std::shared_ptr<ResultCache> shared_cache(const std::shared_ptr<MonitorEngine>& engine) {
    // Aliases the engine: holding the cache keeps the whole engine alive
    return std::shared_ptr<ResultCache>(engine, &engine->cache);
}

} // namespace

MonitorEngine::MonitorEngine(const Config& config, std::unique_ptr<Prober> prober)
    : registry(config.services),
      prober(std::move(prober)),
      executor(*this->prober, std::chrono::seconds(config.request_timeout_seconds)),
      cache(registry, executor, std::chrono::milliseconds(config.freshness_window_ms)) {}

MonitorService::MonitorService(Config config)
    : MonitorService(config, std::make_unique<HttpProber>(config.service_name + "/" + config.version)) {}

MonitorService::MonitorService(Config config, std::unique_ptr<Prober> prober)
    : config_(std::move(config)),
      engine_(std::make_shared<MonitorEngine>(config_, std::move(prober))),
      scheduler_(shared_cache(engine_), std::chrono::seconds(config_.check_interval_seconds)),
      api_server_(config_, shared_cache(engine_)) {
    for (const auto& entry : engine_->registry) {
        spdlog::info("Monitoring {} at {}", entry.name, entry.url);
    }
}

MonitorService::~MonitorService() {
    scheduler_.stop();
    api_server_.stop();
}

bool MonitorService::run() {
    running_ = true;
    spdlog::info("{} started. Checking {} services every {} seconds.",
                 config_.app_name, engine_->registry.size(), config_.check_interval_seconds);

    api_server_.start();
    scheduler_.start();

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Stopping {}...", config_.service_name);
    bool scheduler_joined = scheduler_.stop();
    bool server_joined = api_server_.stop();
    spdlog::info("Monitor run loop finished.");
    return scheduler_joined && server_joined;
}

void MonitorService::stop() {
    running_ = false;
}
