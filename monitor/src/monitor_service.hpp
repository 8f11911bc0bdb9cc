#pragma once

#include "config.hpp"
#include "service_registry.hpp"
#include "prober.hpp"
#include "fanout_executor.hpp"
#include "result_cache.hpp"
#include "scheduler.hpp"
#include "api_server.hpp"
#include <atomic>
#include <memory>

// Registry, prober, executor and cache as one unit. Background threads hold
// it through shared_ptr so a refresh cut loose at shutdown stays valid.
struct MonitorEngine {
    MonitorEngine(const Config& config, std::unique_ptr<Prober> prober);

    ServiceRegistry registry;
    std::unique_ptr<Prober> prober;
    FanoutExecutor executor;
    ResultCache cache;
};

class MonitorService {
public:
    explicit MonitorService(Config config);
    MonitorService(Config config, std::unique_ptr<Prober> prober);
    ~MonitorService();

    // Blocks until stop() is called. Returns false when a background refresh
    // was still in flight at shutdown and had to be left running.
    bool run();
    // Only flips a flag, safe to call from a signal handler
    void stop();

private:
    const Config config_;
    std::shared_ptr<MonitorEngine> engine_;
    Scheduler scheduler_;
    ApiServer api_server_;

    std::atomic<bool> running_{false};
};
