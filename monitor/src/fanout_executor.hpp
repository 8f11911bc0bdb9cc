#pragma once

#include "types.hpp"
#include "prober.hpp"
#include "service_registry.hpp"
#include <chrono>

// Probes every registered service in parallel and joins the outcomes
// into one batch ordered like the registry.
class FanoutExecutor {
public:
    FanoutExecutor(Prober& prober, std::chrono::milliseconds request_timeout);

    ResultBatch execute_all(const ServiceRegistry& registry);

private:
    Prober& prober_;
    std::chrono::milliseconds request_timeout_;
};
