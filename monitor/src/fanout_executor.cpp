#include "fanout_executor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <future>
#include <vector>

FanoutExecutor::FanoutExecutor(Prober& prober, std::chrono::milliseconds request_timeout)
    : prober_(prober), request_timeout_(request_timeout) {}

ResultBatch FanoutExecutor::execute_all(const ServiceRegistry& registry) {
    ResultBatch batch;

    if (registry.empty()) {
        batch.produced_at = std::chrono::system_clock::now();
        return batch;
    }

    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::future<CheckOutcome>> pending;
    pending.reserve(registry.size());
    for (const auto& entry : registry) {
        pending.push_back(std::async(std::launch::async, [this, &entry]() {
            return prober_.probe(entry.name, entry.url, request_timeout_);
        }));
    }

    // Joining in launch order keeps the batch in registry order
    batch.results.reserve(registry.size());
    auto entry = registry.begin();
    for (auto& future : pending) {
        try {
            batch.results.push_back(future.get());
        } catch (const std::exception& e) {
            spdlog::error("Probe task for {} failed: {}", entry->name, e.what());
            CheckOutcome outcome;
            outcome.service_name = entry->name;
            outcome.url = entry->url;
            outcome.is_healthy = false;
            outcome.error_message = e.what();
            outcome.checked_at = std::chrono::system_clock::now();
            batch.results.push_back(outcome);
        }
        ++entry;
    }

    batch.produced_at = std::chrono::system_clock::now();

    spdlog::debug("Checked {} services in {} ms ({} healthy)",
                  batch.results.size(), util::elapsed_ms(start_time), batch.healthy_count());
    return batch;
}
