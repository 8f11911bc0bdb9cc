#pragma once

#include "types.hpp"
#include "fanout_executor.hpp"
#include "service_registry.hpp"
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>

using BatchPtr = std::shared_ptr<const ResultBatch>;

// Latest batch plus the single-flight refresh that replaces it.
//
// get_results(false) serves the cached batch while it is younger than the
// freshness window. Any other call refreshes, but at most one fan-out runs
// at a time: callers arriving while a refresh is in flight wait for that
// run and receive its batch. Batches are immutable and swapped as a whole.
class ResultCache {
public:
    ResultCache(const ServiceRegistry& registry,
                FanoutExecutor& executor,
                std::chrono::milliseconds freshness_window = std::chrono::seconds(5));

    BatchPtr get_results(bool force = false);

    // Number of fan-out runs started so far
    uint64_t refresh_count() const;

    // Non-copyable
    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

private:
    BatchPtr refresh(std::promise<BatchPtr>& promise);

    const ServiceRegistry& registry_;
    FanoutExecutor& executor_;
    const std::chrono::milliseconds freshness_window_;

    mutable std::mutex mutex_;
    BatchPtr current_;
    std::chrono::steady_clock::time_point refreshed_at_;
    std::shared_future<BatchPtr> in_flight_;
    uint64_t refresh_count_ = 0;
};
