#include "result_cache.hpp"
#include <spdlog/spdlog.h>

ResultCache::ResultCache(const ServiceRegistry& registry,
                         FanoutExecutor& executor,
                         std::chrono::milliseconds freshness_window)
    : registry_(registry), executor_(executor), freshness_window_(freshness_window) {}

BatchPtr ResultCache::get_results(bool force) {
    std::promise<BatchPtr> promise;
    std::shared_future<BatchPtr> flight;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!force && current_ &&
            std::chrono::steady_clock::now() - refreshed_at_ < freshness_window_) {
            return current_;
        }

        if (in_flight_.valid()) {
            flight = in_flight_;
        } else {
            in_flight_ = promise.get_future().share();
            ++refresh_count_;
        }
    }

    // Another caller owns the refresh; share its result
    if (flight.valid()) {
        spdlog::debug("Joining in-flight refresh");
        return flight.get();
    }

    return refresh(promise);
}

BatchPtr ResultCache::refresh(std::promise<BatchPtr>& promise) {
    ResultBatch batch;
    try {
        batch = executor_.execute_all(registry_);
    } catch (...) {
        // Release waiters with the same error and let the next caller retry
        spdlog::error("Refresh of {} services failed", registry_.size());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_ = std::shared_future<BatchPtr>();
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    BatchPtr installed;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Keep produced_at non-decreasing even if the wall clock steps back
        batch.produced_at = std::chrono::system_clock::now();
        if (current_ && batch.produced_at < current_->produced_at) {
            batch.produced_at = current_->produced_at;
        }

        installed = std::make_shared<const ResultBatch>(std::move(batch));
        current_ = installed;
        refreshed_at_ = std::chrono::steady_clock::now();
        in_flight_ = std::shared_future<BatchPtr>();
    }

    promise.set_value(installed);

    spdlog::info("Refreshed {} services: {} healthy, {} unhealthy",
                 installed->results.size(), installed->healthy_count(),
                 installed->results.size() - installed->healthy_count());
    return installed;
}

uint64_t ResultCache::refresh_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refresh_count_;
}
