#include "scheduler.hpp"
#include <spdlog/spdlog.h>

Scheduler::Scheduler(std::shared_ptr<ResultCache> cache, std::chrono::milliseconds interval)
    : cache_(std::move(cache)), interval_(interval), state_(std::make_shared<LoopState>()) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->running) {
            spdlog::warn("Scheduler already running");
            return;
        }
    }

    // A previous loop may still be finishing a refresh; it keeps its own state
    state_ = std::make_shared<LoopState>();
    state_->running = true;

    auto state = state_;
    auto cache = cache_;
    auto interval = interval_;
    thread_ = std::thread([state, cache, interval]() {
        run(*state, *cache, interval);
        state->exited.notify();
    });

    spdlog::info("Scheduler started, refreshing every {} ms", interval_.count());
}

bool Scheduler::stop(std::chrono::milliseconds grace) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->running) return true;
        state_->running = false;
    }
    state_->wake.notify_all();

    if (!util::join_or_detach(thread_, state_->exited, grace)) {
        spdlog::warn("Scheduler still refreshing after {} ms, leaving it to finish in the background",
                     grace.count());
        return false;
    }

    spdlog::info("Scheduler stopped after {} cycles", state_->cycles.load());
    return true;
}

bool Scheduler::is_running() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
}

void Scheduler::run(LoopState& state, ResultCache& cache, std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(state.mutex);

    while (state.running) {
        if (state.wake.wait_for(lock, interval, [&state]() { return !state.running; })) {
            break;
        }

        lock.unlock();
        try {
            auto batch = cache.get_results(true);
            spdlog::debug("Scheduled refresh produced {} results", batch->results.size());
        } catch (const std::exception& e) {
            spdlog::error("Scheduled refresh failed: {}", e.what());
        }
        ++state.cycles;
        lock.lock();
    }

    spdlog::debug("Scheduler loop finished");
}
