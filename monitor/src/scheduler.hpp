#pragma once

#include "result_cache.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

// Background loop forcing a cache refresh every interval
class Scheduler {
public:
    Scheduler(std::shared_ptr<ResultCache> cache, std::chrono::milliseconds interval);
    ~Scheduler();

    void start();
    // Signals the loop and waits at most grace for it to exit. A loop still
    // inside a refresh is detached and finishes that refresh on its own.
    // Returns true when the loop thread was joined.
    bool stop(std::chrono::milliseconds grace = std::chrono::milliseconds(250));
    bool is_running() const;

    // Number of refresh cycles the loop has completed
    uint64_t cycles() const { return state_->cycles; }

    // Non-copyable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

private:
    // Shared with the loop thread, which may outlive the scheduler
    struct LoopState {
        std::mutex mutex;
        std::condition_variable wake;
        bool running = false;
        std::atomic<uint64_t> cycles{0};
        util::ExitSignal exited;
    };

    static void run(LoopState& state, ResultCache& cache, std::chrono::milliseconds interval);

    std::shared_ptr<ResultCache> cache_;
    std::chrono::milliseconds interval_;

    std::shared_ptr<LoopState> state_;
    std::thread thread_;
};
