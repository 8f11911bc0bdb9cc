#pragma once
#include "config.hpp"
#include "result_cache.hpp"
#include "util.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

// HTTP surface over the result cache:
//   GET  /              application info
//   GET  /health        liveness of the monitor itself
//   GET  /api/services  cached or refreshed results (JSON)
//   POST /api/check     forced refresh (JSON)
//   GET  /metrics       Prometheus exposition
class ApiServer {
public:
    ApiServer(Config config, std::shared_ptr<ResultCache> cache);
    ~ApiServer();

    // Binds synchronously, then serves on a background thread.
    // A listen_port of 0 binds an ephemeral port. Throws std::runtime_error
    // when the address cannot be bound.
    void start();
    // Stops accepting and waits at most grace for the listener to drain.
    // A listener still serving a forced refresh is detached.
    // Returns true when the listener thread was joined.
    bool stop(std::chrono::milliseconds grace = std::chrono::milliseconds(250));

    int port() const { return port_; }

private:
    void setup_routes();

    const Config config_;
    std::shared_ptr<ResultCache> cache_;
    std::shared_ptr<httplib::Server> server_;
    std::shared_ptr<util::ExitSignal> listener_exited_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    int port_ = 0;
};
