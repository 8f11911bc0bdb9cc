#include "api_server.hpp"
#include "formatter.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace {

void respond_with_services(ResultCache& cache, httplib::Response& res, bool force) {
    try {
        auto batch = cache.get_results(force);
        res.status = 200;
        res.set_content(formatter::to_body(formatter::services_view(*batch)), "application/json");
    } catch (const std::exception& e) {
        spdlog::error("Failed to collect service results: {}", e.what());
        res.status = 500;
        res.set_content(formatter::to_body(nlohmann::json{{"error", e.what()}}), "application/json");
    }
}

} // namespace

ApiServer::ApiServer(Config config, std::shared_ptr<ResultCache> cache)
    : config_(std::move(config)), cache_(std::move(cache)), running_(false) {
    server_ = std::make_shared<httplib::Server>();
    setup_routes();
}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::start() {
    if (running_) {
        spdlog::warn("API server already running");
        return;
    }

    if (config_.listen_port == 0) {
        port_ = server_->bind_to_any_port(config_.listen_addr.c_str());
    } else if (server_->bind_to_port(config_.listen_addr.c_str(), config_.listen_port)) {
        port_ = config_.listen_port;
    } else {
        port_ = -1;
    }

    if (port_ < 0) {
        throw std::runtime_error("Failed to bind API server to " + config_.listen_addr + ":" +
                                 std::to_string(config_.listen_port));
    }

    running_ = true;
    listener_exited_ = std::make_shared<util::ExitSignal>();

    // The listener owns what it touches so it may outlive a bounded stop()
    auto server = server_;
    auto exited = listener_exited_;
    auto address = config_.listen_addr;
    auto port = port_;
    server_thread_ = std::thread([server, exited, address, port]() {
        spdlog::info("API server listening on {}:{}", address, port);
        if (!server->listen_after_bind()) {
            spdlog::error("API server on {}:{} stopped unexpectedly", address, port);
        }
        exited->notify();
    });
}

bool ApiServer::stop(std::chrono::milliseconds grace) {
    if (!running_) {
        return true;
    }
    running_ = false;
    server_->stop();

    if (!util::join_or_detach(server_thread_, *listener_exited_, grace)) {
        spdlog::warn("API server still answering after {} ms, leaving it to finish in the background",
                     grace.count());
        return false;
    }

    spdlog::info("API server stopped");
    return true;
}

void ApiServer::setup_routes() {
    auto cache = cache_;
    auto app_name = config_.app_name;
    auto version = config_.version;

    server_->Get("/", [app_name, version](const httplib::Request&, httplib::Response& res) {
        nlohmann::json info = {
            {"name", app_name},
            {"version", version}
        };
        res.set_content(formatter::to_body(info), "application/json");
    });

    // Liveness of the monitor itself, never probes
    server_->Get("/health", [version](const httplib::Request&, httplib::Response& res) {
        nlohmann::json health = {
            {"status", "healthy"},
            {"version", version},
            {"timestamp", util::current_iso8601()}
        };
        res.set_content(formatter::to_body(health), "application/json");
    });

    server_->Get("/api/services", [cache](const httplib::Request&, httplib::Response& res) {
        respond_with_services(*cache, res, false);
    });

    server_->Post("/api/check", [cache](const httplib::Request&, httplib::Response& res) {
        respond_with_services(*cache, res, true);
    });

    server_->Get("/metrics", [cache](const httplib::Request&, httplib::Response& res) {
        try {
            auto batch = cache->get_results(false);
            res.set_content(formatter::metrics_text(*batch), "text/plain; version=0.0.4; charset=utf-8");
        } catch (const std::exception& e) {
            spdlog::error("Failed to render metrics: {}", e.what());
            res.status = 500;
            res.set_content(std::string("# error: ") + e.what() + "\n", "text/plain");
        }
    });

    // Only fills in bodies the handlers left empty
    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }
        const char* message = res.status == 404 ? "Not Found" : "Request failed";
        res.set_content(nlohmann::json{{"error", message}}.dump(), "application/json");
    });
}
