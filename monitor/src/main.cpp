#include "config.hpp"
#include "monitor_service.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <cstdlib>
#include <memory>

// Global pointer to the service to allow signal handler to access it
std::unique_ptr<MonitorService> service_ptr;

void signal_handler(int) {
    if (service_ptr) {
        service_ptr->stop();
    }
}

int main() {
    try {
        // 1. Load configuration
        Config config = Config::from_env();
        config.validate();

        // 2. Setup logging
        spdlog::set_default_logger(spdlog::stdout_color_mt("svcmon"));
        spdlog::set_level(spdlog::level::from_str(config.log_level));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [tid %t] %v");
        spdlog::info("Log level set to '{}'", config.log_level);
        spdlog::info("Starting {} {}...", config.app_name, config.version);

        // 3. Register signal handlers for graceful shutdown
        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        // 4. Create and run the service
        service_ptr = std::make_unique<MonitorService>(config);
        bool clean = service_ptr->run();
        service_ptr.reset();

        // A refresh left running in the background must not delay exit
        if (!clean) {
            spdlog::info("Service monitor shut down with a refresh still in flight.");
            spdlog::default_logger()->flush();
            std::quick_exit(0);
        }

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        service_ptr.reset();
        return 1;
    }

    spdlog::info("Service monitor has shut down gracefully.");
    return 0;
}
