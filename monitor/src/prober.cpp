#include "prober.hpp"
#include "util.hpp"
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

class HttpProber::Impl {
public:
    explicit Impl(const std::string& user_agent) : user_agent_(user_agent) {}

    CheckOutcome probe(const std::string& name,
                       const std::string& url,
                       std::chrono::milliseconds timeout) {
        CheckOutcome outcome;
        outcome.service_name = name;
        outcome.url = url;

        auto start = std::chrono::steady_clock::now();

        try {
            auto response = cpr::Get(
                cpr::Url{url},
                cpr::Timeout{timeout},
                cpr::Header{{"User-Agent", user_agent_}}
            );
            outcome.response_time_ms = util::elapsed_ms(start);

            if (response.error) {
                outcome.is_healthy = false;
                outcome.error_message = describe_error(response.error);
                spdlog::warn("Probe {} ({}) failed after {} ms: {}",
                             name, url, outcome.response_time_ms, *outcome.error_message);
            } else {
                // 2xx and 3xx count as healthy
                outcome.status_code = static_cast<int>(response.status_code);
                outcome.is_healthy = response.status_code < 400;
                spdlog::debug("Probe {} ({}) returned {} in {} ms",
                              name, url, response.status_code, outcome.response_time_ms);
            }
        } catch (const std::exception& e) {
            outcome.response_time_ms = util::elapsed_ms(start);
            outcome.is_healthy = false;
            outcome.status_code.reset();
            outcome.error_message = e.what();
            spdlog::error("Exception while probing {} ({}): {}", name, url, e.what());
        }

        outcome.checked_at = std::chrono::system_clock::now();
        return outcome;
    }

private:
    static std::string describe_error(const cpr::Error& error) {
        if (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            return "Connection timeout";
        }
        if (!error.message.empty()) {
            return error.message;
        }
        return "Connection failed (cpr error " + std::to_string(static_cast<int>(error.code)) + ")";
    }

    std::string user_agent_;
};

// Public interface implementation
HttpProber::HttpProber(const std::string& user_agent)
    : pImpl_(std::make_unique<Impl>(user_agent)) {}

HttpProber::~HttpProber() = default;

CheckOutcome HttpProber::probe(const std::string& name,
                               const std::string& url,
                               std::chrono::milliseconds timeout) {
    return pImpl_->probe(name, url, timeout);
}
