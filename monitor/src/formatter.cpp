#include "formatter.hpp"
#include "util.hpp"
#include <fmt/format.h>

namespace formatter {

nlohmann::json services_view(const ResultBatch& batch) {
    nlohmann::json services = nlohmann::json::array();
    for (const auto& outcome : batch.results) {
        services.push_back(outcome.to_json());
    }

    size_t healthy = batch.healthy_count();
    return {
        {"services", services},
        {"total", batch.results.size()},
        {"healthy", healthy},
        {"unhealthy", batch.results.size() - healthy},
        {"checked_at", util::format_timestamp(batch.produced_at)}
    };
}

std::string to_body(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string metrics_text(const ResultBatch& batch) {
    std::string out;

    out += "# HELP service_up Whether the service answered with a status below 400 (1) or not (0)\n";
    out += "# TYPE service_up gauge\n";
    for (const auto& outcome : batch.results) {
        out += fmt::format("service_up{{service=\"{}\"}} {}\n",
                           escape_label(outcome.service_name), outcome.is_healthy ? 1 : 0);
    }

    out += "# HELP service_response_time_ms Duration of the last health check in milliseconds\n";
    out += "# TYPE service_response_time_ms gauge\n";
    for (const auto& outcome : batch.results) {
        out += fmt::format("service_response_time_ms{{service=\"{}\"}} {}\n",
                           escape_label(outcome.service_name), outcome.response_time_ms);
    }

    return out;
}

std::string escape_label(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"':  escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default:   escaped += c;
        }
    }
    return escaped;
}

} // namespace formatter
