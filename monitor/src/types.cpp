#include "types.hpp"
#include "util.hpp"
#include <algorithm>

nlohmann::json CheckOutcome::to_json() const {
    nlohmann::json j = {
        {"service_name", service_name},
        {"url", url},
        {"is_healthy", is_healthy},
        {"status_code", nullptr},
        {"response_time_ms", response_time_ms},
        {"error_message", nullptr},
        {"checked_at", util::format_timestamp(checked_at)}
    };
    if (status_code) {
        j["status_code"] = *status_code;
    }
    if (error_message) {
        j["error_message"] = *error_message;
    }
    return j;
}

size_t ResultBatch::healthy_count() const {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [](const CheckOutcome& outcome) { return outcome.is_healthy; }));
}
