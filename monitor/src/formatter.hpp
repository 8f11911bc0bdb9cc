#pragma once

#include "types.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace formatter {

// {services: [...], total, healthy, unhealthy, checked_at}
nlohmann::json services_view(const ResultBatch& batch);

// Serialized JSON body. Invalid UTF-8 in names, urls or error text is
// replaced with U+FFFD instead of failing the response.
std::string to_body(const nlohmann::json& value);

// Prometheus text exposition: service_up and service_response_time_ms gauges
std::string metrics_text(const ResultBatch& batch);

// Escapes a label value for the exposition format
std::string escape_label(const std::string& value);

} // namespace formatter
