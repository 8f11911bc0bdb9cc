#include <gtest/gtest.h>
#include "formatter.hpp"
#include <sstream>

namespace {

CheckOutcome make_outcome(const std::string& name, bool healthy, double response_time_ms) {
    CheckOutcome outcome;
    outcome.service_name = name;
    outcome.url = "http://" + name;
    outcome.is_healthy = healthy;
    outcome.response_time_ms = response_time_ms;
    if (healthy) {
        outcome.status_code = 200;
    } else {
        outcome.error_message = "Connection timeout";
    }
    outcome.checked_at = std::chrono::system_clock::now();
    return outcome;
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TEST(FormatterTest, MetricsForSingleHealthyService) {
    ResultBatch batch;
    batch.results.push_back(make_outcome("a", true, 12.34));

    auto text = formatter::metrics_text(batch);

    EXPECT_NE(text.find("service_up{service=\"a\"} 1\n"), std::string::npos);
    EXPECT_NE(text.find("service_response_time_ms{service=\"a\"} 12.34\n"), std::string::npos);
    EXPECT_NE(text.find("# TYPE service_up gauge\n"), std::string::npos);
    EXPECT_NE(text.find("# TYPE service_response_time_ms gauge\n"), std::string::npos);
}

TEST(FormatterTest, MetricsSeriesKeepBatchOrderAndHeaders) {
    ResultBatch batch;
    batch.results.push_back(make_outcome("zeta", false, 10000.5));
    batch.results.push_back(make_outcome("alpha", true, 3.0));

    auto lines = lines_of(formatter::metrics_text(batch));

    ASSERT_EQ(lines.size(), 8u);
    EXPECT_EQ(lines[0].rfind("# HELP service_up ", 0), 0u);
    EXPECT_EQ(lines[1], "# TYPE service_up gauge");
    EXPECT_EQ(lines[2], "service_up{service=\"zeta\"} 0");
    EXPECT_EQ(lines[3], "service_up{service=\"alpha\"} 1");
    EXPECT_EQ(lines[4].rfind("# HELP service_response_time_ms ", 0), 0u);
    EXPECT_EQ(lines[5], "# TYPE service_response_time_ms gauge");
    EXPECT_EQ(lines[6], "service_response_time_ms{service=\"zeta\"} 10000.5");
    EXPECT_EQ(lines[7], "service_response_time_ms{service=\"alpha\"} 3");
}

TEST(FormatterTest, EmptyBatchRendersHeadersOnly) {
    ResultBatch batch;

    auto lines = lines_of(formatter::metrics_text(batch));
    ASSERT_EQ(lines.size(), 4u);
    for (const auto& line : lines) {
        EXPECT_EQ(line[0], '#');
    }

    auto view = formatter::services_view(batch);
    EXPECT_TRUE(view["services"].is_array());
    EXPECT_TRUE(view["services"].empty());
    EXPECT_EQ(view["total"], 0);
    EXPECT_EQ(view["healthy"], 0);
    EXPECT_EQ(view["unhealthy"], 0);
}

TEST(FormatterTest, ServicesViewCountsHealth) {
    ResultBatch batch;
    batch.results.push_back(make_outcome("a", true, 1.0));
    batch.results.push_back(make_outcome("b", false, 2.0));
    batch.results.push_back(make_outcome("c", true, 3.0));

    auto view = formatter::services_view(batch);

    EXPECT_EQ(view["total"], 3);
    EXPECT_EQ(view["healthy"], 2);
    EXPECT_EQ(view["unhealthy"], 1);
    ASSERT_EQ(view["services"].size(), 3u);
    EXPECT_EQ(view["services"][1]["service_name"], "b");
    EXPECT_TRUE(view.contains("checked_at"));
}

TEST(FormatterTest, OutcomeJsonUsesNullForAbsentFields) {
    auto healthy = make_outcome("a", true, 12.34).to_json();
    EXPECT_EQ(healthy["status_code"], 200);
    EXPECT_TRUE(healthy["error_message"].is_null());
    EXPECT_DOUBLE_EQ(healthy["response_time_ms"].get<double>(), 12.34);

    auto failed = make_outcome("b", false, 50.0).to_json();
    EXPECT_TRUE(failed["status_code"].is_null());
    EXPECT_EQ(failed["error_message"], "Connection timeout");
    EXPECT_FALSE(failed["is_healthy"].get<bool>());

    auto checked_at = failed["checked_at"].get<std::string>();
    EXPECT_EQ(checked_at.size(), 24u);
    EXPECT_EQ(checked_at.back(), 'Z');
}

TEST(FormatterTest, LabelValuesAreEscaped) {
    EXPECT_EQ(formatter::escape_label("plain"), "plain");
    EXPECT_EQ(formatter::escape_label("say \"hi\""), "say \\\"hi\\\"");
    EXPECT_EQ(formatter::escape_label("a\\b"), "a\\\\b");
    EXPECT_EQ(formatter::escape_label("two\nlines"), "two\\nlines");
}

TEST(FormatterTest, BodyReplacesInvalidUtf8) {
    ResultBatch batch;
    batch.results.push_back(make_outcome("bad\xff", false, 1.0));
    batch.results.back().error_message = std::string("reset by \xc3", 10);
    batch.produced_at = std::chrono::system_clock::now();

    std::string body;
    ASSERT_NO_THROW(body = formatter::to_body(formatter::services_view(batch)));

    auto parsed = nlohmann::json::parse(body);
    EXPECT_EQ(parsed["services"][0]["service_name"], "bad\xEF\xBF\xBD");
    EXPECT_EQ(parsed["services"][0]["error_message"], "reset by \xEF\xBF\xBD");
}
