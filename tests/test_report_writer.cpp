/**
 * @file test_report_writer.cpp
 * @brief Unit tests for ReportWriter exports and number formatting
 */

#include <catch2/catch_test_macros.hpp>
#include "report/report_writer.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace budget;
using namespace budget::report;

namespace {

analytics::DashboardAggregate demo_aggregate() {
    analytics::AggregatorOptions options;
    options.fallback_date = analytics::CalendarDate{2025, 6, 15};
    auto aggregate = analytics::Aggregator(options).compute(LedgerLoader::demo_snapshot(),
                                                            AccountGroupConfig::defaults());
    aggregate.source_name = "demo";
    aggregate.is_demo = true;
    return aggregate;
}

std::vector<std::string> read_lines(const std::string &path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TEST_CASE("Currency formatting", "[ReportWriter]") {
    REQUIRE(format_currency(1234.56) == "$1,234.56");
    REQUIRE(format_currency(0.0) == "$0.00");
    REQUIRE(format_currency(5.5) == "$5.50");
    REQUIRE(format_currency(999.999) == "$1,000.00");
    REQUIRE(format_currency(1234567.0) == "$1,234,567.00");
    REQUIRE(format_currency(-80.0) == "-$80.00");
    REQUIRE(format_currency(-0.001) == "$0.00");
}

TEST_CASE("Percentage formatting", "[ReportWriter]") {
    REQUIRE(format_percentage(0.123) == "12.3%");
    REQUIRE(format_percentage(0.0) == "0.0%");
    REQUIRE(format_percentage(1.0) == "100.0%");
    REQUIRE(format_percentage(-0.05) == "-5.0%");
}

TEST_CASE("Change formatting carries a sign", "[ReportWriter]") {
    REQUIRE(format_change(100.0, false) == "+$100.00");
    REQUIRE(format_change(-2000.0, false) == "-$2,000.00");
    REQUIRE(format_change(0.025, true) == "+2.5%");
}

TEST_CASE("ReportWriter file exports", "[ReportWriter]") {
    auto aggregate = demo_aggregate();
    auto dir = std::filesystem::temp_directory_path() / "budget_dashboard_reports";
    std::filesystem::remove_all(dir);

    SECTION("write_all writes every enabled output") {
        OutputConfig config;
        config.directory = dir.string();

        auto written = ReportWriter::write_all(aggregate, config);
        REQUIRE(written.size() == 4);
        for (const auto &path : written) {
            REQUIRE(std::filesystem::exists(path));
        }

        auto cash_flow = read_lines((dir / "cash_flow.csv").string());
        REQUIRE(cash_flow.size() == 3);
        REQUIRE(cash_flow[0] == "month,income,expenses,net");
        REQUIRE(cash_flow[1] == "2024-01,8000.00,1100.00,6900.00");

        auto metrics = read_lines((dir / "metrics.csv").string());
        REQUIRE(metrics.size() == 3);
        REQUIRE(metrics[0] == "month,savings_rate,withdrawal_rate,savings_multiple");
        REQUIRE(metrics[1].rfind("2024-02,0.868750,", 0) == 0);

        auto net_worth = read_lines((dir / "net_worth.csv").string());
        REQUIRE(net_worth.size() == 3);
        REQUIRE(net_worth[0].rfind("month,assets_liquid,", 0) == 0);
    }

    SECTION("Disabled outputs are skipped") {
        OutputConfig config;
        config.directory = dir.string();
        config.write_csv = false;

        auto written = ReportWriter::write_all(aggregate, config);
        REQUIRE(written.size() == 1);
        REQUIRE_FALSE(std::filesystem::exists(dir / "net_worth.csv"));

        std::ifstream file(written[0]);
        auto j = nlohmann::json::parse(file);
        REQUIRE(j["is_demo"] == true);
        REQUIRE(j["summary"]["latest_month"] == "2024-02");
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("ReportWriter console summary", "[ReportWriter]") {
    auto aggregate = demo_aggregate();
    aggregate.last_error = "connection refused";

    std::ostringstream out;
    ReportWriter::print_summary(aggregate, out);
    std::string text = out.str();

    REQUIRE(text.find("DASHBOARD SUMMARY (2024-02)") != std::string::npos);
    REQUIRE(text.find("demonstration data (connection refused)") != std::string::npos);
    REQUIRE(text.find("$646,850.00") != std::string::npos);
    REQUIRE(text.find("-$278,000.00") != std::string::npos);
    REQUIRE(text.find("86.9%") != std::string::npos);
    REQUIRE(text.find("Assets Liquid") != std::string::npos);
    REQUIRE(text.find("+$6,950.00") != std::string::npos);
}
