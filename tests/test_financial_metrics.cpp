/**
 * @file test_financial_metrics.cpp
 * @brief Unit tests for MetricsCalculator and DashboardSummary
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/financial_metrics.hpp"

using namespace budget::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("Metric formulas", "[Metrics]") {
    SECTION("Savings rate") {
        REQUIRE_THAT(MetricsCalculator::savings_rate(8000.0, 2000.0), WithinAbs(0.75, 1e-12));
        REQUIRE_THAT(MetricsCalculator::savings_rate(1000.0, 1500.0), WithinAbs(-0.5, 1e-12));
    }

    SECTION("Withdrawal rate uses unsigned expenses") {
        REQUIRE_THAT(MetricsCalculator::withdrawal_rate(1000.0, 250000.0), WithinAbs(0.004, 1e-12));
    }

    SECTION("Savings multiple is years of expenses covered") {
        REQUIRE_THAT(MetricsCalculator::savings_multiple(120000.0, 1000.0), WithinAbs(10.0, 1e-12));
    }

    SECTION("Degenerate inputs") {
        REQUIRE(MetricsCalculator::savings_rate(0.0, 500.0) == 0.0);
        REQUIRE(MetricsCalculator::savings_rate(-10.0, 500.0) == 0.0);
        REQUIRE(MetricsCalculator::withdrawal_rate(500.0, 0.0) == 0.0);
        REQUIRE(MetricsCalculator::withdrawal_rate(500.0, -100.0) == 0.0);
        REQUIRE(MetricsCalculator::savings_multiple(100000.0, 0.0) == 0.0);
    }
}

TEST_CASE("Metrics example scenario", "[Metrics]") {
    NetWorthByMonth nw{
        {"2024-01", GroupBalances{{"assets_liquid", 5000.0}}},
        {"2024-02", GroupBalances{{"assets_liquid", 4900.0}}},
    };
    CashFlowByMonth cf{{"2024-02", CashFlow{0.0, 100.0, -100.0}}};

    auto metrics = compute_metrics(nw, cf);

    REQUIRE(metrics.size() == 1);
    REQUIRE(metrics.savings_rate == std::vector<double>{0.0});
    REQUIRE_THAT(metrics.withdrawal_rate[0], WithinAbs(100.0 / 4900.0, 1e-12));
    REQUIRE_THAT(metrics.savings_multiple[0], WithinAbs(4900.0 / 1200.0, 1e-12));
}

TEST_CASE("Metrics ordering and asset basis", "[Metrics]") {
    NetWorthByMonth nw{
        {"2024-01", GroupBalances{{"assets_liquid", 10000.0}, {"liabilities_revolving", -9000.0}}},
        {"2024-02", GroupBalances{{"assets_liquid", 12000.0}, {"liabilities_revolving", -9000.0}}},
    };
    CashFlowByMonth cf{
        {"2024-01", CashFlow{4000.0, 1000.0, 3000.0}},
        {"2024-02", CashFlow{4000.0, 2000.0, 2000.0}},
        {"2024-03", CashFlow{4000.0, 3000.0, 1000.0}},
    };

    auto metrics = compute_metrics(nw, cf);

    SECTION("Index 0 is the most recent month") {
        REQUIRE(metrics.months == std::vector<MonthKey>{"2024-03", "2024-02", "2024-01"});
        REQUIRE_THAT(metrics.savings_rate[0], WithinAbs(0.25, 1e-12));
        REQUIRE_THAT(metrics.savings_rate[2], WithinAbs(0.75, 1e-12));
    }

    SECTION("Liabilities are excluded from total assets") {
        REQUIRE_THAT(metrics.withdrawal_rate[1], WithinAbs(2000.0 / 12000.0, 1e-12));
    }

    SECTION("Month without net worth entry has zero assets") {
        REQUIRE(metrics.withdrawal_rate[0] == 0.0);
        REQUIRE(metrics.savings_multiple[0] == 0.0);
    }

    SECTION("Empty cash flow gives empty metrics") {
        REQUIRE(compute_metrics(nw, {}).empty());
    }
}

TEST_CASE("DashboardSummary", "[Metrics]") {
    NetWorthByMonth nw{
        {"2024-01", GroupBalances{{"assets_liquid", 1000.0}, {"liabilities_physical", -500.0}}},
        {"2024-02", GroupBalances{{"assets_liquid", 1500.0}, {"liabilities_physical", -450.0}}},
    };
    CashFlowByMonth cf{
        {"2024-01", CashFlow{1000.0, 800.0, 200.0}},
        {"2024-02", CashFlow{1000.0, 600.0, 400.0}},
    };

    SECTION("Latest month figures with changes") {
        auto summary = DashboardSummary::from_series(nw, cf);

        REQUIRE(summary.latest_month == std::optional<MonthKey>("2024-02"));
        REQUIRE(summary.total_assets == 1500.0);
        REQUIRE(summary.total_debts == -450.0);
        REQUIRE(summary.net_worth == 1050.0);
        REQUIRE_THAT(summary.savings_rate, WithinAbs(0.4, 1e-12));

        REQUIRE(summary.assets_change == std::optional<double>(500.0));
        REQUIRE(summary.debts_change == std::optional<double>(50.0));
        REQUIRE(summary.net_worth_change == std::optional<double>(550.0));
        REQUIRE(summary.savings_rate_change.has_value());
        REQUIRE_THAT(*summary.savings_rate_change, WithinAbs(0.2, 1e-12));
        REQUIRE(summary.group_balances.balance("liabilities_physical") == -450.0);
    }

    SECTION("Single month has no changes") {
        NetWorthByMonth one{{"2024-01", nw.at("2024-01")}};
        auto summary = DashboardSummary::from_series(one, {});

        REQUIRE_FALSE(summary.assets_change.has_value());
        REQUIRE_FALSE(summary.savings_rate_change.has_value());
        REQUIRE(summary.savings_rate == 0.0);
        REQUIRE(summary.to_json()["assets_change"].is_null());
    }

    SECTION("Empty series") {
        auto summary = DashboardSummary::from_series({}, {});
        REQUIRE_FALSE(summary.latest_month.has_value());
        REQUIRE(summary.net_worth == 0.0);
    }
}

TEST_CASE("humanize_group_name", "[Metrics]") {
    REQUIRE(humanize_group_name("assets_liquid") == "Assets Liquid");
    REQUIRE(humanize_group_name("liabilities_revolving") == "Liabilities Revolving");
    REQUIRE(humanize_group_name("") == "");
}
