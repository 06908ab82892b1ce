/**
 * @file test_net_worth_table.cpp
 * @brief Unit tests for NetWorthTable
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/net_worth_table.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace budget::analytics;
using Catch::Matchers::WithinAbs;

namespace {

NetWorthByMonth sample_net_worth() {
    return {
        {"2024-01", GroupBalances{{"assets_liquid", 1000.0}, {"assets_physical", 5000.0}, {"liabilities_physical", -4000.0}}},
        {"2024-02", GroupBalances{{"assets_liquid", 1200.0}, {"assets_physical", 5000.0}, {"liabilities_physical", -3900.0}}},
        {"2024-03", GroupBalances{{"assets_liquid", 900.0}, {"assets_physical", 5100.0}, {"liabilities_physical", -3800.0}}},
    };
}

const std::vector<std::string> GROUPS = {"assets_liquid", "assets_physical", "liabilities_physical"};

} // namespace

TEST_CASE("NetWorthTable construction", "[NetWorthTable]") {
    SECTION("From net worth series") {
        auto table = NetWorthTable::from_net_worth(sample_net_worth(), GROUPS);
        REQUIRE(table.num_months() == 3);
        REQUIRE(table.num_groups() == 3);
        REQUIRE(table.months().front() == "2024-01");
        REQUIRE(table.balances()(1, 0) == 1200.0);
    }

    SECTION("Groups missing from a month read as zero") {
        auto table = NetWorthTable::from_net_worth(sample_net_worth(), {"assets_liquid", "liabilities_revolving"});
        REQUIRE(table.group_series("liabilities_revolving").isZero());
    }

    SECTION("Dimension mismatch") {
        Eigen::MatrixXd balances(2, 2);
        balances.setZero();
        REQUIRE_THROWS_AS(NetWorthTable(balances, {"2024-01"}, {"a", "b"}), std::invalid_argument);
        REQUIRE_THROWS_AS(NetWorthTable(balances, {"2024-01", "2024-02"}, {"a"}), std::invalid_argument);
    }
}

TEST_CASE("NetWorthTable totals", "[NetWorthTable]") {
    auto table = NetWorthTable::from_net_worth(sample_net_worth(), GROUPS);

    Eigen::VectorXd assets = table.total_assets();
    Eigen::VectorXd debts = table.total_debts();
    Eigen::VectorXd net = table.net_worth();

    REQUIRE_THAT(assets(0), WithinAbs(6000.0, 1e-9));
    REQUIRE_THAT(debts(1), WithinAbs(-3900.0, 1e-9));
    REQUIRE_THAT(net(2), WithinAbs(2200.0, 1e-9));

    SECTION("Month-over-month changes") {
        Eigen::MatrixXd changes = table.monthly_changes();
        REQUIRE(changes.rows() == 2);
        REQUIRE_THAT(changes(0, 0), WithinAbs(200.0, 1e-9));
        REQUIRE_THAT(changes(1, 0), WithinAbs(-300.0, 1e-9));
        REQUIRE_THAT(changes(1, 2), WithinAbs(100.0, 1e-9));
    }

    SECTION("Lookups") {
        REQUIRE(table.month_row("2024-03")(1) == 5100.0);
        REQUIRE_THROWS_AS(table.month_row("2023-12"), std::invalid_argument);
        REQUIRE_THROWS_AS(table.group_series("assets_unknown"), std::invalid_argument);
    }
}

TEST_CASE("NetWorthTable CSV export", "[NetWorthTable]") {
    auto table = NetWorthTable::from_net_worth(sample_net_worth(), GROUPS);
    auto dir = std::filesystem::temp_directory_path() / "budget_dashboard_table";
    auto path = (dir / "nested" / "net_worth.csv").string();

    table.to_csv(path);

    std::ifstream file(path);
    REQUIRE(file.is_open());

    std::string header, first;
    std::getline(file, header);
    std::getline(file, first);

    REQUIRE(header == "month,assets_liquid,assets_physical,liabilities_physical,total_assets,total_debts,net_worth");
    REQUIRE(first == "2024-01,1000.00,5000.00,-4000.00,6000.00,-4000.00,2000.00");

    file.close();
    std::filesystem::remove_all(dir);
}
