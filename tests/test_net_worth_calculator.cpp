/**
 * @file test_net_worth_calculator.cpp
 * @brief Unit tests for NetWorthCalculator and GroupBalances
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "analytics/net_worth_calculator.hpp"

using namespace budget;
using namespace budget::analytics;
using Catch::Matchers::WithinAbs;

namespace {

Transaction make_tx(const std::string &account, MinorUnits amount, const std::string &date,
                    std::optional<std::string> transfer_id = std::nullopt) {
    Transaction tx;
    tx.account = account;
    tx.amount = amount;
    tx.date = date;
    tx.transfer_id = std::move(transfer_id);
    return tx;
}

const CalendarDate FIXED_TODAY{2025, 6, 15};

} // namespace

TEST_CASE("GroupBalances accessors", "[NetWorth]") {
    GroupBalances balances{
        {"assets_liquid", 1000.0},
        {"assets_physical", 250000.0},
        {"liabilities_physical", -180000.0},
    };

    REQUIRE(balances.balance("assets_liquid") == 1000.0);
    REQUIRE(balances.balance("assets_unknown") == 0.0);
    REQUIRE_FALSE(balances.contains("assets_unknown"));
    REQUIRE(balances.total_assets() == 251000.0);
    REQUIRE(balances.total_debts() == -180000.0);
    REQUIRE(balances.net_worth() == 71000.0);

    SECTION("set replaces an existing value in place") {
        balances.set("assets_liquid", 5.0);
        REQUIRE(balances.size() == 3);
        REQUIRE(balances.entries().front().second == 5.0);
    }
}

TEST_CASE("Net worth example scenario", "[NetWorth]") {
    std::vector<Account> accounts{{"1", "Checking", false, false}};
    AccountGroupConfig groups{{"assets_liquid", {"Checking"}}};

    auto t2 = make_tx("1", -10000, "2024-02-01");
    t2.category = "c1";
    std::vector<Transaction> transactions{make_tx("1", 500000, "2024-01-15"), t2};

    auto result = compute_net_worth_by_month(transactions, accounts, groups);

    REQUIRE(result.size() == 2);
    REQUIRE(result.at("2024-01").balance("assets_liquid") == 5000.0);
    REQUIRE(result.at("2024-02").balance("assets_liquid") == 4900.0);
}

TEST_CASE("Net worth properties", "[NetWorth]") {
    std::vector<Account> accounts{
        {"1", "Checking", false, false},
        {"2", "Savings", false, false},
        {"3", "Visa", false, false},
    };
    AccountGroupConfig groups{
        {"assets_liquid", {"Checking", "Savings"}},
        {"assets_physical", {"House"}},
        {"liabilities_revolving", {"Visa"}},
    };
    std::vector<Transaction> transactions{
        make_tx("1", 100000, "2024-01-03"),
        make_tx("3", -25050, "2024-01-20"),
        make_tx("2", 40000, "20240310"),
        make_tx("1", -15000, "2024-03-11", std::string("t9")),
        make_tx("2", 15000, "2024-03-11", std::string("t8")),
        make_tx("1", -1234, "2024-05-01"),
    };

    NetWorthCalculator calculator{DateBucketer(FIXED_TODAY)};
    auto result = calculator.compute(transactions, accounts, groups);

    SECTION("Months are the distinct transaction months, ascending") {
        std::vector<MonthKey> months;
        for (const auto &entry : result)
            months.push_back(entry.first);
        REQUIRE(months == std::vector<MonthKey>{"2024-01", "2024-03", "2024-05"});
    }

    SECTION("Idempotence") {
        auto again = calculator.compute(transactions, accounts, groups);
        REQUIRE(again == result);
    }

    SECTION("Completeness: every group in every month") {
        for (const auto &entry : result) {
            for (const auto &name : groups.group_names()) {
                REQUIRE(entry.second.contains(name));
            }
        }
        REQUIRE(result.at("2024-05").balance("assets_physical") == 0.0);
    }

    SECTION("Cumulative balances") {
        REQUIRE(result.at("2024-01").balance("assets_liquid") == 1000.0);
        REQUIRE(result.at("2024-03").balance("assets_liquid") == 1400.0);
        REQUIRE_THAT(result.at("2024-05").balance("assets_liquid"), WithinAbs(1387.66, 1e-9));
    }

    SECTION("No later activity leaves a group unchanged") {
        REQUIRE(result.at("2024-01").balance("liabilities_revolving") == -250.5);
        REQUIRE(result.at("2024-03").balance("liabilities_revolving") == -250.5);
        REQUIRE(result.at("2024-05").balance("liabilities_revolving") == -250.5);
    }

    SECTION("Transfers move balances") {
        GroupBalances without_transfers = NetWorthCalculator(DateBucketer(FIXED_TODAY))
            .compute({transactions[0], transactions[2]}, accounts, groups).at("2024-03");
        REQUIRE(without_transfers.balance("assets_liquid") == 1400.0);

        // One leg only: the transfer affects the group balance
        auto one_leg = calculator.compute({transactions[0], transactions[3]}, accounts, groups);
        REQUIRE(one_leg.at("2024-03").balance("assets_liquid") == 850.0);
    }
}

TEST_CASE("Net worth edge cases", "[NetWorth]") {
    AccountGroupConfig groups{{"assets_liquid", {"Checking"}}};

    SECTION("No transactions yields no months") {
        auto result = compute_net_worth_by_month({}, {{"1", "Checking", false, false}}, groups);
        REQUIRE(result.empty());
    }

    SECTION("Unknown account names contribute nothing") {
        auto result = compute_net_worth_by_month({make_tx("1", 5000, "2024-01-01")},
                                                 {{"1", "Other", false, false}}, groups);
        REQUIRE(result.at("2024-01").balance("assets_liquid") == 0.0);
    }

    SECTION("Unparseable dates land in the current month and are counted") {
        DateParseStats stats;
        NetWorthCalculator calculator{DateBucketer(FIXED_TODAY)};
        auto result = calculator.compute({make_tx("1", 5000, "garbage"), make_tx("1", 100, "2024-01-01")},
                                         {{"1", "Checking", false, false}}, groups, &stats);

        REQUIRE(stats.fallback == 1);
        REQUIRE(stats.iso == 1);
        REQUIRE(result.at("2024-01").balance("assets_liquid") == 1.0);
        REQUIRE(result.at("2025-06").balance("assets_liquid") == 51.0);
    }

    SECTION("Overlapping groups built in code count the account in both") {
        AccountGroupConfig overlapping{
            {"assets_liquid", {"Checking"}},
            {"assets_restricted", {"Checking"}},
        };
        auto result = compute_net_worth_by_month({make_tx("1", 1000, "2024-01-01")},
                                                 {{"1", "Checking", false, false}}, overlapping);
        REQUIRE(result.at("2024-01").total_assets() == 20.0);
    }
}
