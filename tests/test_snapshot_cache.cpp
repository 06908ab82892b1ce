/**
 * @file test_snapshot_cache.cpp
 * @brief Unit tests for SnapshotCache refresh, fallback and publication
 */

#include <catch2/catch_test_macros.hpp>
#include "service/snapshot_cache.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace budget;

namespace {

/// Source whose behavior is switched between fetches
class ScriptedSource : public LedgerSource {
public:
    ScriptedSource(std::shared_ptr<std::atomic<bool>> fail, LedgerSnapshot snapshot)
        : fail_(std::move(fail)), snapshot_(std::move(snapshot)) {}

    LedgerSnapshot fetch() const override {
        if (*fail_) {
            throw std::runtime_error("ledger server unreachable");
        }
        return snapshot_;
    }

    std::string get_name() const override { return "scripted"; }

private:
    std::shared_ptr<std::atomic<bool>> fail_;
    LedgerSnapshot snapshot_;
};

LedgerSnapshot small_ledger() {
    LedgerSnapshot snapshot;
    snapshot.accounts = {{"1", "Checking", false, false}};
    Transaction tx;
    tx.id = "t1";
    tx.account = "1";
    tx.amount = 12345;
    tx.date = "2024-05-02";
    snapshot.transactions = {tx};
    return snapshot;
}

analytics::AggregatorOptions fixed_options() {
    analytics::AggregatorOptions options;
    options.fallback_date = analytics::CalendarDate{2025, 6, 15};
    return options;
}

AccountGroupConfig checking_groups() {
    return AccountGroupConfig{{"assets_liquid", {"Checking"}}};
}

} // namespace

TEST_CASE("SnapshotCache construction", "[SnapshotCache]") {
    REQUIRE_THROWS_AS(SnapshotCache(nullptr, checking_groups()), std::invalid_argument);

    SnapshotCache cache(std::make_unique<DemoLedgerSource>(), checking_groups());
    REQUIRE(cache.current() == nullptr);
    REQUIRE_FALSE(cache.last_updated().has_value());
    REQUIRE(cache.refresh_count() == 0);
}

TEST_CASE("SnapshotCache publishes successful refreshes", "[SnapshotCache]") {
    auto fail = std::make_shared<std::atomic<bool>>(false);
    SnapshotCache cache(std::make_unique<ScriptedSource>(fail, small_ledger()),
                        checking_groups(), fixed_options(), true);

    auto published = cache.refresh();

    REQUIRE(published != nullptr);
    REQUIRE(cache.current() == published);
    REQUIRE(cache.refresh_count() == 1);
    REQUIRE(cache.last_updated() == published->generated_at);
    REQUIRE_FALSE(published->is_demo);
    REQUIRE(published->source_name == "scripted");
    REQUIRE(published->last_error.empty());
    REQUIRE(published->net_worth_by_month.at("2024-05").balance("assets_liquid") == 123.45);

    SECTION("A later refresh replaces the aggregate wholesale") {
        auto first = cache.current();
        auto second = cache.refresh();
        REQUIRE(second != first);
        REQUIRE(cache.current() == second);
        REQUIRE(cache.refresh_count() == 2);
        // Readers holding the old aggregate keep a complete value
        REQUIRE(first->net_worth_by_month.size() == 1);
    }
}

TEST_CASE("SnapshotCache falls back to demonstration data", "[SnapshotCache]") {
    auto fail = std::make_shared<std::atomic<bool>>(true);
    SnapshotCache cache(std::make_unique<ScriptedSource>(fail, small_ledger()),
                        AccountGroupConfig::defaults(), fixed_options(), true);

    auto published = cache.refresh();

    REQUIRE(published->is_demo);
    REQUIRE(published->source_name == "demo");
    REQUIRE(published->last_error == "ledger server unreachable");
    REQUIRE(published->counts.transactions == LedgerLoader::demo_snapshot().transactions.size());
    REQUIRE(published->net_worth_by_month.size() == 2);

    SECTION("Recovery clears the demo flag") {
        *fail = false;
        auto recovered = cache.refresh();
        REQUIRE_FALSE(recovered->is_demo);
        REQUIRE(recovered->last_error.empty());
    }
}

TEST_CASE("SnapshotCache without fallback propagates errors", "[SnapshotCache]") {
    auto fail = std::make_shared<std::atomic<bool>>(false);
    SnapshotCache cache(std::make_unique<ScriptedSource>(fail, small_ledger()),
                        checking_groups(), fixed_options(), false);

    auto good = cache.refresh();

    *fail = true;
    REQUIRE_THROWS_AS(cache.refresh(), std::runtime_error);
    REQUIRE(cache.current() == good);
    REQUIRE(cache.refresh_count() == 1);
}

TEST_CASE("SnapshotCache demo source marks its output", "[SnapshotCache]") {
    SnapshotCache cache(std::make_unique<DemoLedgerSource>(), AccountGroupConfig::defaults(), fixed_options());
    auto published = cache.refresh();
    REQUIRE(published->is_demo);
    REQUIRE(published->last_error.empty());
}

TEST_CASE("SnapshotCache concurrent refresh and read", "[SnapshotCache]") {
    auto fail = std::make_shared<std::atomic<bool>>(false);
    SnapshotCache cache(std::make_unique<ScriptedSource>(fail, small_ledger()),
                        checking_groups(), fixed_options(), true);

    std::atomic<bool> incomplete{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache]() {
            for (int i = 0; i < 10; ++i) {
                cache.refresh();
            }
        });
    }
    threads.emplace_back([&cache, &incomplete]() {
        for (int i = 0; i < 200; ++i) {
            auto current = cache.current();
            if (current && current->net_worth_by_month.size() != 1) {
                incomplete = true;
            }
        }
    });

    for (auto &thread : threads) {
        thread.join();
    }

    REQUIRE_FALSE(incomplete);
    REQUIRE(cache.refresh_count() == 40);
}
