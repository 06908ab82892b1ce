/**
 * @file snapshot_cache.hpp
 * @brief Holds the most recently published dashboard aggregate.
 *
 * Each refresh fetches a fresh ledger snapshot, aggregates it, and swaps
 * the result in as a whole. Readers always observe one complete aggregate,
 * either the previous one or the new one, never a partially built mix.
 */

#ifndef BUDGET_SERVICE_SNAPSHOT_CACHE_HPP
#define BUDGET_SERVICE_SNAPSHOT_CACHE_HPP

#include "analytics/aggregator.hpp"
#include "data/account_groups.hpp"
#include "data/ledger_source.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

namespace budget
{

    /**
     * @class SnapshotCache
     * @brief Refreshes and publishes DashboardAggregate values
     *
     * Usage:
     * @code
     *   SnapshotCache cache(LedgerSourceFactory::create(config.ledger),
     *                       config.account_groups, config.cash_flow, true);
     *   cache.refresh();
     *   auto aggregate = cache.current();
     * @endcode
     *
     * Thread safety: refresh() calls are serialized. current() may be
     * called from any thread while a refresh is running.
     */
    class SnapshotCache
    {
    public:
        using AggregatePtr = std::shared_ptr<const analytics::DashboardAggregate>;

        /**
         * @param source Primary ledger source
         * @param groups Account group configuration used for every refresh
         * @param options Aggregation options
         * @param fallback_to_demo Publish the demonstration ledger when the source fails
         * @throws std::invalid_argument if source is null
         */
        SnapshotCache(std::unique_ptr<LedgerSource> source,
                      AccountGroupConfig groups,
                      analytics::AggregatorOptions options = analytics::AggregatorOptions(),
                      bool fallback_to_demo = true);

        SnapshotCache(const SnapshotCache &) = delete;
        SnapshotCache &operator=(const SnapshotCache &) = delete;

        /**
         * @brief Fetch, aggregate and publish a new aggregate
         *
         * When the primary source throws and demo fallback is enabled, the
         * demonstration ledger is aggregated instead and the result carries
         * is_demo = true and the fetch error in last_error. Without
         * fallback the error propagates and the previous aggregate stays
         * published.
         *
         * @return The newly published aggregate
         */
        AggregatePtr refresh();

        /**
         * @brief The latest published aggregate, or nullptr before the first refresh
         */
        AggregatePtr current() const;

        /**
         * @brief Time of the last successful publish
         */
        std::optional<std::chrono::system_clock::time_point> last_updated() const;

        /**
         * @brief Number of successful publishes
         */
        size_t refresh_count() const;

        const LedgerSource &source() const { return *source_; }
        bool fallback_to_demo() const { return fallback_to_demo_; }

    private:
        void publish(AggregatePtr aggregate);

        std::unique_ptr<LedgerSource> source_;
        DemoLedgerSource demo_source_;
        AccountGroupConfig groups_;
        analytics::Aggregator aggregator_;
        bool fallback_to_demo_;

        std::mutex refresh_mutex_;         ///< Serializes refresh cycles
        mutable std::mutex publish_mutex_; ///< Guards the fields below
        AggregatePtr current_;
        std::optional<std::chrono::system_clock::time_point> last_updated_;
        size_t refresh_count_ = 0;
    };

} // namespace budget

#endif // BUDGET_SERVICE_SNAPSHOT_CACHE_HPP
