/**
 * @file aggregator.hpp
 * @brief Runs the net worth, cash flow and metrics calculators over one ledger snapshot.
 *
 * The Aggregator is a pure function of its inputs: a ledger snapshot and
 * an account group configuration go in, one complete DashboardAggregate
 * comes out. It holds no state between calls and never throws on ledger
 * content; malformed dates and unresolved references degrade to the
 * documented defaults and are counted in the result's diagnostics.
 */

#ifndef BUDGET_ANALYTICS_AGGREGATOR_HPP
#define BUDGET_ANALYTICS_AGGREGATOR_HPP

#include "analytics/cash_flow_calculator.hpp"
#include "analytics/date_bucketer.hpp"
#include "analytics/financial_metrics.hpp"
#include "analytics/net_worth_calculator.hpp"
#include "analytics/net_worth_table.hpp"
#include "data/account_groups.hpp"
#include "data/ledger.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace budget
{
    namespace analytics
    {

        /**
         * @struct AggregatorOptions
         * @brief Cash-flow presentation settings and diagnostics.
         */
        struct AggregatorOptions
        {
            std::vector<int> moving_average_windows{6, 12}; ///< Trailing MA windows, in months
            bool exclude_first_month = false;               ///< Drop the first cash-flow month
            bool exclude_current_month = false;             ///< Drop the last cash-flow month
            std::vector<std::string> filter_payees;         ///< Payee names or ids left out of cash flow
            std::optional<CalendarDate> fallback_date;      ///< Date for unparseable records (default: today UTC)
            bool verbose = false;                           ///< Report diagnostics on stderr

            /**
             * @brief Load from the "cash_flow" config section.
             * @throws std::invalid_argument on a non-positive window
             */
            static AggregatorOptions from_json(const nlohmann::ordered_json &j);
        };

        /**
         * @struct LedgerCounts
         * @brief Record counts of the snapshot an aggregate was built from.
         */
        struct LedgerCounts
        {
            size_t accounts = 0;
            size_t categories = 0;
            size_t payees = 0;
            size_t transactions = 0;
        };

        /**
         * @struct CashFlowAverage
         * @brief Trailing moving averages of the cash-flow series for one window.
         *
         * Entry i averages months [i, i + window - 1] of the ascending series.
         */
        struct CashFlowAverage
        {
            int window = 0;
            Eigen::VectorXd income;
            Eigen::VectorXd expenses;
            Eigen::VectorXd net;
        };

        /**
         * @struct DashboardAggregate
         * @brief Everything the presentation layer consumes, computed in one pass.
         *
         * Treated as immutable once published.
         */
        struct DashboardAggregate
        {
            LedgerCounts counts;
            AccountGroupConfig account_groups;
            NetWorthByMonth net_worth_by_month;
            CashFlowByMonth cash_flow_by_month;
            Metrics metrics;
            DashboardSummary summary;
            std::vector<CashFlowAverage> cash_flow_averages;
            DateParseStats date_stats;

            bool is_demo = false;    ///< Built from the demonstration dataset
            std::string source_name; ///< Ledger source that produced the snapshot
            std::string last_error;  ///< Fetch error that triggered the demo fallback, if any
            std::chrono::system_clock::time_point generated_at;

            /// Dense months x groups view of net_worth_by_month
            NetWorthTable net_worth_table() const;

            /// Ascending cash-flow vectors
            CashFlowSeries cash_flow_series() const;

            nlohmann::ordered_json to_json() const;
        };

        /**
         * @class Aggregator
         * @brief Computes a DashboardAggregate from a ledger snapshot.
         *
         * Usage:
         * @code
         *   Aggregator aggregator;
         *   DashboardAggregate result = aggregator.compute(snapshot, groups);
         *   double rate = result.metrics.savings_rate.front();
         * @endcode
         *
         * Thread safety: compute() is const and touches no shared state;
         * concurrent calls with different inputs are safe.
         */
        class Aggregator
        {
        public:
            explicit Aggregator(const AggregatorOptions &options = AggregatorOptions());

            DashboardAggregate compute(const LedgerSnapshot &snapshot,
                                       const AccountGroupConfig &groups) const;

            const AggregatorOptions &options() const { return options_; }

        private:
            AggregatorOptions options_;
        };

        /**
         * @brief Format a time point as "YYYY-MM-DDTHH:MM:SSZ".
         */
        std::string format_utc_timestamp(std::chrono::system_clock::time_point tp);

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_AGGREGATOR_HPP
