/**
 * @file financial_metrics.hpp
 * @brief Savings rate, withdrawal rate and savings multiple per month.
 *
 * Relates monthly cash flow to the month's total asset balance:
 *
 *   savings_rate     = (income - expenses) / income        (0 if income <= 0)
 *   withdrawal_rate  = expenses / total_assets             (0 if total_assets <= 0)
 *   savings_multiple = total_assets / (expenses * 12)      (0 if expenses <= 0)
 *
 * where total_assets sums the "assets_" groups only. One value is produced
 * per cash-flow month; sequences are ordered most recent month first.
 */

#ifndef BUDGET_ANALYTICS_FINANCIAL_METRICS_HPP
#define BUDGET_ANALYTICS_FINANCIAL_METRICS_HPP

#include "analytics/cash_flow_calculator.hpp"
#include "analytics/net_worth_calculator.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace budget
{
    namespace analytics
    {

        /// Months per year used to annualize expenses
        inline constexpr double MONTHS_PER_YEAR = 12.0;

        /**
         * @struct Metrics
         * @brief Health ratios, index 0 = most recent month.
         */
        struct Metrics
        {
            std::vector<MonthKey> months;        ///< Month of each entry, most recent first
            std::vector<double> savings_rate;     ///< (income - expenses) / income
            std::vector<double> withdrawal_rate;  ///< expenses / total assets
            std::vector<double> savings_multiple; ///< years of expenses covered by assets

            size_t size() const { return months.size(); }
            bool empty() const { return months.empty(); }

            nlohmann::ordered_json to_json() const;
        };

        /**
         * @class MetricsCalculator
         * @brief Stateless transform from the two monthly series to Metrics.
         *
         * A cash-flow month with no net-worth entry is treated as having
         * zero assets.
         */
        class MetricsCalculator
        {
        public:
            Metrics compute(const NetWorthByMonth &net_worth,
                            const CashFlowByMonth &cash_flow) const;

            static double savings_rate(double income, double expenses);
            static double withdrawal_rate(double expenses, double total_assets);
            static double savings_multiple(double total_assets, double expenses);
        };

        /**
         * @brief Metrics from the two monthly series.
         */
        Metrics compute_metrics(const NetWorthByMonth &net_worth,
                                const CashFlowByMonth &cash_flow);

        /**
         * @struct DashboardSummary
         * @brief Headline figures for the latest month, with month-over-month changes.
         *
         * Balance figures come from the latest net-worth month, the savings
         * rate from the latest cash-flow month. Changes are present only when
         * a previous month exists in the respective series.
         */
        struct DashboardSummary
        {
            std::optional<MonthKey> latest_month;
            double total_assets = 0.0;
            double total_debts = 0.0;
            double net_worth = 0.0;
            double savings_rate = 0.0;

            std::optional<double> assets_change;
            std::optional<double> debts_change;
            std::optional<double> net_worth_change;
            std::optional<double> savings_rate_change;

            /// Balances of the latest month, for the per-group table
            GroupBalances group_balances;

            static DashboardSummary from_series(const NetWorthByMonth &net_worth,
                                                const CashFlowByMonth &cash_flow);

            nlohmann::ordered_json to_json() const;
        };

        /**
         * @brief "assets_liquid" -> "Assets Liquid".
         */
        std::string humanize_group_name(const std::string &group_name);

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_FINANCIAL_METRICS_HPP
