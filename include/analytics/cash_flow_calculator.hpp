/**
 * @file cash_flow_calculator.hpp
 * @brief Monthly income, expenses and net cash flow.
 *
 * Transfers and uncategorized transactions are excluded. The remaining
 * transactions are bucketed by month and split by the category's income
 * flag. Expenses are reported unsigned; net keeps the true outflow sign.
 */

#ifndef BUDGET_ANALYTICS_CASH_FLOW_CALCULATOR_HPP
#define BUDGET_ANALYTICS_CASH_FLOW_CALCULATOR_HPP

#include "analytics/date_bucketer.hpp"
#include "data/ledger.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace budget
{
    namespace analytics
    {

        /**
         * @struct CashFlow
         * @brief One month of cash flow in major units.
         */
        struct CashFlow
        {
            double income = 0.0;   ///< Sum of income-category amounts (natural sign)
            double expenses = 0.0; ///< Absolute value of the expense-category sum, always >= 0
            double net = 0.0;      ///< income + signed expense sum

            bool operator==(const CashFlow &other) const
            {
                return income == other.income && expenses == other.expenses && net == other.net;
            }

            nlohmann::ordered_json to_json() const;
        };

        /// Month key -> cash flow, ascending by month
        using CashFlowByMonth = std::map<MonthKey, CashFlow>;

        /**
         * @class CashFlowCalculator
         * @brief Computes CashFlowByMonth from transactions and categories.
         *
         * A category id that does not resolve is treated as an expense
         * category. Months with no categorized, non-transfer transaction
         * do not appear in the result.
         *
         * Transactions whose payee id is in the excluded set are skipped,
         * e.g. payroll deductions booked against an off-budget account.
         */
        class CashFlowCalculator
        {
        public:
            CashFlowCalculator() = default;
            explicit CashFlowCalculator(const DateBucketer &bucketer,
                                        std::set<std::string> excluded_payee_ids = {})
                : bucketer_(bucketer), excluded_payee_ids_(std::move(excluded_payee_ids)) {}

            CashFlowByMonth compute(const std::vector<Transaction> &transactions,
                                    const std::vector<Category> &categories) const;

            const std::set<std::string> &excluded_payee_ids() const { return excluded_payee_ids_; }

            /**
             * @brief Ids of the payees listed by name or id in filter
             *
             * Listed names that match no payee are ignored.
             */
            static std::set<std::string> resolve_payee_ids(const std::vector<Payee> &payees,
                                                           const std::vector<std::string> &filter);

        private:
            DateBucketer bucketer_;
            std::set<std::string> excluded_payee_ids_;
        };

        /**
         * @brief Cash flow by month using a bucketer that falls back to today's UTC date.
         */
        CashFlowByMonth compute_cash_flow_by_month(const std::vector<Transaction> &transactions,
                                                   const std::vector<Category> &categories);

        /**
         * @brief Drop the first and/or last month of a cash-flow series.
         *
         * The first month of a ledger is usually partial, and the current
         * month is still in progress; both skew averages and ratios.
         */
        CashFlowByMonth trim_cash_flow(const CashFlowByMonth &cash_flow,
                                       bool exclude_first_month,
                                       bool exclude_last_month);

        /**
         * @struct CashFlowSeries
         * @brief Cash flow as aligned vectors for charting (ascending months).
         */
        struct CashFlowSeries
        {
            std::vector<MonthKey> months;
            Eigen::VectorXd income;
            Eigen::VectorXd expenses;
            Eigen::VectorXd net;

            static CashFlowSeries from_cash_flow(const CashFlowByMonth &cash_flow);

            size_t size() const { return months.size(); }
        };

        /**
         * @brief Trailing simple moving average.
         * @param series Input values.
         * @param window Window length (>= 1).
         * @return Vector of size n - window + 1, result[i] averages [i, i + window - 1].
         * @throws std::invalid_argument if window < 1 or window > series length
         */
        Eigen::VectorXd moving_average(const Eigen::VectorXd &series, int window);

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_CASH_FLOW_CALCULATOR_HPP
