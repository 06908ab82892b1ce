/*
 * @file net_worth_table.hpp
 * @brief Dense months x groups view of net worth balances.
 *
 * Stores NetWorthByMonth as an Eigen matrix with month and group indices
 * so that per-month totals (assets, debts, net worth) and per-group
 * series can be extracted with vector operations for charting and export.
 */

#ifndef BUDGET_ANALYTICS_NET_WORTH_TABLE_HPP
#define BUDGET_ANALYTICS_NET_WORTH_TABLE_HPP

#include "analytics/net_worth_calculator.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace budget
{
    namespace analytics
    {

        /**
         * @class NetWorthTable
         * @brief Container for group balance time series.
         *
         * @note Rows are months in ascending order, columns are groups in
         *       configuration order.
         */
        class NetWorthTable
        {
        public:
            /**
             * @brief Constructor with data.
             * @param balances Balance matrix (months x groups).
             * @param months Month keys, ascending.
             * @param groups Group names.
             * @throws std::invalid_argument if dimensions don't match
             */
            NetWorthTable(const Eigen::MatrixXd &balances,
                          const std::vector<MonthKey> &months,
                          const std::vector<std::string> &groups);

            ~NetWorthTable() = default;

            /**
             * @brief Build from calculator output.
             *
             * Columns follow `group_order`; groups missing from a month read as 0.0.
             */
            static NetWorthTable from_net_worth(const NetWorthByMonth &net_worth,
                                                const std::vector<std::string> &group_order);

            // ===========================================
            //  Data Access
            // ===========================================

            const Eigen::MatrixXd &balances() const { return balances_; }
            const std::vector<MonthKey> &months() const { return months_; }
            const std::vector<std::string> &groups() const { return groups_; }

            size_t num_months() const { return static_cast<size_t>(balances_.rows()); }
            size_t num_groups() const { return static_cast<size_t>(balances_.cols()); }

            /**
             * @brief Balance series of one group.
             * @throws std::invalid_argument if the group is unknown
             */
            Eigen::VectorXd group_series(const std::string &group) const;

            /**
             * @brief Balances of every group for one month.
             * @throws std::invalid_argument if the month is unknown
             */
            Eigen::VectorXd month_row(const MonthKey &month) const;

            // ===========================================
            //  Totals
            // ===========================================

            /// Per-month sum over "assets_" columns
            Eigen::VectorXd total_assets() const;

            /// Per-month sum over "liabilities_" columns
            Eigen::VectorXd total_debts() const;

            /// Per-month assets plus debts
            Eigen::VectorXd net_worth() const;

            /**
             * @brief Month-over-month change of each group (months-1 x groups).
             */
            Eigen::MatrixXd monthly_changes() const;

            /**
             * @brief Write the table as CSV: month, one column per group, then totals.
             * @throws std::runtime_error if the file cannot be opened
             */
            void to_csv(const std::string &filepath) const;

        private:
            Eigen::VectorXd sum_columns(bool (*predicate)(const std::string &)) const;
            int find_group_index(const std::string &group) const;
            int find_month_index(const MonthKey &month) const;

            Eigen::MatrixXd balances_;               ///< Balance matrix (months x groups)
            std::vector<MonthKey> months_;           ///< Month keys
            std::vector<std::string> groups_;        ///< Group names
            std::map<MonthKey, size_t> month_index_; ///< Month to row
            std::map<std::string, size_t> group_index_; ///< Group to column
        };

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_NET_WORTH_TABLE_HPP
