/**
 * @file report_writer.hpp
 * @brief Writes dashboard aggregates to JSON, CSV and the console
 */

#ifndef BUDGET_REPORT_REPORT_WRITER_HPP
#define BUDGET_REPORT_REPORT_WRITER_HPP

#include "analytics/aggregator.hpp"
#include "data/ledger_loader.hpp"

#include <nlohmann/json.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace budget
{
    namespace report
    {

        /**
         * @class ReportWriter
         * @brief Export and console presentation of a DashboardAggregate
         *
         * File layout written by write_all():
         *   <dir>/dashboard.json   full aggregate
         *   <dir>/net_worth.csv    month x group balances with totals
         *   <dir>/cash_flow.csv    income, expenses, net per month
         *   <dir>/metrics.csv      savings rate, withdrawal rate, savings multiple
         */
        class ReportWriter
        {
        public:
            /// Full aggregate as a JSON document
            static nlohmann::ordered_json to_json(const analytics::DashboardAggregate &aggregate);

            static void write_json(const analytics::DashboardAggregate &aggregate,
                                   const std::string &filepath);

            static void write_net_worth_csv(const analytics::DashboardAggregate &aggregate,
                                            const std::string &filepath);

            static void write_cash_flow_csv(const analytics::DashboardAggregate &aggregate,
                                            const std::string &filepath);

            static void write_metrics_csv(const analytics::DashboardAggregate &aggregate,
                                          const std::string &filepath);

            /**
             * @brief Write every enabled output into config.directory
             * @return Paths of the files written
             * @throws std::runtime_error if a file cannot be written
             */
            static std::vector<std::string> write_all(const analytics::DashboardAggregate &aggregate,
                                                      const OutputConfig &config);

            /**
             * @brief Print the headline summary and the per-group table
             */
            static void print_summary(const analytics::DashboardAggregate &aggregate, std::ostream &os);
        };

        /// 1234.5 -> "$1,234.50", -80 -> "-$80.00"
        std::string format_currency(double amount);

        /// 0.1234 -> "12.3%"
        std::string format_percentage(double ratio);

        /// Signed change, e.g. "+$100.00" or "-2.5%"
        std::string format_change(double change, bool as_percentage);

    } // namespace report
} // namespace budget

#endif // BUDGET_REPORT_REPORT_WRITER_HPP
