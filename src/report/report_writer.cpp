/**
 * @file report_writer.cpp
 * @brief Implementation of ReportWriter and the number formatters
 */

#include "report/report_writer.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace budget
{
    namespace report
    {

        namespace
        {
            std::ofstream open_output(const std::string &filepath)
            {
                std::filesystem::path path(filepath);
                if (path.has_parent_path())
                {
                    std::filesystem::create_directories(path.parent_path());
                }

                std::ofstream file(filepath);
                if (!file.is_open())
                {
                    throw std::runtime_error("Could not open file for writing: " + filepath);
                }
                return file;
            }
        } // anonymous namespace

        // ===================================================================
        // File exports
        // ===================================================================

        nlohmann::ordered_json ReportWriter::to_json(const analytics::DashboardAggregate &aggregate)
        {
            return aggregate.to_json();
        }

        void ReportWriter::write_json(const analytics::DashboardAggregate &aggregate,
                                      const std::string &filepath)
        {
            std::ofstream file = open_output(filepath);
            file << to_json(aggregate).dump(2) << "\n";
        }

        void ReportWriter::write_net_worth_csv(const analytics::DashboardAggregate &aggregate,
                                               const std::string &filepath)
        {
            aggregate.net_worth_table().to_csv(filepath);
        }

        void ReportWriter::write_cash_flow_csv(const analytics::DashboardAggregate &aggregate,
                                               const std::string &filepath)
        {
            std::ofstream file = open_output(filepath);

            file << "month,income,expenses,net\n";
            file << std::fixed << std::setprecision(2);

            for (const auto &entry : aggregate.cash_flow_by_month)
            {
                file << entry.first << ","
                     << entry.second.income << ","
                     << entry.second.expenses << ","
                     << entry.second.net << "\n";
            }
        }

        void ReportWriter::write_metrics_csv(const analytics::DashboardAggregate &aggregate,
                                             const std::string &filepath)
        {
            std::ofstream file = open_output(filepath);
            const analytics::Metrics &m = aggregate.metrics;

            file << "month,savings_rate,withdrawal_rate,savings_multiple\n";
            file << std::fixed << std::setprecision(6);

            for (size_t i = 0; i < m.size(); ++i)
            {
                file << m.months[i] << ","
                     << m.savings_rate[i] << ","
                     << m.withdrawal_rate[i] << ","
                     << m.savings_multiple[i] << "\n";
            }
        }

        std::vector<std::string> ReportWriter::write_all(const analytics::DashboardAggregate &aggregate,
                                                         const OutputConfig &config)
        {
            std::vector<std::string> written;
            std::filesystem::path dir(config.directory);

            if (config.write_json)
            {
                std::string path = (dir / "dashboard.json").string();
                write_json(aggregate, path);
                written.push_back(path);
            }

            if (config.write_csv)
            {
                std::string nw_path = (dir / "net_worth.csv").string();
                write_net_worth_csv(aggregate, nw_path);
                written.push_back(nw_path);

                std::string cf_path = (dir / "cash_flow.csv").string();
                write_cash_flow_csv(aggregate, cf_path);
                written.push_back(cf_path);

                std::string metrics_path = (dir / "metrics.csv").string();
                write_metrics_csv(aggregate, metrics_path);
                written.push_back(metrics_path);
            }

            return written;
        }

        // ===================================================================
        // Console output
        // ===================================================================

        void ReportWriter::print_summary(const analytics::DashboardAggregate &aggregate, std::ostream &os)
        {
            const analytics::DashboardSummary &s = aggregate.summary;

            os << "\n"
               << std::string(60, '=') << "\n"
               << "DASHBOARD SUMMARY";
            if (s.latest_month)
                os << " (" << *s.latest_month << ")";
            os << "\n"
               << std::string(60, '=') << "\n";

            if (aggregate.is_demo)
            {
                os << "NOTE: showing demonstration data";
                if (!aggregate.last_error.empty())
                    os << " (" << aggregate.last_error << ")";
                os << "\n\n";
            }

            auto row = [&os](const std::string &label, const std::string &value,
                             const std::optional<double> &change, bool as_percentage)
            {
                os << "  " << std::setw(16) << std::left << label
                   << std::setw(18) << std::right << value;
                if (change)
                    os << "  (" << format_change(*change, as_percentage) << ")";
                os << "\n";
            };

            row("Total Assets", format_currency(s.total_assets), s.assets_change, false);
            row("Total Debts", format_currency(s.total_debts), s.debts_change, false);
            row("Net Worth", format_currency(s.net_worth), s.net_worth_change, false);
            row("Savings Rate", format_percentage(s.savings_rate), s.savings_rate_change, true);

            if (!s.group_balances.empty())
            {
                os << "\nAccount Groups:\n";
                for (const auto &entry : s.group_balances.entries())
                {
                    os << "  " << std::setw(28) << std::left << analytics::humanize_group_name(entry.first)
                       << std::setw(18) << std::right << format_currency(entry.second) << "\n";
                }
            }

            if (!aggregate.cash_flow_by_month.empty())
            {
                os << "\nCash Flow:\n";
                os << "  " << std::setw(10) << std::left << "Month"
                   << std::setw(16) << std::right << "Income"
                   << std::setw(16) << "Expenses"
                   << std::setw(16) << "Net" << "\n";
                for (const auto &entry : aggregate.cash_flow_by_month)
                {
                    os << "  " << std::setw(10) << std::left << entry.first
                       << std::setw(16) << std::right << format_currency(entry.second.income)
                       << std::setw(16) << format_currency(entry.second.expenses)
                       << std::setw(16) << format_currency(entry.second.net) << "\n";
                }
            }

            os << std::string(60, '-') << "\n";
            os << "Source: " << aggregate.source_name
               << "  Updated: " << analytics::format_utc_timestamp(aggregate.generated_at) << "\n";
        }

        // ===================================================================
        // Formatting
        // ===================================================================

        std::string format_currency(double amount)
        {
            long long cents = std::llround(std::fabs(amount) * 100.0);
            std::string digits = std::to_string(cents / 100);

            std::string grouped;
            int count = 0;
            for (auto it = digits.rbegin(); it != digits.rend(); ++it)
            {
                if (count > 0 && count % 3 == 0)
                    grouped.insert(grouped.begin(), ',');
                grouped.insert(grouped.begin(), *it);
                ++count;
            }

            std::ostringstream oss;
            if (amount < 0.0 && cents > 0)
                oss << "-";
            oss << "$" << grouped << "." << std::setw(2) << std::setfill('0') << (cents % 100);
            return oss.str();
        }

        std::string format_percentage(double ratio)
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
            return oss.str();
        }

        std::string format_change(double change, bool as_percentage)
        {
            std::string text = as_percentage ? format_percentage(change) : format_currency(change);
            if (text.front() != '-')
                text.insert(text.begin(), '+');
            return text;
        }

    } // namespace report
} // namespace budget
