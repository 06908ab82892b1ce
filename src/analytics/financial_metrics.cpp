/**
 * @file financial_metrics.cpp
 * @brief Implementation of MetricsCalculator and DashboardSummary
 */

#include "analytics/financial_metrics.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace budget
{
    namespace analytics
    {

        namespace
        {
            nlohmann::ordered_json optional_to_json(const std::optional<double> &value)
            {
                if (value)
                    return *value;
                return nullptr;
            }
        } // anonymous namespace

        // ===================================================================
        // Metrics
        // ===================================================================

        nlohmann::ordered_json Metrics::to_json() const
        {
            return nlohmann::ordered_json{
                {"months", months},
                {"savings_rate", savings_rate},
                {"withdrawal_rate", withdrawal_rate},
                {"savings_multiple", savings_multiple}};
        }

        // ===================================================================
        // MetricsCalculator
        // ===================================================================

        double MetricsCalculator::savings_rate(double income, double expenses)
        {
            if (income > 0.0)
                return (income - expenses) / income;
            return 0.0;
        }

        double MetricsCalculator::withdrawal_rate(double expenses, double total_assets)
        {
            if (total_assets > 0.0)
                return expenses / total_assets;
            return 0.0;
        }

        double MetricsCalculator::savings_multiple(double total_assets, double expenses)
        {
            if (expenses > 0.0)
                return total_assets / (expenses * MONTHS_PER_YEAR);
            return 0.0;
        }

        Metrics MetricsCalculator::compute(const NetWorthByMonth &net_worth,
                                           const CashFlowByMonth &cash_flow) const
        {
            Metrics metrics;
            metrics.months.reserve(cash_flow.size());
            metrics.savings_rate.reserve(cash_flow.size());
            metrics.withdrawal_rate.reserve(cash_flow.size());
            metrics.savings_multiple.reserve(cash_flow.size());

            // Ascending pass, reversed below so index 0 is the latest month
            for (const auto &entry : cash_flow)
            {
                const MonthKey &month = entry.first;
                const CashFlow &flow = entry.second;

                auto nw = net_worth.find(month);
                double total_assets = nw != net_worth.end() ? nw->second.total_assets() : 0.0;

                metrics.months.push_back(month);
                metrics.savings_rate.push_back(savings_rate(flow.income, flow.expenses));
                metrics.withdrawal_rate.push_back(withdrawal_rate(flow.expenses, total_assets));
                metrics.savings_multiple.push_back(savings_multiple(total_assets, flow.expenses));
            }

            std::reverse(metrics.months.begin(), metrics.months.end());
            std::reverse(metrics.savings_rate.begin(), metrics.savings_rate.end());
            std::reverse(metrics.withdrawal_rate.begin(), metrics.withdrawal_rate.end());
            std::reverse(metrics.savings_multiple.begin(), metrics.savings_multiple.end());

            return metrics;
        }

        Metrics compute_metrics(const NetWorthByMonth &net_worth,
                                const CashFlowByMonth &cash_flow)
        {
            return MetricsCalculator().compute(net_worth, cash_flow);
        }

        // ===================================================================
        // DashboardSummary
        // ===================================================================

        DashboardSummary DashboardSummary::from_series(const NetWorthByMonth &net_worth,
                                                       const CashFlowByMonth &cash_flow)
        {
            DashboardSummary summary;

            if (!net_worth.empty())
            {
                auto latest = std::prev(net_worth.end());
                summary.latest_month = latest->first;
                summary.group_balances = latest->second;
                summary.total_assets = latest->second.total_assets();
                summary.total_debts = latest->second.total_debts();
                summary.net_worth = summary.total_assets + summary.total_debts;

                if (net_worth.size() > 1)
                {
                    const auto &previous = std::prev(latest)->second;
                    summary.assets_change = summary.total_assets - previous.total_assets();
                    summary.debts_change = summary.total_debts - previous.total_debts();
                    summary.net_worth_change = summary.net_worth - previous.net_worth();
                }
            }

            if (!cash_flow.empty())
            {
                auto latest = std::prev(cash_flow.end());
                summary.savings_rate = MetricsCalculator::savings_rate(latest->second.income,
                                                                       latest->second.expenses);
                if (cash_flow.size() > 1)
                {
                    const auto &previous = std::prev(latest)->second;
                    summary.savings_rate_change =
                        summary.savings_rate - MetricsCalculator::savings_rate(previous.income, previous.expenses);
                }
            }

            return summary;
        }

        nlohmann::ordered_json DashboardSummary::to_json() const
        {
            nlohmann::ordered_json j;
            if (latest_month)
                j["latest_month"] = *latest_month;
            else
                j["latest_month"] = nullptr;
            j["total_assets"] = total_assets;
            j["total_debts"] = total_debts;
            j["net_worth"] = net_worth;
            j["savings_rate"] = savings_rate;
            j["assets_change"] = optional_to_json(assets_change);
            j["debts_change"] = optional_to_json(debts_change);
            j["net_worth_change"] = optional_to_json(net_worth_change);
            j["savings_rate_change"] = optional_to_json(savings_rate_change);
            j["group_balances"] = group_balances.to_json();
            return j;
        }

        std::string humanize_group_name(const std::string &group_name)
        {
            std::string out;
            out.reserve(group_name.size());
            bool start_of_word = true;
            for (char c : group_name)
            {
                if (c == '_')
                {
                    out += ' ';
                    start_of_word = true;
                    continue;
                }
                unsigned char uc = static_cast<unsigned char>(c);
                out += static_cast<char>(start_of_word ? std::toupper(uc) : std::tolower(uc));
                start_of_word = false;
            }
            return out;
        }

    } // namespace analytics
} // namespace budget
