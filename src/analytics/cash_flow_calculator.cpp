/**
 * @file cash_flow_calculator.cpp
 * @brief Implementation of CashFlowCalculator and cash-flow series helpers
 */

#include "analytics/cash_flow_calculator.hpp"

#include <cstdlib>
#include <iterator>
#include <stdexcept>
#include <unordered_map>

namespace budget
{
    namespace analytics
    {

        nlohmann::ordered_json CashFlow::to_json() const
        {
            return nlohmann::ordered_json{
                {"income", income},
                {"expenses", expenses},
                {"net", net}};
        }

        // ===================================================================
        // CashFlowCalculator
        // ===================================================================

        CashFlowByMonth CashFlowCalculator::compute(const std::vector<Transaction> &transactions,
                                                    const std::vector<Category> &categories) const
        {
            std::unordered_map<std::string, const Category *> category_by_id;
            for (const auto &category : categories)
            {
                category_by_id[category.id] = &category;
            }

            struct MonthTotals
            {
                MinorUnits income = 0;
                MinorUnits expenses = 0; // signed
            };
            std::map<MonthKey, MonthTotals> totals;

            for (const auto &tx : transactions)
            {
                if (tx.is_transfer() || !tx.category)
                    continue;
                if (!tx.payee.empty() && excluded_payee_ids_.count(tx.payee))
                    continue;

                auto &month = totals[bucketer_.month_key(tx.date)];

                auto it = category_by_id.find(*tx.category);
                bool is_income = it != category_by_id.end() && it->second->is_income;
                if (is_income)
                    month.income += tx.amount;
                else
                    month.expenses += tx.amount;
            }

            CashFlowByMonth result;
            for (const auto &entry : totals)
            {
                CashFlow flow;
                flow.income = to_major_units(entry.second.income);
                flow.expenses = to_major_units(std::abs(entry.second.expenses));
                flow.net = to_major_units(entry.second.income + entry.second.expenses);
                result.emplace(entry.first, flow);
            }

            return result;
        }

        std::set<std::string> CashFlowCalculator::resolve_payee_ids(const std::vector<Payee> &payees,
                                                                    const std::vector<std::string> &filter)
        {
            std::set<std::string> ids;
            if (filter.empty())
                return ids;

            std::set<std::string> wanted(filter.begin(), filter.end());
            for (const auto &payee : payees)
            {
                if (wanted.count(payee.name) || wanted.count(payee.id))
                    ids.insert(payee.id);
            }
            return ids;
        }

        CashFlowByMonth compute_cash_flow_by_month(const std::vector<Transaction> &transactions,
                                                   const std::vector<Category> &categories)
        {
            return CashFlowCalculator().compute(transactions, categories);
        }

        CashFlowByMonth trim_cash_flow(const CashFlowByMonth &cash_flow,
                                       bool exclude_first_month,
                                       bool exclude_last_month)
        {
            CashFlowByMonth trimmed = cash_flow;
            if (exclude_first_month && !trimmed.empty())
                trimmed.erase(trimmed.begin());
            if (exclude_last_month && !trimmed.empty())
                trimmed.erase(std::prev(trimmed.end()));
            return trimmed;
        }

        // ===================================================================
        // Series helpers
        // ===================================================================

        CashFlowSeries CashFlowSeries::from_cash_flow(const CashFlowByMonth &cash_flow)
        {
            CashFlowSeries series;
            const Eigen::Index n = static_cast<Eigen::Index>(cash_flow.size());
            series.months.reserve(cash_flow.size());
            series.income.resize(n);
            series.expenses.resize(n);
            series.net.resize(n);

            Eigen::Index i = 0;
            for (const auto &entry : cash_flow)
            {
                series.months.push_back(entry.first);
                series.income(i) = entry.second.income;
                series.expenses(i) = entry.second.expenses;
                series.net(i) = entry.second.net;
                ++i;
            }
            return series;
        }

        Eigen::VectorXd moving_average(const Eigen::VectorXd &series, int window)
        {
            if (window < 1)
            {
                throw std::invalid_argument(
                    "Expected positive value for parameter 'window', got: " + std::to_string(window));
            }
            if (window > series.size())
            {
                throw std::invalid_argument(
                    "Moving average window (" + std::to_string(window) + ") exceeds series length (" +
                    std::to_string(series.size()) + ")");
            }

            const Eigen::Index out_size = series.size() - window + 1;
            Eigen::VectorXd result(out_size);
            for (Eigen::Index i = 0; i < out_size; ++i)
            {
                result(i) = series.segment(i, window).mean();
            }
            return result;
        }

    } // namespace analytics
} // namespace budget
