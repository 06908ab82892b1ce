/**
 * @file aggregator.cpp
 * @brief Implementation of Aggregator and DashboardAggregate
 */

#include "analytics/aggregator.hpp"

#include <ctime>
#include <iostream>
#include <stdexcept>

namespace budget
{
    namespace analytics
    {

        namespace
        {
            nlohmann::ordered_json vector_to_json(const Eigen::VectorXd &v)
            {
                nlohmann::ordered_json arr = nlohmann::ordered_json::array();
                for (Eigen::Index i = 0; i < v.size(); ++i)
                    arr.push_back(v(i));
                return arr;
            }
        } // anonymous namespace

        // ===================================================================
        // AggregatorOptions
        // ===================================================================

        AggregatorOptions AggregatorOptions::from_json(const nlohmann::ordered_json &j)
        {
            AggregatorOptions options;
            options.moving_average_windows = j.value("moving_average_windows", std::vector<int>{6, 12});
            options.exclude_first_month = j.value("exclude_first_month", false);
            options.exclude_current_month = j.value("exclude_current_month", false);
            options.filter_payees = j.value("filter_payees", std::vector<std::string>{});

            for (int window : options.moving_average_windows)
            {
                if (window < 1)
                {
                    throw std::invalid_argument(
                        "Expected positive moving average window, got: " + std::to_string(window));
                }
            }

            return options;
        }

        // ===================================================================
        // DashboardAggregate
        // ===================================================================

        NetWorthTable DashboardAggregate::net_worth_table() const
        {
            return NetWorthTable::from_net_worth(net_worth_by_month, account_groups.group_names());
        }

        CashFlowSeries DashboardAggregate::cash_flow_series() const
        {
            return CashFlowSeries::from_cash_flow(cash_flow_by_month);
        }

        nlohmann::ordered_json DashboardAggregate::to_json() const
        {
            nlohmann::ordered_json j;

            j["generated_at"] = format_utc_timestamp(generated_at);
            j["source"] = source_name;
            j["is_demo"] = is_demo;
            if (!last_error.empty())
                j["last_error"] = last_error;

            j["ledger"] = {
                {"accounts", counts.accounts},
                {"categories", counts.categories},
                {"payees", counts.payees},
                {"transactions", counts.transactions}};

            j["account_groups"] = account_groups.to_json();

            nlohmann::ordered_json nw = nlohmann::ordered_json::object();
            for (const auto &entry : net_worth_by_month)
                nw[entry.first] = entry.second.to_json();
            j["net_worth_by_month"] = nw;

            nlohmann::ordered_json cf = nlohmann::ordered_json::object();
            for (const auto &entry : cash_flow_by_month)
                cf[entry.first] = entry.second.to_json();
            j["cash_flow_by_month"] = cf;

            j["metrics"] = metrics.to_json();
            j["summary"] = summary.to_json();

            nlohmann::ordered_json averages = nlohmann::ordered_json::array();
            for (const auto &avg : cash_flow_averages)
            {
                averages.push_back(nlohmann::ordered_json{{"window", avg.window},
                                                          {"income", vector_to_json(avg.income)},
                                                          {"expenses", vector_to_json(avg.expenses)},
                                                          {"net", vector_to_json(avg.net)}});
            }
            j["cash_flow_moving_averages"] = averages;

            j["date_parsing"] = date_stats.to_json();
            return j;
        }

        // ===================================================================
        // Aggregator
        // ===================================================================

        Aggregator::Aggregator(const AggregatorOptions &options) : options_(options)
        {
        }

        DashboardAggregate Aggregator::compute(const LedgerSnapshot &snapshot,
                                               const AccountGroupConfig &groups) const
        {
            const DateBucketer bucketer = options_.fallback_date
                                              ? DateBucketer(*options_.fallback_date)
                                              : DateBucketer();

            DashboardAggregate result;
            result.generated_at = std::chrono::system_clock::now();
            result.counts = {snapshot.accounts.size(), snapshot.categories.size(),
                             snapshot.payees.size(), snapshot.transactions.size()};
            result.account_groups = groups;

            // Net worth and cash flow run independently over the same transactions
            result.net_worth_by_month = NetWorthCalculator(bucketer).compute(
                snapshot.transactions, snapshot.accounts, groups, &result.date_stats);

            CashFlowCalculator cash_flow_calculator(
                bucketer, CashFlowCalculator::resolve_payee_ids(snapshot.payees, options_.filter_payees));
            result.cash_flow_by_month = trim_cash_flow(
                cash_flow_calculator.compute(snapshot.transactions, snapshot.categories),
                options_.exclude_first_month,
                options_.exclude_current_month);

            result.metrics = MetricsCalculator().compute(result.net_worth_by_month, result.cash_flow_by_month);
            result.summary = DashboardSummary::from_series(result.net_worth_by_month, result.cash_flow_by_month);

            CashFlowSeries series = result.cash_flow_series();
            for (int window : options_.moving_average_windows)
            {
                if (window < 1 || static_cast<size_t>(window) > series.size())
                    continue;

                CashFlowAverage avg;
                avg.window = window;
                avg.income = moving_average(series.income, window);
                avg.expenses = moving_average(series.expenses, window);
                avg.net = moving_average(series.net, window);
                result.cash_flow_averages.push_back(std::move(avg));
            }

            if (options_.verbose)
            {
                std::cerr << "Aggregated " << snapshot.transactions.size() << " transactions into "
                          << result.net_worth_by_month.size() << " net worth months and "
                          << result.cash_flow_by_month.size() << " cash flow months\n";
                if (!options_.filter_payees.empty())
                {
                    std::cerr << "Excluding " << cash_flow_calculator.excluded_payee_ids().size()
                              << " payee(s) from cash flow\n";
                }
                if (result.date_stats.fallback > 0)
                {
                    std::cerr << "Warning: " << result.date_stats.fallback
                              << " transaction date(s) could not be parsed and were assigned to "
                              << DateBucketer::format_month(bucketer.today().year, bucketer.today().month)
                              << "\n";
                }
            }

            return result;
        }

        std::string format_utc_timestamp(std::chrono::system_clock::time_point tp)
        {
            std::time_t t = std::chrono::system_clock::to_time_t(tp);
            std::tm utc{};
            gmtime_r(&t, &utc);
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
            return std::string(buffer);
        }

    } // namespace analytics
} // namespace budget
