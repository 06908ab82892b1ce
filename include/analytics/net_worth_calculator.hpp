/**
 * @file net_worth_calculator.hpp
 * @brief Cumulative account-group balances per month.
 *
 * For every month that has at least one transaction, sums the amounts of
 * all transactions dated in or before that month whose account belongs to
 * each configured group. Balances are cumulative-to-date, not monthly
 * deltas, and are reported in major units.
 */

#ifndef BUDGET_ANALYTICS_NET_WORTH_CALCULATOR_HPP
#define BUDGET_ANALYTICS_NET_WORTH_CALCULATOR_HPP

#include "analytics/date_bucketer.hpp"
#include "data/account_groups.hpp"
#include "data/ledger.hpp"

#include <nlohmann/json.hpp>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace budget
{
    namespace analytics
    {

        /**
         * @class GroupBalances
         * @brief Balances of each account group for one month.
         *
         * Keeps group insertion order. `balance()` is total: an unknown
         * group reads as 0.0 instead of failing.
         */
        class GroupBalances
        {
        public:
            using Entry = std::pair<std::string, double>;

            GroupBalances() = default;
            GroupBalances(std::initializer_list<Entry> entries);

            /**
             * @brief Set a group's balance, keeping its position if already present.
             */
            void set(const std::string &group_name, double balance);

            /**
             * @brief Balance of a group in major units, 0.0 if the group is unknown.
             */
            double balance(const std::string &group_name) const;

            bool contains(const std::string &group_name) const;
            const std::vector<Entry> &entries() const { return entries_; }
            size_t size() const { return entries_.size(); }
            bool empty() const { return entries_.empty(); }

            /// Sum over groups prefixed "assets_"
            double total_assets() const;

            /// Sum over groups prefixed "liabilities_" (naturally negative)
            double total_debts() const;

            /// Assets plus debts
            double net_worth() const { return total_assets() + total_debts(); }

            bool operator==(const GroupBalances &other) const { return entries_ == other.entries_; }
            bool operator!=(const GroupBalances &other) const { return !(*this == other); }

            nlohmann::ordered_json to_json() const;

        private:
            std::vector<Entry> entries_;
        };

        /// Month key -> group balances, ascending by month
        using NetWorthByMonth = std::map<MonthKey, GroupBalances>;

        /**
         * @class NetWorthCalculator
         * @brief Computes NetWorthByMonth from a ledger and a group configuration.
         *
         * Every month is recomputed from the full transaction list, so the
         * result does not depend on transaction order. Every configured group
         * appears in every month, with 0.0 when nothing matches.
         *
         * Usage:
         * @code
         *   NetWorthCalculator calc;
         *   auto by_month = calc.compute(snapshot.transactions, snapshot.accounts, groups);
         *   double liquid = by_month["2024-02"].balance("assets_liquid");
         * @endcode
         */
        class NetWorthCalculator
        {
        public:
            NetWorthCalculator() = default;
            explicit NetWorthCalculator(const DateBucketer &bucketer) : bucketer_(bucketer) {}

            /**
             * @brief Compute cumulative group balances for every transaction month.
             * @param transactions Ledger transactions.
             * @param accounts Ledger accounts (id -> name lookup).
             * @param groups Account group configuration.
             * @param stats Optional sink for date parse counts (one entry per transaction).
             */
            NetWorthByMonth compute(const std::vector<Transaction> &transactions,
                                    const std::vector<Account> &accounts,
                                    const AccountGroupConfig &groups,
                                    DateParseStats *stats = nullptr) const;

            const DateBucketer &bucketer() const { return bucketer_; }

        private:
            DateBucketer bucketer_;
        };

        /**
         * @brief Net worth by month using a bucketer that falls back to today's UTC date.
         */
        NetWorthByMonth compute_net_worth_by_month(const std::vector<Transaction> &transactions,
                                                   const std::vector<Account> &accounts,
                                                   const AccountGroupConfig &groups);

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_NET_WORTH_CALCULATOR_HPP
