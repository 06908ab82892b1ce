/**
 * @file net_worth_calculator.cpp
 * @brief Implementation of GroupBalances and NetWorthCalculator
 */

#include "analytics/net_worth_calculator.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace budget
{
    namespace analytics
    {

        // ===================================================================
        // GroupBalances
        // ===================================================================

        GroupBalances::GroupBalances(std::initializer_list<Entry> entries)
        {
            for (const auto &e : entries)
            {
                set(e.first, e.second);
            }
        }

        void GroupBalances::set(const std::string &group_name, double balance)
        {
            for (auto &e : entries_)
            {
                if (e.first == group_name)
                {
                    e.second = balance;
                    return;
                }
            }
            entries_.emplace_back(group_name, balance);
        }

        double GroupBalances::balance(const std::string &group_name) const
        {
            for (const auto &e : entries_)
            {
                if (e.first == group_name)
                    return e.second;
            }
            return 0.0;
        }

        bool GroupBalances::contains(const std::string &group_name) const
        {
            return std::any_of(entries_.begin(), entries_.end(),
                               [&](const Entry &e)
                               { return e.first == group_name; });
        }

        double GroupBalances::total_assets() const
        {
            double total = 0.0;
            for (const auto &e : entries_)
            {
                if (is_asset_group(e.first))
                    total += e.second;
            }
            return total;
        }

        double GroupBalances::total_debts() const
        {
            double total = 0.0;
            for (const auto &e : entries_)
            {
                if (is_liability_group(e.first))
                    total += e.second;
            }
            return total;
        }

        nlohmann::ordered_json GroupBalances::to_json() const
        {
            nlohmann::ordered_json j = nlohmann::ordered_json::object();
            for (const auto &e : entries_)
            {
                j[e.first] = e.second;
            }
            return j;
        }

        // ===================================================================
        // NetWorthCalculator
        // ===================================================================

        NetWorthByMonth NetWorthCalculator::compute(const std::vector<Transaction> &transactions,
                                                    const std::vector<Account> &accounts,
                                                    const AccountGroupConfig &groups,
                                                    DateParseStats *stats) const
        {
            // Account id -> account; a later duplicate id replaces an earlier one
            std::unordered_map<std::string, const Account *> account_by_id;
            for (const auto &account : accounts)
            {
                account_by_id[account.id] = &account;
            }

            // Resolve each group's member names to account ids
            std::vector<std::unordered_set<std::string>> group_account_ids;
            group_account_ids.reserve(groups.size());
            for (const auto &group : groups.groups())
            {
                std::unordered_set<std::string> ids;
                for (const auto &entry : account_by_id)
                {
                    const auto &members = group.second;
                    if (std::find(members.begin(), members.end(), entry.second->name) != members.end())
                    {
                        ids.insert(entry.first);
                    }
                }
                group_account_ids.push_back(std::move(ids));
            }

            // Bucket every transaction once
            std::vector<MonthKey> tx_months;
            tx_months.reserve(transactions.size());
            std::set<MonthKey> months;
            for (const auto &tx : transactions)
            {
                BucketedDate bucketed = bucketer_.bucket(tx.date);
                if (stats)
                    stats->record(bucketed.format);
                months.insert(bucketed.month);
                tx_months.push_back(std::move(bucketed.month));
            }

            NetWorthByMonth result;
            for (const auto &month : months)
            {
                GroupBalances balances;
                size_t g = 0;
                for (const auto &group : groups.groups())
                {
                    const auto &ids = group_account_ids[g++];
                    MinorUnits sum = 0;
                    for (size_t i = 0; i < transactions.size(); ++i)
                    {
                        // Not after month m: every transaction in or before m
                        if (tx_months[i] > month)
                            continue;
                        if (ids.count(transactions[i].account))
                            sum += transactions[i].amount;
                    }
                    balances.set(group.first, to_major_units(sum));
                }
                result.emplace(month, std::move(balances));
            }

            return result;
        }

        NetWorthByMonth compute_net_worth_by_month(const std::vector<Transaction> &transactions,
                                                   const std::vector<Account> &accounts,
                                                   const AccountGroupConfig &groups)
        {
            return NetWorthCalculator().compute(transactions, accounts, groups);
        }

    } // namespace analytics
} // namespace budget
