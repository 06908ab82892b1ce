/**
 * @file net_worth_table.cpp
 * @brief Implementation of NetWorthTable
 */

#include "analytics/net_worth_table.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace budget
{
    namespace analytics
    {

        // ============================================================================
        // Constructors
        // ============================================================================

        NetWorthTable::NetWorthTable(const Eigen::MatrixXd &balances,
                                     const std::vector<MonthKey> &months,
                                     const std::vector<std::string> &groups)
            : balances_(balances), months_(months), groups_(groups)
        {
            if (balances_.rows() != static_cast<Eigen::Index>(months_.size()))
            {
                throw std::invalid_argument("Balance matrix rows must match months vector size");
            }
            if (balances_.cols() != static_cast<Eigen::Index>(groups_.size()))
            {
                throw std::invalid_argument("Balance matrix columns must match groups vector size");
            }

            for (size_t i = 0; i < months_.size(); ++i)
                month_index_[months_[i]] = i;
            for (size_t j = 0; j < groups_.size(); ++j)
                group_index_[groups_[j]] = j;
        }

        NetWorthTable NetWorthTable::from_net_worth(const NetWorthByMonth &net_worth,
                                                    const std::vector<std::string> &group_order)
        {
            std::vector<MonthKey> months;
            months.reserve(net_worth.size());

            Eigen::MatrixXd balances(static_cast<Eigen::Index>(net_worth.size()),
                                     static_cast<Eigen::Index>(group_order.size()));

            Eigen::Index row = 0;
            for (const auto &entry : net_worth)
            {
                months.push_back(entry.first);
                for (size_t j = 0; j < group_order.size(); ++j)
                {
                    balances(row, static_cast<Eigen::Index>(j)) = entry.second.balance(group_order[j]);
                }
                ++row;
            }

            return NetWorthTable(balances, months, group_order);
        }

        // ============================================================================
        // Data Access
        // ============================================================================

        Eigen::VectorXd NetWorthTable::group_series(const std::string &group) const
        {
            int idx = find_group_index(group);
            if (idx < 0)
            {
                throw std::invalid_argument("Group not found: " + group);
            }
            return balances_.col(idx);
        }

        Eigen::VectorXd NetWorthTable::month_row(const MonthKey &month) const
        {
            int idx = find_month_index(month);
            if (idx < 0)
            {
                throw std::invalid_argument("Month not found: " + month);
            }
            return balances_.row(idx).transpose();
        }

        // ============================================================================
        // Totals
        // ============================================================================

        Eigen::VectorXd NetWorthTable::total_assets() const
        {
            return sum_columns(&is_asset_group);
        }

        Eigen::VectorXd NetWorthTable::total_debts() const
        {
            return sum_columns(&is_liability_group);
        }

        Eigen::VectorXd NetWorthTable::net_worth() const
        {
            return total_assets() + total_debts();
        }

        Eigen::MatrixXd NetWorthTable::monthly_changes() const
        {
            if (balances_.rows() < 2)
            {
                return Eigen::MatrixXd(0, balances_.cols());
            }
            const Eigen::Index n = balances_.rows();
            return balances_.bottomRows(n - 1) - balances_.topRows(n - 1);
        }

        void NetWorthTable::to_csv(const std::string &filepath) const
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

            file << "month";
            for (const auto &group : groups_)
            {
                file << "," << group;
            }
            file << ",total_assets,total_debts,net_worth\n";

            Eigen::VectorXd assets = total_assets();
            Eigen::VectorXd debts = total_debts();

            file << std::fixed << std::setprecision(2);
            for (size_t i = 0; i < months_.size(); ++i)
            {
                const auto r = static_cast<Eigen::Index>(i);
                file << months_[i];
                for (Eigen::Index j = 0; j < balances_.cols(); ++j)
                {
                    file << "," << balances_(r, j);
                }
                file << "," << assets(r) << "," << debts(r) << "," << assets(r) + debts(r) << "\n";
            }
        }

        // ============================================================================
        // Private Helpers
        // ============================================================================

        Eigen::VectorXd NetWorthTable::sum_columns(bool (*predicate)(const std::string &)) const
        {
            Eigen::VectorXd total = Eigen::VectorXd::Zero(balances_.rows());
            for (size_t j = 0; j < groups_.size(); ++j)
            {
                if (predicate(groups_[j]))
                {
                    total += balances_.col(static_cast<Eigen::Index>(j));
                }
            }
            return total;
        }

        int NetWorthTable::find_group_index(const std::string &group) const
        {
            auto it = group_index_.find(group);
            return it == group_index_.end() ? -1 : static_cast<int>(it->second);
        }

        int NetWorthTable::find_month_index(const MonthKey &month) const
        {
            auto it = month_index_.find(month);
            return it == month_index_.end() ? -1 : static_cast<int>(it->second);
        }

    } // namespace analytics
} // namespace budget
