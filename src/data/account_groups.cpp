/**
 * @file account_groups.cpp
 * @brief Implementation of AccountGroupConfig
 */

#include "data/account_groups.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace budget
{

    namespace
    {
        bool starts_with(const std::string &value, const char *prefix)
        {
            return value.rfind(prefix, 0) == 0;
        }

        const AccountGroupConfig::Members &no_members()
        {
            static const AccountGroupConfig::Members empty;
            return empty;
        }
    } // anonymous namespace

    bool is_asset_group(const std::string &group_name)
    {
        return starts_with(group_name, ASSET_GROUP_PREFIX);
    }

    bool is_liability_group(const std::string &group_name)
    {
        return starts_with(group_name, LIABILITY_GROUP_PREFIX);
    }

    // ============================================================================
    // Construction and modification
    // ============================================================================

    AccountGroupConfig::AccountGroupConfig(std::initializer_list<Group> groups)
    {
        for (const auto &g : groups)
        {
            set_group(g.first, g.second);
        }
    }

    void AccountGroupConfig::set_group(const std::string &group_name, const Members &members)
    {
        Members unique;
        unique.reserve(members.size());
        for (const auto &name : members)
        {
            if (std::find(unique.begin(), unique.end(), name) == unique.end())
                unique.push_back(name);
        }

        auto it = std::find_if(groups_.begin(), groups_.end(),
                               [&](const Group &g)
                               { return g.first == group_name; });
        if (it != groups_.end())
        {
            it->second = std::move(unique);
        }
        else
        {
            groups_.emplace_back(group_name, std::move(unique));
        }
    }

    // ============================================================================
    // Queries
    // ============================================================================

    std::vector<std::string> AccountGroupConfig::group_names() const
    {
        std::vector<std::string> names;
        names.reserve(groups_.size());
        for (const auto &g : groups_)
            names.push_back(g.first);
        return names;
    }

    const AccountGroupConfig::Members &AccountGroupConfig::members(const std::string &group_name) const
    {
        for (const auto &g : groups_)
        {
            if (g.first == group_name)
                return g.second;
        }
        return no_members();
    }

    bool AccountGroupConfig::contains(const std::string &group_name) const
    {
        return std::any_of(groups_.begin(), groups_.end(),
                           [&](const Group &g)
                           { return g.first == group_name; });
    }

    std::vector<GroupOverlap> AccountGroupConfig::find_overlaps() const
    {
        std::vector<GroupOverlap> overlaps;
        std::map<std::string, std::string> owner; // account name -> first group

        for (const auto &g : groups_)
        {
            for (const auto &account_name : g.second)
            {
                auto inserted = owner.emplace(account_name, g.first);
                if (!inserted.second)
                {
                    overlaps.push_back({account_name, inserted.first->second, g.first});
                }
            }
        }

        return overlaps;
    }

    void AccountGroupConfig::validate() const
    {
        for (const auto &g : groups_)
        {
            if (g.first.empty())
            {
                throw std::invalid_argument("Account group name cannot be empty");
            }
        }

        auto overlaps = find_overlaps();
        if (!overlaps.empty())
        {
            const auto &o = overlaps.front();
            throw std::invalid_argument(
                "Account '" + o.account_name + "' is listed in both '" + o.first_group +
                "' and '" + o.second_group + "'");
        }
    }

    // ============================================================================
    // JSON
    // ============================================================================

    AccountGroupConfig AccountGroupConfig::from_json(const nlohmann::ordered_json &j)
    {
        if (!j.is_object())
        {
            throw std::invalid_argument("'account_groups' must be an object of account name arrays");
        }

        AccountGroupConfig config;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            if (!it.value().is_array())
            {
                throw std::invalid_argument("Account group '" + it.key() + "' must be an array of account names");
            }

            Members members;
            for (const auto &name : it.value())
            {
                if (!name.is_string())
                {
                    throw std::invalid_argument("Account group '" + it.key() + "' contains a non-string entry");
                }
                members.push_back(name.get<std::string>());
            }
            config.set_group(it.key(), members);
        }

        config.validate();
        return config;
    }

    nlohmann::ordered_json AccountGroupConfig::to_json() const
    {
        nlohmann::ordered_json j = nlohmann::ordered_json::object();
        for (const auto &g : groups_)
        {
            j[g.first] = g.second;
        }
        return j;
    }

    AccountGroupConfig AccountGroupConfig::defaults()
    {
        return AccountGroupConfig{
            {"assets_liquid", {"Ally Savings", "Bank of America", "Capital One Checking"}},
            {"assets_restricted", {"Roth IRA", "Vanguard 401k"}},
            {"assets_investment", {}},
            {"assets_physical", {"House Asset"}},
            {"liabilities_installment", {}},
            {"liabilities_physical", {"Mortgage"}},
            {"liabilities_revolving", {}},
            {"liabilities_transacting", {"HSBC"}}};
    }

} // namespace budget
