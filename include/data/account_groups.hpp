/**
 * @file account_groups.hpp
 * @brief User-defined account groups used to roll up balances.
 *
 * An account group maps a group name (conventionally prefixed `assets_`
 * or `liabilities_`) to a list of account names. Group order is preserved
 * from the configuration file and drives the column order of every
 * tabular output.
 */

#ifndef BUDGET_DATA_ACCOUNT_GROUPS_HPP
#define BUDGET_DATA_ACCOUNT_GROUPS_HPP

#include <nlohmann/json.hpp>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace budget
{
    /// Prefix marking asset groups
    inline constexpr const char *ASSET_GROUP_PREFIX = "assets_";

    /// Prefix marking liability groups
    inline constexpr const char *LIABILITY_GROUP_PREFIX = "liabilities_";

    /**
     * @brief True if the group name starts with "assets_".
     */
    bool is_asset_group(const std::string &group_name);

    /**
     * @brief True if the group name starts with "liabilities_".
     */
    bool is_liability_group(const std::string &group_name);

    /**
     * @struct GroupOverlap
     * @brief An account name listed in more than one group.
     */
    struct GroupOverlap
    {
        std::string account_name;
        std::string first_group;
        std::string second_group;
    };

    /**
     * @class AccountGroupConfig
     * @brief Ordered mapping from group name to member account names.
     *
     * Membership is matched against Account::name, case-sensitive. Names
     * that match no account contribute nothing; this is not an error.
     *
     * Usage:
     * @code
     *   AccountGroupConfig groups{
     *       {"assets_liquid", {"Checking", "Savings"}},
     *       {"liabilities_revolving", {"Visa"}}};
     *   groups.validate();
     * @endcode
     */
    class AccountGroupConfig
    {
    public:
        using Members = std::vector<std::string>;
        using Group = std::pair<std::string, Members>;

        AccountGroupConfig() = default;
        AccountGroupConfig(std::initializer_list<Group> groups);

        /**
         * @brief Add a group, or replace the members of an existing one.
         *
         * A replaced group keeps its original position. Duplicate names
         * within one group are collapsed.
         */
        void set_group(const std::string &group_name, const Members &members);

        const std::vector<Group> &groups() const { return groups_; }
        std::vector<std::string> group_names() const;

        /**
         * @brief Members of a group, or an empty list for unknown groups.
         */
        const Members &members(const std::string &group_name) const;

        bool contains(const std::string &group_name) const;
        size_t size() const { return groups_.size(); }
        bool empty() const { return groups_.empty(); }

        /**
         * @brief Every account name that appears in more than one group.
         */
        std::vector<GroupOverlap> find_overlaps() const;

        /**
         * @brief Reject overlapping membership and empty group names.
         * @throws std::invalid_argument naming the first offending account
         */
        void validate() const;

        /**
         * @brief Parse from a JSON object of arrays, preserving key order.
         * @throws std::invalid_argument if the document is malformed or groups overlap
         */
        static AccountGroupConfig from_json(const nlohmann::ordered_json &j);
        nlohmann::ordered_json to_json() const;

        /**
         * @brief The grouping shipped with the dashboard when none is configured.
         */
        static AccountGroupConfig defaults();

    private:
        std::vector<Group> groups_;
    };

} // namespace budget

#endif // BUDGET_DATA_ACCOUNT_GROUPS_HPP
