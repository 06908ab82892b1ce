/**
 * @file ledger.hpp
 * @brief Ledger record types read from the budgeting application.
 *
 * Accounts, categories, payees and transactions as delivered by the
 * upstream ledger API. Amounts are integer minor units (cents). The
 * aggregation engine only reads these records; it never mutates them.
 */

#ifndef BUDGET_DATA_LEDGER_HPP
#define BUDGET_DATA_LEDGER_HPP

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace budget
{
    /// Integer currency amount in minor units (cents)
    using MinorUnits = std::int64_t;

    /**
     * @brief Convert minor units to major units (cents to dollars).
     */
    inline double to_major_units(MinorUnits amount)
    {
        return static_cast<double>(amount) / 100.0;
    }

    /**
     * @struct Account
     * @brief A ledger account. `name` is the join key for account groups.
     */
    struct Account
    {
        std::string id;         ///< Account identifier
        std::string name;       ///< Display name, matched case-sensitively by groups
        bool offbudget = false; ///< Tracking (off-budget) account
        bool closed = false;    ///< Account has been closed

        static Account from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    /**
     * @struct Category
     * @brief A spending or income category.
     */
    struct Category
    {
        std::string id;         ///< Category identifier
        std::string name;       ///< Display name
        std::string group_id;   ///< Owning category group
        bool is_income = false; ///< Income category (defaults to expense)

        static Category from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    /**
     * @struct Payee
     * @brief A transaction counterparty. Carried through, not aggregated.
     */
    struct Payee
    {
        std::string id;
        std::string name;

        static Payee from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    /**
     * @struct Transaction
     * @brief A single ledger transaction.
     *
     * `date` is ISO-8601 (YYYY-MM-DD) or compact (YYYYMMDD) and may be
     * absent. A non-null `transfer_id` marks an inter-account transfer:
     * it moves balances but is neither income nor expense.
     */
    struct Transaction
    {
        std::string id;                         ///< Transaction identifier
        std::string account;                    ///< Owning account id
        std::optional<std::string> category;    ///< Category id, null when uncategorized
        MinorUnits amount = 0;                  ///< Signed amount in minor units
        std::optional<std::string> date;        ///< Raw date field
        std::optional<std::string> transfer_id; ///< Counterpart transaction for transfers
        std::string payee;                      ///< Payee id (may be empty)

        bool is_transfer() const { return transfer_id.has_value(); }

        static Transaction from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;
    };

    /**
     * @struct LedgerSnapshot
     * @brief The combined ledger pulled from the budgeting system at one point in time.
     */
    struct LedgerSnapshot
    {
        std::vector<Account> accounts;
        std::vector<Category> categories;
        std::vector<Payee> payees;
        std::vector<Transaction> transactions;

        /**
         * @brief Parse a ledger document.
         *
         * Expected shape:
         * { "accounts": [...], "categories": [...], "payees": [...], "transactions": [...] }
         * Missing arrays are treated as empty.
         *
         * @throws std::invalid_argument if a present section is not an array
         */
        static LedgerSnapshot from_json(const nlohmann::json &j);
        nlohmann::json to_json() const;

        bool empty() const
        {
            return accounts.empty() && categories.empty() && transactions.empty();
        }
    };

} // namespace budget

#endif // BUDGET_DATA_LEDGER_HPP
