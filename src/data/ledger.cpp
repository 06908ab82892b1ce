/**
 * @file ledger.cpp
 * @brief JSON conversion for ledger records
 */

#include "data/ledger.hpp"
#include <cmath>
#include <stdexcept>

namespace budget
{

    namespace
    {
        // Identifiers arrive as strings from the HTTP API but as integers from
        // some exports; both are normalized to strings.
        std::optional<std::string> optional_string(const nlohmann::json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return std::nullopt;
            if (it->is_string())
                return it->get<std::string>();
            if (it->is_number_integer())
                return std::to_string(it->get<std::int64_t>());
            return it->dump();
        }

        // Dates are only ever strings; any other JSON type is treated as absent
        std::optional<std::string> string_only(const nlohmann::json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return std::nullopt;
            return it->get<std::string>();
        }

        std::string string_or_empty(const nlohmann::json &j, const char *key)
        {
            return optional_string(j, key).value_or("");
        }

        bool bool_or(const nlohmann::json &j, const char *key, bool fallback)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return fallback;
            if (it->is_boolean())
                return it->get<bool>();
            if (it->is_number())
                return it->get<double>() != 0.0;
            return fallback;
        }

        MinorUnits amount_or_zero(const nlohmann::json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_number())
                return 0;
            if (it->is_number_integer())
                return it->get<MinorUnits>();
            return static_cast<MinorUnits>(std::llround(it->get<double>()));
        }

        void put_optional(nlohmann::json &j, const char *key, const std::optional<std::string> &value)
        {
            if (value)
                j[key] = *value;
            else
                j[key] = nullptr;
        }

        template <typename T>
        std::vector<T> parse_section(const nlohmann::json &j, const char *key)
        {
            std::vector<T> out;
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return out;
            if (!it->is_array())
            {
                throw std::invalid_argument(std::string("Ledger section '") + key + "' must be an array");
            }
            out.reserve(it->size());
            for (const auto &item : *it)
            {
                if (item.is_object())
                    out.push_back(T::from_json(item));
            }
            return out;
        }

        template <typename T>
        nlohmann::json dump_section(const std::vector<T> &records)
        {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto &r : records)
                arr.push_back(r.to_json());
            return arr;
        }
    } // anonymous namespace

    // ==========
    // Account
    // ==========

    Account Account::from_json(const nlohmann::json &j)
    {
        Account a;
        a.id = string_or_empty(j, "id");
        a.name = string_or_empty(j, "name");
        a.offbudget = bool_or(j, "offbudget", false);
        a.closed = bool_or(j, "closed", false);
        return a;
    }

    nlohmann::json Account::to_json() const
    {
        return nlohmann::json{
            {"id", id},
            {"name", name},
            {"offbudget", offbudget},
            {"closed", closed}};
    }

    // ==========
    // Category
    // ==========

    Category Category::from_json(const nlohmann::json &j)
    {
        Category c;
        c.id = string_or_empty(j, "id");
        c.name = string_or_empty(j, "name");
        c.group_id = string_or_empty(j, "group_id");
        c.is_income = bool_or(j, "is_income", false);
        return c;
    }

    nlohmann::json Category::to_json() const
    {
        return nlohmann::json{
            {"id", id},
            {"name", name},
            {"group_id", group_id},
            {"is_income", is_income}};
    }

    // ==========
    // Payee
    // ==========

    Payee Payee::from_json(const nlohmann::json &j)
    {
        Payee p;
        p.id = string_or_empty(j, "id");
        p.name = string_or_empty(j, "name");
        return p;
    }

    nlohmann::json Payee::to_json() const
    {
        return nlohmann::json{{"id", id}, {"name", name}};
    }

    // ==============
    // Transaction
    // ==============

    Transaction Transaction::from_json(const nlohmann::json &j)
    {
        Transaction t;
        t.id = string_or_empty(j, "id");
        t.account = string_or_empty(j, "account");
        t.category = optional_string(j, "category");
        t.amount = amount_or_zero(j, "amount");
        t.date = string_only(j, "date");
        t.transfer_id = optional_string(j, "transfer_id");
        t.payee = string_or_empty(j, "payee");
        return t;
    }

    nlohmann::json Transaction::to_json() const
    {
        nlohmann::json j;
        j["id"] = id;
        j["account"] = account;
        put_optional(j, "category", category);
        j["amount"] = amount;
        put_optional(j, "date", date);
        put_optional(j, "transfer_id", transfer_id);
        j["payee"] = payee;
        return j;
    }

    // =================
    // LedgerSnapshot
    // =================

    LedgerSnapshot LedgerSnapshot::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            throw std::invalid_argument("Ledger document must be a JSON object");
        }

        LedgerSnapshot snapshot;
        snapshot.accounts = parse_section<Account>(j, "accounts");
        snapshot.categories = parse_section<Category>(j, "categories");
        snapshot.payees = parse_section<Payee>(j, "payees");
        snapshot.transactions = parse_section<Transaction>(j, "transactions");
        return snapshot;
    }

    nlohmann::json LedgerSnapshot::to_json() const
    {
        nlohmann::json j;
        j["accounts"] = dump_section(accounts);
        j["categories"] = dump_section(categories);
        j["payees"] = dump_section(payees);
        j["transactions"] = dump_section(transactions);
        return j;
    }

} // namespace budget
