/**
 * @file ledger_loader.cpp
 * @brief Implementation of LedgerLoader and configuration structures
 */

#include "data/ledger_loader.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace budget
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    LedgerSourceConfig LedgerSourceConfig::from_json(const nlohmann::ordered_json &j)
    {
        LedgerSourceConfig config;
        config.source = j.value("source", "file");
        config.path = j.value("path", "");
        config.fallback_to_demo = j.value("fallback_to_demo", true);
        return config;
    }

    RefreshConfig RefreshConfig::from_json(const nlohmann::ordered_json &j)
    {
        RefreshConfig config;
        config.interval_seconds = j.value("interval_seconds", 300);

        if (config.interval_seconds <= 0)
        {
            throw std::invalid_argument(
                "Expected positive value for parameter 'interval_seconds', got: " +
                std::to_string(config.interval_seconds));
        }

        return config;
    }

    OutputConfig OutputConfig::from_json(const nlohmann::ordered_json &j)
    {
        OutputConfig config;
        config.directory = j.value("directory", "results");
        config.write_json = j.value("write_json", true);
        config.write_csv = j.value("write_csv", true);
        return config;
    }

    DashboardConfig DashboardConfig::from_json(const nlohmann::ordered_json &j)
    {
        if (!j.is_object())
        {
            throw std::invalid_argument("Configuration must be a JSON object");
        }

        DashboardConfig config;

        if (j.contains("ledger"))
        {
            config.ledger = LedgerSourceConfig::from_json(j["ledger"]);
        }

        if (j.contains("account_groups"))
        {
            config.account_groups = AccountGroupConfig::from_json(j["account_groups"]);
        }

        if (j.contains("cash_flow"))
        {
            config.cash_flow = analytics::AggregatorOptions::from_json(j["cash_flow"]);
        }

        if (j.contains("refresh"))
        {
            config.refresh = RefreshConfig::from_json(j["refresh"]);
        }

        if (j.contains("output"))
        {
            config.output = OutputConfig::from_json(j["output"]);
        }

        return config;
    }

    DashboardConfig DashboardConfig::load_from_file(const std::string &config_path)
    {
        return LedgerLoader::load_config(config_path);
    }

    // ================
    // Ledger Loading
    // ================

    LedgerSnapshot LedgerLoader::load_ledger(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open ledger file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("Ledger parsing error in " + filepath + ": " + std::string(e.what()));
        }

        try
        {
            return LedgerSnapshot::from_json(j);
        }
        catch (const std::invalid_argument &e)
        {
            throw std::runtime_error("Invalid ledger " + filepath + ": " + std::string(e.what()));
        }
    }

    void LedgerLoader::save_ledger(const LedgerSnapshot &snapshot, const std::string &filepath)
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

        file << snapshot.to_json().dump(2) << "\n";
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::ordered_json LedgerLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::ordered_json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::ordered_json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        return j;
    }

    DashboardConfig LedgerLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        try
        {
            return DashboardConfig::from_json(j);
        }
        catch (const nlohmann::ordered_json::exception &e)
        {
            throw std::invalid_argument("Invalid configuration " + config_path + ": " + std::string(e.what()));
        }
    }

    // ===========================
    // Demonstration Data
    // ===========================

    LedgerSnapshot LedgerLoader::demo_snapshot()
    {
        LedgerSnapshot snapshot;

        snapshot.accounts = {
            {"1", "Ally Savings", false, false},
            {"2", "Capital One Checking", false, false},
            {"3", "Roth IRA", true, false},
            {"4", "House Asset", true, false},
            {"5", "Mortgage", true, false}};

        snapshot.categories = {
            {"1", "Salary", "income_group", true},
            {"2", "Groceries", "expense_group", false},
            {"3", "Utilities", "expense_group", false}};

        snapshot.payees = {
            {"p1", "Employer"},
            {"p2", "Grocery Store"},
            {"p3", "Power Company"}};

        auto tx = [](const std::string &id, const std::string &account,
                     std::optional<std::string> category, MinorUnits amount,
                     const std::string &date, std::optional<std::string> transfer_id,
                     const std::string &payee)
        {
            Transaction t;
            t.id = id;
            t.account = account;
            t.category = std::move(category);
            t.amount = amount;
            t.date = date;
            t.transfer_id = std::move(transfer_id);
            t.payee = payee;
            return t;
        };

        snapshot.transactions = {
            // Opening balances
            tx("o1", "1", std::nullopt, 5000000, "2024-01-01", std::nullopt, ""),
            tx("o2", "2", std::nullopt, 1500000, "2024-01-01", std::nullopt, ""),
            tx("o3", "3", std::nullopt, 12000000, "2024-01-01", std::nullopt, ""),
            tx("o4", "4", std::nullopt, 45000000, "2024-01-01", std::nullopt, ""),
            tx("o5", "5", std::nullopt, -28000000, "2024-01-01", std::nullopt, ""),

            // January
            tx("1", "2", std::string("1"), 800000, "2024-01-01", std::nullopt, "p1"),
            tx("2", "2", std::string("2"), -80000, "2024-01-05", std::nullopt, "p2"),
            tx("3", "2", std::string("3"), -30000, "2024-01-10", std::nullopt, "p3"),

            // February, in compact form as exported by direct database reads
            tx("4", "2", std::string("1"), 800000, "20240201", std::nullopt, "p1"),
            tx("5", "2", std::string("2"), -75000, "20240206", std::nullopt, "p2"),
            tx("6", "2", std::string("3"), -30000, "20240212", std::nullopt, "p3"),
            tx("7", "2", std::nullopt, -120000, "2024-02-15", std::string("8"), ""),
            tx("8", "1", std::nullopt, 120000, "2024-02-15", std::string("7"), ""),
            tx("9", "2", std::nullopt, -200000, "2024-02-20", std::string("10"), ""),
            tx("10", "5", std::nullopt, 200000, "2024-02-20", std::string("9"), "")};

        return snapshot;
    }

} // namespace budget
