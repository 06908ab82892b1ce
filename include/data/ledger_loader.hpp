/**
 * @file ledger_loader.hpp
 * @brief Ledger and configuration loading utilities
 *
 * Loads ledger snapshots exported from the budgeting application and the
 * dashboard configuration (ledger source, account groups, cash-flow
 * options, refresh interval, output settings) from JSON files.
 */

#ifndef BUDGET_DATA_LEDGER_LOADER_HPP
#define BUDGET_DATA_LEDGER_LOADER_HPP

#include "analytics/aggregator.hpp"
#include "data/account_groups.hpp"
#include "data/ledger.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace budget
{

    /**
     * @struct LedgerSourceConfig
     * @brief Where the ledger snapshot comes from
     */
    struct LedgerSourceConfig
    {
        std::string source = "file";        ///< Source type (file, demo)
        std::string path;                   ///< Ledger JSON path for the file source
        bool fallback_to_demo = true;       ///< Substitute demo data when the fetch fails

        static LedgerSourceConfig from_json(const nlohmann::ordered_json &j);
    };

    /**
     * @struct RefreshConfig
     * @brief Refresh cadence for watch mode
     */
    struct RefreshConfig
    {
        int interval_seconds = 300;         ///< Seconds between refresh cycles

        /**
         * @throws std::invalid_argument if interval_seconds <= 0
         */
        static RefreshConfig from_json(const nlohmann::ordered_json &j);
    };

    /**
     * @struct OutputConfig
     * @brief Report output settings
     */
    struct OutputConfig
    {
        std::string directory = "results";  ///< Output directory
        bool write_json = true;             ///< Write dashboard.json
        bool write_csv = true;              ///< Write per-series CSV files

        static OutputConfig from_json(const nlohmann::ordered_json &j);
    };

    /**
     * @struct DashboardConfig
     * @brief Complete dashboard configuration
     */
    struct DashboardConfig
    {
        LedgerSourceConfig ledger;
        AccountGroupConfig account_groups = AccountGroupConfig::defaults();
        analytics::AggregatorOptions cash_flow;
        RefreshConfig refresh;
        OutputConfig output;

        /**
         * @brief Build from a parsed document; absent sections keep their defaults
         * @throws std::invalid_argument if a section is malformed or groups overlap
         */
        static DashboardConfig from_json(const nlohmann::ordered_json &j);

        /**
         * @brief Load complete configuration from JSON file
         */
        static DashboardConfig load_from_file(const std::string &config_path);
    };

    /**
     * @class LedgerLoader
     * @brief Loads ledger snapshots and configuration from JSON files
     */
    class LedgerLoader
    {
    public:
        LedgerLoader() = default;
        ~LedgerLoader() = default;

        // ========================================================================
        // Ledger Loading
        // ========================================================================

        /**
         * @brief Load a ledger snapshot
         *
         * Expected format:
         * {
         *   "accounts":     [{"id": "1", "name": "Checking"}],
         *   "categories":   [{"id": "c1", "is_income": false}],
         *   "payees":       [],
         *   "transactions": [{"id": "t1", "account": "1", "category": "c1",
         *                     "amount": -1250, "date": "2024-02-01", "transfer_id": null}]
         * }
         *
         * @param filepath Path to ledger JSON file
         * @return LedgerSnapshot
         * @throws std::runtime_error if the file cannot be read or parsed
         */
        static LedgerSnapshot load_ledger(const std::string &filepath);

        /**
         * @brief Save a ledger snapshot as JSON
         * @throws std::runtime_error if the file cannot be written
         */
        static void save_ledger(const LedgerSnapshot &snapshot, const std::string &filepath);

        // ========================================================================
        // Configuration Loading
        // ========================================================================

        /**
         * @brief Load a JSON file, preserving object key order
         * @throws std::runtime_error if the file cannot be loaded
         */
        static nlohmann::ordered_json load_json(const std::string &filepath);

        /**
         * @brief Load complete dashboard configuration
         * @throws std::runtime_error if the file cannot be loaded
         * @throws std::invalid_argument if the configuration is invalid
         */
        static DashboardConfig load_config(const std::string &config_path);

        // ========================================================================
        // Demonstration Data
        // ========================================================================

        /**
         * @brief The fixed demonstration ledger shown when the real ledger is unavailable
         *
         * Five accounts matching the default account groups, salary,
         * groceries and utilities categories, and two months of activity
         * including inter-account transfers.
         */
        static LedgerSnapshot demo_snapshot();
    };

} // namespace budget

#endif // BUDGET_DATA_LEDGER_LOADER_HPP
