/**
 * @file main.cpp
 * @brief Main entry point for the Budget Dashboard
 *
 * Command-line application that loads configuration, fetches the ledger,
 * aggregates net worth, cash flow and financial health metrics, and
 * writes the dashboard reports.
 */

#include "data/ledger_loader.hpp"
#include "data/ledger_source.hpp"
#include "report/report_writer.hpp"
#include "service/snapshot_cache.hpp"
#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

using namespace budget;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Budget Dashboard v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --ledger PATH         Ledger JSON file (overrides the configured path)\n"
              << "  --output PATH         Path to output directory (default: from config)\n"
              << "  --demo                Use the demonstration ledger\n"
              << "  --watch N             Run N refresh cycles at the configured interval\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/dashboard_config.json --verbose\n"
              << "  " << program_name << " --config data/config/dashboard_config.json --watch 3\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Budget Dashboard v1.0.0                                  \n"
              << "       Net Worth, Cash Flow and Financial Health Metrics        \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string ledger_path;
    std::string output_dir;
    bool use_demo = false;
    int watch_cycles = 0;
    bool verbose = false;
    bool show_help = false;
    std::string error;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--ledger" && i + 1 < argc)
            {
                args.ledger_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--demo")
            {
                args.use_demo = true;
            }
            else if (arg == "--watch" && i + 1 < argc)
            {
                std::string value = argv[++i];
                try
                {
                    args.watch_cycles = std::stoi(value);
                }
                catch (const std::exception &)
                {
                    args.error = "Invalid value for --watch: " + value;
                }
                if (args.error.empty() && args.watch_cycles < 1)
                {
                    args.error = "--watch expects a positive cycle count, got: " + value;
                }
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() && error.empty();
    }
};

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = LedgerLoader::load_config(args.config_path);

        if (!args.ledger_path.empty())
        {
            config.ledger.source = "file";
            config.ledger.path = args.ledger_path;
        }
        if (args.use_demo)
        {
            config.ledger.source = "demo";
        }
        if (!args.output_dir.empty())
        {
            config.output.directory = args.output_dir;
        }
        config.cash_flow.verbose = args.verbose;

        if (args.verbose)
        {
            std::cout << "  - Ledger source: " << config.ledger.source;
            if (!config.ledger.path.empty())
                std::cout << " (" << config.ledger.path << ")";
            std::cout << "\n  - Demo fallback: " << (config.ledger.fallback_to_demo ? "on" : "off") << "\n";
            std::cout << "  - Account groups: ";
            for (const auto &name : config.account_groups.group_names())
            {
                std::cout << name << " ";
            }
            std::cout << "\n  - Refresh interval: " << config.refresh.interval_seconds << "s\n";
        }

        // ====================================================================
        // 2. Create Ledger Source
        // ====================================================================
        std::cout << "[2/4] Creating ledger source..." << std::endl;

        auto source = LedgerSourceFactory::create(config.ledger);
        std::cout << "  - Source: " << source->get_name() << "\n";

        SnapshotCache cache(std::move(source), config.account_groups, config.cash_flow,
                            config.ledger.fallback_to_demo);

        // ====================================================================
        // 3. Refresh and Aggregate
        // ====================================================================
        const int cycles = args.watch_cycles > 0 ? args.watch_cycles : 1;

        for (int cycle = 1; cycle <= cycles; ++cycle)
        {
            std::cout << "[3/4] Refreshing dashboard";
            if (cycles > 1)
                std::cout << " (cycle " << cycle << "/" << cycles << ")";
            std::cout << "..." << std::endl;

            auto aggregate = cache.refresh();

            std::cout << "  - Loaded " << aggregate->counts.accounts << " accounts, "
                      << aggregate->counts.transactions << " transactions\n";

            if (aggregate->date_stats.fallback > 0 && !args.verbose)
            {
                std::cerr << "Warning: " << aggregate->date_stats.fallback
                          << " transaction(s) had unparseable dates\n";
            }
            if (aggregate->is_demo && !aggregate->last_error.empty() && !args.verbose)
            {
                std::cerr << "Warning: ledger unavailable, showing demonstration data: "
                          << aggregate->last_error << "\n";
            }

            report::ReportWriter::print_summary(*aggregate, std::cout);

            // ================================================================
            // 4. Write Reports
            // ================================================================
            std::cout << "\n[4/4] Writing reports..." << std::endl;

            auto written = report::ReportWriter::write_all(*aggregate, config.output);
            for (const auto &path : written)
            {
                std::cout << "  - Saved: " << path << "\n";
            }

            if (cycle < cycles)
            {
                if (args.verbose)
                {
                    std::cout << "  - Next refresh in " << config.refresh.interval_seconds << "s\n";
                }
                std::this_thread::sleep_for(std::chrono::seconds(config.refresh.interval_seconds));
            }
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Dashboard refreshed " << cache.refresh_count() << " time(s) in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (!args.error.empty())
    {
        std::cerr << "Error: " << args.error << std::endl;
        return 1;
    }

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
