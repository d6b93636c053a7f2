/**
 * @file main.cpp
 * @brief Main entry point for the optsim portfolio simulator
 *
 * Command-line application that loads configuration and quote data, runs a
 * stocks + options backtest, and writes the trade log, balance series and
 * analytics.
 */

#include "data/data_loader.hpp"
#include "data/market_data.hpp"
#include "backtest/allocation.hpp"
#include "backtest/backtest_engine.hpp"
#include "strategy/strategy.hpp"
#include "analytics/performance_metrics.hpp"
#include "analytics/trade_statistics.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace optsim;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "optsim v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --capital AMOUNT      Override backtest.initial_capital\n"
              << "  --monthly             Step on the first trading day of each month only\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config config/backtest_config.json --verbose\n"
              << std::endl;
}

void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       optsim v1.0.0                                           \n"
              << "       Stocks + Options Portfolio Simulation                   \n"
              << "================================================================\n"
              << std::endl;
}

double parse_capital(const std::string &text)
{
    double value = 0.0;
    try
    {
        value = std::stod(text);
    }
    catch (const std::exception &)
    {
        throw std::invalid_argument("Expected a number for --capital, got: " + text);
    }
    if (value <= 0.0)
    {
        throw std::invalid_argument("Expected positive value for parameter 'capital', got: " + text);
    }
    return value;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir = "results";
    double capital_override = 0.0;
    bool monthly = false;
    bool verbose = false;
    bool show_help = false;

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
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--capital" && i + 1 < argc)
            {
                args.capital_override = parse_capital(argv[++i]);
            }
            else if (arg == "--monthly")
            {
                args.monthly = true;
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
        return !show_help && !config_path.empty();
    }
};

void print_allocation(const backtest::Allocation &allocation,
                      const std::vector<Stock> &stocks)
{
    std::cout << "  - Allocation: stocks " << std::fixed << std::setprecision(2)
              << allocation.stocks * 100 << "%, options " << allocation.options * 100
              << "%, cash " << allocation.cash * 100 << "%\n";
    std::cout << "  - Stock targets:";
    for (const auto &s : stocks)
    {
        std::cout << " " << s.symbol << "=" << s.percentage * 100 << "%";
    }
    std::cout << "\n";
}

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
        std::cout << "[1/5] Loading configuration..." << std::endl;

        auto config = BacktestConfig::load_from_file(args.config_path);

        auto params = backtest::BacktestParams::from_json(config.backtest);
        if (args.verbose)
        {
            params.verbose = true;
        }
        if (args.monthly)
        {
            params.monthly = true;
        }
        if (args.capital_override > 0.0)
        {
            params.initial_capital = args.capital_override;
        }
        auto allocation = backtest::Allocation::from_json(config.allocation);
        auto stocks = backtest::stocks_from_json(config.stocks);

        if (params.verbose)
        {
            std::cout << "  - Stocks file: " << config.data.stocks_file << "\n";
            std::cout << "  - Options file: " << config.data.options_file << "\n";
            std::cout << "  - Initial capital: " << std::fixed << std::setprecision(2)
                      << params.initial_capital << "\n";
            std::cout << "  - Rebalance every " << params.rebalance.frequency_months
                      << " month(s), " << (params.monthly ? "monthly" : "daily") << " steps\n";
            print_allocation(allocation, stocks);
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/5] Loading market data..." << std::endl;

        auto stocks_data = DataLoader::load_stocks_csv(config.data.stocks_file,
                                                       config.data.stocks_schema);
        auto options_data = DataLoader::load_options_csv(config.data.options_file,
                                                         config.data.options_schema);

        if (!config.data.start_date.empty() || !config.data.end_date.empty())
        {
            stocks_data = stocks_data.filter_by_date(config.data.start_date, config.data.end_date);
            options_data = options_data.filter_by_date(config.data.start_date, config.data.end_date);
        }

        std::cout << "  - Loaded " << stocks_data.num_rows() << " stock quotes, "
                  << options_data.num_rows() << " option quotes over "
                  << stocks_data.num_dates() << " dates" << std::endl;

        if (params.verbose)
        {
            stocks_data.print_summary();
            options_data.print_summary();
        }

        // ====================================================================
        // 3. Build Strategy
        // ====================================================================
        std::cout << "[3/5] Building options strategy..." << std::endl;

        auto options_strategy = std::make_unique<strategy::Strategy>(
            strategy::Strategy::from_json(config.strategy, config.data.options_schema,
                                          params.initial_capital, params.shares_per_contract));

        if (params.verbose)
        {
            for (const auto &leg : options_strategy->legs())
            {
                std::cout << "  - Leg " << leg.name() << " (" << to_string(leg.type()) << ", "
                          << to_string(leg.direction()) << ")\n"
                          << "      entry: " << leg.entry_filter().query() << "\n"
                          << "      exit:  " << leg.exit_filter().query() << "\n";
            }
        }

        // ====================================================================
        // 4. Run Backtest
        // ====================================================================
        std::cout << "[4/5] Running backtest..." << std::endl;

        backtest::BacktestEngine engine(allocation, params);
        engine.set_stocks(stocks);
        engine.set_stocks_data(std::move(stocks_data));
        engine.set_options_data(std::move(options_data));
        engine.set_options_strategy(std::move(options_strategy));

        const auto &trade_log = engine.run();

        std::cout << "  - " << engine.balance().size() - 1 << " dates simulated, "
                  << engine.rebalance_dates().size() << " rebalances, "
                  << trade_log.option_trades().size() << " option trades" << std::endl;

        if (params.verbose)
        {
            trade_log.print_summary();
        }

        // ====================================================================
        // 5. Analytics and Export
        // ====================================================================
        std::cout << "[5/5] Computing analytics..." << std::endl;

        auto stats = engine.summary();
        analytics::PerformanceMetrics metrics(engine.balance(), 0.02, params.monthly ? 12 : 252);

        std::cout << "\n"
                  << stats.to_string() << "\n";
        std::cout << metrics.summary() << std::endl;

        std::filesystem::create_directories(args.output_dir);

        std::string trade_file = args.output_dir + "/trade_log.csv";
        std::string stock_trade_file = args.output_dir + "/stock_trades.csv";
        std::string balance_file = args.output_dir + "/balance.csv";
        std::string analytics_file = args.output_dir + "/analytics.json";
        std::string drawdown_file = args.output_dir + "/drawdown.csv";

        trade_log.export_to_csv(trade_file);
        trade_log.export_stocks_to_csv(stock_trade_file);
        engine.balance().export_to_csv(balance_file);
        metrics.to_csv(drawdown_file);

        nlohmann::json analytics;
        analytics["trade_statistics"] = stats.to_json();
        analytics["performance"] = metrics.to_json();
        analytics["allocation"] = engine.allocation().to_json();
        analytics["rebalance_dates"] = engine.rebalance_dates();

        std::ofstream out(analytics_file);
        if (!out.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + analytics_file);
        }
        out << analytics.dump(2) << "\n";

        std::cout << "  - Trade log exported to: " << trade_file << "\n";
        std::cout << "  - Stock trades exported to: " << stock_trade_file << "\n";
        std::cout << "  - Balance exported to: " << balance_file << "\n";
        std::cout << "  - Analytics exported to: " << analytics_file << "\n";
        std::cout << "  - Drawdown series exported to: " << drawdown_file << "\n";

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Backtest completed successfully in "
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
    CommandLineArgs args;
    try
    {
        args = CommandLineArgs::parse(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
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
