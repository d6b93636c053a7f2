/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Loads stock quotes and option chains from long-format CSV files whose
 * column names are given by a Schema, and simulation configuration from JSON.
 */

#ifndef OPTSIM_DATA_DATA_LOADER_HPP
#define OPTSIM_DATA_DATA_LOADER_HPP

#include "data/market_data.hpp"
#include "data/schema.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace optsim
{

    /**
     * @struct DataConfig
     * @brief Input files and their column layouts
     */
    struct DataConfig
    {
        std::string stocks_file;  ///< Path to stock quotes CSV
        std::string options_file; ///< Path to option chains CSV
        std::string start_date;   ///< Optional start date filter
        std::string end_date;     ///< Optional end date filter
        Schema stocks_schema = Schema::stocks();
        Schema options_schema = Schema::options();

        /**
         * @brief Load from JSON object
         *
         * "stocks_schema" / "options_schema" objects override individual
         * canonical-key -> column-name mappings of the defaults.
         */
        static DataConfig from_json(const nlohmann::json &j);
    };

    /**
     * @struct BacktestConfig
     * @brief Complete simulation configuration
     *
     * The data section is decoded here; the remaining sections are kept as
     * JSON and decoded by the components that own them.
     */
    struct BacktestConfig
    {
        DataConfig data;
        nlohmann::json backtest = nlohmann::json::object();
        nlohmann::json allocation = nlohmann::json::object();
        nlohmann::json stocks = nlohmann::json::array();
        nlohmann::json strategy = nlohmann::json::object();

        static BacktestConfig from_json(const nlohmann::json &j);

        /**
         * @brief Load complete configuration from JSON file
         */
        static BacktestConfig load_from_file(const std::string &config_path);
    };

    /**
     * @class DataLoader
     * @brief Loads and parses quote data from CSV files
     *
     * Both loaders expect long format, one quote per row, with a header
     * naming the columns. Dates may be YYYY-MM-DD (optionally with a time
     * part) or MM/DD/YYYY.
     */
    class DataLoader
    {
    public:
        DataLoader() = default;
        ~DataLoader() = default;

        // ========================================================================
        // CSV Loading Methods
        // ========================================================================

        /**
         * @brief Load stock quotes
         *
         * Required columns: symbol, date, adjClose. Other price columns default
         * to 0 when absent.
         *
         * @param filepath Path to CSV file
         * @param schema Column layout
         * @return StocksData object
         * @throws std::runtime_error if the file cannot be read or a required column is missing
         */
        static StocksData load_stocks_csv(const std::string &filepath,
                                          const Schema &schema = Schema::stocks());

        /**
         * @brief Load option chains
         *
         * Every key of the schema except dte is required. When the dte column
         * is absent or empty, dte is computed from the expiration date.
         *
         * @param filepath Path to CSV file
         * @param schema Column layout
         * @return OptionsData object
         * @throws std::runtime_error if the file cannot be read or a required column is missing
         */
        static OptionsData load_options_csv(const std::string &filepath,
                                            const Schema &schema = Schema::options());

        // ========================================================================
        // Configuration Loading
        // ========================================================================

        /**
         * @brief Load JSON configuration file
         * @param filepath Path to JSON config file
         * @return JSON object
         * @throws std::runtime_error if file cannot be loaded
         */
        static nlohmann::json load_json(const std::string &filepath);

        static BacktestConfig load_config(const std::string &config_path);

        // ========================================================================
        // Export Methods
        // ========================================================================

        static void save_stocks_csv(const StocksData &data, const std::string &filepath);
        static void save_options_csv(const OptionsData &data, const std::string &filepath);

        // ========================
        // Parsing Helpers
        // ========================

        /**
         * @brief Parse CSV line into tokens
         * @param line CSV line string
         * @return Vector of tokens
         */
        static std::vector<std::string> parse_csv_line(const std::string &line);

        static std::string trim(const std::string &str);

        /**
         * @brief Convert string to double safely
         * @param str String representation of number
         * @return Double value, or NaN if conversion fails
         */
        static double safe_stod(const std::string &str);
    };

} // namespace optsim

#endif // OPTSIM_DATA_DATA_LOADER_HPP
