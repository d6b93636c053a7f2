/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader class and configuration structures
 */

#include "data/data_loader.hpp"
#include "data/date_utils.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <stdexcept>

namespace optsim
{

    namespace
    {
        using ColumnIndex = std::map<std::string, size_t>;

        ColumnIndex index_header(const std::vector<std::string> &header)
        {
            ColumnIndex index;
            for (size_t i = 0; i < header.size(); ++i)
            {
                index.emplace(DataLoader::trim(header[i]), i);
            }
            return index;
        }

        /// Position of a schema key's column, or -1 when absent.
        long find_column(const ColumnIndex &index, const Schema &schema, const std::string &key)
        {
            auto it = index.find(schema[key]);
            return it == index.end() ? -1 : static_cast<long>(it->second);
        }

        size_t require_column(const ColumnIndex &index, const Schema &schema,
                              const std::string &key, const std::string &filepath)
        {
            long pos = find_column(index, schema, key);
            if (pos < 0)
            {
                throw std::runtime_error("Missing required column '" + schema[key] +
                                         "' in " + filepath);
            }
            return static_cast<size_t>(pos);
        }

        std::string field_at(const std::vector<std::string> &fields, long pos)
        {
            if (pos < 0 || static_cast<size_t>(pos) >= fields.size())
                return "";
            return DataLoader::trim(fields[pos]);
        }

        double number_at(const std::vector<std::string> &fields, long pos)
        {
            double v = DataLoader::safe_stod(field_at(fields, pos));
            return std::isnan(v) ? 0.0 : v;
        }

        std::map<std::string, std::string> schema_overrides(const nlohmann::json &j)
        {
            std::map<std::string, std::string> out;
            for (auto it = j.begin(); it != j.end(); ++it)
            {
                out[it.key()] = it.value().get<std::string>();
            }
            return out;
        }
    } // namespace

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    DataConfig DataConfig::from_json(const nlohmann::json &j)
    {
        DataConfig config;
        config.stocks_file = j.value("stocks_file", "data/stocks.csv");
        config.options_file = j.value("options_file", "data/options.csv");
        config.start_date = j.value("start_date", "");
        config.end_date = j.value("end_date", "");

        if (j.contains("stocks_schema"))
        {
            config.stocks_schema.update(schema_overrides(j["stocks_schema"]));
        }
        if (j.contains("options_schema"))
        {
            config.options_schema.update(schema_overrides(j["options_schema"]));
        }

        return config;
    }

    BacktestConfig BacktestConfig::from_json(const nlohmann::json &j)
    {
        BacktestConfig config;

        if (j.contains("data"))
        {
            config.data = DataConfig::from_json(j["data"]);
        }
        if (j.contains("backtest"))
        {
            config.backtest = j["backtest"];
        }
        if (j.contains("allocation"))
        {
            config.allocation = j["allocation"];
        }
        if (j.contains("stocks"))
        {
            config.stocks = j["stocks"];
        }
        if (j.contains("strategy"))
        {
            config.strategy = j["strategy"];
        }

        return config;
    }

    BacktestConfig BacktestConfig::load_from_file(const std::string &config_path)
    {
        return DataLoader::load_config(config_path);
    }

    // ===========================
    // CSV Loading - Stocks
    // ===========================

    StocksData DataLoader::load_stocks_csv(const std::string &filepath, const Schema &schema)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        ColumnIndex header = index_header(parse_csv_line(line));
        size_t symbol_col = require_column(header, schema, "symbol", filepath);
        size_t date_col = require_column(header, schema, "date", filepath);
        size_t adj_close_col = require_column(header, schema, "adjClose", filepath);
        long open_col = find_column(header, schema, "open");
        long high_col = find_column(header, schema, "high");
        long low_col = find_column(header, schema, "low");
        long close_col = find_column(header, schema, "close");
        long volume_col = find_column(header, schema, "volume");

        StocksData data(schema);
        size_t line_no = 1;

        while (std::getline(file, line))
        {
            ++line_no;
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);

            StockQuote quote;
            quote.symbol = field_at(fields, symbol_col);
            quote.date = date_utils::normalize_date(field_at(fields, date_col));
            quote.adj_close = safe_stod(field_at(fields, adj_close_col));
            if (std::isnan(quote.adj_close))
            {
                throw std::runtime_error("Invalid " + schema["adjClose"] + " value on line " +
                                         std::to_string(line_no) + " of " + filepath);
            }
            quote.open = number_at(fields, open_col);
            quote.high = number_at(fields, high_col);
            quote.low = number_at(fields, low_col);
            quote.close = number_at(fields, close_col);
            quote.volume = number_at(fields, volume_col);

            data.add_quote(quote);
        }

        if (data.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        return data;
    }

    // ===========================
    // CSV Loading - Options
    // ===========================

    OptionsData DataLoader::load_options_csv(const std::string &filepath, const Schema &schema)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file: " + filepath);
        }

        std::string line;
        if (!std::getline(file, line))
        {
            throw std::runtime_error("Empty CSV file: " + filepath);
        }

        ColumnIndex header = index_header(parse_csv_line(line));
        std::map<std::string, size_t> cols;
        for (const auto &kv : schema.mappings())
        {
            if (kv.first == "dte")
                continue;
            cols[kv.first] = require_column(header, schema, kv.first, filepath);
        }
        long dte_col = schema.contains("dte") ? find_column(header, schema, "dte") : -1;

        OptionsData data(schema);

        while (std::getline(file, line))
        {
            if (trim(line).empty())
                continue;

            auto fields = parse_csv_line(line);

            OptionQuote quote;
            quote.underlying = field_at(fields, cols["underlying"]);
            quote.underlying_last = number_at(fields, cols["underlying_last"]);
            quote.date = date_utils::normalize_date(field_at(fields, cols["date"]));
            quote.contract = field_at(fields, cols["contract"]);
            quote.type = parse_option_type(field_at(fields, cols["type"]));
            quote.expiration = date_utils::normalize_date(field_at(fields, cols["expiration"]));
            quote.strike = number_at(fields, cols["strike"]);
            quote.bid = number_at(fields, cols["bid"]);
            quote.ask = number_at(fields, cols["ask"]);
            quote.volume = number_at(fields, cols["volume"]);
            quote.open_interest = number_at(fields, cols["open_interest"]);
            quote.last = number_at(fields, cols["last"]);

            // negative dte is recomputed from the expiration by add_quote
            std::string dte = field_at(fields, dte_col);
            double dte_value = safe_stod(dte);
            quote.dte = std::isnan(dte_value) ? -1 : static_cast<int>(dte_value);

            data.add_quote(quote);
        }

        if (data.empty())
        {
            throw std::runtime_error("No valid data found in CSV file: " + filepath);
        }

        return data;
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json DataLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    BacktestConfig DataLoader::load_config(const std::string &config_path)
    {
        return BacktestConfig::from_json(load_json(config_path));
    }

    // ==================
    // Export Methods
    // ==================

    void DataLoader::save_stocks_csv(const StocksData &data, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        const Schema &s = data.schema();
        file << s["symbol"] << "," << s["date"] << "," << s["open"] << "," << s["high"] << ","
             << s["low"] << "," << s["close"] << "," << s["volume"] << "," << s["adjClose"] << "\n";

        for (const auto &date : data.dates())
        {
            for (const auto &q : data.snapshot(date).rows())
            {
                file << q.symbol << "," << q.date << std::fixed << std::setprecision(6)
                     << "," << q.open << "," << q.high << "," << q.low << "," << q.close
                     << "," << std::setprecision(0) << q.volume
                     << "," << std::setprecision(6) << q.adj_close << "\n";
            }
        }

        file.close();
    }

    void DataLoader::save_options_csv(const OptionsData &data, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        const Schema &s = data.schema();
        file << s["underlying"] << "," << s["underlying_last"] << "," << s["contract"] << ","
             << s["type"] << "," << s["expiration"] << "," << s["date"] << "," << s["strike"] << ","
             << s["last"] << "," << s["bid"] << "," << s["ask"] << "," << s["volume"] << ","
             << s["open_interest"] << "," << s["dte"] << "\n";

        for (const auto &date : data.dates())
        {
            for (const auto &q : data.snapshot(date).rows())
            {
                file << q.underlying << "," << std::fixed << std::setprecision(2) << q.underlying_last
                     << "," << q.contract << "," << to_string(q.type) << "," << q.expiration
                     << "," << q.date << "," << q.strike << "," << q.last << "," << q.bid
                     << "," << q.ask << "," << std::setprecision(0) << q.volume
                     << "," << q.open_interest << "," << q.dte << "\n";
            }
        }

        file.close();
    }

    // =======================
    // Parsing Helpers
    // =======================

    std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
    {
        std::vector<std::string> tokens;
        std::string token;
        bool in_quotes = false;

        for (char c : line)
        {
            if (c == '"')
            {
                in_quotes = !in_quotes;
            }
            else if (c == ',' && !in_quotes)
            {
                tokens.push_back(token);
                token.clear();
            }
            else
            {
                token += c;
            }
        }

        tokens.push_back(token);
        return tokens;
    }

    std::string DataLoader::trim(const std::string &str)
    {
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
            return "";

        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, last - first + 1);
    }

    double DataLoader::safe_stod(const std::string &str)
    {
        std::string trimmed = trim(str);
        if (trimmed.empty() || trimmed == "nan" || trimmed == "NaN")
        {
            return std::numeric_limits<double>::quiet_NaN();
        }

        try
        {
            size_t consumed = 0;
            double value = std::stod(trimmed, &consumed);
            if (consumed != trimmed.size())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }
        catch (const std::invalid_argument &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
        catch (const std::out_of_range &)
        {
            return std::numeric_limits<double>::quiet_NaN();
        }
    }

} // namespace optsim
