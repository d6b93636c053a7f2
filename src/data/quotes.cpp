/**
 * @file quotes.cpp
 * @brief Implementation of quote snapshots
 */

#include "data/quotes.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace optsim
{

    std::string to_string(OptionType type)
    {
        return type == OptionType::CALL ? "call" : "put";
    }

    OptionType parse_option_type(const std::string &value)
    {
        std::string s = value;
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return std::tolower(c); });
        if (s == "call" || s == "c")
            return OptionType::CALL;
        if (s == "put" || s == "p")
            return OptionType::PUT;
        throw std::invalid_argument("Expected one of 'call','put' for parameter 'type', got: " + value);
    }

    // ============================================================================
    // StockSnapshot
    // ============================================================================

    StockSnapshot::StockSnapshot(std::string date, std::vector<StockQuote> rows)
        : date_(std::move(date)), rows_(std::move(rows))
    {
        for (size_t i = 0; i < rows_.size(); ++i)
        {
            // first quote wins on duplicate symbols
            symbol_index_.emplace(rows_[i].symbol, i);
        }
    }

    const StockQuote *StockSnapshot::find(const std::string &symbol) const
    {
        auto it = symbol_index_.find(symbol);
        if (it == symbol_index_.end())
            return nullptr;
        return &rows_[it->second];
    }

    double StockSnapshot::adj_close(const std::string &symbol) const
    {
        const StockQuote *quote = find(symbol);
        if (quote == nullptr)
        {
            throw std::runtime_error("No quote for symbol '" + symbol + "' on " + date_);
        }
        return quote->adj_close;
    }

    // ============================================================================
    // OptionSnapshot
    // ============================================================================

    OptionSnapshot::OptionSnapshot(std::string date, std::vector<OptionQuote> rows)
        : date_(std::move(date)), rows_(std::move(rows))
    {
        for (size_t i = 0; i < rows_.size(); ++i)
        {
            contract_index_.emplace(rows_[i].contract, i);
        }
    }

    const OptionQuote *OptionSnapshot::find(const std::string &contract) const
    {
        auto it = contract_index_.find(contract);
        if (it == contract_index_.end())
            return nullptr;
        return &rows_[it->second];
    }

} // namespace optsim
