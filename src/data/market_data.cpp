#include "data/market_data.hpp"
#include "data/date_utils.hpp"

#include <iostream>
#include <set>
#include <stdexcept>

namespace optsim
{

    // =========================
    // StocksData
    // =========================

    StocksData::StocksData(Schema schema)
        : schema_(std::move(schema))
    {
    }

    std::vector<std::string> StocksData::dates() const
    {
        std::vector<std::string> out;
        out.reserve(rows_by_date_.size());
        for (const auto &kv : rows_by_date_)
        {
            out.push_back(kv.first);
        }
        return out;
    }

    size_t StocksData::num_rows() const
    {
        size_t n = 0;
        for (const auto &kv : rows_by_date_)
        {
            n += kv.second.size();
        }
        return n;
    }

    bool StocksData::has_date(const std::string &date) const
    {
        return rows_by_date_.count(date) > 0;
    }

    std::string StocksData::start_date() const
    {
        if (rows_by_date_.empty())
        {
            throw std::runtime_error("Stocks data is empty");
        }
        return rows_by_date_.begin()->first;
    }

    std::string StocksData::end_date() const
    {
        if (rows_by_date_.empty())
        {
            throw std::runtime_error("Stocks data is empty");
        }
        return rows_by_date_.rbegin()->first;
    }

    StockSnapshot StocksData::snapshot(const std::string &date) const
    {
        auto it = rows_by_date_.find(date);
        if (it == rows_by_date_.end())
        {
            return StockSnapshot(date, {});
        }
        return StockSnapshot(date, it->second);
    }

    std::vector<std::string> StocksData::step_dates(bool monthly) const
    {
        return date_utils::select_step_dates(dates(), monthly);
    }

    void StocksData::add_quote(const StockQuote &quote)
    {
        if (!date_utils::is_valid_date_format(quote.date))
        {
            throw std::runtime_error("Invalid quote date '" + quote.date + "' for symbol " + quote.symbol);
        }
        rows_by_date_[quote.date].push_back(quote);
    }

    StocksData StocksData::filter_by_date(const std::string &start_date,
                                          const std::string &end_date) const
    {
        StocksData filtered(schema_);
        for (const auto &kv : rows_by_date_)
        {
            if (!start_date.empty() && kv.first < start_date)
                continue;
            if (!end_date.empty() && kv.first > end_date)
                continue;
            filtered.rows_by_date_[kv.first] = kv.second;
        }
        return filtered;
    }

    void StocksData::print_summary() const
    {
        std::set<std::string> symbols;
        for (const auto &kv : rows_by_date_)
        {
            for (const auto &q : kv.second)
            {
                symbols.insert(q.symbol);
            }
        }

        std::cout << "\n=== Stocks Data Summary ===\n";
        std::cout << "Rows: " << num_rows() << " over " << num_dates() << " dates\n";
        if (!empty())
        {
            std::cout << "Date range: " << start_date() << " to " << end_date() << "\n";
        }
        std::cout << "Symbols: ";
        for (const auto &s : symbols)
        {
            std::cout << s << " ";
        }
        std::cout << "\n==========================\n"
                  << std::endl;
    }

    // =========================
    // OptionsData
    // =========================

    OptionsData::OptionsData(Schema schema)
        : schema_(std::move(schema))
    {
    }

    std::vector<std::string> OptionsData::dates() const
    {
        std::vector<std::string> out;
        out.reserve(rows_by_date_.size());
        for (const auto &kv : rows_by_date_)
        {
            out.push_back(kv.first);
        }
        return out;
    }

    size_t OptionsData::num_rows() const
    {
        size_t n = 0;
        for (const auto &kv : rows_by_date_)
        {
            n += kv.second.size();
        }
        return n;
    }

    bool OptionsData::has_date(const std::string &date) const
    {
        return rows_by_date_.count(date) > 0;
    }

    std::string OptionsData::start_date() const
    {
        if (rows_by_date_.empty())
        {
            throw std::runtime_error("Options data is empty");
        }
        return rows_by_date_.begin()->first;
    }

    std::string OptionsData::end_date() const
    {
        if (rows_by_date_.empty())
        {
            throw std::runtime_error("Options data is empty");
        }
        return rows_by_date_.rbegin()->first;
    }

    OptionSnapshot OptionsData::snapshot(const std::string &date) const
    {
        auto it = rows_by_date_.find(date);
        if (it == rows_by_date_.end())
        {
            return OptionSnapshot(date, {});
        }
        return OptionSnapshot(date, it->second);
    }

    std::vector<std::string> OptionsData::step_dates(bool monthly) const
    {
        return date_utils::select_step_dates(dates(), monthly);
    }

    void OptionsData::add_quote(const OptionQuote &quote)
    {
        if (!date_utils::is_valid_date_format(quote.date))
        {
            throw std::runtime_error("Invalid quote date '" + quote.date + "' for contract " + quote.contract);
        }

        OptionQuote row = quote;
        if (row.dte < 0)
        {
            if (!date_utils::is_valid_date_format(row.expiration))
            {
                throw std::runtime_error("Invalid expiration '" + row.expiration + "' for contract " + row.contract);
            }
            row.dte = date_utils::days_between(row.date, row.expiration);
        }
        rows_by_date_[row.date].push_back(std::move(row));
    }

    OptionsData OptionsData::filter_by_date(const std::string &start_date,
                                            const std::string &end_date) const
    {
        OptionsData filtered(schema_);
        for (const auto &kv : rows_by_date_)
        {
            if (!start_date.empty() && kv.first < start_date)
                continue;
            if (!end_date.empty() && kv.first > end_date)
                continue;
            filtered.rows_by_date_[kv.first] = kv.second;
        }
        return filtered;
    }

    void OptionsData::print_summary() const
    {
        std::set<std::string> underlyings;
        for (const auto &kv : rows_by_date_)
        {
            for (const auto &q : kv.second)
            {
                underlyings.insert(q.underlying);
            }
        }

        std::cout << "\n=== Options Data Summary ===\n";
        std::cout << "Rows: " << num_rows() << " over " << num_dates() << " dates\n";
        if (!empty())
        {
            std::cout << "Date range: " << start_date() << " to " << end_date() << "\n";
        }
        std::cout << "Underlyings: ";
        for (const auto &u : underlyings)
        {
            std::cout << u << " ";
        }
        std::cout << "\n===========================\n"
                  << std::endl;
    }

} // namespace optsim
