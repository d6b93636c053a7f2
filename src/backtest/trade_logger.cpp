/**
 * @file trade_logger.cpp
 * @brief Implementation of TradeLogger
 */

#include "backtest/trade_logger.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace optsim {
namespace backtest {

namespace {

void prepare_output(const std::string& filepath)
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }
}

} // namespace

bool OptionTradeRecord::is_entry() const
{
    return !position.legs.empty() && optsim::is_entry(position.legs.front().order);
}

const std::string& OptionTradeRecord::contract() const
{
    if (position.legs.empty())
    {
        throw std::logic_error("Option trade " + std::to_string(trade_id) + " has no legs");
    }
    return position.legs.front().contract;
}

TradeLogger::TradeLogger(std::vector<std::string> leg_names)
    : leg_names_(std::move(leg_names))
{
}

void TradeLogger::log_option_trade(const std::string& date, const OptionPosition& position)
{
    if (position.legs.size() != leg_names_.size())
    {
        throw std::invalid_argument("Trade has " + std::to_string(position.legs.size()) +
                                    " legs, expected " + std::to_string(leg_names_.size()));
    }
    option_trades_.push_back(OptionTradeRecord{next_trade_id_++, date, position});
}

void TradeLogger::log_stock_trade(const std::string& date, const StockPosition& position)
{
    stock_trades_.push_back(StockTradeRecord{next_trade_id_++, date, position.symbol,
                                             position.price, position.qty});
}

void TradeLogger::log_rebalance(const std::string& date, const std::vector<StockPosition>& stocks)
{
    rebalance_count_ += 1;
    for (const auto& s : stocks)
    {
        log_stock_trade(date, s);
    }
}

std::vector<OptionTradeRecord> TradeLogger::trades_for_date(const std::string& date) const
{
    std::vector<OptionTradeRecord> out;
    for (const auto& t : option_trades_)
    {
        if (t.date == date)
            out.push_back(t);
    }
    return out;
}

std::vector<OptionTradeRecord> TradeLogger::trades_for_contract(const std::string& contract) const
{
    std::vector<OptionTradeRecord> out;
    for (const auto& t : option_trades_)
    {
        if (!t.position.legs.empty() && t.contract() == contract)
            out.push_back(t);
    }
    return out;
}

std::vector<OptionTradeRecord> TradeLogger::entries() const
{
    std::vector<OptionTradeRecord> out;
    for (const auto& t : option_trades_)
    {
        if (t.is_entry())
            out.push_back(t);
    }
    return out;
}

std::vector<OptionTradeRecord> TradeLogger::exits() const
{
    std::vector<OptionTradeRecord> out;
    for (const auto& t : option_trades_)
    {
        if (!t.is_entry())
            out.push_back(t);
    }
    return out;
}

TradeSummary TradeLogger::get_summary() const
{
    TradeSummary s;
    s.total_trades = num_trades();
    s.stock_trades = static_cast<int>(stock_trades_.size());
    s.rebalance_count = rebalance_count_;

    for (const auto& t : option_trades_)
    {
        if (t.is_entry())
            ++s.entry_trades;
        else
            ++s.exit_trades;
        s.option_cash_flow -= t.total_cost();
    }

    for (const auto& t : stock_trades_)
    {
        s.stock_notional += t.price * static_cast<double>(t.qty);
    }

    return s;
}

void TradeLogger::export_to_csv(const std::string& filepath) const
{
    prepare_output(filepath);

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "trade_id,date";
    for (const auto& leg : leg_names_)
    {
        file << "," << leg << "_contract," << leg << "_underlying," << leg << "_expiration,"
             << leg << "_type," << leg << "_strike," << leg << "_cost," << leg << "_order";
    }
    file << ",totals_cost,totals_qty,totals_date\n";
    file << std::fixed << std::setprecision(4);

    for (const auto& t : option_trades_)
    {
        file << t.trade_id << "," << t.date;
        for (const auto& leg : t.position.legs)
        {
            file << "," << leg.contract
                 << "," << leg.underlying
                 << "," << leg.expiration
                 << "," << to_string(leg.type)
                 << "," << leg.strike
                 << "," << leg.cost
                 << "," << to_string(leg.order);
        }
        file << "," << t.position.totals.cost
             << "," << t.position.totals.qty
             << "," << t.position.totals.date << "\n";
    }

    file.close();
}

void TradeLogger::export_stocks_to_csv(const std::string& filepath) const
{
    prepare_output(filepath);

    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "trade_id,date,symbol,price,qty\n";
    file << std::fixed << std::setprecision(4);
    for (const auto& t : stock_trades_)
    {
        file << t.trade_id << "," << t.date << "," << t.symbol << ","
             << t.price << "," << t.qty << "\n";
    }

    file.close();
}

void TradeLogger::print_summary() const
{
    auto s = get_summary();
    std::cout << "\n=== Trade Log Summary ===\n";
    std::cout << "Total trades: " << s.total_trades << "\n";
    std::cout << "Option entries: " << s.entry_trades << "  Option exits: " << s.exit_trades << "\n";
    std::cout << "Stock trades: " << s.stock_trades << "\n";
    std::cout << "Option cash flow: " << s.option_cash_flow << "\n";
    std::cout << "Stock notional: " << s.stock_notional << "\n";
    std::cout << "Rebalance events: " << s.rebalance_count << "\n";
    std::cout << "==========================\n";
}

void TradeLogger::clear()
{
    option_trades_.clear();
    stock_trades_.clear();
    next_trade_id_ = 0;
    rebalance_count_ = 0;
}

} // namespace backtest
} // namespace optsim
