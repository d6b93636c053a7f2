#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "backtest/inventory.hpp"

namespace optsim {
namespace backtest {

/**
 * @struct OptionTradeRecord
 * @brief Snapshot of an option position at the moment it was entered or exited.
 */
struct OptionTradeRecord {
    int trade_id;
    std::string date;
    OptionPosition position;

    /** @brief Entry when the first leg's order opens a position. */
    bool is_entry() const;
    const std::string& contract() const;  ///< First-leg contract
    double total_cost() const { return position.total_price(); }
};

struct StockTradeRecord {
    int trade_id;
    std::string date;
    std::string symbol;
    double price;
    long qty;
};

struct TradeSummary {
    int total_trades = 0;
    int entry_trades = 0;
    int exit_trades = 0;
    int stock_trades = 0;
    double option_cash_flow = 0.0;  ///< -sum(cost * qty) over option trades
    double stock_notional = 0.0;
    int rebalance_count = 0;
};

/**
 * @class TradeLogger
 * @brief Append-only log of option and stock trades.
 */
class TradeLogger {
public:
    explicit TradeLogger(std::vector<std::string> leg_names = {});
    ~TradeLogger() = default;

    void log_option_trade(const std::string& date, const OptionPosition& position);
    void log_stock_trade(const std::string& date, const StockPosition& position);
    void log_rebalance(const std::string& date, const std::vector<StockPosition>& stocks);

    const std::vector<std::string>& leg_names() const { return leg_names_; }
    const std::vector<OptionTradeRecord>& option_trades() const { return option_trades_; }
    const std::vector<StockTradeRecord>& stock_trades() const { return stock_trades_; }

    std::vector<OptionTradeRecord> trades_for_date(const std::string& date) const;
    std::vector<OptionTradeRecord> trades_for_contract(const std::string& contract) const;
    std::vector<OptionTradeRecord> entries() const;
    std::vector<OptionTradeRecord> exits() const;

    TradeSummary get_summary() const;
    int num_trades() const { return static_cast<int>(option_trades_.size() + stock_trades_.size()); }

    /**
     * @brief Option trades as CSV, one column per leg field (<leg>_<field>)
     *        followed by totals_cost, totals_qty, totals_date.
     */
    void export_to_csv(const std::string& filepath) const;
    void export_stocks_to_csv(const std::string& filepath) const;
    void print_summary() const;

    void clear();

private:
    std::vector<std::string> leg_names_;
    std::vector<OptionTradeRecord> option_trades_;
    std::vector<StockTradeRecord> stock_trades_;
    int next_trade_id_ = 0;
    int rebalance_count_ = 0;
};

} // namespace backtest
} // namespace optsim
