/**
 * @file trade_statistics.cpp
 * @brief Implementation of TradeStatistics
 */

#include "analytics/trade_statistics.hpp"
#include "backtest/balance_series.hpp"
#include "backtest/trade_logger.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace optsim
{
    namespace analytics
    {

        std::vector<MatchedTrade> TradeStatistics::match_trades(const backtest::TradeLogger &trade_log)
        {
            const auto &trades = trade_log.option_trades();
            std::vector<bool> used(trades.size(), false);
            std::vector<MatchedTrade> matched;

            for (size_t i = 0; i < trades.size(); ++i)
            {
                const auto &entry = trades[i];
                if (entry.position.legs.empty() || !entry.is_entry())
                    continue;

                for (size_t k = i + 1; k < trades.size(); ++k)
                {
                    const auto &exit = trades[k];
                    if (used[k] || exit.position.legs.empty() || exit.is_entry())
                        continue;
                    if (exit.contract() != entry.contract())
                        continue;

                    used[k] = true;
                    matched.push_back(MatchedTrade{entry.trade_id, exit.trade_id, entry.contract(),
                                                   entry.date, exit.date,
                                                   entry.total_cost() + exit.total_cost()});
                    break;
                }
            }

            return matched;
        }

        TradeStatistics TradeStatistics::compute(const backtest::TradeLogger &trade_log,
                                                 const backtest::BalanceSeries &balance,
                                                 double initial_capital)
        {
            if (!(initial_capital > 0.0))
            {
                throw std::invalid_argument("Expected positive value for parameter 'initial_capital', got: " +
                                            std::to_string(initial_capital));
            }

            TradeStatistics s;
            auto matched = match_trades(trade_log);

            s.total_trades = static_cast<int>(trade_log.exits().size());

            int losing = 0;
            double profit_sum = 0.0;
            double max_cost = 0.0;
            for (const auto &t : matched)
            {
                if (t.cost < 0.0)
                    ++s.wins;
                else
                    ++losing;
                profit_sum += -t.cost;
                max_cost = std::max(max_cost, t.cost);
            }

            s.losses = s.total_trades - s.wins;
            s.win_pct = s.total_trades > 0
                            ? static_cast<double>(s.wins) / s.total_trades * 100.0
                            : 0.0;
            s.largest_loss = max_cost;

            if (losing > 0)
                s.profit_factor = static_cast<double>(s.wins) / losing;
            else if (s.wins > 0)
                s.profit_factor = std::numeric_limits<double>::infinity();
            else
                s.profit_factor = 0.0;

            s.avg_profit = matched.empty() ? 0.0 : profit_sum / static_cast<double>(matched.size());

            const auto &records = balance.records();
            if (records.size() > 1)
            {
                double sum = 0.0;
                for (size_t i = 1; i < records.size(); ++i)
                    sum += records[i].pct_change;
                s.avg_pl_pct = sum / static_cast<double>(records.size() - 1) * 100.0;
            }

            double capital = initial_capital;
            for (const auto &t : trade_log.option_trades())
            {
                capital -= t.total_cost();
            }
            s.total_pl_pct = (capital / initial_capital - 1.0) * 100.0;

            return s;
        }

        std::string TradeStatistics::to_string() const
        {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(2);
            ss << "\n=== Trade Statistics ===\n";
            ss << "Total trades:   " << total_trades << "\n";
            ss << "Wins:           " << wins << "\n";
            ss << "Losses:         " << losses << "\n";
            ss << "Win %:          " << win_pct << "\n";
            ss << "Largest loss:   " << largest_loss << "\n";
            ss << "Profit factor:  " << profit_factor << "\n";
            ss << "Average profit: " << avg_profit << "\n";
            ss << "Average P&L %:  " << avg_pl_pct << "\n";
            ss << "Total P&L %:    " << total_pl_pct << "\n";
            ss << "========================\n";
            return ss.str();
        }

        nlohmann::json TradeStatistics::to_json() const
        {
            nlohmann::json j;
            j["total_trades"] = total_trades;
            j["wins"] = wins;
            j["losses"] = losses;
            j["win_pct"] = win_pct;
            j["largest_loss"] = largest_loss;
            // JSON has no infinity
            if (std::isinf(profit_factor))
                j["profit_factor"] = "inf";
            else
                j["profit_factor"] = profit_factor;
            j["avg_profit"] = avg_profit;
            j["avg_pl_pct"] = avg_pl_pct;
            j["total_pl_pct"] = total_pl_pct;
            return j;
        }

    } // namespace analytics
} // namespace optsim
