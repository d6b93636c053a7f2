/**
 * @file trade_statistics.hpp
 * @brief Aggregate statistics of closed option trades.
 *
 * Each entry in the trade log is matched to the first later exit whose
 * first-leg contract is the same. An entry with no matching exit is skipped.
 * The P&L of a matched trade is
 *   cost = entry.cost * entry.qty + exit.cost * exit.qty
 * so a negative cost is a win.
 */

#ifndef OPTSIM_ANALYTICS_TRADE_STATISTICS_HPP
#define OPTSIM_ANALYTICS_TRADE_STATISTICS_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace optsim
{

    namespace backtest
    {
        class TradeLogger;
        class BalanceSeries;
    }

    namespace analytics
    {

        /**
         * @struct MatchedTrade
         * @brief One entry paired with its exit.
         */
        struct MatchedTrade
        {
            int entry_id;
            int exit_id;
            std::string contract;
            std::string entry_date;
            std::string exit_date;
            double cost; ///< Net cash paid; negative is a profit
        };

        /**
         * @struct TradeStatistics
         * @brief Summary row of a run.
         */
        struct TradeStatistics
        {
            int total_trades = 0;      ///< Number of exits in the log
            int wins = 0;              ///< Matched trades with cost < 0
            int losses = 0;            ///< total_trades - wins
            double win_pct = 0.0;      ///< wins / total_trades * 100
            double largest_loss = 0.0; ///< max(0, largest matched cost)
            double profit_factor = 0.0;
            double avg_profit = 0.0;   ///< Mean of -cost over matched trades
            double avg_pl_pct = 0.0;   ///< Mean step % change of total capital
            double total_pl_pct = 0.0; ///< Option trade P&L relative to initial capital, in %

            /**
             * @brief Compute statistics from a finished run.
             *
             * profit_factor = wins / (matched trades with cost >= 0); +inf when
             * there are wins and no losing matches, 0 when nothing matched.
             * avg_pl_pct skips the seed record of the balance series.
             *
             * @throws std::invalid_argument If initial_capital is not positive.
             */
            static TradeStatistics compute(const backtest::TradeLogger &trade_log,
                                           const backtest::BalanceSeries &balance,
                                           double initial_capital);

            static std::vector<MatchedTrade> match_trades(const backtest::TradeLogger &trade_log);

            std::string to_string() const;
            nlohmann::json to_json() const;
        };

    } // namespace analytics
} // namespace optsim

#endif // OPTSIM_ANALYTICS_TRADE_STATISTICS_HPP
