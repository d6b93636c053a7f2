// SPDX-License-Identifier: MIT
#pragma once

#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "data/market_data.hpp"
#include "backtest/allocation.hpp"
#include "backtest/balance_series.hpp"
#include "backtest/rebalance_scheduler.hpp"
#include "backtest/simulation_state.hpp"
#include "backtest/trade_logger.hpp"
#include "strategy/strategy.hpp"
#include "analytics/trade_statistics.hpp"

namespace optsim
{
    namespace backtest
    {

        struct BacktestParams
        {
            double initial_capital = 1000000.0;
            long shares_per_contract = 100;
            bool stop_if_broke = true;
            RebalanceConfig rebalance;
            bool monthly = false; ///< Step on the first trading date of each month
            bool verbose = false;

            /**
             * @throws std::invalid_argument On non-positive capital or contract size.
             */
            static BacktestParams from_json(const nlohmann::json &j);
        };

        enum class RunState
        {
            INITIALIZING,
            RUNNING,
            FINISHED
        };

        std::string to_string(RunState state);

        /**
         * @class BacktestEngine
         * @brief Drives a stocks + options simulation over a date stream.
         *
         * Usage:
         * @code
         *   BacktestEngine engine(Allocation::normalized(0.5, 0.5, 0.0), params);
         *   engine.set_stocks({{"SPY", 1.0}});
         *   engine.set_stocks_data(stocks_data);
         *   engine.set_options_data(options_data);
         *   engine.set_options_strategy(std::make_unique<strategy::Strategy>(strategy));
         *   const TradeLogger &log = engine.run(1, false);
         * @endcode
         *
         * Every step date first runs the rebalancer when it is a rebalance
         * date (always on the first date), then the balance tracker.
         */
        class BacktestEngine
        {
        public:
            explicit BacktestEngine(const Allocation &allocation,
                                    const BacktestParams &params = BacktestParams());
            ~BacktestEngine() = default;

            /**
             * @throws std::invalid_argument If the targets are not valid (see validate_stock_targets).
             */
            void set_stocks(const std::vector<Stock> &stocks);

            /**
             * @brief Attach the option strategy; its contract size is set from the params.
             * @throws std::invalid_argument If strategy is null.
             */
            void set_options_strategy(std::unique_ptr<strategy::Strategy> strategy);

            void set_stocks_data(StocksData data);
            void set_options_data(OptionsData data);

            /**
             * @brief Run the simulation.
             * @param rebalance_frequency Months between rebalances; 0 rebalances only on the first date.
             * @param monthly Step on the first trading date of each month instead of daily.
             * @return The trade log.
             * @throws std::invalid_argument If data, stocks or strategy are missing, the
             *         option schema differs from the strategy's, or the stock and option
             *         date sets differ. The engine is then INITIALIZING and the
             *         results of any earlier run are discarded.
             */
            const TradeLogger &run(int rebalance_frequency, bool monthly = false);

            /** @brief Run with the cadence and step mode from the params. */
            const TradeLogger &run();

            RunState state() const { return state_; }
            const BacktestParams &params() const { return params_; }
            const Allocation &allocation() const { return allocation_; }
            const std::vector<Stock> &stocks() const { return stocks_; }
            const strategy::Strategy *options_strategy() const { return strategy_.get(); }

            /**
             * @throws std::logic_error If no run has started.
             */
            const BalanceSeries &balance() const;
            const TradeLogger &trade_log() const;
            const Inventory &inventory() const;
            const CapitalLedger &ledger() const;

            const std::vector<std::string> &rebalance_dates() const { return rebalance_dates_; }

            /**
             * @brief Trade statistics of the finished run.
             * @throws std::logic_error If the run has not finished.
             */
            analytics::TradeStatistics summary() const;

        private:
            void validate() const;
            const SimulationState &require_state() const;

            Allocation allocation_;
            BacktestParams params_;
            std::vector<Stock> stocks_;
            std::unique_ptr<strategy::Strategy> strategy_;
            std::unique_ptr<StocksData> stocks_data_;
            std::unique_ptr<OptionsData> options_data_;

            std::unique_ptr<SimulationState> state_data_;
            std::vector<std::string> rebalance_dates_;
            RunState state_ = RunState::INITIALIZING;
        };

    } // namespace backtest
} // namespace optsim
