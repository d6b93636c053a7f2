// SPDX-License-Identifier: MIT

#include "backtest/backtest_engine.hpp"
#include "backtest/balance_tracker.hpp"
#include "backtest/execution_engine.hpp"
#include "backtest/rebalancer.hpp"
#include "data/date_utils.hpp"

#include <iostream>

namespace optsim
{
    namespace backtest
    {

        // ------------------------- BacktestParams -------------------------------
        BacktestParams BacktestParams::from_json(const nlohmann::json &j)
        {
            BacktestParams p;
            p.initial_capital = j.value("initial_capital", 1000000.0);
            p.shares_per_contract = j.value("shares_per_contract", 100L);
            p.stop_if_broke = j.value("stop_if_broke", true);
            p.rebalance = RebalanceConfig::from_json(j);
            p.monthly = j.value("monthly", false);
            p.verbose = j.value("verbose", false);

            if (!(p.initial_capital > 0.0))
            {
                throw std::invalid_argument("Expected positive value for parameter 'initial_capital', got: " +
                                            std::to_string(p.initial_capital));
            }
            if (p.shares_per_contract <= 0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'shares_per_contract', got: " +
                                            std::to_string(p.shares_per_contract));
            }
            return p;
        }

        std::string to_string(RunState state)
        {
            switch (state)
            {
            case RunState::INITIALIZING:
                return "initializing";
            case RunState::RUNNING:
                return "running";
            case RunState::FINISHED:
                return "finished";
            }
            return "unknown";
        }

        // ------------------------- BacktestEngine -------------------------------
        BacktestEngine::BacktestEngine(const Allocation &allocation, const BacktestParams &params)
            : allocation_(Allocation::normalized(allocation.stocks, allocation.options, allocation.cash)),
              params_(params)
        {
            if (!(params_.initial_capital > 0.0))
            {
                throw std::invalid_argument("Expected positive value for parameter 'initial_capital', got: " +
                                            std::to_string(params_.initial_capital));
            }
        }

        void BacktestEngine::set_stocks(const std::vector<Stock> &stocks)
        {
            validate_stock_targets(stocks);
            stocks_ = stocks;
        }

        void BacktestEngine::set_options_strategy(std::unique_ptr<strategy::Strategy> strategy)
        {
            if (!strategy)
            {
                throw std::invalid_argument("Options strategy must not be null");
            }
            strategy->set_shares_per_contract(params_.shares_per_contract);
            strategy_ = std::move(strategy);
        }

        void BacktestEngine::set_stocks_data(StocksData data)
        {
            stocks_data_ = std::make_unique<StocksData>(std::move(data));
        }

        void BacktestEngine::set_options_data(OptionsData data)
        {
            options_data_ = std::make_unique<OptionsData>(std::move(data));
        }

        void BacktestEngine::validate() const
        {
            if (!stocks_data_)
                throw std::invalid_argument("Stocks data not set");
            if (!options_data_)
                throw std::invalid_argument("Options data not set");
            if (!strategy_)
                throw std::invalid_argument("Options strategy not set");
            if (stocks_.empty())
                throw std::invalid_argument("Stock targets not set");
            if (strategy_->legs().empty())
                throw std::invalid_argument("Options strategy has no legs");
            if (options_data_->schema() != strategy_->schema())
                throw std::invalid_argument("Options data schema does not match the strategy schema");
            if (stocks_data_->empty())
                throw std::invalid_argument("Stocks data has no dates");
            if (stocks_data_->dates() != options_data_->dates())
            {
                throw std::invalid_argument("Stocks and options data have different dates (" +
                                            std::to_string(stocks_data_->num_dates()) + " vs " +
                                            std::to_string(options_data_->num_dates()) + ")");
            }
        }

        // ------------------------- Run methods ---------------------------------
        const TradeLogger &BacktestEngine::run()
        {
            return run(params_.rebalance.frequency_months, params_.monthly);
        }

        const TradeLogger &BacktestEngine::run(int rebalance_frequency, bool monthly)
        {
            // drop any earlier run's results
            state_ = RunState::INITIALIZING;
            state_data_.reset();
            rebalance_dates_.clear();

            if (rebalance_frequency < 0)
            {
                throw std::invalid_argument("Expected non-negative value for parameter 'rebalance_frequency', got: " +
                                            std::to_string(rebalance_frequency));
            }
            validate();

            state_ = RunState::RUNNING;
            strategy_->set_initial_capital(params_.initial_capital);
            state_data_ = std::make_unique<SimulationState>(params_.initial_capital, strategy_->leg_names());
            SimulationState &state = *state_data_;

            ExecutionEngine execution(params_.stop_if_broke, params_.verbose);
            Rebalancer rebalancer(allocation_, stocks_, execution, params_.verbose);
            BalanceTracker tracker(execution, params_.verbose);

            std::vector<std::string> dates = stocks_data_->step_dates(monthly);

            RebalanceConfig cadence;
            cadence.frequency_months = rebalance_frequency;
            RebalanceScheduler scheduler(cadence);
            scheduler.build(dates);

            state.balance.seed(date_utils::add_days(dates.front(), -1), params_.initial_capital);

            const size_t total = dates.size();
            for (size_t i = 0; i < total; ++i)
            {
                const std::string &date = dates[i];
                StockSnapshot stocks = stocks_data_->snapshot(date);
                OptionSnapshot chain = options_data_->snapshot(date);

                if (scheduler.should_rebalance(date))
                {
                    rebalancer.rebalance(state, *strategy_, stocks, chain, date);
                    scheduler.record_rebalance(date);
                    rebalance_dates_.push_back(date);
                }

                tracker.update(state, *strategy_, stocks, chain, date);

                if (params_.verbose)
                {
                    std::cerr << "\rProgress: " << (i + 1) << "/" << total << " dates" << std::flush;
                }
            }
            if (params_.verbose)
                std::cerr << std::endl;

            state.balance.finalize();
            state_ = RunState::FINISHED;
            return state.trade_log;
        }

        // ------------------------- Accessors -----------------------------------
        const SimulationState &BacktestEngine::require_state() const
        {
            if (!state_data_)
                throw std::logic_error("Backtest has not been run");
            return *state_data_;
        }

        const BalanceSeries &BacktestEngine::balance() const
        {
            return require_state().balance;
        }

        const TradeLogger &BacktestEngine::trade_log() const
        {
            return require_state().trade_log;
        }

        const Inventory &BacktestEngine::inventory() const
        {
            return require_state().inventory;
        }

        const CapitalLedger &BacktestEngine::ledger() const
        {
            return require_state().ledger;
        }

        analytics::TradeStatistics BacktestEngine::summary() const
        {
            if (state_ != RunState::FINISHED)
                throw std::logic_error("Backtest has not finished");
            const SimulationState &state = require_state();
            return analytics::TradeStatistics::compute(state.trade_log, state.balance,
                                                       params_.initial_capital);
        }

    } // namespace backtest
} // namespace optsim
