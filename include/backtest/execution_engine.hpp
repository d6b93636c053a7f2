// SPDX-License-Identifier: MIT
#ifndef OPTSIM_BACKTEST_EXECUTION_ENGINE_HPP
#define OPTSIM_BACKTEST_EXECUTION_ENGINE_HPP

#include <string>
#include <vector>
#include "backtest/simulation_state.hpp"
#include "data/quotes.hpp"
#include "strategy/enums.hpp"
#include "strategy/strategy.hpp"

namespace optsim {
namespace backtest {

/**
 * @class ExecutionEngine
 * @brief Applies entry and exit signals and stock resizes to the simulation state.
 */
class ExecutionEngine {
public:
    explicit ExecutionEngine(bool stop_if_broke = true, bool verbose = false);

    bool stop_if_broke() const { return stop_if_broke_; }

    /**
     * @brief Fill the first candidate, if affordable.
     *
     * Only candidates.front() is considered. total_price = cost * qty; with
     * stop_if_broke the fill requires options_cash >= total_price. On fill
     * the row goes to inventory and the trade log and total_price is debited
     * from options cash.
     *
     * @return true when a position was entered.
     */
    bool execute_entry(SimulationState& state,
                       const std::vector<OptionPosition>& candidates) const;

    /**
     * @brief Close the masked inventory rows.
     *
     * Logs every exit row, removes the masked rows and debits sum(costs)
     * from options cash. Never blocked by cash.
     *
     * @throws std::invalid_argument If the mask, exits and costs disagree in size.
     */
    void execute_exit(SimulationState& state, const strategy::ExitSignals& signals) const;

    /**
     * @brief Ask the strategy for today's exits and execute them.
     * @return Number of positions closed.
     */
    size_t process_exits(SimulationState& state,
                         const strategy::Strategy& strategy,
                         const OptionSnapshot& chain,
                         const std::string& date) const;

    /**
     * @brief Buy floor(stocks_allocation * percentage / price) shares of each target.
     *
     * Positions are added to the inventory at today's adjusted close.
     *
     * @return Dollars spent.
     * @throws std::runtime_error If a target has no positive price today.
     */
    double resize_stocks(SimulationState& state,
                         const std::vector<Stock>& stocks,
                         const StockSnapshot& snapshot,
                         double stocks_allocation) const;

private:
    bool stop_if_broke_;
    bool verbose_;
};

} // namespace backtest
} // namespace optsim

#endif // OPTSIM_BACKTEST_EXECUTION_ENGINE_HPP
