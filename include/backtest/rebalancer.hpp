// SPDX-License-Identifier: MIT
#ifndef OPTSIM_BACKTEST_REBALANCER_HPP
#define OPTSIM_BACKTEST_REBALANCER_HPP

#include <string>
#include <vector>
#include "backtest/allocation.hpp"
#include "backtest/execution_engine.hpp"
#include "backtest/simulation_state.hpp"
#include "strategy/strategy.hpp"

namespace optsim {
namespace backtest {

/**
 * @struct RebalanceReport
 * @brief What one rebalance did.
 */
struct RebalanceReport {
    std::string date;
    size_t exited = 0;               ///< Positions closed by strategy exit signals
    size_t liquidated = 0;           ///< Remaining positions closed at mark
    double marked_capital = 0.0;     ///< stocks cash + options cash + stock marks
    double total_capital = 0.0;      ///< Capital redistributed
    double stocks_allocation = 0.0;
    double options_allocation = 0.0;
    double cash_allocation = 0.0;
    double stocks_spent = 0.0;
    bool entered = false;
};

/**
 * @class Rebalancer
 * @brief Full liquidation and re-entry at target weights.
 *
 * Order of operations:
 *  1. strategy exit pass;
 *  2. remaining options closed at their mark (missing contracts at 0) and
 *     logged as exits;
 *  3. total capital = stocks cash + options cash + stock marks, or the last
 *     tracked total when that is 0;
 *  4. inventory reset and stocks bought with floor sizing; unspent stock
 *     dollars and the cash allocation stay in stocks cash;
 *  5. options cash = options allocation, the strategy's initial capital is
 *     set to it, and one entry is attempted.
 */
class Rebalancer {
public:
    Rebalancer(const Allocation& allocation,
               std::vector<Stock> stocks,
               const ExecutionEngine& execution,
               bool verbose = false);

    RebalanceReport rebalance(SimulationState& state,
                              strategy::Strategy& strategy,
                              const StockSnapshot& stocks,
                              const OptionSnapshot& chain,
                              const std::string& date) const;

    const Allocation& allocation() const { return allocation_; }
    const std::vector<Stock>& stocks() const { return stocks_; }
    const ExecutionEngine& execution() const { return execution_; }

private:
    size_t liquidate_options(SimulationState& state,
                             const strategy::Strategy& strategy,
                             const OptionSnapshot& chain,
                             const std::string& date) const;

    Allocation allocation_;
    std::vector<Stock> stocks_;
    ExecutionEngine execution_;
    bool verbose_;
};

} // namespace backtest
} // namespace optsim

#endif // OPTSIM_BACKTEST_REBALANCER_HPP
