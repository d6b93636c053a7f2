#ifndef OPTSIM_BACKTEST_BALANCE_TRACKER_HPP
#define OPTSIM_BACKTEST_BALANCE_TRACKER_HPP

#include <string>
#include "backtest/balance_series.hpp"
#include "backtest/execution_engine.hpp"
#include "backtest/simulation_state.hpp"
#include "strategy/strategy.hpp"

namespace optsim {
namespace backtest {

/**
 * @class BalanceTracker
 * @brief Per-date exit pass and mark-to-market.
 *
 * Executes the day's exit signals, marks options (missing contracts at 0)
 * and stocks, sets the ledger's total capital and appends one balance record.
 */
class BalanceTracker {
public:
    explicit BalanceTracker(const ExecutionEngine& execution, bool verbose = false);

    const BalanceRecord& update(SimulationState& state,
                                const strategy::Strategy& strategy,
                                const StockSnapshot& stocks,
                                const OptionSnapshot& chain,
                                const std::string& date) const;

    const ExecutionEngine& execution() const { return execution_; }

private:
    ExecutionEngine execution_;
    bool verbose_;
};

} // namespace backtest
} // namespace optsim

#endif // OPTSIM_BACKTEST_BALANCE_TRACKER_HPP
