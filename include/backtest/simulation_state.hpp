#ifndef OPTSIM_BACKTEST_SIMULATION_STATE_HPP
#define OPTSIM_BACKTEST_SIMULATION_STATE_HPP

#include <string>
#include <vector>
#include "backtest/balance_series.hpp"
#include "backtest/capital_ledger.hpp"
#include "backtest/inventory.hpp"
#include "backtest/trade_logger.hpp"

namespace optsim {
namespace backtest {

/**
 * @struct SimulationState
 * @brief Everything a run mutates, owned by one BacktestEngine.
 *
 * Step components receive it by reference; nothing else holds it.
 */
struct SimulationState {
    SimulationState(double initial_capital, const std::vector<std::string>& leg_names)
        : inventory(leg_names), ledger(initial_capital), trade_log(leg_names) {}

    Inventory inventory;
    CapitalLedger ledger;
    TradeLogger trade_log;
    BalanceSeries balance;
};

} // namespace backtest
} // namespace optsim

#endif // OPTSIM_BACKTEST_SIMULATION_STATE_HPP
