#include "backtest/balance_tracker.hpp"
#include "backtest/valuation.hpp"

#include <iostream>

namespace optsim {
namespace backtest {

BalanceTracker::BalanceTracker(const ExecutionEngine& execution, bool verbose)
    : execution_(execution), verbose_(verbose) {}

const BalanceRecord& BalanceTracker::update(SimulationState& state,
                                            const strategy::Strategy& strategy,
                                            const StockSnapshot& stocks,
                                            const OptionSnapshot& chain,
                                            const std::string& date) const {
    execution_.process_exits(state, strategy, chain, date);

    OptionMarks marks = mark_options(strategy, state.inventory, chain, date);
    if (verbose_ && marks.missing > 0) {
        std::cerr << "[" << date << "] " << marks.missing
                  << " option legs missing from chain, marked at 0" << std::endl;
    }

    BalanceRecord r;
    r.date = date;
    r.calls_capital = marks.calls;
    r.puts_capital = marks.puts;
    r.option_capital = state.ledger.options_cash() + marks.total();
    r.stock_capital = mark_stocks(state.inventory, stocks) + state.ledger.stocks_cash();
    r.total_capital = r.stock_capital + r.option_capital;
    r.total_cash = state.ledger.total_cash();
    r.stock_qty = state.inventory.stock_qty();
    r.options_qty = state.inventory.option_qty();

    state.ledger.set_total_capital(r.total_capital);
    state.balance.append(r);
    return state.balance.back();
}

} // namespace backtest
} // namespace optsim
