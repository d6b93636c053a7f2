// ============================================================================
// Implementation of Rebalancer
// ============================================================================

#include "backtest/rebalancer.hpp"
#include "backtest/valuation.hpp"

#include <iostream>

namespace optsim {
namespace backtest {

Rebalancer::Rebalancer(const Allocation& allocation,
                       std::vector<Stock> stocks,
                       const ExecutionEngine& execution,
                       bool verbose)
    : allocation_(allocation), stocks_(std::move(stocks)), execution_(execution), verbose_(verbose) {
    validate_stock_targets(stocks_);
}

size_t Rebalancer::liquidate_options(SimulationState& state,
                                     const strategy::Strategy& strategy,
                                     const OptionSnapshot& chain,
                                     const std::string& date) const {
    const size_t rows = state.inventory.options().size();
    if (rows == 0) return 0;

    OptionMarks marks = mark_options(strategy, state.inventory, chain, date);
    if (verbose_ && marks.missing > 0) {
        std::cerr << "[" << date << "] " << marks.missing
                  << " option legs missing from chain, closed at 0" << std::endl;
    }

    strategy::ExitSignals all;
    all.exits = std::move(marks.exits);
    all.costs = std::move(marks.costs);
    all.mask.assign(rows, true);
    execution_.execute_exit(state, all);
    return rows;
}

RebalanceReport Rebalancer::rebalance(SimulationState& state,
                                      strategy::Strategy& strategy,
                                      const StockSnapshot& stocks,
                                      const OptionSnapshot& chain,
                                      const std::string& date) const {
    RebalanceReport report;
    report.date = date;

    // -- Close everything
    report.exited = execution_.process_exits(state, strategy, chain, date);
    report.liquidated = liquidate_options(state, strategy, chain, date);

    // -- Capital to redistribute
    const double stock_marks = mark_stocks(state.inventory, stocks);
    report.marked_capital = state.ledger.stocks_cash() + state.ledger.options_cash() + stock_marks;
    report.total_capital = report.marked_capital != 0.0 ? report.marked_capital
                                                        : state.ledger.total_capital();
    state.ledger.set_total_capital(report.total_capital);

    report.stocks_allocation = allocation_.stocks * report.total_capital;
    report.options_allocation = allocation_.options * report.total_capital;
    report.cash_allocation = allocation_.cash * report.total_capital;

    // -- Re-enter
    state.inventory.reset();

    report.stocks_spent = execution_.resize_stocks(state, stocks_, stocks, report.stocks_allocation);
    // the cash allocation is held in stocks cash so it stays part of total capital
    state.ledger.set_stocks_cash(report.stocks_allocation - report.stocks_spent + report.cash_allocation);
    state.trade_log.log_rebalance(date, state.inventory.stocks());

    state.ledger.set_options_cash(report.options_allocation);
    strategy.set_initial_capital(report.options_allocation);
    report.entered = execution_.execute_entry(
        state, strategy.filter_entries(chain, state.inventory, date));

    if (verbose_) {
        std::cout << "[" << date << "] rebalance: capital " << report.total_capital
                  << ", stocks " << report.stocks_allocation
                  << " (spent " << report.stocks_spent << ")"
                  << ", options " << report.options_allocation
                  << ", cash " << report.cash_allocation
                  << (report.entered ? ", entered 1 position" : "") << std::endl;
    }

    return report;
}

} // namespace backtest
} // namespace optsim
