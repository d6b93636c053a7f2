// ============================================================================
// Implementation of ExecutionEngine
// ============================================================================

#include "backtest/execution_engine.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <Eigen/Dense>

namespace optsim {
namespace backtest {

ExecutionEngine::ExecutionEngine(bool stop_if_broke, bool verbose)
    : stop_if_broke_(stop_if_broke), verbose_(verbose) {}

// ============================================================================
// Options
// ============================================================================

bool ExecutionEngine::execute_entry(SimulationState& state,
                                    const std::vector<OptionPosition>& candidates) const {
    if (candidates.empty()) return false;

    const OptionPosition& candidate = candidates.front();
    const double total_price = candidate.total_price();

    if (stop_if_broke_ && state.ledger.options_cash() < total_price) {
        if (verbose_) {
            std::cerr << "[" << candidate.totals.date << "] entry rejected: cost "
                      << total_price << " exceeds options cash " << state.ledger.options_cash()
                      << std::endl;
        }
        return false;
    }

    state.inventory.add_option(candidate);
    state.trade_log.log_option_trade(candidate.totals.date, candidate);
    state.ledger.debit_options(total_price);
    return true;
}

void ExecutionEngine::execute_exit(SimulationState& state,
                                   const strategy::ExitSignals& signals) const {
    const size_t masked = static_cast<size_t>(
        std::count(signals.mask.begin(), signals.mask.end(), true));

    if (signals.exits.size() != signals.costs.size() || masked != signals.exits.size()) {
        std::ostringstream msg;
        msg << "Exit signals disagree: " << signals.exits.size() << " rows, "
            << signals.costs.size() << " costs, " << masked << " masked";
        throw std::invalid_argument(msg.str());
    }

    for (const auto& row : signals.exits) {
        state.trade_log.log_option_trade(row.totals.date, row);
    }

    state.inventory.remove_options(signals.mask);

    double total = 0.0;
    for (double c : signals.costs) total += c;
    state.ledger.debit_options(total);
}

size_t ExecutionEngine::process_exits(SimulationState& state,
                                      const strategy::Strategy& strategy,
                                      const OptionSnapshot& chain,
                                      const std::string& date) const {
    if (state.inventory.options().empty()) return 0;

    strategy::ExitSignals signals = strategy.filter_exits(chain, state.inventory, date);
    if (signals.empty()) return 0;

    execute_exit(state, signals);
    return signals.exits.size();
}

// ============================================================================
// Stocks
// ============================================================================

double ExecutionEngine::resize_stocks(SimulationState& state,
                                      const std::vector<Stock>& stocks,
                                      const StockSnapshot& snapshot,
                                      double stocks_allocation) const {
    const Eigen::Index n = static_cast<Eigen::Index>(stocks.size());
    if (n == 0) return 0.0;

    Eigen::VectorXd pct(n);
    Eigen::VectorXd prices(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const Stock& s = stocks[static_cast<size_t>(i)];
        pct[i] = s.percentage;
        prices[i] = snapshot.adj_close(s.symbol);
        if (!(prices[i] > 0.0)) {
            std::ostringstream msg;
            msg << "Price of " << s.symbol << " on " << snapshot.date()
                << " is not positive: " << prices[i];
            throw std::runtime_error(msg.str());
        }
    }

    Eigen::VectorXd target_dollars = stocks_allocation * pct;
    Eigen::VectorXd qty = (target_dollars.array() / prices.array()).floor().max(0.0).matrix();

    for (Eigen::Index i = 0; i < n; ++i) {
        state.inventory.add_stock(stocks[static_cast<size_t>(i)].symbol, prices[i],
                                  static_cast<long>(qty[i]));
    }

    return qty.dot(prices);
}

} // namespace backtest
} // namespace optsim
