#include "backtest/capital_ledger.hpp"

#include <stdexcept>
#include <string>

namespace optsim {
namespace backtest {

CapitalLedger::CapitalLedger(double initial_capital)
    : initial_capital_(initial_capital), total_capital_(initial_capital) {
    if (!(initial_capital > 0.0)) {
        throw std::invalid_argument("Expected positive value for parameter 'initial_capital', got: " +
                                    std::to_string(initial_capital));
    }
}

void CapitalLedger::reset() {
    stocks_cash_ = 0.0;
    options_cash_ = 0.0;
    total_capital_ = initial_capital_;
}

} // namespace backtest
} // namespace optsim
