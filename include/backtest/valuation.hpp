#ifndef OPTSIM_BACKTEST_VALUATION_HPP
#define OPTSIM_BACKTEST_VALUATION_HPP

#include <string>
#include <vector>
#include "backtest/inventory.hpp"
#include "data/quotes.hpp"
#include "strategy/strategy.hpp"

namespace optsim {
namespace backtest {

/**
 * @struct OptionMarks
 * @brief Option inventory marked to one day's chain.
 *
 * calls and puts are -sum(exit cost * qty) over the legs of each type, so
 * a long leg adds value and a short leg subtracts it. exits holds the
 * closing record of every inventory row and costs its cost * qty.
 */
struct OptionMarks {
    double calls = 0.0;
    double puts = 0.0;
    std::vector<OptionPosition> exits;
    std::vector<double> costs;
    size_t missing = 0;  ///< Legs whose contract was absent and imputed at 0

    double total() const { return calls + puts; }
};

/**
 * @brief Mark every option position at its closing price.
 *
 * A contract absent from the chain is valued at zero; the position stays in
 * inventory.
 */
OptionMarks mark_options(const strategy::Strategy& strategy,
                         const Inventory& inventory,
                         const OptionSnapshot& chain,
                         const std::string& date);

/**
 * @brief Market value of the stock inventory at adjusted close.
 * @throws std::runtime_error If a held symbol has no quote in the snapshot.
 */
double mark_stocks(const Inventory& inventory, const StockSnapshot& snapshot);

} // namespace backtest
} // namespace optsim

#endif // OPTSIM_BACKTEST_VALUATION_HPP
