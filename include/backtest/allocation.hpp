// SPDX-License-Identifier: MIT
#ifndef OPTSIM_BACKTEST_ALLOCATION_HPP
#define OPTSIM_BACKTEST_ALLOCATION_HPP

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "strategy/enums.hpp"

namespace optsim {
namespace backtest {

/**
 * @struct Allocation
 * @brief Target weights of the stocks, options and cash pools.
 *
 * Always normalized: the three weights are non-negative and sum to 1.
 */
struct Allocation {
    double stocks = 0.0;
    double options = 0.0;
    double cash = 0.0;

    /**
     * @brief Divide each raw weight by the sum of all three.
     * @throws std::invalid_argument If a weight is negative or the sum is not positive.
     */
    static Allocation normalized(double stocks, double options, double cash);

    /**
     * @brief Build from a {stocks, options, cash} map; missing keys are 0.
     * @throws std::invalid_argument On an unknown key or a degenerate split.
     */
    static Allocation from_map(const std::map<std::string, double>& weights);

    static Allocation from_json(const nlohmann::json& j);

    double sum() const { return stocks + options + cash; }
    nlohmann::json to_json() const;
};

/// Tolerance for the stock percentage sum check.
constexpr double kStockSumTolerance = 1e-9;

/**
 * @brief Check that stock targets are usable.
 * @throws std::invalid_argument If the list is empty, a symbol is empty or
 *         repeated, a percentage is negative, or the percentages do not sum to 1.
 */
void validate_stock_targets(const std::vector<Stock>& stocks);

/**
 * @brief Parse [{"symbol": "SPY", "percentage": 0.6}, ...] and validate it.
 */
std::vector<Stock> stocks_from_json(const nlohmann::json& j);

} // namespace backtest
} // namespace optsim

#endif // OPTSIM_BACKTEST_ALLOCATION_HPP
