// SPDX-License-Identifier: MIT
#ifndef OPTSIM_BACKTEST_BALANCE_SERIES_HPP
#define OPTSIM_BACKTEST_BALANCE_SERIES_HPP

#include <string>
#include <vector>
#include <Eigen/Dense>

namespace optsim {
namespace backtest {

/**
 * @struct BalanceRecord
 * @brief Capital breakdown for one simulated date.
 */
struct BalanceRecord {
    std::string date;
    double total_capital = 0.0;   ///< stock_capital + option_capital
    double total_cash = 0.0;      ///< stocks cash + options cash
    double stock_capital = 0.0;   ///< stock marks + stocks cash
    double option_capital = 0.0;  ///< options cash + calls + puts
    double calls_capital = 0.0;
    double puts_capital = 0.0;
    long stock_qty = 0;
    long options_qty = 0;
    double pct_change = 0.0;          ///< Filled by BalanceSeries::finalize()
    double accumulated_return = 1.0;  ///< Filled by BalanceSeries::finalize()
};

/**
 * @class BalanceSeries
 * @brief Append-only per-date balance records.
 *
 * The first record is a seed dated the day before the first step, holding
 * the initial capital as cash, so the first step's % change is measured
 * against the starting capital.
 */
class BalanceSeries {
public:
    BalanceSeries() = default;

    void seed(const std::string& date, double initial_capital);

    /**
     * @throws std::invalid_argument If the date is not after the last record's date.
     */
    void append(const BalanceRecord& record);

    /**
     * @brief Fill % change and accumulated return.
     *
     * pct_change[0] = 0, pct_change[i] = total[i] / total[i-1] - 1 (0 when
     * total[i-1] is 0); accumulated_return is the cumulative product of
     * (1 + pct_change), so it is 1.0 on the first record.
     */
    void finalize();

    const std::vector<BalanceRecord>& records() const { return records_; }
    const BalanceRecord& back() const;
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    bool finalized() const { return finalized_; }

    std::vector<std::string> dates() const;
    Eigen::VectorXd total_capital() const;
    Eigen::VectorXd pct_change() const;
    Eigen::VectorXd accumulated_return() const;

    void export_to_csv(const std::string& filepath) const;

private:
    std::vector<BalanceRecord> records_;
    bool finalized_ = false;
};

} // namespace backtest
} // namespace optsim

#endif // OPTSIM_BACKTEST_BALANCE_SERIES_HPP
