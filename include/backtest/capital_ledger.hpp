#ifndef OPTSIM_BACKTEST_CAPITAL_LEDGER_HPP
#define OPTSIM_BACKTEST_CAPITAL_LEDGER_HPP

namespace optsim {
namespace backtest {

/**
 * @class CapitalLedger
 * @brief Stock-side cash, option-side cash and the last known total capital.
 *
 * Both cash pools start at zero; total capital starts at the initial
 * capital and is overwritten by every rebalance and balance update.
 * Option cash may go negative when the affordability check is disabled.
 */
class CapitalLedger {
public:
    explicit CapitalLedger(double initial_capital = 1000000.0);

    double initial_capital() const { return initial_capital_; }
    double stocks_cash() const { return stocks_cash_; }
    double options_cash() const { return options_cash_; }
    double total_cash() const { return stocks_cash_ + options_cash_; }
    double total_capital() const { return total_capital_; }

    void set_stocks_cash(double amount) { stocks_cash_ = amount; }
    void set_options_cash(double amount) { options_cash_ = amount; }
    void set_total_capital(double amount) { total_capital_ = amount; }

    /** @brief Pay for an option fill. */
    void debit_options(double amount) { options_cash_ -= amount; }
    /** @brief Receive option proceeds. */
    void credit_options(double amount) { options_cash_ += amount; }

    /** @brief Back to the state at construction. */
    void reset();

private:
    double initial_capital_;
    double stocks_cash_ = 0.0;
    double options_cash_ = 0.0;
    double total_capital_;
};

} // namespace backtest
} // namespace optsim

#endif // OPTSIM_BACKTEST_CAPITAL_LEDGER_HPP
