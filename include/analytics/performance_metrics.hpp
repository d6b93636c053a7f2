/**
 * @file performance_metrics.hpp
 * @brief Return and risk metrics of a simulated balance series.
 *
 * The NAV is the total capital of every balance record, seed included, so
 * the first NAV is the starting capital and there is one step return per
 * simulated date. Annualized values assume 252 steps per year by default;
 * pass 12 for a monthly-stepped run.
 */

#ifndef OPTSIM_ANALYTICS_PERFORMANCE_METRICS_HPP
#define OPTSIM_ANALYTICS_PERFORMANCE_METRICS_HPP

#include <string>
#include <vector>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace optsim
{

    namespace backtest
    {
        class BalanceSeries;
    }

    namespace analytics
    {

        /**
         * @struct DrawdownInfo
         * @brief Deepest peak-to-trough fall of the NAV.
         */
        struct DrawdownInfo
        {
            double depth = 0.0;       ///< Positive fraction of the peak
            int peak_index = 0;
            int trough_index = 0;
            int recovery_index = -1;  ///< First NAV back at the peak, -1 if never

            int duration_steps() const { return trough_index - peak_index; }
            int recovery_steps() const { return recovery_index < 0 ? -1 : recovery_index - trough_index; }
        };

        /**
         * @class PerformanceMetrics
         * @brief Performance analytics over a NAV series.
         *
         * @code
         * analytics::PerformanceMetrics metrics(engine.balance());
         * std::cout << metrics.summary();
         * @endcode
         */
        class PerformanceMetrics
        {
        public:
            /**
             * @param balance Finalized series with at least two records.
             * @param risk_free_rate Annualized risk-free rate.
             * @param steps_per_year Simulation steps per year.
             * @throws std::invalid_argument If the series is not finalized, is too
             *         short, or starts at a non-positive capital.
             */
            explicit PerformanceMetrics(const backtest::BalanceSeries &balance,
                                        double risk_free_rate = 0.02,
                                        int steps_per_year = 252);

            /**
             * @brief Metrics of a bare NAV series, one date per value.
             * @throws std::invalid_argument On fewer than two values, a date count
             *         mismatch or a non-positive first value.
             */
            PerformanceMetrics(const Eigen::VectorXd &nav,
                               const std::vector<std::string> &dates,
                               double risk_free_rate = 0.02,
                               int steps_per_year = 252);

            // ===============================================================
            // Returns
            // ===============================================================

            double total_return() const;

            /** @brief Compound annual growth rate; -1 once the NAV is wiped out. */
            double annualized_return() const;

            double best_step() const { return returns_.maxCoeff(); }
            double worst_step() const { return returns_.minCoeff(); }

            /** @brief Fraction of steps with a positive return. */
            double hit_rate() const;

            // ===============================================================
            // Risk
            // ===============================================================

            /** @brief Sample standard deviation of step returns, annualized. */
            double annualized_volatility() const;

            /**
             * @brief Annualized semi-deviation of step returns below a target.
             * @param target_return Annualized target, spread evenly over the steps.
             */
            double downside_deviation(double target_return = 0.0) const;

            double max_drawdown() const { return max_drawdown_.depth; }
            const DrawdownInfo &max_drawdown_info() const { return max_drawdown_; }

            /** @brief NAV / running peak - 1 at every NAV point. */
            const Eigen::VectorXd &drawdown_series() const { return drawdowns_; }

            // ===============================================================
            // Risk-Adjusted
            // ===============================================================

            double sharpe_ratio() const;
            double sortino_ratio(double target_return = 0.0) const;
            double calmar_ratio() const;

            // ===============================================================
            // Capital split
            // ===============================================================

            /**
             * @brief Mean share of total capital held in the options pool.
             *
             * Taken over the simulated dates, seed excluded. 0 for a bare NAV series.
             */
            double average_option_weight() const;

            // ===============================================================
            // Accessors and export
            // ===============================================================

            const Eigen::VectorXd &nav() const { return nav_; }
            const Eigen::VectorXd &returns() const { return returns_; }
            const std::vector<std::string> &dates() const { return dates_; }
            double risk_free_rate() const { return risk_free_rate_; }
            int steps_per_year() const { return steps_per_year_; }

            std::string summary() const;
            nlohmann::json to_json() const;

            /**
             * @brief Write date, nav, return, drawdown rows.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void to_csv(const std::string &filepath) const;

        private:
            void validate() const;
            void compute();
            double years() const;

            Eigen::VectorXd nav_;
            Eigen::VectorXd returns_;
            Eigen::VectorXd drawdowns_;
            Eigen::VectorXd option_weights_;
            std::vector<std::string> dates_;
            double risk_free_rate_;
            int steps_per_year_;
            DrawdownInfo max_drawdown_;
        };

    } // namespace analytics
} // namespace optsim

#endif // OPTSIM_ANALYTICS_PERFORMANCE_METRICS_HPP
