/**
 * @file performance_metrics.cpp
 * @brief Implementation of PerformanceMetrics
 */

#include "analytics/performance_metrics.hpp"
#include "backtest/balance_series.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace optsim
{
    namespace analytics
    {

        namespace
        {
            const backtest::BalanceSeries &require_finalized(const backtest::BalanceSeries &balance)
            {
                if (!balance.finalized())
                {
                    throw std::invalid_argument("Balance series must be finalized before computing metrics");
                }
                return balance;
            }

            /// Fraction of total capital in the options pool, seed record excluded.
            Eigen::VectorXd option_weights(const backtest::BalanceSeries &balance)
            {
                const auto &records = balance.records();
                if (records.size() < 2)
                    return Eigen::VectorXd();

                Eigen::VectorXd w(static_cast<Eigen::Index>(records.size() - 1));
                for (size_t i = 1; i < records.size(); ++i)
                {
                    const auto &r = records[i];
                    w[static_cast<Eigen::Index>(i - 1)] =
                        r.total_capital != 0.0 ? r.option_capital / r.total_capital : 0.0;
                }
                return w;
            }

            std::string date_or_blank(const std::vector<std::string> &dates, int index)
            {
                return index >= 0 && static_cast<size_t>(index) < dates.size() ? dates[index] : "";
            }
        } // namespace

        // ===================================================================
        // Construction
        // ===================================================================

        PerformanceMetrics::PerformanceMetrics(const backtest::BalanceSeries &balance,
                                               double risk_free_rate,
                                               int steps_per_year)
            : nav_(require_finalized(balance).total_capital()),
              option_weights_(option_weights(balance)),
              dates_(balance.dates()),
              risk_free_rate_(risk_free_rate),
              steps_per_year_(steps_per_year)
        {
            validate();
            compute();
        }

        PerformanceMetrics::PerformanceMetrics(const Eigen::VectorXd &nav,
                                               const std::vector<std::string> &dates,
                                               double risk_free_rate,
                                               int steps_per_year)
            : nav_(nav),
              dates_(dates),
              risk_free_rate_(risk_free_rate),
              steps_per_year_(steps_per_year)
        {
            validate();
            compute();
        }

        void PerformanceMetrics::validate() const
        {
            if (nav_.size() < 2)
            {
                throw std::invalid_argument("NAV series must have at least 2 elements, got: " +
                                            std::to_string(nav_.size()));
            }
            if (static_cast<Eigen::Index>(dates_.size()) != nav_.size())
            {
                throw std::invalid_argument("Dates size (" + std::to_string(dates_.size()) +
                                            ") must match NAV series size (" + std::to_string(nav_.size()) + ")");
            }
            if (nav_[0] <= 0.0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'starting_nav', got: " +
                                            std::to_string(nav_[0]));
            }
            if (steps_per_year_ <= 0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'steps_per_year', got: " +
                                            std::to_string(steps_per_year_));
            }
        }

        void PerformanceMetrics::compute()
        {
            const Eigen::Index n = nav_.size();

            // a step from zero capital has no return
            returns_.resize(n - 1);
            for (Eigen::Index i = 1; i < n; ++i)
            {
                returns_[i - 1] = nav_[i - 1] != 0.0 ? nav_[i] / nav_[i - 1] - 1.0 : 0.0;
            }

            drawdowns_.resize(n);
            double peak = nav_[0];
            int peak_index = 0;
            max_drawdown_ = DrawdownInfo();
            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (nav_[i] > peak)
                {
                    peak = nav_[i];
                    peak_index = static_cast<int>(i);
                }
                drawdowns_[i] = nav_[i] / peak - 1.0;
                if (-drawdowns_[i] > max_drawdown_.depth)
                {
                    max_drawdown_.depth = -drawdowns_[i];
                    max_drawdown_.peak_index = peak_index;
                    max_drawdown_.trough_index = static_cast<int>(i);
                }
            }

            if (max_drawdown_.depth > 0.0)
            {
                const double target = nav_[max_drawdown_.peak_index];
                for (Eigen::Index i = max_drawdown_.trough_index + 1; i < n; ++i)
                {
                    if (nav_[i] >= target)
                    {
                        max_drawdown_.recovery_index = static_cast<int>(i);
                        break;
                    }
                }
            }
        }

        double PerformanceMetrics::years() const
        {
            return static_cast<double>(returns_.size()) / steps_per_year_;
        }

        // ===================================================================
        // Returns
        // ===================================================================

        double PerformanceMetrics::total_return() const
        {
            return nav_[nav_.size() - 1] / nav_[0] - 1.0;
        }

        double PerformanceMetrics::annualized_return() const
        {
            const double total = total_return();
            if (total <= -1.0)
                return -1.0;
            return std::pow(1.0 + total, 1.0 / years()) - 1.0;
        }

        double PerformanceMetrics::hit_rate() const
        {
            return static_cast<double>((returns_.array() > 0.0).count()) / returns_.size();
        }

        // ===================================================================
        // Risk
        // ===================================================================

        double PerformanceMetrics::annualized_volatility() const
        {
            const Eigen::Index n = returns_.size();
            if (n < 2)
                return 0.0;

            const double var = (returns_.array() - returns_.mean()).square().sum() / (n - 1);
            return std::sqrt(var * steps_per_year_);
        }

        double PerformanceMetrics::downside_deviation(double target_return) const
        {
            const Eigen::Index n = returns_.size();
            if (n < 2)
                return 0.0;

            const double step_target = target_return / steps_per_year_;
            const double sum_sq = (returns_.array() - step_target).min(0.0).square().sum();
            return std::sqrt(sum_sq / (n - 1) * steps_per_year_);
        }

        // ===================================================================
        // Risk-Adjusted
        // ===================================================================

        double PerformanceMetrics::sharpe_ratio() const
        {
            const double vol = annualized_volatility();
            return vol > 0.0 ? (annualized_return() - risk_free_rate_) / vol : 0.0;
        }

        double PerformanceMetrics::sortino_ratio(double target_return) const
        {
            const double dd = downside_deviation(target_return);
            return dd > 0.0 ? (annualized_return() - target_return) / dd : 0.0;
        }

        double PerformanceMetrics::calmar_ratio() const
        {
            return max_drawdown_.depth > 0.0 ? annualized_return() / max_drawdown_.depth : 0.0;
        }

        double PerformanceMetrics::average_option_weight() const
        {
            return option_weights_.size() > 0 ? option_weights_.mean() : 0.0;
        }

        // ===================================================================
        // Export
        // ===================================================================

        std::string PerformanceMetrics::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(4);
            oss << "=== Performance ===\n";
            oss << "Period:             " << dates_.front() << " to " << dates_.back()
                << " (" << returns_.size() << " steps)\n";
            oss << "Total return:       " << total_return() * 100.0 << "%\n";
            oss << "Annualized return:  " << annualized_return() * 100.0 << "%\n";
            oss << "Annualized vol:     " << annualized_volatility() * 100.0 << "%\n";
            oss << "Best / worst step:  " << best_step() * 100.0 << "% / " << worst_step() * 100.0 << "%\n";
            oss << "Hit rate:           " << hit_rate() * 100.0 << "%\n";
            oss << "Sharpe:             " << sharpe_ratio() << "\n";
            oss << "Sortino:            " << sortino_ratio() << "\n";
            oss << "Calmar:             " << calmar_ratio() << "\n";
            oss << "Max drawdown:       " << max_drawdown() * 100.0 << "%";
            if (max_drawdown_.depth > 0.0)
            {
                oss << " (" << dates_[max_drawdown_.peak_index] << " / "
                    << dates_[max_drawdown_.trough_index] << ", ";
                if (max_drawdown_.recovery_index < 0)
                    oss << "unrecovered)";
                else
                    oss << "recovered " << dates_[max_drawdown_.recovery_index] << ")";
            }
            oss << "\n";
            oss << "Avg option weight:  " << average_option_weight() * 100.0 << "%\n";
            oss << "===================\n";
            return oss.str();
        }

        nlohmann::json PerformanceMetrics::to_json() const
        {
            nlohmann::json j;
            j["total_return"] = total_return();
            j["annualized_return"] = annualized_return();
            j["annualized_volatility"] = annualized_volatility();
            j["downside_deviation"] = downside_deviation();
            j["sharpe_ratio"] = sharpe_ratio();
            j["sortino_ratio"] = sortino_ratio();
            j["calmar_ratio"] = calmar_ratio();
            j["best_step"] = best_step();
            j["worst_step"] = worst_step();
            j["hit_rate"] = hit_rate();
            j["average_option_weight"] = average_option_weight();
            j["max_drawdown"] = {
                {"depth", max_drawdown_.depth},
                {"peak_date", date_or_blank(dates_, max_drawdown_.peak_index)},
                {"trough_date", date_or_blank(dates_, max_drawdown_.trough_index)},
                {"recovery_date", date_or_blank(dates_, max_drawdown_.recovery_index)},
                {"duration_steps", max_drawdown_.duration_steps()},
                {"recovery_steps", max_drawdown_.recovery_steps()}};
            j["risk_free_rate"] = risk_free_rate_;
            j["steps_per_year"] = steps_per_year_;
            j["num_steps"] = static_cast<int>(returns_.size());
            return j;
        }

        void PerformanceMetrics::to_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "date,nav,return,drawdown\n";
            file << std::fixed << std::setprecision(8);
            for (Eigen::Index i = 0; i < nav_.size(); ++i)
            {
                file << dates_[i] << "," << nav_[i] << ",";
                if (i > 0)
                    file << returns_[i - 1];
                file << "," << drawdowns_[i] << "\n";
            }
        }

    } // namespace analytics
} // namespace optsim
