#pragma once

#include <set>
#include <string>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

namespace optsim {
namespace backtest {

/**
 * @struct RebalanceConfig
 * @brief Rebalance cadence in months; 0 rebalances on the first date only.
 */
struct RebalanceConfig {
    int frequency_months = 1;

    static RebalanceConfig from_json(const nlohmann::json& j);
};

/**
 * @class RebalanceScheduler
 * @brief Decides which step dates trigger a full rebalance.
 *
 * Scheduled dates are business month starts (first weekday of a month)
 * every frequency_months months, anchored at the first business month start
 * on or after the first step date. Each scheduled date fires on the first
 * step date on or after it, so a holiday or a monthly step grid never skips
 * a rebalance. The first step date always fires.
 */
class RebalanceScheduler {
public:
    explicit RebalanceScheduler(const RebalanceConfig& config);
    ~RebalanceScheduler() = default;

    /**
     * @brief Compute trigger dates for an ascending list of step dates.
     */
    void build(const std::vector<std::string>& step_dates);

    bool should_rebalance(const std::string& date) const;

    void record_rebalance(const std::string& date);
    void reset();

    const RebalanceConfig& config() const { return config_; }
    const std::vector<std::string>& scheduled_dates() const { return scheduled_dates_; }
    const std::set<std::string>& trigger_dates() const { return trigger_dates_; }
    const std::string& last_rebalance_date() const { return last_rebalance_date_; }
    int rebalance_count() const { return rebalance_count_; }

    /** @brief First weekday of a calendar month. */
    static std::string business_month_start(int year, int month);

    /**
     * @brief Business month starts in [start_date, end_date], every_n_months apart.
     * @throws std::invalid_argument If every_n_months is not positive.
     */
    static std::vector<std::string> business_month_starts(const std::string& start_date,
                                                          const std::string& end_date,
                                                          int every_n_months);

private:
    RebalanceConfig config_;
    std::vector<std::string> scheduled_dates_;
    std::set<std::string> trigger_dates_;
    std::string last_rebalance_date_;
    int rebalance_count_;
};

} // namespace backtest
} // namespace optsim
