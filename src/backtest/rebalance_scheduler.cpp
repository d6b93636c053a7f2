#include "backtest/rebalance_scheduler.hpp"
#include "data/date_utils.hpp"

#include <algorithm>

namespace optsim {
namespace backtest {

RebalanceConfig RebalanceConfig::from_json(const nlohmann::json& j) {
    RebalanceConfig cfg;
    if (j.contains("rebalance_frequency")) {
        cfg.frequency_months = j.at("rebalance_frequency").get<int>();
    }
    if (cfg.frequency_months < 0) {
        throw std::invalid_argument("Expected non-negative value for parameter 'rebalance_frequency', got: " +
                                    std::to_string(cfg.frequency_months));
    }
    return cfg;
}

RebalanceScheduler::RebalanceScheduler(const RebalanceConfig& config)
    : config_(config), last_rebalance_date_(), rebalance_count_(0) {
    if (config_.frequency_months < 0) {
        throw std::invalid_argument("Expected non-negative value for parameter 'frequency_months', got: " +
                                    std::to_string(config_.frequency_months));
    }
}

void RebalanceScheduler::build(const std::vector<std::string>& step_dates) {
    scheduled_dates_.clear();
    trigger_dates_.clear();
    if (step_dates.empty()) return;

    trigger_dates_.insert(step_dates.front());
    if (config_.frequency_months == 0) return;

    scheduled_dates_ = business_month_starts(step_dates.front(), step_dates.back(),
                                             config_.frequency_months);
    for (const auto& scheduled : scheduled_dates_) {
        auto it = std::lower_bound(step_dates.begin(), step_dates.end(), scheduled);
        if (it != step_dates.end()) trigger_dates_.insert(*it);
    }
}

bool RebalanceScheduler::should_rebalance(const std::string& date) const {
    return trigger_dates_.count(date) > 0;
}

void RebalanceScheduler::record_rebalance(const std::string& date) {
    last_rebalance_date_ = date;
    ++rebalance_count_;
}

void RebalanceScheduler::reset() {
    last_rebalance_date_.clear();
    rebalance_count_ = 0;
}

std::string RebalanceScheduler::business_month_start(int year, int month) {
    std::string date = date_utils::make_date(year, month, 1);
    int dow = date_utils::day_of_week(date); // 0=Mon, 6=Sun
    if (dow == 5) return date_utils::add_days(date, 2);
    if (dow == 6) return date_utils::add_days(date, 1);
    return date;
}

std::vector<std::string> RebalanceScheduler::business_month_starts(const std::string& start_date,
                                                                   const std::string& end_date,
                                                                   int every_n_months) {
    if (every_n_months <= 0) {
        throw std::invalid_argument("Expected positive value for parameter 'every_n_months', got: " +
                                    std::to_string(every_n_months));
    }

    int year = date_utils::extract_year(start_date);
    int month = date_utils::extract_month(start_date);

    // anchor: first business month start on or after start_date
    if (business_month_start(year, month) < start_date) {
        if (++month > 12) { month = 1; ++year; }
    }

    std::vector<std::string> out;
    while (true) {
        std::string bms = business_month_start(year, month);
        if (bms > end_date) break;
        out.push_back(bms);
        month += every_n_months;
        while (month > 12) { month -= 12; ++year; }
    }
    return out;
}

} // namespace backtest
} // namespace optsim
