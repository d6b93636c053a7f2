#include "backtest/balance_series.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace optsim {
namespace backtest {

void BalanceSeries::seed(const std::string& date, double initial_capital) {
    BalanceRecord r;
    r.date = date;
    r.total_capital = initial_capital;
    r.total_cash = initial_capital;
    append(r);
}

void BalanceSeries::append(const BalanceRecord& record) {
    if (!records_.empty() && !(records_.back().date < record.date)) {
        throw std::invalid_argument("Balance record date " + record.date +
                                    " is not after " + records_.back().date);
    }
    records_.push_back(record);
    finalized_ = false;
}

void BalanceSeries::finalize() {
    if (records_.empty()) {
        finalized_ = true;
        return;
    }

    Eigen::VectorXd capital = total_capital();
    const Eigen::Index n = capital.size();

    Eigen::VectorXd pct = Eigen::VectorXd::Zero(n);
    for (Eigen::Index i = 1; i < n; ++i) {
        if (capital[i - 1] != 0.0) pct[i] = capital[i] / capital[i - 1] - 1.0;
    }

    Eigen::VectorXd growth = (pct.array() + 1.0).matrix();
    double acc = 1.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        acc *= growth[i];
        records_[i].pct_change = pct[i];
        records_[i].accumulated_return = acc;
    }

    finalized_ = true;
}

const BalanceRecord& BalanceSeries::back() const {
    if (records_.empty()) throw std::logic_error("Balance series is empty");
    return records_.back();
}

std::vector<std::string> BalanceSeries::dates() const {
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& r : records_) out.push_back(r.date);
    return out;
}

Eigen::VectorXd BalanceSeries::total_capital() const {
    Eigen::VectorXd v(static_cast<Eigen::Index>(records_.size()));
    for (size_t i = 0; i < records_.size(); ++i) v[i] = records_[i].total_capital;
    return v;
}

Eigen::VectorXd BalanceSeries::pct_change() const {
    Eigen::VectorXd v(static_cast<Eigen::Index>(records_.size()));
    for (size_t i = 0; i < records_.size(); ++i) v[i] = records_[i].pct_change;
    return v;
}

Eigen::VectorXd BalanceSeries::accumulated_return() const {
    Eigen::VectorXd v(static_cast<Eigen::Index>(records_.size()));
    for (size_t i = 0; i < records_.size(); ++i) v[i] = records_[i].accumulated_return;
    return v;
}

void BalanceSeries::export_to_csv(const std::string& filepath) const {
    std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }

    file << "date,total_capital,total_cash,stock_capital,option_capital,calls_capital,"
            "puts_capital,stock_qty,options_qty,pct_change,accumulated_return\n";
    for (const auto& r : records_) {
        file << r.date << std::fixed << std::setprecision(4)
             << "," << r.total_capital
             << "," << r.total_cash
             << "," << r.stock_capital
             << "," << r.option_capital
             << "," << r.calls_capital
             << "," << r.puts_capital
             << "," << r.stock_qty
             << "," << r.options_qty
             << std::setprecision(8)
             << "," << r.pct_change
             << "," << r.accumulated_return << "\n";
    }

    file.close();
}

} // namespace backtest
} // namespace optsim
