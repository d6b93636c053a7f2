#include "backtest/allocation.hpp"

#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

namespace optsim {
namespace backtest {

Allocation Allocation::normalized(double stocks, double options, double cash) {
    const std::pair<const char*, double> weights[] = {
        {"stocks", stocks}, {"options", options}, {"cash", cash}};
    for (const auto& w : weights) {
        if (!(w.second >= 0.0) || std::isinf(w.second)) {
            std::ostringstream msg;
            msg << "Expected non-negative value for parameter '" << w.first << "', got: " << w.second;
            throw std::invalid_argument(msg.str());
        }
    }

    double total = stocks + options + cash;
    if (!(total > 0.0)) {
        throw std::invalid_argument("Allocation weights must have a positive sum");
    }

    Allocation a;
    a.stocks = stocks / total;
    a.options = options / total;
    a.cash = cash / total;
    return a;
}

Allocation Allocation::from_map(const std::map<std::string, double>& weights) {
    double stocks = 0.0, options = 0.0, cash = 0.0;
    for (const auto& kv : weights) {
        if (kv.first == "stocks") stocks = kv.second;
        else if (kv.first == "options") options = kv.second;
        else if (kv.first == "cash") cash = kv.second;
        else throw std::invalid_argument("Expected one of 'stocks','options','cash' for allocation key, got: " + kv.first);
    }
    return normalized(stocks, options, cash);
}

Allocation Allocation::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Allocation must be a JSON object");
    }
    std::map<std::string, double> weights;
    for (auto it = j.begin(); it != j.end(); ++it) {
        weights[it.key()] = it.value().get<double>();
    }
    return from_map(weights);
}

nlohmann::json Allocation::to_json() const {
    return nlohmann::json{{"stocks", stocks}, {"options", options}, {"cash", cash}};
}

void validate_stock_targets(const std::vector<Stock>& stocks) {
    if (stocks.empty()) {
        throw std::invalid_argument("At least one stock target is required");
    }

    std::set<std::string> seen;
    double total = 0.0;
    for (const auto& s : stocks) {
        if (s.symbol.empty()) {
            throw std::invalid_argument("Stock target symbol must not be empty");
        }
        if (!seen.insert(s.symbol).second) {
            throw std::invalid_argument("Duplicate stock target: " + s.symbol);
        }
        if (!(s.percentage >= 0.0)) {
            std::ostringstream msg;
            msg << "Expected non-negative value for parameter 'percentage' of " << s.symbol
                << ", got: " << s.percentage;
            throw std::invalid_argument(msg.str());
        }
        total += s.percentage;
    }

    if (std::abs(total - 1.0) > kStockSumTolerance) {
        std::ostringstream msg;
        msg << "Stock percentages must sum to 1.0, got: " << total;
        throw std::invalid_argument(msg.str());
    }
}

std::vector<Stock> stocks_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("Stock targets must be a JSON array");
    }
    std::vector<Stock> stocks;
    for (const auto& item : j) {
        Stock s;
        s.symbol = item.at("symbol").get<std::string>();
        s.percentage = item.at("percentage").get<double>();
        stocks.push_back(s);
    }
    validate_stock_targets(stocks);
    return stocks;
}

} // namespace backtest
} // namespace optsim
