#include "backtest/valuation.hpp"

namespace optsim {
namespace backtest {

OptionMarks mark_options(const strategy::Strategy& strategy,
                         const Inventory& inventory,
                         const OptionSnapshot& chain,
                         const std::string& date) {
    OptionMarks marks;
    const auto& rows = inventory.options();
    if (rows.empty()) return marks;

    const size_t num_legs = strategy.legs().size();
    std::vector<std::vector<LegRecord>> candidates(num_legs);
    for (size_t l = 0; l < num_legs; ++l) {
        std::vector<bool> missing;
        candidates[l] = strategy.exit_candidates(l, inventory, chain, &missing);
        for (bool m : missing) {
            if (m) ++marks.missing;
        }
    }

    marks.exits.reserve(rows.size());
    marks.costs.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        const double qty = static_cast<double>(rows[i].totals.qty);

        OptionPosition exit;
        exit.legs.reserve(num_legs);
        double cost = 0.0;
        for (size_t l = 0; l < num_legs; ++l) {
            const LegRecord& leg = candidates[l][i];
            double value = -leg.cost * qty;
            if (leg.type == OptionType::CALL) marks.calls += value;
            else marks.puts += value;
            cost += leg.cost;
            exit.legs.push_back(leg);
        }
        exit.totals = TotalsRecord{cost, rows[i].totals.qty, date};

        marks.costs.push_back(cost * qty);
        marks.exits.push_back(std::move(exit));
    }

    return marks;
}

double mark_stocks(const Inventory& inventory, const StockSnapshot& snapshot) {
    double value = 0.0;
    for (const auto& p : inventory.stocks()) {
        value += snapshot.adj_close(p.symbol) * static_cast<double>(p.qty);
    }
    return value;
}

} // namespace backtest
} // namespace optsim
