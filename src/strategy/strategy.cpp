/**
 * @file strategy.cpp
 * @brief Implementation of the default filter-driven option strategy
 */

#include "strategy/strategy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace optsim
{
    namespace strategy
    {

        Strategy::Strategy(Schema schema, double initial_capital, long shares_per_contract)
            : schema_(std::move(schema)),
              initial_capital_(initial_capital),
              shares_per_contract_(shares_per_contract)
        {
            set_shares_per_contract(shares_per_contract);
        }

        void Strategy::add_leg(const StrategyLeg &leg)
        {
            for (const auto &existing : legs_)
            {
                if (existing.name() == leg.name())
                {
                    throw std::invalid_argument("Duplicate strategy leg name: " + leg.name());
                }
            }
            legs_.push_back(leg);
        }

        void Strategy::add_legs(const std::vector<StrategyLeg> &legs)
        {
            for (const auto &leg : legs)
            {
                add_leg(leg);
            }
        }

        std::vector<std::string> Strategy::leg_names() const
        {
            std::vector<std::string> names;
            names.reserve(legs_.size());
            for (const auto &leg : legs_)
            {
                names.push_back(leg.name());
            }
            return names;
        }

        void Strategy::set_shares_per_contract(long shares)
        {
            if (shares <= 0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'shares_per_contract', got: " +
                                            std::to_string(shares));
            }
            shares_per_contract_ = shares;
        }

        void Strategy::set_exit_thresholds(double profit_pct, double loss_pct)
        {
            if (profit_pct < 0.0)
            {
                throw std::invalid_argument("Expected non-negative value for parameter 'profit_pct', got: " +
                                            std::to_string(profit_pct));
            }
            if (loss_pct < 0.0)
            {
                throw std::invalid_argument("Expected non-negative value for parameter 'loss_pct', got: " +
                                            std::to_string(loss_pct));
            }
            thresholds_.profit_pct = profit_pct;
            thresholds_.loss_pct = loss_pct;
        }

        // ============================================================================
        // Entries
        // ============================================================================

        LegRecord Strategy::entry_leg(const StrategyLeg &leg, const OptionQuote &quote) const
        {
            LegRecord record;
            record.contract = quote.contract;
            record.underlying = quote.underlying;
            record.expiration = quote.expiration;
            record.type = quote.type;
            record.strike = quote.strike;
            record.cost = leg.entry_price(quote) * static_cast<double>(shares_per_contract_);
            if (leg.direction() == Direction::SELL)
                record.cost = -record.cost;
            record.order = get_order(leg.direction(), Signal::ENTRY);
            return record;
        }

        std::vector<OptionPosition> Strategy::filter_entries(const OptionSnapshot &chain,
                                                             const backtest::Inventory &inventory,
                                                             const std::string &date) const
        {
            std::vector<OptionPosition> candidates;
            if (legs_.empty())
                return candidates;

            std::vector<std::vector<const OptionQuote *>> matches(legs_.size());
            for (size_t l = 0; l < legs_.size(); ++l)
            {
                for (const auto &quote : chain.rows())
                {
                    if (legs_[l].entry_filter()(quote) && !inventory.holds_contract(l, quote.contract))
                    {
                        matches[l].push_back(&quote);
                    }
                }
                if (matches[l].empty())
                    return candidates;
            }

            size_t n = matches[0].size();
            for (const auto &m : matches)
                n = std::min(n, m.size());

            for (size_t i = 0; i < n; ++i)
            {
                OptionPosition position;
                position.legs.reserve(legs_.size());
                double cost = 0.0;
                for (size_t l = 0; l < legs_.size(); ++l)
                {
                    position.legs.push_back(entry_leg(legs_[l], *matches[l][i]));
                    cost += position.legs.back().cost;
                }

                if (cost == 0.0)
                    continue;

                long qty = static_cast<long>(std::floor(initial_capital_ / std::abs(cost)));
                if (qty <= 0)
                    continue;

                position.totals = TotalsRecord{cost, qty, date};
                candidates.push_back(std::move(position));
            }

            return candidates;
        }

        // ============================================================================
        // Exits
        // ============================================================================

        std::vector<LegRecord> Strategy::exit_candidates(size_t leg,
                                                         const backtest::Inventory &inventory,
                                                         const OptionSnapshot &chain,
                                                         std::vector<bool> *missing) const
        {
            if (leg >= legs_.size())
            {
                throw std::invalid_argument("Leg index " + std::to_string(leg) + " out of range");
            }

            const StrategyLeg &def = legs_[leg];
            const auto &rows = inventory.options();

            std::vector<LegRecord> out;
            out.reserve(rows.size());
            if (missing != nullptr)
                missing->assign(rows.size(), false);

            for (size_t i = 0; i < rows.size(); ++i)
            {
                const LegRecord &held = rows[i].legs.at(leg);
                LegRecord record = held;
                record.order = get_order(def.direction(), Signal::EXIT);

                const OptionQuote *quote = chain.find(held.contract);
                if (quote == nullptr)
                {
                    record.cost = 0.0;
                    if (missing != nullptr)
                        (*missing)[i] = true;
                }
                else
                {
                    record.cost = def.exit_price(*quote) * static_cast<double>(shares_per_contract_);
                    if (def.direction() == Direction::BUY)
                        record.cost = -record.cost;
                }
                out.push_back(record);
            }

            return out;
        }

        double Strategy::excess_return(double entry_cost, double current_cost) const
        {
            double sign = (entry_cost > 0.0) ? 1.0 : -1.0;
            return (current_cost / entry_cost + 1.0) * -sign;
        }

        ExitSignals Strategy::filter_exits(const OptionSnapshot &chain,
                                           const backtest::Inventory &inventory,
                                           const std::string &date) const
        {
            const auto &rows = inventory.options();

            ExitSignals signals;
            signals.mask.assign(rows.size(), false);
            if (rows.empty())
                return signals;

            std::vector<std::vector<LegRecord>> candidates(legs_.size());
            std::vector<std::vector<bool>> missing(legs_.size());
            for (size_t l = 0; l < legs_.size(); ++l)
            {
                candidates[l] = exit_candidates(l, inventory, chain, &missing[l]);
            }

            for (size_t i = 0; i < rows.size(); ++i)
            {
                double current_cost = 0.0;
                bool filter_hit = false;
                bool any_missing = false;

                for (size_t l = 0; l < legs_.size(); ++l)
                {
                    current_cost += candidates[l][i].cost;
                    any_missing = any_missing || missing[l][i];

                    if (legs_[l].has_exit_filter())
                    {
                        const OptionQuote *quote = chain.find(rows[i].legs[l].contract);
                        if (quote != nullptr && legs_[l].exit_filter()(*quote))
                            filter_hit = true;
                    }
                }

                bool threshold_hit = false;
                double entry_cost = rows[i].totals.cost;
                // a zero-imputed leg is not a price move
                if (entry_cost != 0.0 && !any_missing)
                {
                    double excess = excess_return(entry_cost, current_cost);
                    threshold_hit = excess >= thresholds_.profit_pct || excess <= -thresholds_.loss_pct;
                }

                if (!filter_hit && !threshold_hit)
                    continue;

                signals.mask[i] = true;

                OptionPosition exit;
                exit.legs.reserve(legs_.size());
                for (size_t l = 0; l < legs_.size(); ++l)
                {
                    exit.legs.push_back(candidates[l][i]);
                }
                exit.totals = TotalsRecord{current_cost, rows[i].totals.qty, date};

                signals.costs.push_back(current_cost * static_cast<double>(rows[i].totals.qty));
                signals.exits.push_back(std::move(exit));
            }

            return signals;
        }

        // ============================================================================
        // JSON
        // ============================================================================

        Strategy Strategy::from_json(const nlohmann::json &j, const Schema &schema,
                                     double initial_capital, long shares_per_contract)
        {
            Strategy strategy(schema, initial_capital, shares_per_contract);

            if (j.contains("legs"))
            {
                size_t index = 0;
                for (const auto &leg_json : j["legs"])
                {
                    ++index;
                    std::string name = leg_json.value("name", "leg_" + std::to_string(index));
                    OptionType type = parse_option_type(leg_json.value("type", "call"));
                    Direction direction = parse_direction(leg_json.value("direction", "buy"));

                    StrategyLeg leg(name, schema, type, direction);
                    if (leg_json.contains("entry"))
                    {
                        leg.set_entry_filter(schema.filter_from_json(leg_json["entry"]));
                    }
                    if (leg_json.contains("exit"))
                    {
                        leg.set_exit_filter(schema.filter_from_json(leg_json["exit"]));
                    }
                    strategy.add_leg(leg);
                }
            }

            if (j.contains("exit_thresholds"))
            {
                const auto &t = j["exit_thresholds"];
                double inf = std::numeric_limits<double>::infinity();
                double profit = t.contains("profit_pct") && !t["profit_pct"].is_null()
                                    ? t["profit_pct"].get<double>()
                                    : inf;
                double loss = t.contains("loss_pct") && !t["loss_pct"].is_null()
                                  ? t["loss_pct"].get<double>()
                                  : inf;
                strategy.set_exit_thresholds(profit, loss);
            }

            return strategy;
        }

    } // namespace strategy
} // namespace optsim
