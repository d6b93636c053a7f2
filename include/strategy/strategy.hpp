/**
 * @file strategy.hpp
 * @brief Multi-leg option strategy: entry candidates and exit signals.
 */

#ifndef OPTSIM_STRATEGY_STRATEGY_HPP
#define OPTSIM_STRATEGY_STRATEGY_HPP

#include "backtest/inventory.hpp"
#include "data/quotes.hpp"
#include "data/schema.hpp"
#include "strategy/strategy_leg.hpp"

#include <limits>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace optsim
{
    namespace strategy
    {

        /**
         * @struct ExitThresholds
         * @brief Profit and loss fractions that close a position.
         */
        struct ExitThresholds
        {
            double profit_pct = std::numeric_limits<double>::infinity();
            double loss_pct = std::numeric_limits<double>::infinity();
        };

        /**
         * @struct ExitSignals
         * @brief Result of an exit pass over the option inventory.
         *
         * mask has one entry per inventory row; exits and costs have one
         * entry per masked row, in inventory order. costs[i] is the current
         * per-unit cost times quantity.
         */
        struct ExitSignals
        {
            std::vector<OptionPosition> exits;
            std::vector<bool> mask;
            std::vector<double> costs;

            bool empty() const { return exits.empty(); }
        };

        /**
         * @class Strategy
         * @brief Ordered option legs and the rules that open and close them.
         *
         * filter_entries and filter_exits are virtual so a custom signal
         * policy can replace the default filter-driven one.
         */
        class Strategy
        {
        public:
            /**
             * @param schema Option data layout the filters were written against.
             * @param initial_capital Capital used to size new positions.
             * @param shares_per_contract Contract multiplier.
             * @throws std::invalid_argument If shares_per_contract is not positive.
             */
            explicit Strategy(Schema schema,
                              double initial_capital = 1000000.0,
                              long shares_per_contract = 100);
            virtual ~Strategy() = default;

            const Schema &schema() const { return schema_; }

            /**
             * @throws std::invalid_argument If a leg with the same name exists.
             */
            void add_leg(const StrategyLeg &leg);
            void add_legs(const std::vector<StrategyLeg> &legs);
            void clear_legs() { legs_.clear(); }

            const std::vector<StrategyLeg> &legs() const { return legs_; }
            std::vector<std::string> leg_names() const;

            double initial_capital() const { return initial_capital_; }
            void set_initial_capital(double capital) { initial_capital_ = capital; }

            long shares_per_contract() const { return shares_per_contract_; }
            void set_shares_per_contract(long shares);

            /**
             * @brief Close positions whose return reaches +profit_pct or -loss_pct.
             * @throws std::invalid_argument If a threshold is negative.
             */
            void set_exit_thresholds(double profit_pct, double loss_pct);
            const ExitThresholds &exit_thresholds() const { return thresholds_; }

            /**
             * @brief Ranked entry candidates for today's chain.
             *
             * Pairs the i-th matching row of every leg, skipping contracts
             * already held in that leg. totals.qty is
             * floor(initial_capital / |totals.cost|); candidates with zero cost
             * or zero quantity are dropped.
             */
            virtual std::vector<OptionPosition> filter_entries(const OptionSnapshot &chain,
                                                               const backtest::Inventory &inventory,
                                                               const std::string &date) const;

            /**
             * @brief Exit rows, inventory mask and costs for today's chain.
             *
             * A row exits when any leg's exit filter matches its current quote
             * or when its return crosses an exit threshold.
             */
            virtual ExitSignals filter_exits(const OptionSnapshot &chain,
                                             const backtest::Inventory &inventory,
                                             const std::string &date) const;

            /**
             * @brief Closing leg record for every inventory row.
             *
             * Valued at the opposite price column; cost is negated for BUY legs.
             * A contract missing from the chain keeps its inventory fields and
             * gets cost 0.
             *
             * @param leg Leg index.
             * @param missing When given, receives one flag per row set for missing contracts.
             */
            std::vector<LegRecord> exit_candidates(size_t leg,
                                                   const backtest::Inventory &inventory,
                                                   const OptionSnapshot &chain,
                                                   std::vector<bool> *missing = nullptr) const;

            /**
             * @brief Build a strategy from its JSON description.
             *
             * @code
             * {"legs": [{"name": "leg_1", "type": "put", "direction": "sell",
             *            "entry": [{"field": "dte", "op": ">=", "value": 60}],
             *            "exit":  [{"field": "dte", "op": "<=", "value": 30}]}],
             *  "exit_thresholds": {"profit_pct": 0.5, "loss_pct": 1.0}}
             * @endcode
             */
            static Strategy from_json(const nlohmann::json &j, const Schema &schema,
                                      double initial_capital = 1000000.0,
                                      long shares_per_contract = 100);

        private:
            LegRecord entry_leg(const StrategyLeg &leg, const OptionQuote &quote) const;
            double excess_return(double entry_cost, double current_cost) const;

            Schema schema_;
            std::vector<StrategyLeg> legs_;
            double initial_capital_;
            long shares_per_contract_;
            ExitThresholds thresholds_;
        };

    } // namespace strategy
} // namespace optsim

#endif // OPTSIM_STRATEGY_STRATEGY_HPP
