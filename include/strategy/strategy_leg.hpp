/**
 * @file strategy_leg.hpp
 * @brief One named option leg of a strategy with its entry and exit filters.
 */

#ifndef OPTSIM_STRATEGY_STRATEGY_LEG_HPP
#define OPTSIM_STRATEGY_STRATEGY_LEG_HPP

#include "data/schema.hpp"
#include "strategy/enums.hpp"

#include <string>

namespace optsim
{
    namespace strategy
    {

        /**
         * @class StrategyLeg
         * @brief Leg definition: name, option type, direction and filters.
         *
         * The entry filter always includes (type == leg type) and
         * (price > 0) for the leg's price column; user filters are AND-ed on
         * top. The exit filter includes (type == leg type) and only becomes
         * active once a user exit filter is set.
         */
        class StrategyLeg
        {
        public:
            StrategyLeg(std::string name, const Schema &schema,
                        OptionType type = OptionType::CALL,
                        Direction direction = Direction::BUY);

            const std::string &name() const { return name_; }
            OptionType type() const { return type_; }
            Direction direction() const { return direction_; }

            const Filter &entry_filter() const { return entry_filter_; }
            const Filter &exit_filter() const { return exit_filter_; }
            bool has_exit_filter() const { return has_exit_filter_; }

            void set_entry_filter(const Filter &filter);
            void set_exit_filter(const Filter &filter);

            /** @brief Price the leg opens at (ask for BUY, bid for SELL). */
            double entry_price(const OptionQuote &quote) const { return price_for(quote, direction_); }

            /** @brief Price the leg closes at, from the opposite column. */
            double exit_price(const OptionQuote &quote) const { return price_for(quote, ~direction_); }

        private:
            Filter base_entry_filter() const;
            Filter base_exit_filter() const;

            std::string name_;
            Schema schema_;
            OptionType type_;
            Direction direction_;
            Filter entry_filter_;
            Filter exit_filter_;
            bool has_exit_filter_ = false;
        };

    } // namespace strategy
} // namespace optsim

#endif // OPTSIM_STRATEGY_STRATEGY_LEG_HPP
