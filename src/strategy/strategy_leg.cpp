#include "strategy/strategy_leg.hpp"

#include <stdexcept>

namespace optsim
{
    namespace strategy
    {

        StrategyLeg::StrategyLeg(std::string name, const Schema &schema,
                                 OptionType type, Direction direction)
            : name_(std::move(name)), schema_(schema), type_(type), direction_(direction)
        {
            if (name_.empty())
            {
                throw std::invalid_argument("Strategy leg name must not be empty");
            }
            entry_filter_ = base_entry_filter();
            exit_filter_ = Filter::none();
        }

        void StrategyLeg::set_entry_filter(const Filter &filter)
        {
            entry_filter_ = base_entry_filter() & filter;
        }

        void StrategyLeg::set_exit_filter(const Filter &filter)
        {
            exit_filter_ = base_exit_filter() & filter;
            has_exit_filter_ = true;
        }

        Filter StrategyLeg::base_entry_filter() const
        {
            return base_exit_filter() & (schema_.number(price_key(direction_)) > 0.0);
        }

        Filter StrategyLeg::base_exit_filter() const
        {
            return schema_.text("type") == to_string(type_);
        }

    } // namespace strategy
} // namespace optsim
