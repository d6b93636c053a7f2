#include "backtest/inventory.hpp"

#include <algorithm>
#include <stdexcept>

namespace optsim
{
    namespace backtest
    {

        Inventory::Inventory(std::vector<std::string> leg_names)
            : leg_names_(std::move(leg_names))
        {
        }

        void Inventory::reset()
        {
            stocks_.clear();
            options_.clear();
        }

        size_t Inventory::leg_index(const std::string &name) const
        {
            auto it = std::find(leg_names_.begin(), leg_names_.end(), name);
            if (it == leg_names_.end())
            {
                throw std::invalid_argument("Unknown leg: " + name);
            }
            return static_cast<size_t>(std::distance(leg_names_.begin(), it));
        }

        // =========
        // Stocks
        // =========

        void Inventory::add_stock(const std::string &symbol, double price, long qty)
        {
            if (qty < 0)
            {
                throw std::invalid_argument("Expected non-negative value for parameter 'qty', got: " +
                                            std::to_string(qty));
            }
            if (price <= 0.0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'price', got: " +
                                            std::to_string(price));
            }
            stocks_.push_back(StockPosition{symbol, price, qty});
        }

        size_t Inventory::remove_stock(const std::string &symbol)
        {
            size_t before = stocks_.size();
            stocks_.erase(std::remove_if(stocks_.begin(), stocks_.end(),
                                         [&symbol](const StockPosition &p)
                                         { return p.symbol == symbol; }),
                          stocks_.end());
            return before - stocks_.size();
        }

        const StockPosition *Inventory::find_stock(const std::string &symbol) const
        {
            for (const auto &p : stocks_)
            {
                if (p.symbol == symbol)
                    return &p;
            }
            return nullptr;
        }

        // =========
        // Options
        // =========

        void Inventory::add_option(const OptionPosition &position)
        {
            if (position.legs.size() != leg_names_.size())
            {
                throw std::invalid_argument("Option position has " + std::to_string(position.legs.size()) +
                                            " legs, expected " + std::to_string(leg_names_.size()));
            }
            options_.push_back(position);
        }

        size_t Inventory::remove_options(const std::vector<bool> &mask)
        {
            if (mask.size() != options_.size())
            {
                throw std::invalid_argument("Exit mask size " + std::to_string(mask.size()) +
                                            " does not match " + std::to_string(options_.size()) +
                                            " option positions");
            }

            std::vector<OptionPosition> kept;
            kept.reserve(options_.size());
            for (size_t i = 0; i < options_.size(); ++i)
            {
                if (!mask[i])
                    kept.push_back(std::move(options_[i]));
            }
            size_t removed = options_.size() - kept.size();
            options_ = std::move(kept);
            return removed;
        }

        bool Inventory::holds_contract(size_t leg, const std::string &contract) const
        {
            for (const auto &row : options_)
            {
                if (leg < row.legs.size() && row.legs[leg].contract == contract)
                    return true;
            }
            return false;
        }

        // ===========
        // Aggregates
        // ===========

        long Inventory::stock_qty() const
        {
            long total = 0;
            for (const auto &p : stocks_)
                total += p.qty;
            return total;
        }

        long Inventory::option_qty() const
        {
            long total = 0;
            for (const auto &row : options_)
                total += row.totals.qty;
            return total;
        }

    } // namespace backtest
} // namespace optsim
