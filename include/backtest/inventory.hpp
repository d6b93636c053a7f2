/**
 * @file inventory.hpp
 * @brief Stock and multi-leg option positions currently held.
 */

#ifndef OPTSIM_BACKTEST_INVENTORY_HPP
#define OPTSIM_BACKTEST_INVENTORY_HPP

#include "data/quotes.hpp"
#include "strategy/enums.hpp"

#include <string>
#include <vector>

namespace optsim
{

    /**
     * @struct LegRecord
     * @brief One leg of an option position or trade.
     *
     * cost is per contract (price * shares_per_contract); positive means
     * cash paid, negative cash received.
     */
    struct LegRecord
    {
        std::string contract;
        std::string underlying;
        std::string expiration;
        OptionType type = OptionType::CALL;
        double strike = 0.0;
        double cost = 0.0;
        Order order = Order::BTO;
    };

    /**
     * @struct TotalsRecord
     * @brief Aggregate of a multi-leg position: per-unit cost, quantity, date.
     */
    struct TotalsRecord
    {
        double cost = 0.0;
        long qty = 0;
        std::string date;
    };

    /**
     * @struct OptionPosition
     * @brief N leg records plus one totals record, entered or exited atomically.
     */
    struct OptionPosition
    {
        std::vector<LegRecord> legs;
        TotalsRecord totals;

        /** @brief Cash paid for the whole position (cost * qty). */
        double total_price() const { return totals.cost * static_cast<double>(totals.qty); }
    };

    /**
     * @struct StockPosition
     * @brief Stock holding: symbol, acquisition price, whole-share quantity.
     */
    struct StockPosition
    {
        std::string symbol;
        double price = 0.0;
        long qty = 0;
    };

    namespace backtest
    {

        /**
         * @class Inventory
         * @brief Current stock and option positions.
         *
         * The leg layout (ordered leg names) is fixed at construction and kept
         * across reset(), so every option row always has one record per leg.
         */
        class Inventory
        {
        public:
            explicit Inventory(std::vector<std::string> leg_names = {});

            /** @brief Remove every stock and option position; the leg layout is kept. */
            void reset();

            const std::vector<std::string> &leg_names() const { return leg_names_; }
            size_t num_legs() const { return leg_names_.size(); }

            /**
             * @brief Index of a leg by name.
             * @throws std::invalid_argument If no leg has this name.
             */
            size_t leg_index(const std::string &name) const;

            // ====================================================================
            // Stocks
            // ====================================================================

            /**
             * @throws std::invalid_argument If qty is negative or price is not positive.
             */
            void add_stock(const std::string &symbol, double price, long qty);

            /**
             * @brief Remove every row for a symbol.
             * @return Number of rows removed.
             */
            size_t remove_stock(const std::string &symbol);

            const StockPosition *find_stock(const std::string &symbol) const;
            const std::vector<StockPosition> &stocks() const { return stocks_; }

            // ====================================================================
            // Options
            // ====================================================================

            /**
             * @throws std::invalid_argument If the row's leg count differs from the layout.
             */
            void add_option(const OptionPosition &position);

            /**
             * @brief Remove the option rows whose mask entry is true.
             * @return Number of rows removed.
             * @throws std::invalid_argument If the mask size differs from the number of rows.
             */
            size_t remove_options(const std::vector<bool> &mask);

            const std::vector<OptionPosition> &options() const { return options_; }

            /** @brief True when a contract is held in the given leg of any row. */
            bool holds_contract(size_t leg, const std::string &contract) const;

            // ====================================================================
            // Aggregates
            // ====================================================================

            long stock_qty() const;
            long option_qty() const;
            bool empty() const { return stocks_.empty() && options_.empty(); }

        private:
            std::vector<std::string> leg_names_;
            std::vector<StockPosition> stocks_;
            std::vector<OptionPosition> options_;
        };

    } // namespace backtest
} // namespace optsim

#endif // OPTSIM_BACKTEST_INVENTORY_HPP
