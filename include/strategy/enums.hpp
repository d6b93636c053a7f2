/**
 * @file enums.hpp
 * @brief Direction, signal and order tags shared by strategies and the engine.
 */

#ifndef OPTSIM_STRATEGY_ENUMS_HPP
#define OPTSIM_STRATEGY_ENUMS_HPP

#include "data/quotes.hpp"

#include <string>

namespace optsim
{

    /**
     * @enum Direction
     * @brief Side of an option leg.
     *
     * BUY legs are valued at the ask, SELL legs at the bid.
     */
    enum class Direction
    {
        BUY,
        SELL
    };

    /** @brief Opposite direction, used to value the closing trade of a leg. */
    Direction operator~(Direction direction);

    enum class Signal
    {
        ENTRY,
        EXIT
    };

    /**
     * @enum Order
     * @brief Order tag written on every leg of a trade.
     */
    enum class Order
    {
        BTO, ///< Buy to open
        BTC, ///< Buy to close
        STO, ///< Sell to open
        STC  ///< Sell to close
    };

    /**
     * @brief Order tag for a leg direction and signal.
     *
     * BUY/ENTRY -> BTO, BUY/EXIT -> STC, SELL/ENTRY -> STO, SELL/EXIT -> BTC.
     */
    Order get_order(Direction direction, Signal signal);

    bool is_entry(Order order);

    /** @brief Price of a quote for the given direction (ask for BUY, bid for SELL). */
    double price_for(const OptionQuote &quote, Direction direction);

    /** @brief Canonical schema key of the price column for a direction. */
    std::string price_key(Direction direction);

    std::string to_string(Direction direction);
    std::string to_string(Order order);

    /**
     * @brief Parse "buy"/"sell" (any case).
     * @throws std::invalid_argument On anything else.
     */
    Direction parse_direction(const std::string &value);

    /**
     * @brief Parse "BTO"/"BTC"/"STO"/"STC" (any case).
     * @throws std::invalid_argument On anything else.
     */
    Order parse_order(const std::string &value);

    /**
     * @struct Stock
     * @brief Stock target: symbol and its share of the stock allocation.
     */
    struct Stock
    {
        std::string symbol;
        double percentage = 0.0;
    };

} // namespace optsim

#endif // OPTSIM_STRATEGY_ENUMS_HPP
