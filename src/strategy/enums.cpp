#include "strategy/enums.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace optsim
{

    namespace
    {
        std::string upper(const std::string &value)
        {
            std::string s = value;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return std::toupper(c); });
            return s;
        }
    } // namespace

    Direction operator~(Direction direction)
    {
        return direction == Direction::BUY ? Direction::SELL : Direction::BUY;
    }

    Order get_order(Direction direction, Signal signal)
    {
        if (direction == Direction::BUY)
            return signal == Signal::ENTRY ? Order::BTO : Order::STC;
        return signal == Signal::ENTRY ? Order::STO : Order::BTC;
    }

    bool is_entry(Order order)
    {
        return order == Order::BTO || order == Order::STO;
    }

    double price_for(const OptionQuote &quote, Direction direction)
    {
        return direction == Direction::BUY ? quote.ask : quote.bid;
    }

    std::string price_key(Direction direction)
    {
        return direction == Direction::BUY ? "ask" : "bid";
    }

    std::string to_string(Direction direction)
    {
        return direction == Direction::BUY ? "buy" : "sell";
    }

    std::string to_string(Order order)
    {
        switch (order)
        {
        case Order::BTO:
            return "BTO";
        case Order::BTC:
            return "BTC";
        case Order::STO:
            return "STO";
        case Order::STC:
            return "STC";
        }
        return "UNKNOWN";
    }

    Direction parse_direction(const std::string &value)
    {
        std::string s = upper(value);
        if (s == "BUY")
            return Direction::BUY;
        if (s == "SELL")
            return Direction::SELL;
        throw std::invalid_argument("Expected one of 'buy','sell' for parameter 'direction', got: " + value);
    }

    Order parse_order(const std::string &value)
    {
        std::string s = upper(value);
        if (s == "BTO")
            return Order::BTO;
        if (s == "BTC")
            return Order::BTC;
        if (s == "STO")
            return Order::STO;
        if (s == "STC")
            return Order::STC;
        throw std::invalid_argument("Expected one of 'BTO','BTC','STO','STC' for parameter 'order', got: " + value);
    }

} // namespace optsim
