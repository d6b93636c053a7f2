#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "strategy/strategy.hpp"
#include "test_helpers.hpp"
#include <cmath>

using namespace optsim;
using namespace optsim::strategy;

TEST_CASE("Direction and order tags", "[Strategy]") {
    REQUIRE(~Direction::BUY == Direction::SELL);
    REQUIRE(get_order(Direction::BUY, Signal::ENTRY) == Order::BTO);
    REQUIRE(get_order(Direction::BUY, Signal::EXIT) == Order::STC);
    REQUIRE(get_order(Direction::SELL, Signal::ENTRY) == Order::STO);
    REQUIRE(get_order(Direction::SELL, Signal::EXIT) == Order::BTC);
    REQUIRE(is_entry(Order::STO));
    REQUIRE_FALSE(is_entry(Order::BTC));

    OptionQuote q = test::option_quote("A", OptionType::CALL, "2020-01-02", 1.0, 1.2);
    REQUIRE(price_for(q, Direction::BUY) == 1.2);
    REQUIRE(price_for(q, Direction::SELL) == 1.0);
    REQUIRE(price_key(Direction::BUY) == "ask");

    REQUIRE(parse_direction("Sell") == Direction::SELL);
    REQUIRE(parse_order("stc") == Order::STC);
    REQUIRE(to_string(Order::BTO) == "BTO");
    REQUIRE_THROWS_AS(parse_direction("hold"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_order("XYZ"), std::invalid_argument);
}

TEST_CASE("Entry candidates", "[Strategy]") {
    Schema schema = Schema::options();
    backtest::Inventory empty({"leg_1"});

    SECTION("Long call priced at the ask") {
        Strategy s = test::single_leg_strategy(OptionType::CALL, Direction::BUY, 10000.0);
        OptionSnapshot chain("2020-01-02", {
            test::option_quote("C1", OptionType::CALL, "2020-01-02", 1.0, 1.2),
            test::option_quote("P1", OptionType::PUT, "2020-01-02", 2.0, 2.2)});

        auto candidates = s.filter_entries(chain, empty, "2020-01-02");
        REQUIRE(candidates.size() == 1);
        const LegRecord& leg = candidates[0].legs[0];
        REQUIRE(leg.contract == "C1");
        REQUIRE(leg.order == Order::BTO);
        REQUIRE(leg.cost == Catch::Approx(120.0));
        REQUIRE(candidates[0].totals.qty == 83);
        REQUIRE(candidates[0].totals.date == "2020-01-02");
    }

    SECTION("Short leg priced at the bid and negated") {
        Strategy s = test::single_leg_strategy(OptionType::PUT, Direction::SELL, 10000.0);
        OptionSnapshot chain("2020-01-02", {test::option_quote("P1", OptionType::PUT, "2020-01-02", 2.0, 2.2)});

        auto candidates = s.filter_entries(chain, empty, "2020-01-02");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].legs[0].order == Order::STO);
        REQUIRE(candidates[0].totals.cost == Catch::Approx(-200.0));
        REQUIRE(candidates[0].totals.qty == 50);
    }

    SECTION("Quotes with a zero price are skipped") {
        Strategy s = test::single_leg_strategy(OptionType::CALL, Direction::BUY, 10000.0);
        OptionSnapshot chain("2020-01-02", {test::option_quote("C1", OptionType::CALL, "2020-01-02", 0.0, 0.0)});
        REQUIRE(s.filter_entries(chain, empty, "2020-01-02").empty());
    }

    SECTION("Unaffordable candidates are dropped") {
        Strategy s = test::single_leg_strategy(OptionType::CALL, Direction::BUY, 100.0);
        OptionSnapshot chain("2020-01-02", {test::option_quote("C1", OptionType::CALL, "2020-01-02", 1.0, 1.2)});
        REQUIRE(s.filter_entries(chain, empty, "2020-01-02").empty());
    }

    SECTION("Held contracts are skipped") {
        Strategy s = test::single_leg_strategy(OptionType::CALL, Direction::BUY, 10000.0);
        backtest::Inventory held({"leg_1"});
        held.add_option(test::one_leg_position("C1", OptionType::CALL, 120.0, 1, "2020-01-01"));
        OptionSnapshot chain("2020-01-02", {
            test::option_quote("C1", OptionType::CALL, "2020-01-02", 1.0, 1.2),
            test::option_quote("C2", OptionType::CALL, "2020-01-02", 0.5, 0.6, 110.0)});

        auto candidates = s.filter_entries(chain, held, "2020-01-02");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].legs[0].contract == "C2");
    }

    SECTION("Legs are paired row by row") {
        Strategy s(schema, 10000.0, 100);
        StrategyLeg short_put("short_put", schema, OptionType::PUT, Direction::SELL);
        short_put.set_entry_filter(schema.number("strike") == 105.0);
        StrategyLeg long_put("long_put", schema, OptionType::PUT, Direction::BUY);
        long_put.set_entry_filter(schema.number("strike") == 95.0);
        s.add_legs({short_put, long_put});

        OptionSnapshot chain("2020-01-02", {
            test::option_quote("P105", OptionType::PUT, "2020-01-02", 3.0, 3.2, 105.0),
            test::option_quote("P95", OptionType::PUT, "2020-01-02", 1.0, 1.2, 95.0),
            test::option_quote("C105", OptionType::CALL, "2020-01-02", 2.0, 2.2, 105.0)});

        backtest::Inventory two_legs({"short_put", "long_put"});
        auto candidates = s.filter_entries(chain, two_legs, "2020-01-02");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].legs[0].contract == "P105");
        REQUIRE(candidates[0].legs[1].contract == "P95");
        // credit 300 against debit 120
        REQUIRE(candidates[0].totals.cost == Catch::Approx(-180.0));
        REQUIRE(candidates[0].totals.qty == 55);
    }

    SECTION("A leg with no match yields nothing") {
        Strategy s(schema, 10000.0, 100);
        s.add_leg(StrategyLeg("leg_1", schema, OptionType::CALL, Direction::BUY));
        s.add_leg(StrategyLeg("leg_2", schema, OptionType::PUT, Direction::BUY));
        OptionSnapshot chain("2020-01-02", {test::option_quote("C1", OptionType::CALL, "2020-01-02", 1.0, 1.2)});
        backtest::Inventory inv({"leg_1", "leg_2"});
        REQUIRE(s.filter_entries(chain, inv, "2020-01-02").empty());
    }
}

TEST_CASE("Exit signals", "[Strategy]") {
    Schema schema = Schema::options();
    Strategy s(schema, 10000.0, 100);
    StrategyLeg leg("leg_1", schema, OptionType::CALL, Direction::BUY);
    leg.set_exit_filter(schema.number("dte") <= 30.0);
    s.add_leg(leg);

    backtest::Inventory inv({"leg_1"});
    inv.add_option(test::one_leg_position("NEAR", OptionType::CALL, 100.0, 2, "2020-01-02"));
    inv.add_option(test::one_leg_position("FAR", OptionType::CALL, 100.0, 3, "2020-01-02"));

    OptionSnapshot chain("2020-05-20", {
        test::option_quote("NEAR", OptionType::CALL, "2020-05-20", 1.1, 1.3, 100.0, "2020-06-19", 30),
        test::option_quote("FAR", OptionType::CALL, "2020-05-20", 1.2, 1.4, 100.0, "2020-08-21", 93)});

    SECTION("Exit filter") {
        ExitSignals signals = s.filter_exits(chain, inv, "2020-05-20");
        REQUIRE(signals.mask == std::vector<bool>{true, false});
        REQUIRE(signals.exits.size() == 1);
        REQUIRE(signals.exits[0].legs[0].order == Order::STC);
        REQUIRE(signals.exits[0].totals.cost == Catch::Approx(-110.0));
        REQUIRE(signals.costs[0] == Catch::Approx(-220.0));
    }

    SECTION("Loss threshold") {
        s.set_exit_thresholds(1.0, 0.5);
        OptionSnapshot down("2020-02-03", {
            test::option_quote("NEAR", OptionType::CALL, "2020-02-03", 0.6, 0.7, 100.0, "2020-06-19", 137),
            test::option_quote("FAR", OptionType::CALL, "2020-02-03", 0.4, 0.5, 100.0, "2020-08-21", 200)});
        ExitSignals signals = s.filter_exits(down, inv, "2020-02-03");
        // FAR: (-40 / 100 + 1) * -1 = -0.6
        REQUIRE(signals.mask == std::vector<bool>{false, true});
        REQUIRE(signals.exits[0].legs[0].contract == "FAR");
        REQUIRE(signals.costs[0] == Catch::Approx(-120.0));
    }

    SECTION("Profit threshold on a credit position") {
        Strategy short_put = test::single_leg_strategy(OptionType::PUT, Direction::SELL, 10000.0);
        short_put.set_exit_thresholds(0.5, 1.0);
        backtest::Inventory credit({"leg_1"});
        credit.add_option(test::one_leg_position("P1", OptionType::PUT, -300.0, 1, "2020-01-02", Order::STO));

        OptionSnapshot cheap("2020-02-03", {test::option_quote("P1", OptionType::PUT, "2020-02-03", 0.9, 1.0)});
        ExitSignals signals = short_put.filter_exits(cheap, credit, "2020-02-03");
        REQUIRE(signals.mask == std::vector<bool>{true});
        REQUIRE(signals.exits[0].legs[0].order == Order::BTC);
        REQUIRE(signals.costs[0] == Catch::Approx(100.0));
    }

    SECTION("Missing contracts are not threshold exits") {
        s.set_exit_thresholds(0.1, 0.1);
        OptionSnapshot partial("2020-02-03", {
            test::option_quote("FAR", OptionType::CALL, "2020-02-03", 1.0, 1.1, 100.0, "2020-08-21", 200)});
        ExitSignals signals = s.filter_exits(partial, inv, "2020-02-03");
        REQUIRE(signals.mask == std::vector<bool>{false, false});
        REQUIRE(signals.empty());

        std::vector<bool> missing;
        auto candidates = s.exit_candidates(0, inv, partial, &missing);
        REQUIRE(missing == std::vector<bool>{true, false});
        REQUIRE(candidates[0].cost == 0.0);
        REQUIRE(candidates[0].contract == "NEAR");
        REQUIRE(candidates[1].cost == Catch::Approx(-100.0));
    }

    SECTION("Empty inventory") {
        backtest::Inventory none({"leg_1"});
        ExitSignals signals = s.filter_exits(chain, none, "2020-05-20");
        REQUIRE(signals.mask.empty());
        REQUIRE(signals.empty());
    }

    REQUIRE_THROWS_AS(s.exit_candidates(3, inv, chain), std::invalid_argument);
}

TEST_CASE("Strategy configuration", "[Strategy]") {
    Schema schema = Schema::options();

    SECTION("Duplicate leg names") {
        Strategy s(schema);
        s.add_leg(StrategyLeg("leg_1", schema));
        REQUIRE_THROWS_AS(s.add_leg(StrategyLeg("leg_1", schema, OptionType::PUT)), std::invalid_argument);
        REQUIRE(s.leg_names() == std::vector<std::string>{"leg_1"});
    }

    SECTION("Invalid parameters") {
        REQUIRE_THROWS_AS(Strategy(schema, 1000.0, 0), std::invalid_argument);
        Strategy s(schema);
        REQUIRE_THROWS_AS(s.set_exit_thresholds(-0.1, 0.5), std::invalid_argument);
        REQUIRE_THROWS_AS(s.set_shares_per_contract(-100), std::invalid_argument);
    }

    SECTION("From JSON") {
        nlohmann::json j = {
            {"legs", nlohmann::json::array({
                {{"name", "short_put"}, {"type", "put"}, {"direction", "sell"},
                 {"entry", nlohmann::json::array({{{"field", "dte"}, {"op", ">="}, {"value", 60}}})},
                 {"exit", nlohmann::json::array({{{"field", "dte"}, {"op", "<="}, {"value", 30}}})}},
                {{"type", "call"}}})},
            {"exit_thresholds", {{"profit_pct", 0.5}}}};

        Strategy s = Strategy::from_json(j, schema, 50000.0, 10);
        REQUIRE(s.leg_names() == std::vector<std::string>{"short_put", "leg_2"});
        REQUIRE(s.legs()[0].direction() == Direction::SELL);
        REQUIRE(s.legs()[0].has_exit_filter());
        REQUIRE_FALSE(s.legs()[1].has_exit_filter());
        REQUIRE(s.legs()[1].direction() == Direction::BUY);
        REQUIRE(s.initial_capital() == 50000.0);
        REQUIRE(s.shares_per_contract() == 10);
        REQUIRE(s.exit_thresholds().profit_pct == 0.5);
        REQUIRE(std::isinf(s.exit_thresholds().loss_pct));

        OptionQuote q = test::option_quote("P", OptionType::PUT, "2020-01-02", 1.0, 1.1, 100.0, "2020-06-19", 45);
        REQUIRE_FALSE(s.legs()[0].entry_filter()(q));
        q.dte = 90;
        REQUIRE(s.legs()[0].entry_filter()(q));
    }

    SECTION("From JSON with an unknown direction") {
        nlohmann::json j = {{"legs", nlohmann::json::array({{{"direction", "hold"}}})}};
        REQUIRE_THROWS_AS(Strategy::from_json(j, schema), std::invalid_argument);
    }
}
