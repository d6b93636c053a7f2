#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "backtest/balance_tracker.hpp"
#include "backtest/execution_engine.hpp"
#include "backtest/simulation_state.hpp"
#include "test_helpers.hpp"

using namespace optsim;
using namespace optsim::backtest;

TEST_CASE("BalanceTracker marks stocks and options", "[BalanceTracker]") {
    Schema schema = Schema::options();
    strategy::Strategy strat(schema, 100000.0, 100);
    strat.add_leg(strategy::StrategyLeg("leg_1", schema, OptionType::CALL, Direction::BUY));

    SimulationState state(100000.0, strat.leg_names());
    state.inventory.add_stock("X", 100.0, 10);
    state.ledger.set_stocks_cash(50.0);
    state.ledger.set_options_cash(400.0);
    state.inventory.add_option(test::one_leg_position("C1", OptionType::CALL, 120.0, 2, "2020-01-02"));

    BalanceTracker tracker(ExecutionEngine(false));
    REQUIRE_FALSE(tracker.execution().stop_if_broke());

    OptionSnapshot chain("2020-01-03", {test::option_quote("C1", OptionType::CALL, "2020-01-03", 1.5, 1.6)});
    const BalanceRecord& r = tracker.update(state, strat, test::stock_snapshot("2020-01-03", {{"X", 105.0}}),
                                            chain, "2020-01-03");

    // long calls marked at bid: 1.5 * 100 * 2
    REQUIRE(r.date == "2020-01-03");
    REQUIRE(r.calls_capital == Catch::Approx(300.0));
    REQUIRE(r.puts_capital == Catch::Approx(0.0));
    REQUIRE(r.option_capital == Catch::Approx(700.0));
    REQUIRE(r.stock_capital == Catch::Approx(1050.0 + 50.0));
    REQUIRE(r.total_capital == Catch::Approx(1800.0));
    REQUIRE(r.total_cash == Catch::Approx(450.0));
    REQUIRE(r.stock_qty == 10);
    REQUIRE(r.options_qty == 2);
    REQUIRE(state.ledger.total_capital() == Catch::Approx(1800.0));
    REQUIRE(state.balance.size() == 1);
}

TEST_CASE("BalanceTracker short legs reduce capital", "[BalanceTracker]") {
    Schema schema = Schema::options();
    strategy::Strategy strat(schema, 100000.0, 100);
    strat.add_leg(strategy::StrategyLeg("leg_1", schema, OptionType::PUT, Direction::SELL));

    SimulationState state(100000.0, strat.leg_names());
    state.ledger.set_options_cash(1000.0);
    state.inventory.add_option(test::one_leg_position("P1", OptionType::PUT, -300.0, 1, "2020-01-02", Order::STO));

    ExecutionEngine engine;
    BalanceTracker tracker(engine);

    // buying back costs the ask
    OptionSnapshot chain("2020-01-03", {test::option_quote("P1", OptionType::PUT, "2020-01-03", 3.9, 4.0)});
    const BalanceRecord& r = tracker.update(state, strat, StockSnapshot("2020-01-03", {}), chain, "2020-01-03");

    REQUIRE(r.puts_capital == Catch::Approx(-400.0));
    REQUIRE(r.calls_capital == Catch::Approx(0.0));
    REQUIRE(r.option_capital == Catch::Approx(600.0));
    REQUIRE(r.total_capital == Catch::Approx(600.0));
}

TEST_CASE("BalanceTracker exits before marking", "[BalanceTracker]") {
    Schema schema = Schema::options();
    strategy::Strategy strat(schema, 100000.0, 100);
    strat.add_leg(strategy::StrategyLeg("leg_1", schema, OptionType::CALL, Direction::BUY));
    strat.set_exit_thresholds(0.5, 0.5);

    SimulationState state(100000.0, strat.leg_names());
    state.ledger.set_options_cash(0.0);
    state.inventory.add_option(test::one_leg_position("C1", OptionType::CALL, 100.0, 1, "2020-01-02"));

    ExecutionEngine engine;
    BalanceTracker tracker(engine);

    // bid 1.6: current cost -160 against entry 100 is a 60% gain
    OptionSnapshot chain("2020-01-03", {test::option_quote("C1", OptionType::CALL, "2020-01-03", 1.6, 1.7)});
    const BalanceRecord& r = tracker.update(state, strat, StockSnapshot("2020-01-03", {}), chain, "2020-01-03");

    REQUIRE(state.inventory.options().empty());
    REQUIRE(state.trade_log.exits().size() == 1);
    REQUIRE(r.calls_capital == 0.0);
    REQUIRE(r.option_capital == Catch::Approx(160.0));
    REQUIRE(r.options_qty == 0);
}

TEST_CASE("BalanceTracker keeps positions missing from the chain", "[BalanceTracker]") {
    auto strat = test::single_leg_strategy(OptionType::CALL, Direction::BUY);
    strat.set_exit_thresholds(0.1, 0.1);

    SimulationState state(100000.0, strat.leg_names());
    state.ledger.set_options_cash(50.0);
    state.inventory.add_option(test::one_leg_position("C1", OptionType::CALL, 100.0, 4, "2020-01-02"));

    ExecutionEngine engine;
    BalanceTracker tracker(engine);

    const BalanceRecord& r = tracker.update(state, strat, StockSnapshot("2020-01-03", {}),
                                            OptionSnapshot("2020-01-03", {}), "2020-01-03");

    // imputed at zero, not a threshold exit
    REQUIRE(state.inventory.options().size() == 1);
    REQUIRE(state.trade_log.exits().empty());
    REQUIRE(r.calls_capital == 0.0);
    REQUIRE(r.total_capital == Catch::Approx(50.0));
    REQUIRE(r.options_qty == 4);
}

TEST_CASE("BalanceSeries derives returns", "[BalanceSeries]") {
    BalanceSeries series;
    series.seed("2020-01-01", 100.0);

    BalanceRecord r;
    const double totals[] = {100.0, 110.0, 99.0, 108.9};
    const char* dates[] = {"2020-01-02", "2020-01-03", "2020-01-06", "2020-01-07"};
    for (int i = 0; i < 4; ++i) {
        r.date = dates[i];
        r.total_capital = totals[i];
        series.append(r);
    }

    REQUIRE_FALSE(series.finalized());
    series.finalize();
    REQUIRE(series.finalized());

    auto pct = series.pct_change();
    auto acc = series.accumulated_return();
    REQUIRE(pct.size() == 5);
    REQUIRE(pct[0] == 0.0);
    REQUIRE(acc[0] == 1.0);
    REQUIRE(pct[1] == Catch::Approx(0.0));
    REQUIRE(pct[2] == Catch::Approx(0.10));
    REQUIRE(pct[3] == Catch::Approx(-0.10));
    REQUIRE(pct[4] == Catch::Approx(0.10));

    double running = 1.0;
    for (Eigen::Index i = 0; i < pct.size(); ++i) {
        running *= 1.0 + pct[i];
        REQUIRE(acc[i] == Catch::Approx(running));
    }
    REQUIRE(acc[4] == Catch::Approx(1.089));

    SECTION("Dates must increase") {
        r.date = "2020-01-07";
        REQUIRE_THROWS_AS(series.append(r), std::invalid_argument);
    }

    SECTION("A zero previous total gives zero change") {
        BalanceSeries s;
        s.seed("2020-01-01", 10.0);
        r.date = "2020-01-02";
        r.total_capital = 0.0;
        s.append(r);
        r.date = "2020-01-03";
        r.total_capital = 5.0;
        s.append(r);
        s.finalize();
        REQUIRE(s.records()[2].pct_change == 0.0);
        REQUIRE(s.records()[2].accumulated_return == 0.0);
    }
}
