#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "analytics/trade_statistics.hpp"
#include "backtest/balance_series.hpp"
#include "backtest/trade_logger.hpp"
#include "test_helpers.hpp"
#include <cmath>

using namespace optsim;
using namespace optsim::analytics;
using optsim::backtest::BalanceRecord;
using optsim::backtest::BalanceSeries;
using optsim::backtest::TradeLogger;

namespace {

BalanceSeries flat_balance(double capital) {
    BalanceSeries b;
    b.seed("2020-01-01", capital);
    BalanceRecord r;
    r.date = "2020-01-02";
    r.total_capital = capital * 1.02;
    b.append(r);
    r.date = "2020-01-03";
    r.total_capital = capital * 1.02 * 0.99;
    b.append(r);
    b.finalize();
    return b;
}

void round_trip(TradeLogger& log, const std::string& contract, double entry, double exit, long qty) {
    log.log_option_trade("2020-01-02", test::one_leg_position(contract, OptionType::CALL, entry, qty, "2020-01-02"));
    log.log_option_trade("2020-02-03", test::one_leg_position(contract, OptionType::CALL, exit, qty, "2020-02-03",
                                                              Order::STC));
}

} // namespace

TEST_CASE("Trade matching", "[TradeStatistics]") {
    TradeLogger log({"leg_1"});
    log.log_option_trade("2020-01-02", test::one_leg_position("A", OptionType::CALL, 100.0, 2, "2020-01-02"));
    log.log_option_trade("2020-01-02", test::one_leg_position("B", OptionType::CALL, 50.0, 1, "2020-01-02"));
    log.log_option_trade("2020-01-10", test::one_leg_position("A", OptionType::CALL, -130.0, 2, "2020-01-10",
                                                              Order::STC));
    // B never exits
    log.log_option_trade("2020-01-20", test::one_leg_position("A", OptionType::CALL, 90.0, 1, "2020-01-20"));
    log.log_option_trade("2020-02-03", test::one_leg_position("A", OptionType::CALL, -60.0, 1, "2020-02-03",
                                                              Order::STC));

    auto matched = TradeStatistics::match_trades(log);
    REQUIRE(matched.size() == 2);
    REQUIRE(matched[0].entry_id == 0);
    REQUIRE(matched[0].exit_id == 2);
    REQUIRE(matched[0].cost == Catch::Approx(200.0 - 260.0));
    REQUIRE(matched[0].exit_date == "2020-01-10");
    REQUIRE(matched[1].entry_id == 3);
    REQUIRE(matched[1].exit_id == 4);
    REQUIRE(matched[1].cost == Catch::Approx(30.0));
}

TEST_CASE("Trade statistics", "[TradeStatistics]") {
    TradeLogger log({"leg_1"});
    BalanceSeries balance = flat_balance(100000.0);

    SECTION("Wins and losses") {
        round_trip(log, "A", 100.0, -150.0, 10); // +500
        round_trip(log, "B", 100.0, -80.0, 10);  // -200
        round_trip(log, "C", 100.0, -120.0, 5);  // +100

        TradeStatistics s = TradeStatistics::compute(log, balance, 100000.0);
        REQUIRE(s.total_trades == 3);
        REQUIRE(s.wins == 2);
        REQUIRE(s.losses == 1);
        REQUIRE(s.win_pct == Catch::Approx(200.0 / 3.0));
        REQUIRE(s.largest_loss == Catch::Approx(200.0));
        REQUIRE(s.profit_factor == Catch::Approx(2.0));
        REQUIRE(s.avg_profit == Catch::Approx(400.0 / 3.0));
        // net option cash 400 on 100000
        REQUIRE(s.total_pl_pct == Catch::Approx(0.4));
        REQUIRE(s.avg_pl_pct == Catch::Approx((0.02 - 0.01) / 2.0 * 100.0));
    }

    SECTION("Only wins gives an infinite profit factor") {
        round_trip(log, "A", 100.0, -150.0, 1);
        TradeStatistics s = TradeStatistics::compute(log, balance, 100000.0);
        REQUIRE(std::isinf(s.profit_factor));
        REQUIRE(s.largest_loss == 0.0);
        REQUIRE(s.to_json()["profit_factor"] == "inf");
    }

    SECTION("No trades") {
        TradeStatistics s = TradeStatistics::compute(log, balance, 100000.0);
        REQUIRE(s.total_trades == 0);
        REQUIRE(s.win_pct == 0.0);
        REQUIRE(s.profit_factor == 0.0);
        REQUIRE(s.avg_profit == 0.0);
        REQUIRE(s.total_pl_pct == 0.0);
    }

    SECTION("Open positions count against total P&L") {
        log.log_option_trade("2020-01-02", test::one_leg_position("A", OptionType::CALL, 250.0, 4, "2020-01-02"));
        TradeStatistics s = TradeStatistics::compute(log, balance, 100000.0);
        REQUIRE(s.total_trades == 0);
        REQUIRE(s.total_pl_pct == Catch::Approx(-1.0));
    }

    SECTION("Invalid initial capital") {
        REQUIRE_THROWS_AS(TradeStatistics::compute(log, balance, 0.0), std::invalid_argument);
    }
}

TEST_CASE("Trade statistics output", "[TradeStatistics]") {
    TradeStatistics s;
    s.total_trades = 4;
    s.wins = 3;
    s.losses = 1;
    s.profit_factor = 3.0;

    nlohmann::json j = s.to_json();
    REQUIRE(j["total_trades"] == 4);
    REQUIRE(j["profit_factor"].get<double>() == 3.0);
    REQUIRE(j.contains("total_pl_pct"));

    std::string text = s.to_string();
    REQUIRE(text.find("Total trades:   4") != std::string::npos);
    REQUIRE(text.find("Profit factor:  3.00") != std::string::npos);
}
