/**
 * @file test_data_loader.cpp
 * @brief Unit tests for DataLoader and the quote containers
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "data/data_loader.hpp"
#include "data/date_utils.hpp"
#include "data/market_data.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace optsim;
using Catch::Matchers::WithinAbs;

namespace {

std::string write_temp(const std::string& name, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / ("optsim_test_" + name);
    std::ofstream out(path);
    out << contents;
    return path.string();
}

const char* kStocksCsv =
    "symbol,date,open,high,low,close,volume,adjClose\n"
    "SPY,2020-01-02,323.5,324.9,322.5,324.87,59151200,318.2\n"
    "AGG,2020-01-02,112.9,113.0,112.8,112.94,5001000,110.1\n"
    "SPY,2020-01-03,321.2,323.6,321.1,322.41,77709700,315.8\n"
    "\n"
    "AGG,2020-01-03,113.2,113.4,113.1,113.27,4220000,110.4\n";

const char* kOptionsCsv =
    "underlying,underlying_last,optionroot,type,expiration,quotedate,strike,last,bid,ask,volume,openinterest,dte\n"
    "SPY,324.87,SPY200221C00320000,call,2020-02-21,2020-01-02,320,9.1,9.0,9.2,120,4000,50\n"
    "SPY,324.87,SPY200221P00320000,put,2020-02-21,2020-01-02,320,4.1,4.0,4.2,80,3000,\n"
    "SPY,322.41,SPY200221C00320000,call,2020-02-21,2020-01-03,320,7.5,7.4,7.6,95,4100,49\n";

} // namespace

TEST_CASE("Date utilities", "[DataLoader]") {
    REQUIRE(date_utils::normalize_date("2020-01-02") == "2020-01-02");
    REQUIRE(date_utils::normalize_date("2020-01-02 00:00:00") == "2020-01-02");
    REQUIRE(date_utils::normalize_date("1/2/2020") == "2020-01-02");
    REQUIRE(date_utils::normalize_date("12/31/2019") == "2019-12-31");
    REQUIRE_THROWS_AS(date_utils::normalize_date("Jan 2 2020"), std::runtime_error);

    REQUIRE(date_utils::day_of_week("2020-01-06") == 0);
    REQUIRE(date_utils::add_days("2020-03-01", -1) == "2020-02-29");
    REQUIRE(date_utils::select_step_dates({"2020-01-02", "2020-01-03", "2020-02-03"}, true) ==
            std::vector<std::string>{"2020-01-02", "2020-02-03"});
}

TEST_CASE("Parsing helpers", "[DataLoader]") {
    auto tokens = DataLoader::parse_csv_line("a,\"b,c\",d");
    REQUIRE(tokens.size() == 3);
    REQUIRE(tokens[1] == "b,c");

    REQUIRE(DataLoader::trim("  x \r\n") == "x");
    REQUIRE(DataLoader::safe_stod("1.5") == 1.5);
    REQUIRE(std::isnan(DataLoader::safe_stod("")));
    REQUIRE(std::isnan(DataLoader::safe_stod("abc")));
}

TEST_CASE("Load stocks CSV", "[DataLoader]") {
    std::string path = write_temp("stocks.csv", kStocksCsv);

    SECTION("Default schema") {
        StocksData data = DataLoader::load_stocks_csv(path);
        REQUIRE(data.num_dates() == 2);
        REQUIRE(data.num_rows() == 4);
        REQUIRE(data.start_date() == "2020-01-02");
        REQUIRE(data.end_date() == "2020-01-03");

        StockSnapshot snap = data.snapshot("2020-01-03");
        REQUIRE_THAT(snap.adj_close("SPY"), WithinAbs(315.8, 1e-9));
        REQUIRE(snap.find("AGG")->close == 113.27);
        REQUIRE_THROWS_AS(snap.adj_close("QQQ"), std::runtime_error);
    }

    SECTION("Date filter") {
        StocksData data = DataLoader::load_stocks_csv(path).filter_by_date("2020-01-03", "");
        REQUIRE(data.dates() == std::vector<std::string>{"2020-01-03"});
    }

    SECTION("Renamed columns") {
        std::string renamed = write_temp("stocks_renamed.csv",
                                         "Ticker,Date,Adj Close\n"
                                         "SPY,01/02/2020,318.2\n");
        Schema schema = Schema::stocks();
        schema.update({{"symbol", "Ticker"}, {"date", "Date"}, {"adjClose", "Adj Close"}});
        StocksData data = DataLoader::load_stocks_csv(renamed, schema);
        REQUIRE(data.dates() == std::vector<std::string>{"2020-01-02"});
        REQUIRE(data.snapshot("2020-01-02").find("SPY")->open == 0.0);
        REQUIRE(data.schema() == schema);
    }

    SECTION("Missing required column") {
        std::string bad = write_temp("stocks_bad.csv", "symbol,date,close\nSPY,2020-01-02,1.0\n");
        REQUIRE_THROWS_AS(DataLoader::load_stocks_csv(bad), std::runtime_error);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(DataLoader::load_stocks_csv("/nonexistent/stocks.csv"), std::runtime_error);
    }
}

TEST_CASE("Load options CSV", "[DataLoader]") {
    std::string path = write_temp("options.csv", kOptionsCsv);
    OptionsData data = DataLoader::load_options_csv(path);

    REQUIRE(data.num_dates() == 2);
    REQUIRE(data.num_rows() == 3);

    OptionSnapshot chain = data.snapshot("2020-01-02");
    REQUIRE(chain.rows().size() == 2);

    const OptionQuote* call = chain.find("SPY200221C00320000");
    REQUIRE(call != nullptr);
    REQUIRE(call->type == OptionType::CALL);
    REQUIRE(call->bid == 9.0);
    REQUIRE(call->ask == 9.2);
    REQUIRE(call->open_interest == 4000.0);
    REQUIRE(call->dte == 50);

    SECTION("Empty dte is computed from the expiration") {
        const OptionQuote* put = chain.find("SPY200221P00320000");
        REQUIRE(put != nullptr);
        REQUIRE(put->type == OptionType::PUT);
        REQUIRE(put->dte == 50);
    }

    SECTION("Missing dte column") {
        std::string no_dte = write_temp("options_no_dte.csv",
                                        "underlying,underlying_last,optionroot,type,expiration,quotedate,"
                                        "strike,last,bid,ask,volume,openinterest\n"
                                        "SPY,324.87,SPY200117C00320000,c,01/17/2020,01/02/2020,320,5,4.9,5.1,1,1\n");
        OptionsData d = DataLoader::load_options_csv(no_dte);
        REQUIRE(d.snapshot("2020-01-02").rows()[0].dte == 15);
        REQUIRE(d.snapshot("2020-01-02").rows()[0].expiration == "2020-01-17");
    }

    SECTION("Missing required column") {
        std::string bad = write_temp("options_bad.csv", "underlying,quotedate\nSPY,2020-01-02\n");
        REQUIRE_THROWS_AS(DataLoader::load_options_csv(bad), std::runtime_error);
    }

    SECTION("Save and reload") {
        std::string out = (std::filesystem::temp_directory_path() / "optsim_test_options_out.csv").string();
        DataLoader::save_options_csv(data, out);
        OptionsData reloaded = DataLoader::load_options_csv(out);
        REQUIRE(reloaded.num_rows() == 3);
        REQUIRE(reloaded.snapshot("2020-01-03").find("SPY200221C00320000")->bid == 7.4);
    }
}

TEST_CASE("OptionsData container", "[MarketData]") {
    OptionsData data;
    data.add_quote(test::option_quote("C1", OptionType::CALL, "2020-01-02", 1.0, 1.1, 100.0, "2020-01-17", -1));
    data.add_quote(test::option_quote("C1", OptionType::CALL, "2020-02-03", 1.0, 1.1, 100.0, "2020-02-21", 7));

    REQUIRE(data.snapshot("2020-01-02").rows()[0].dte == 15);
    REQUIRE(data.snapshot("2020-02-03").rows()[0].dte == 7);
    REQUIRE(data.snapshot("2020-03-02").rows().empty());
    REQUIRE(data.step_dates(true).size() == 2);

    REQUIRE_THROWS_AS(data.add_quote(test::option_quote("C1", OptionType::CALL, "bad", 1.0, 1.1)),
                      std::runtime_error);
}

TEST_CASE("Load configuration", "[DataLoader]") {
    std::string path = write_temp("config.json", R"({
        "data": {
            "stocks_file": "s.csv",
            "options_file": "o.csv",
            "start_date": "2020-01-01",
            "options_schema": {"date": "Date"}
        },
        "backtest": {"initial_capital": 500000},
        "allocation": {"stocks": 0.9, "options": 0.1},
        "stocks": [{"symbol": "SPY", "percentage": 1.0}]
    })");

    BacktestConfig cfg = DataLoader::load_config(path);
    REQUIRE(cfg.data.stocks_file == "s.csv");
    REQUIRE(cfg.data.options_file == "o.csv");
    REQUIRE(cfg.data.start_date == "2020-01-01");
    REQUIRE(cfg.data.end_date.empty());
    REQUIRE(cfg.data.options_schema["date"] == "Date");
    REQUIRE(cfg.data.stocks_schema == Schema::stocks());
    REQUIRE(cfg.backtest["initial_capital"].get<double>() == 500000.0);
    REQUIRE(cfg.stocks.size() == 1);
    REQUIRE(cfg.strategy.empty());

    SECTION("Loading through the config type") {
        BacktestConfig same = BacktestConfig::load_from_file(path);
        REQUIRE(same.data.stocks_file == cfg.data.stocks_file);
        REQUIRE(same.backtest == cfg.backtest);
        REQUIRE_THROWS_AS(BacktestConfig::load_from_file(path + ".missing"), std::runtime_error);
    }

    SECTION("Unknown schema key") {
        nlohmann::json j = {{"data", {{"stocks_schema", {{"ticker", "T"}}}}}};
        REQUIRE_THROWS_AS(BacktestConfig::from_json(j), std::invalid_argument);
    }

    SECTION("Invalid JSON") {
        std::string bad = write_temp("bad.json", "{ not json");
        REQUIRE_THROWS_AS(DataLoader::load_json(bad), std::runtime_error);
    }
}
