#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "data/schema.hpp"
#include "test_helpers.hpp"

using namespace optsim;

TEST_CASE("Filter combinators", "[Schema]") {
    OptionQuote q = test::option_quote("A", OptionType::CALL, "2020-01-02", 1.0, 1.2);

    REQUIRE(Filter::all()(q));
    REQUIRE_FALSE(Filter::none()(q));
    REQUIRE((Filter::all() | Filter::none())(q));
    REQUIRE_FALSE((Filter::all() & Filter::none())(q));
    REQUIRE((~Filter::none())(q));

    REQUIRE(Filter::all().query() == "True");
    REQUIRE((Filter::all() & Filter::none()).query() == "(True) & (False)");
    REQUIRE((~Filter::none()).query() == "!(False)");

    REQUIRE_THROWS_AS(Filter("broken", Filter::Predicate()), std::invalid_argument);
}

TEST_CASE("Numeric fields", "[Schema]") {
    Schema s = Schema::options();
    OptionQuote q = test::option_quote("A", OptionType::CALL, "2020-01-02", 1.0, 1.2, 105.0, "2020-06-19", 90);
    q.underlying_last = 100.0;

    SECTION("Comparisons against values") {
        REQUIRE((s.number("dte") >= 60.0)(q));
        REQUIRE_FALSE((s.number("dte") < 90.0)(q));
        REQUIRE((s.number("dte") == 90.0)(q));
        REQUIRE((s.number("ask") != 1.0)(q));
        REQUIRE((s.number("dte") >= 60.0).query() == "dte >= 60");
    }

    SECTION("Arithmetic") {
        Field moneyness = s.number("underlying_last") * 1.1;
        REQUIRE(moneyness.name() == "underlying_last * 1.1");
        REQUIRE(moneyness(q) == Catch::Approx(110.0));
        REQUIRE((s.number("strike") - 5.0)(q) == 100.0);
        REQUIRE((s.number("bid") + 0.5)(q) == 1.5);
        REQUIRE((s.number("strike") / 2.0)(q) == 52.5);
        REQUIRE_THROWS_AS(s.number("strike") / 0.0, std::invalid_argument);
    }

    SECTION("Comparisons between fields") {
        Filter otm = s.number("strike") > s.number("underlying_last");
        REQUIRE(otm(q));
        REQUIRE(otm.query() == "strike > underlying_last");
        REQUIRE((s.number("strike") <= s.number("underlying_last") * 1.1)(q));
        REQUIRE_FALSE((s.number("bid") >= s.number("ask"))(q));
    }

    SECTION("Field names follow the column mapping") {
        Schema renamed = Schema::options();
        renamed.update({{"dte", "DTE"}});
        REQUIRE((renamed.number("dte") > 1.0).query() == "DTE > 1");
    }

    SECTION("Unknown or non-numeric keys") {
        REQUIRE_THROWS_AS(s.number("missing"), std::invalid_argument);
        REQUIRE_THROWS_AS(s.number("underlying"), std::invalid_argument);
    }
}

TEST_CASE("Text fields", "[Schema]") {
    Schema s = Schema::options();
    OptionQuote q = test::option_quote("A", OptionType::PUT, "2020-01-02", 1.0, 1.2);

    REQUIRE((s.text("underlying") == "X")(q));
    REQUIRE((s.text("type") == "put")(q));
    REQUIRE((s.text("type") != "call")(q));
    REQUIRE((s.text("underlying") == "X").query() == "underlying == 'X'");

    Filter in = s.text("underlying").isin({"SPX", "X"});
    REQUIRE(in(q));
    REQUIRE(in.query() == "underlying in ['SPX', 'X']");
    REQUIRE_FALSE(s.text("underlying").isin({"SPX"})(q));

    REQUIRE_THROWS_AS(s.text("strike"), std::invalid_argument);
}

TEST_CASE("Filters from JSON", "[Schema]") {
    Schema s = Schema::options();
    OptionQuote q = test::option_quote("A", OptionType::CALL, "2020-01-02", 1.0, 1.2, 100.0, "2020-06-19", 75);

    nlohmann::json conditions = nlohmann::json::array({
        {{"field", "underlying"}, {"op", "=="}, {"value", "X"}},
        {{"field", "dte"}, {"op", ">="}, {"value", 60}}});
    Filter f = s.filter_from_json(conditions);
    REQUIRE(f(q));
    REQUIRE(f.query() == "(underlying == 'X') & (dte >= 60)");

    q.dte = 30;
    REQUIRE_FALSE(f(q));

    SECTION("Empty list accepts everything") {
        REQUIRE(s.filter_from_json(nlohmann::json::array())(q));
    }

    SECTION("Malformed conditions") {
        REQUIRE_THROWS_AS(s.filter_from_json(nlohmann::json::object()), std::invalid_argument);
        REQUIRE_THROWS_AS(s.filter_from_json(nlohmann::json::array({
                              {{"field", "dte"}, {"op", "~"}, {"value", 1}}})),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(s.filter_from_json(nlohmann::json::array({
                              {{"field", "underlying"}, {"op", "<"}, {"value", "X"}}})),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(s.filter_from_json(nlohmann::json::array({
                              {{"field", "bogus"}, {"op", "=="}, {"value", 1}}})),
                          std::invalid_argument);
    }
}

TEST_CASE("Schema mappings", "[Schema]") {
    Schema a = Schema::options();
    Schema b = Schema::options();
    REQUIRE(a == b);
    REQUIRE(a["contract"] == "optionroot");
    REQUIRE(a.contains("dte"));
    REQUIRE_FALSE(Schema::stocks().contains("dte"));

    b.update({{"contract", "symbol"}});
    REQUIRE(a != b);
    REQUIRE(b["contract"] == "symbol");

    REQUIRE_THROWS_AS(b.update({{"nope", "x"}}), std::invalid_argument);
    REQUIRE_THROWS_AS(a["nope"], std::invalid_argument);
}
