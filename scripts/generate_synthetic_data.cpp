/**
 * @file generate_synthetic_data.cpp
 * @brief Generate synthetic stock quotes and a matching option chain for optsim
 */

#include "data/data_loader.hpp"
#include "data/date_utils.hpp"
#include "data/market_data.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace optsim;

namespace {

double normal_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

// Black-Scholes value of a European option, years to expiry t
double black_scholes(OptionType type, double spot, double strike, double t,
                     double rate, double vol) {
    if (t <= 0.0) {
        return type == OptionType::CALL ? std::max(spot - strike, 0.0)
                                        : std::max(strike - spot, 0.0);
    }
    double sqrt_t = std::sqrt(t);
    double d1 = (std::log(spot / strike) + (rate + 0.5 * vol * vol) * t) / (vol * sqrt_t);
    double d2 = d1 - vol * sqrt_t;
    double discount = std::exp(-rate * t);
    if (type == OptionType::CALL) {
        return spot * normal_cdf(d1) - strike * discount * normal_cdf(d2);
    }
    return strike * discount * normal_cdf(-d2) - spot * normal_cdf(-d1);
}

// Third Friday of the month
std::string monthly_expiration(int year, int month) {
    std::string first = date_utils::make_date(year, month, 1);
    int offset = (4 - date_utils::day_of_week(first) + 7) % 7;
    return date_utils::add_days(first, offset + 14);
}

std::string contract_symbol(const std::string& underlying, const std::string& expiration,
                            OptionType type, double strike) {
    // OCC style: root + YYMMDD + C/P + strike * 1000 padded to 8 digits
    std::string yymmdd = expiration.substr(2, 2) + expiration.substr(5, 2) + expiration.substr(8, 2);
    char strike_part[16];
    std::snprintf(strike_part, sizeof(strike_part), "%08ld",
                  static_cast<long>(std::lround(strike * 1000.0)));
    return underlying + yymmdd + (type == OptionType::CALL ? "C" : "P") + strike_part;
}

double round_cents(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "\n=== Synthetic Data Generator ===\n" << std::endl;

    std::string output_dir = "data";
    int num_days = 504;
    unsigned int seed = 42;
    std::string start_date = "2022-01-03";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--output-dir" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--days" && i + 1 < argc) {
            num_days = std::stoi(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [OPTIONS]\n"
                      << "Options:\n"
                      << "  --output-dir DIR   Output directory (default: data)\n"
                      << "  --days N           Number of trading days (default: 504)\n"
                      << "  --seed S           Random seed (default: 42)\n"
                      << "  --help             Show this help\n";
            return 0;
        } else {
            std::cerr << "Warning: Unknown argument: " << arg << std::endl;
        }
    }

    if (num_days < 2) {
        std::cerr << "Error: Expected at least 2 for parameter 'days', got: " << num_days << std::endl;
        return 1;
    }

    // Stocks: the option underlying plus a low-volatility bond fund
    struct Asset {
        std::string symbol;
        double start_price;
        double drift;
        double volatility;
    };
    std::vector<Asset> assets = {
        {"SPY", 450.0, 0.0003, 0.012},
        {"AGG", 100.0, 0.0001, 0.003},
    };

    const double rate = 0.02;
    const double implied_vol = 0.20;
    const double strike_step = 5.0;
    const int strikes_each_side = 8;
    const int expirations_ahead = 3;

    std::mt19937 gen(seed);
    std::normal_distribution<double> shock(0.0, 1.0);

    // Weekday calendar
    std::vector<std::string> dates;
    std::string date = start_date;
    while (static_cast<int>(dates.size()) < num_days) {
        if (date_utils::day_of_week(date) < 5) {
            dates.push_back(date);
        }
        date = date_utils::add_days(date, 1);
    }

    std::cout << "Generating " << dates.size() << " trading days from " << dates.front()
              << " to " << dates.back() << " (seed " << seed << ")" << std::endl;

    StocksData stocks;
    OptionsData options;

    std::vector<double> prices;
    for (const auto& a : assets) {
        prices.push_back(a.start_price);
    }

    for (size_t d = 0; d < dates.size(); ++d) {
        const std::string& today = dates[d];

        for (size_t j = 0; j < assets.size(); ++j) {
            double open = prices[j];
            if (d > 0) {
                prices[j] *= std::exp(assets[j].drift - 0.5 * assets[j].volatility * assets[j].volatility +
                                      assets[j].volatility * shock(gen));
            }
            double close = prices[j];

            StockQuote q;
            q.symbol = assets[j].symbol;
            q.date = today;
            q.open = open;
            q.close = close;
            q.high = std::max(open, close) * (1.0 + 0.25 * assets[j].volatility);
            q.low = std::min(open, close) * (1.0 - 0.25 * assets[j].volatility);
            q.volume = 1.0e6;
            q.adj_close = close;
            stocks.add_quote(q);
        }

        // Option chain on the first asset
        double spot = prices[0];
        double atm = std::round(spot / strike_step) * strike_step;
        int year = date_utils::extract_year(today);
        int month = date_utils::extract_month(today);

        for (int k = 1; k <= expirations_ahead; ++k) {
            int m = month + k;
            int y = year + (m - 1) / 12;
            m = (m - 1) % 12 + 1;
            std::string expiration = monthly_expiration(y, m);
            double t = date_utils::days_between(today, expiration) / 365.0;

            for (int s = -strikes_each_side; s <= strikes_each_side; ++s) {
                double strike = atm + s * strike_step;
                for (OptionType type : {OptionType::CALL, OptionType::PUT}) {
                    double fair = black_scholes(type, spot, strike, t, rate, implied_vol);
                    double spread = std::max(0.05, 0.02 * fair);

                    OptionQuote q;
                    q.underlying = assets[0].symbol;
                    q.underlying_last = round_cents(spot);
                    q.date = today;
                    q.contract = contract_symbol(q.underlying, expiration, type, strike);
                    q.type = type;
                    q.expiration = expiration;
                    q.strike = strike;
                    q.bid = round_cents(std::max(0.0, fair - spread / 2.0));
                    q.ask = round_cents(fair + spread / 2.0);
                    q.last = round_cents(fair);
                    q.volume = 100.0 * (strikes_each_side + 1 - std::abs(s));
                    q.open_interest = 10.0 * q.volume;
                    q.dte = -1;
                    options.add_quote(q);
                }
            }
        }
    }

    std::filesystem::create_directories(output_dir);
    std::string stocks_file = output_dir + "/stocks.csv";
    std::string options_file = output_dir + "/options.csv";

    std::cout << "Saving to " << stocks_file << "..." << std::endl;
    DataLoader::save_stocks_csv(stocks, stocks_file);
    std::cout << "Saving to " << options_file << "..." << std::endl;
    DataLoader::save_options_csv(options, options_file);

    std::cout << "\n=== Generated Data Summary ===\n";
    std::cout << "Stock quotes:  " << stocks.num_rows() << "\n";
    std::cout << "Option quotes: " << options.num_rows() << "\n";
    std::cout << "Final prices: ";
    for (size_t j = 0; j < assets.size(); ++j) {
        std::cout << assets[j].symbol << "=" << std::fixed << std::setprecision(2) << prices[j] << " ";
    }
    std::cout << "\n";

    std::cout << "\nData generation complete.\n" << std::endl;
    std::cout << "You can now run:\n";
    std::cout << "  ./build/bin/optsim --config config/backtest_config.json --verbose\n";
    std::cout << std::endl;

    return 0;
}
