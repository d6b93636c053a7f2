/*
 * @file market_data.hpp
 * @brief Date-indexed stock and option quote storage.
 *
 * StocksData and OptionsData hold long-format quote rows grouped by date in
 * ascending order. Each exposes per-date snapshots and the list of dates a
 * simulation steps through (daily, or the first trading date of each month).
 */

#ifndef OPTSIM_DATA_MARKET_DATA_HPP
#define OPTSIM_DATA_MARKET_DATA_HPP

#include "data/quotes.hpp"
#include "data/schema.hpp"

#include <map>
#include <string>
#include <vector>

namespace optsim
{

    /**
     * @class StocksData
     * @brief Container for daily stock quotes of several symbols.
     */
    class StocksData
    {
    public:
        explicit StocksData(Schema schema = Schema::stocks());

        /** ===========================================
         *  Data Access Methods
         *  ===========================================
         */

        const Schema &schema() const { return schema_; }

        /**
         * @brief Distinct quote dates in ascending order.
         */
        std::vector<std::string> dates() const;

        size_t num_dates() const { return rows_by_date_.size(); }
        size_t num_rows() const;
        bool empty() const { return rows_by_date_.empty(); }
        bool has_date(const std::string &date) const;

        /**
         * @brief First quote date.
         * @throws std::runtime_error If no quotes are loaded.
         */
        std::string start_date() const;

        /**
         * @brief Last quote date.
         * @throws std::runtime_error If no quotes are loaded.
         */
        std::string end_date() const;

        /**
         * @brief All quotes for one date.
         * @return Snapshot, empty when the date has no quotes.
         */
        StockSnapshot snapshot(const std::string &date) const;

        /**
         * @brief Dates to simulate.
         * @param monthly Keep only the first trading date of each month.
         */
        std::vector<std::string> step_dates(bool monthly) const;

        /** ===========================================
         *  Data Modification Methods
         *  ===========================================
         */

        void add_quote(const StockQuote &quote);

        /**
         * @brief Keep only dates inside [start_date, end_date].
         * @param start_date Inclusive lower bound, ignored when empty.
         * @param end_date Inclusive upper bound, ignored when empty.
         */
        StocksData filter_by_date(const std::string &start_date,
                                  const std::string &end_date) const;

        void print_summary() const;

    private:
        Schema schema_;
        std::map<std::string, std::vector<StockQuote>> rows_by_date_; ///< date -> quotes
    };

    /**
     * @class OptionsData
     * @brief Container for daily option chains.
     */
    class OptionsData
    {
    public:
        explicit OptionsData(Schema schema = Schema::options());

        const Schema &schema() const { return schema_; }

        std::vector<std::string> dates() const;

        size_t num_dates() const { return rows_by_date_.size(); }
        size_t num_rows() const;
        bool empty() const { return rows_by_date_.empty(); }
        bool has_date(const std::string &date) const;

        std::string start_date() const;
        std::string end_date() const;

        /**
         * @brief Option chain for one date.
         * @return Snapshot, empty when the date has no quotes.
         */
        OptionSnapshot snapshot(const std::string &date) const;

        std::vector<std::string> step_dates(bool monthly) const;

        /**
         * @brief Append one quote.
         *
         * When dte is negative it is recomputed as the number of calendar
         * days from the quote date to expiration.
         */
        void add_quote(const OptionQuote &quote);

        OptionsData filter_by_date(const std::string &start_date,
                                   const std::string &end_date) const;

        void print_summary() const;

    private:
        Schema schema_;
        std::map<std::string, std::vector<OptionQuote>> rows_by_date_; ///< date -> chain
    };

} // namespace optsim

#endif // OPTSIM_DATA_MARKET_DATA_HPP
