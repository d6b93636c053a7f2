/**
 * @file quotes.hpp
 * @brief Typed quote rows and per-date snapshots for stocks and options.
 *
 * A snapshot holds every quote for one date and an index built once at
 * construction, so lookups by symbol (stocks) or contract (options) are
 * keyed instead of scanned.
 */

#ifndef OPTSIM_DATA_QUOTES_HPP
#define OPTSIM_DATA_QUOTES_HPP

#include <map>
#include <string>
#include <vector>

namespace optsim
{
    /**
     * @enum OptionType
     * @brief Call or put.
     */
    enum class OptionType
    {
        CALL,
        PUT
    };

    std::string to_string(OptionType type);

    /**
     * @brief Parse "call"/"put" (also "c"/"p", any case).
     * @throws std::invalid_argument On anything else.
     */
    OptionType parse_option_type(const std::string &value);

    struct StockQuote
    {
        std::string symbol;
        std::string date;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        double volume = 0.0;
        double adj_close = 0.0;
    };

    struct OptionQuote
    {
        std::string underlying;
        double underlying_last = 0.0;
        std::string date;
        std::string contract;
        OptionType type = OptionType::CALL;
        std::string expiration;
        double strike = 0.0;
        double bid = 0.0;
        double ask = 0.0;
        double volume = 0.0;
        double open_interest = 0.0;
        double last = 0.0;
        int dte = 0; ///< Calendar days from date to expiration
    };

    /**
     * @class StockSnapshot
     * @brief All stock quotes for a single date, indexed by symbol.
     */
    class StockSnapshot
    {
    public:
        StockSnapshot() = default;
        StockSnapshot(std::string date, std::vector<StockQuote> rows);

        const std::string &date() const { return date_; }
        const std::vector<StockQuote> &rows() const { return rows_; }
        size_t size() const { return rows_.size(); }
        bool empty() const { return rows_.empty(); }

        /**
         * @brief Find the quote for a symbol.
         * @return Pointer to the row, or nullptr when the symbol is absent.
         */
        const StockQuote *find(const std::string &symbol) const;

        /**
         * @brief Adjusted close for a symbol.
         * @throws std::runtime_error If the symbol has no quote on this date.
         */
        double adj_close(const std::string &symbol) const;

    private:
        std::string date_;
        std::vector<StockQuote> rows_;
        std::map<std::string, size_t> symbol_index_;
    };

    /**
     * @class OptionSnapshot
     * @brief One day's option chain, indexed by contract.
     */
    class OptionSnapshot
    {
    public:
        OptionSnapshot() = default;
        OptionSnapshot(std::string date, std::vector<OptionQuote> rows);

        const std::string &date() const { return date_; }
        const std::vector<OptionQuote> &rows() const { return rows_; }
        size_t size() const { return rows_.size(); }
        bool empty() const { return rows_.empty(); }

        /**
         * @brief Find the quote for a contract.
         * @return Pointer to the row, or nullptr when the contract is not in today's chain.
         */
        const OptionQuote *find(const std::string &contract) const;

    private:
        std::string date_;
        std::vector<OptionQuote> rows_;
        std::map<std::string, size_t> contract_index_;
    };

} // namespace optsim

#endif // OPTSIM_DATA_QUOTES_HPP
