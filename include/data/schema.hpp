/**
 * @file schema.hpp
 * @brief Column schemas and filter expressions over option quotes.
 *
 * A Schema maps canonical keys (e.g. "contract", "dte") to the column names
 * of a particular data source. Schemas compare by value so a strategy can
 * check that it was written against the same layout as the data it reads.
 *
 * Fields and Filters are built from a schema and evaluate against typed
 * OptionQuote rows:
 * @code
 *   Schema s = Schema::options();
 *   Filter f = (s.text("underlying") == "SPX") & (s.number("dte") >= 60);
 *   bool keep = f(quote);
 * @endcode
 */

#ifndef OPTSIM_DATA_SCHEMA_HPP
#define OPTSIM_DATA_SCHEMA_HPP

#include "data/quotes.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace optsim
{

    /**
     * @class Filter
     * @brief Named boolean predicate over an option quote.
     */
    class Filter
    {
    public:
        using Predicate = std::function<bool(const OptionQuote &)>;

        /** @brief Filter that accepts every row. */
        Filter();
        Filter(std::string query, Predicate predicate);

        static Filter all();
        static Filter none();

        bool operator()(const OptionQuote &quote) const { return predicate_(quote); }

        /** @brief Human-readable form, e.g. "(type == 'call') & (dte >= 60)". */
        const std::string &query() const { return query_; }

        Filter operator&(const Filter &other) const;
        Filter operator|(const Filter &other) const;
        Filter operator~() const;

    private:
        std::string query_;
        Predicate predicate_;
    };

    /**
     * @class Field
     * @brief Numeric column accessor that supports arithmetic and comparison.
     */
    class Field
    {
    public:
        using Getter = std::function<double(const OptionQuote &)>;

        Field(std::string name, Getter getter);

        const std::string &name() const { return name_; }
        double operator()(const OptionQuote &quote) const { return getter_(quote); }

        Field operator+(double value) const;
        Field operator-(double value) const;
        Field operator*(double value) const;
        Field operator/(double value) const;

        Filter operator==(double value) const;
        Filter operator!=(double value) const;
        Filter operator<(double value) const;
        Filter operator<=(double value) const;
        Filter operator>(double value) const;
        Filter operator>=(double value) const;

        Filter operator==(const Field &other) const;
        Filter operator!=(const Field &other) const;
        Filter operator<(const Field &other) const;
        Filter operator<=(const Field &other) const;
        Filter operator>(const Field &other) const;
        Filter operator>=(const Field &other) const;

    private:
        std::string name_;
        Getter getter_;
    };

    /**
     * @class StringField
     * @brief Text column accessor supporting equality tests.
     */
    class StringField
    {
    public:
        using Getter = std::function<std::string(const OptionQuote &)>;

        StringField(std::string name, Getter getter);

        const std::string &name() const { return name_; }
        std::string operator()(const OptionQuote &quote) const { return getter_(quote); }

        Filter operator==(const std::string &value) const;
        Filter operator!=(const std::string &value) const;
        Filter isin(const std::vector<std::string> &values) const;

    private:
        std::string name_;
        Getter getter_;
    };

    /**
     * @class Schema
     * @brief Mapping from canonical keys to source column names.
     */
    class Schema
    {
    public:
        Schema() = default;
        explicit Schema(std::map<std::string, std::string> mappings);

        /**
         * @brief Default layout of daily stock quotes.
         *
         * Keys: symbol, date, open, high, low, close, volume, adjClose.
         */
        static Schema stocks();

        /**
         * @brief Default layout of historical option chains.
         *
         * Keys: underlying, underlying_last, date, contract, type, expiration,
         * strike, bid, ask, volume, open_interest, last, dte.
         */
        static Schema options();

        /**
         * @brief Override column names for the given keys.
         * @throws std::invalid_argument If a key is not part of this schema.
         */
        void update(const std::map<std::string, std::string> &mappings);

        /**
         * @brief Column name for a canonical key.
         * @throws std::invalid_argument If the key is unknown.
         */
        const std::string &operator[](const std::string &key) const;

        bool contains(const std::string &key) const;
        const std::map<std::string, std::string> &mappings() const { return mappings_; }

        /**
         * @brief Numeric option field for a canonical key.
         * @throws std::invalid_argument If the key is unknown or not numeric.
         */
        Field number(const std::string &key) const;

        /**
         * @brief Text option field for a canonical key.
         * @throws std::invalid_argument If the key is unknown or not textual.
         */
        StringField text(const std::string &key) const;

        /**
         * @brief Build a filter from a JSON condition list.
         *
         * Each condition is {"field": key, "op": "==|!=|<|<=|>|>=", "value": v};
         * conditions are AND-ed. A string value selects a text field.
         */
        Filter filter_from_json(const nlohmann::json &conditions) const;

        bool operator==(const Schema &other) const { return mappings_ == other.mappings_; }
        bool operator!=(const Schema &other) const { return !(*this == other); }

    private:
        std::map<std::string, std::string> mappings_;
    };

} // namespace optsim

#endif // OPTSIM_DATA_SCHEMA_HPP
