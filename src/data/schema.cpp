/**
 * @file schema.cpp
 * @brief Implementation of Schema, Field, StringField and Filter
 */

#include "data/schema.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace optsim
{

    namespace
    {
        std::string format_number(double value)
        {
            std::ostringstream ss;
            ss << value;
            return ss.str();
        }

        template <typename Compare>
        Filter compare_value(const Field &field, const std::string &op, double value, Compare cmp)
        {
            Field copy = field;
            return Filter(field.name() + " " + op + " " + format_number(value),
                          [copy, value, cmp](const OptionQuote &q)
                          { return cmp(copy(q), value); });
        }

        template <typename Compare>
        Filter compare_field(const Field &lhs, const std::string &op, const Field &rhs, Compare cmp)
        {
            Field a = lhs;
            Field b = rhs;
            return Filter(lhs.name() + " " + op + " " + rhs.name(),
                          [a, b, cmp](const OptionQuote &q)
                          { return cmp(a(q), b(q)); });
        }

        template <typename Combine>
        Field combine(const Field &field, const std::string &op, double value, Combine fn)
        {
            Field copy = field;
            return Field(field.name() + " " + op + " " + format_number(value),
                         [copy, value, fn](const OptionQuote &q)
                         { return fn(copy(q), value); });
        }
    } // namespace

    // ============================================================================
    // Filter
    // ============================================================================

    Filter::Filter()
        : query_("True"), predicate_([](const OptionQuote &)
                                     { return true; })
    {
    }

    Filter::Filter(std::string query, Predicate predicate)
        : query_(std::move(query)), predicate_(std::move(predicate))
    {
        if (!predicate_)
        {
            throw std::invalid_argument("Filter predicate must be callable");
        }
    }

    Filter Filter::all()
    {
        return Filter();
    }

    Filter Filter::none()
    {
        return Filter("False", [](const OptionQuote &)
                      { return false; });
    }

    Filter Filter::operator&(const Filter &other) const
    {
        Predicate a = predicate_;
        Predicate b = other.predicate_;
        return Filter("(" + query_ + ") & (" + other.query_ + ")",
                      [a, b](const OptionQuote &q)
                      { return a(q) && b(q); });
    }

    Filter Filter::operator|(const Filter &other) const
    {
        Predicate a = predicate_;
        Predicate b = other.predicate_;
        return Filter("(" + query_ + ") | (" + other.query_ + ")",
                      [a, b](const OptionQuote &q)
                      { return a(q) || b(q); });
    }

    Filter Filter::operator~() const
    {
        Predicate a = predicate_;
        return Filter("!(" + query_ + ")", [a](const OptionQuote &q)
                      { return !a(q); });
    }

    // ============================================================================
    // Field
    // ============================================================================

    Field::Field(std::string name, Getter getter)
        : name_(std::move(name)), getter_(std::move(getter))
    {
    }

    Field Field::operator+(double value) const
    {
        return combine(*this, "+", value, [](double a, double b)
                       { return a + b; });
    }

    Field Field::operator-(double value) const
    {
        return combine(*this, "-", value, [](double a, double b)
                       { return a - b; });
    }

    Field Field::operator*(double value) const
    {
        return combine(*this, "*", value, [](double a, double b)
                       { return a * b; });
    }

    Field Field::operator/(double value) const
    {
        if (value == 0.0)
        {
            throw std::invalid_argument("Division of field '" + name_ + "' by zero");
        }
        return combine(*this, "/", value, [](double a, double b)
                       { return a / b; });
    }

    Filter Field::operator==(double value) const
    {
        return compare_value(*this, "==", value, [](double a, double b)
                             { return a == b; });
    }

    Filter Field::operator!=(double value) const
    {
        return compare_value(*this, "!=", value, [](double a, double b)
                             { return a != b; });
    }

    Filter Field::operator<(double value) const
    {
        return compare_value(*this, "<", value, [](double a, double b)
                             { return a < b; });
    }

    Filter Field::operator<=(double value) const
    {
        return compare_value(*this, "<=", value, [](double a, double b)
                             { return a <= b; });
    }

    Filter Field::operator>(double value) const
    {
        return compare_value(*this, ">", value, [](double a, double b)
                             { return a > b; });
    }

    Filter Field::operator>=(double value) const
    {
        return compare_value(*this, ">=", value, [](double a, double b)
                             { return a >= b; });
    }

    Filter Field::operator==(const Field &other) const
    {
        return compare_field(*this, "==", other, [](double a, double b)
                             { return a == b; });
    }

    Filter Field::operator!=(const Field &other) const
    {
        return compare_field(*this, "!=", other, [](double a, double b)
                             { return a != b; });
    }

    Filter Field::operator<(const Field &other) const
    {
        return compare_field(*this, "<", other, [](double a, double b)
                             { return a < b; });
    }

    Filter Field::operator<=(const Field &other) const
    {
        return compare_field(*this, "<=", other, [](double a, double b)
                             { return a <= b; });
    }

    Filter Field::operator>(const Field &other) const
    {
        return compare_field(*this, ">", other, [](double a, double b)
                             { return a > b; });
    }

    Filter Field::operator>=(const Field &other) const
    {
        return compare_field(*this, ">=", other, [](double a, double b)
                             { return a >= b; });
    }

    // ============================================================================
    // StringField
    // ============================================================================

    StringField::StringField(std::string name, Getter getter)
        : name_(std::move(name)), getter_(std::move(getter))
    {
    }

    Filter StringField::operator==(const std::string &value) const
    {
        Getter g = getter_;
        return Filter(name_ + " == '" + value + "'", [g, value](const OptionQuote &q)
                      { return g(q) == value; });
    }

    Filter StringField::operator!=(const std::string &value) const
    {
        Getter g = getter_;
        return Filter(name_ + " != '" + value + "'", [g, value](const OptionQuote &q)
                      { return g(q) != value; });
    }

    Filter StringField::isin(const std::vector<std::string> &values) const
    {
        Getter g = getter_;
        std::string joined;
        for (const auto &v : values)
        {
            joined += (joined.empty() ? "'" : ", '") + v + "'";
        }
        return Filter(name_ + " in [" + joined + "]", [g, values](const OptionQuote &q)
                      { return std::find(values.begin(), values.end(), g(q)) != values.end(); });
    }

    // ============================================================================
    // Schema
    // ============================================================================

    Schema::Schema(std::map<std::string, std::string> mappings)
        : mappings_(std::move(mappings))
    {
    }

    Schema Schema::stocks()
    {
        return Schema({{"symbol", "symbol"},
                       {"date", "date"},
                       {"open", "open"},
                       {"high", "high"},
                       {"low", "low"},
                       {"close", "close"},
                       {"volume", "volume"},
                       {"adjClose", "adjClose"}});
    }

    Schema Schema::options()
    {
        return Schema({{"underlying", "underlying"},
                       {"underlying_last", "underlying_last"},
                       {"date", "quotedate"},
                       {"contract", "optionroot"},
                       {"type", "type"},
                       {"expiration", "expiration"},
                       {"strike", "strike"},
                       {"bid", "bid"},
                       {"ask", "ask"},
                       {"volume", "volume"},
                       {"open_interest", "openinterest"},
                       {"last", "last"},
                       {"dte", "dte"}});
    }

    void Schema::update(const std::map<std::string, std::string> &mappings)
    {
        for (const auto &kv : mappings)
        {
            if (!contains(kv.first))
            {
                throw std::invalid_argument("Unknown schema key: " + kv.first);
            }
            mappings_[kv.first] = kv.second;
        }
    }

    const std::string &Schema::operator[](const std::string &key) const
    {
        auto it = mappings_.find(key);
        if (it == mappings_.end())
        {
            throw std::invalid_argument("Unknown schema key: " + key);
        }
        return it->second;
    }

    bool Schema::contains(const std::string &key) const
    {
        return mappings_.count(key) > 0;
    }

    Field Schema::number(const std::string &key) const
    {
        const std::string &column = (*this)[key];

        Field::Getter getter;
        if (key == "underlying_last")
            getter = [](const OptionQuote &q)
            { return q.underlying_last; };
        else if (key == "strike")
            getter = [](const OptionQuote &q)
            { return q.strike; };
        else if (key == "bid")
            getter = [](const OptionQuote &q)
            { return q.bid; };
        else if (key == "ask")
            getter = [](const OptionQuote &q)
            { return q.ask; };
        else if (key == "volume")
            getter = [](const OptionQuote &q)
            { return q.volume; };
        else if (key == "open_interest")
            getter = [](const OptionQuote &q)
            { return q.open_interest; };
        else if (key == "last")
            getter = [](const OptionQuote &q)
            { return q.last; };
        else if (key == "dte")
            getter = [](const OptionQuote &q)
            { return static_cast<double>(q.dte); };
        else
            throw std::invalid_argument("Schema key is not a numeric option field: " + key);

        return Field(column, getter);
    }

    StringField Schema::text(const std::string &key) const
    {
        const std::string &column = (*this)[key];

        StringField::Getter getter;
        if (key == "underlying")
            getter = [](const OptionQuote &q)
            { return q.underlying; };
        else if (key == "contract")
            getter = [](const OptionQuote &q)
            { return q.contract; };
        else if (key == "type")
            getter = [](const OptionQuote &q)
            { return to_string(q.type); };
        else if (key == "expiration")
            getter = [](const OptionQuote &q)
            { return q.expiration; };
        else if (key == "date")
            getter = [](const OptionQuote &q)
            { return q.date; };
        else
            throw std::invalid_argument("Schema key is not a text option field: " + key);

        return StringField(column, getter);
    }

    Filter Schema::filter_from_json(const nlohmann::json &conditions) const
    {
        Filter result;
        bool first = true;

        if (!conditions.is_array())
        {
            throw std::invalid_argument("Filter conditions must be a JSON array");
        }

        for (const auto &cond : conditions)
        {
            std::string key = cond.at("field").get<std::string>();
            std::string op = cond.at("op").get<std::string>();
            const auto &value = cond.at("value");

            Filter f;
            if (value.is_string())
            {
                StringField field = text(key);
                std::string v = value.get<std::string>();
                if (op == "==")
                    f = field == v;
                else if (op == "!=")
                    f = field != v;
                else
                    throw std::invalid_argument("Expected one of '==','!=' for text condition on '" + key + "', got: " + op);
            }
            else if (value.is_number())
            {
                Field field = number(key);
                double v = value.get<double>();
                if (op == "==")
                    f = field == v;
                else if (op == "!=")
                    f = field != v;
                else if (op == "<")
                    f = field < v;
                else if (op == "<=")
                    f = field <= v;
                else if (op == ">")
                    f = field > v;
                else if (op == ">=")
                    f = field >= v;
                else
                    throw std::invalid_argument("Expected one of '==','!=','<','<=','>','>=' for parameter 'op', got: " + op);
            }
            else
            {
                throw std::invalid_argument("Condition value for '" + key + "' must be a number or a string");
            }

            result = first ? f : (result & f);
            first = false;
        }

        return result;
    }

} // namespace optsim
