#include "data/date_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace optsim
{
    namespace date_utils
    {

        namespace
        {
            std::tm to_tm(const std::string &date)
            {
                std::tm tm = {};
                tm.tm_year = extract_year(date) - 1900;
                tm.tm_mon = extract_month(date) - 1;
                tm.tm_mday = extract_day(date);
                tm.tm_hour = 12;
                return tm;
            }

            bool all_digits(const std::string &s)
            {
                if (s.empty())
                    return false;
                for (char c : s)
                {
                    if (!std::isdigit(static_cast<unsigned char>(c)))
                        return false;
                }
                return true;
            }
        } // namespace

        int extract_year(const std::string &date)
        {
            return std::stoi(date.substr(0, 4));
        }

        int extract_month(const std::string &date)
        {
            return std::stoi(date.substr(5, 2));
        }

        int extract_day(const std::string &date)
        {
            return std::stoi(date.substr(8, 2));
        }

        int day_of_week(const std::string &date)
        {
            std::tm tm = to_tm(date);
            std::mktime(&tm);
            // tm_wday: 0=Sun, 1=Mon ... 6=Sat
            return (tm.tm_wday + 6) % 7;
        }

        int days_between(const std::string &date1, const std::string &date2)
        {
            std::tm tm1 = to_tm(date1);
            std::tm tm2 = to_tm(date2);
            std::time_t t1 = std::mktime(&tm1);
            std::time_t t2 = std::mktime(&tm2);
            if (t1 == (std::time_t)-1 || t2 == (std::time_t)-1)
                return 0;
            double diff = std::difftime(t2, t1);
            return static_cast<int>(std::llround(diff / 86400.0));
        }

        std::string add_days(const std::string &date, int days_offset)
        {
            std::tm tm = to_tm(date);
            tm.tm_mday += days_offset;
            std::mktime(&tm);
            char buffer[11];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &tm);
            return std::string(buffer);
        }

        std::string make_date(int year, int month, int day)
        {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
            return std::string(buffer);
        }

        bool is_valid_date_format(const std::string &date)
        {
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }
            return true;
        }

        std::string normalize_date(const std::string &raw)
        {
            if (raw.size() >= 10 && is_valid_date_format(raw.substr(0, 10)))
                return raw.substr(0, 10);

            // MM/DD/YYYY, possibly with single-digit month or day
            std::string head = raw.substr(0, raw.find(' '));
            size_t first = head.find('/');
            size_t second = head.find('/', first == std::string::npos ? 0 : first + 1);
            if (first != std::string::npos && second != std::string::npos)
            {
                std::string m = head.substr(0, first);
                std::string d = head.substr(first + 1, second - first - 1);
                std::string y = head.substr(second + 1);
                if (all_digits(m) && all_digits(d) && all_digits(y) && y.size() == 4)
                    return make_date(std::stoi(y), std::stoi(m), std::stoi(d));
            }

            throw std::runtime_error("Unrecognized date format: '" + raw + "'");
        }

        std::vector<std::string> select_step_dates(const std::vector<std::string> &dates,
                                                   bool monthly)
        {
            if (!monthly)
                return dates;

            std::vector<std::string> out;
            for (const auto &date : dates)
            {
                if (out.empty() || out.back().substr(0, 7) != date.substr(0, 7))
                    out.push_back(date);
            }
            return out;
        }

    } // namespace date_utils
} // namespace optsim
