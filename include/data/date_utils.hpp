/**
 * @file date_utils.hpp
 * @brief Calendar helpers for YYYY-MM-DD date strings.
 */

#ifndef OPTSIM_DATA_DATE_UTILS_HPP
#define OPTSIM_DATA_DATE_UTILS_HPP

#include <string>
#include <vector>

namespace optsim
{
    namespace date_utils
    {
        int extract_year(const std::string &date);
        int extract_month(const std::string &date);
        int extract_day(const std::string &date);

        /**
         * @brief Day of week for a date.
         * @return 0=Mon ... 6=Sun
         */
        int day_of_week(const std::string &date);

        /**
         * @brief Signed number of calendar days from date1 to date2.
         */
        int days_between(const std::string &date1, const std::string &date2);

        std::string add_days(const std::string &date, int days_offset);

        std::string make_date(int year, int month, int day);

        bool is_valid_date_format(const std::string &date);

        /**
         * @brief Normalize a raw date field to YYYY-MM-DD.
         *
         * Accepts YYYY-MM-DD (optionally followed by a time part) and
         * MM/DD/YYYY.
         *
         * @throws std::runtime_error If the field matches neither format.
         */
        std::string normalize_date(const std::string &raw);

        /**
         * @brief Select the dates a simulation steps through.
         * @param dates Ascending, distinct dates.
         * @param monthly When true, keep only the first date of each calendar month.
         */
        std::vector<std::string> select_step_dates(const std::vector<std::string> &dates,
                                                   bool monthly);

    } // namespace date_utils
} // namespace optsim

#endif // OPTSIM_DATA_DATE_UTILS_HPP
