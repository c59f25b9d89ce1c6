/**
 * @file dates.hpp
 * @brief ISO date (YYYY-MM-DD) helpers on the proleptic Gregorian calendar
 *
 * Day arithmetic is done on day counts, independent of the local time zone.
 */

#pragma once

#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace portsim
{
    namespace dates
    {

        struct CivilDate
        {
            int year = 1970;
            int month = 1;
            int day = 1;
        };

        /// True if s has the shape YYYY-MM-DD with a valid month and day.
        inline bool is_valid(const std::string &s)
        {
            if (s.size() != 10 || s[4] != '-' || s[7] != '-')
                return false;
            for (size_t i = 0; i < s.size(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(s[i])))
                    return false;
            }
            const int year = std::stoi(s.substr(0, 4));
            const int month = std::stoi(s.substr(5, 2));
            const int day = std::stoi(s.substr(8, 2));
            if (month < 1 || month > 12 || day < 1)
                return false;
            static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            return day <= days_in_month[month - 1] + (month == 2 && leap ? 1 : 0);
        }

        /**
         * @throws std::invalid_argument if s is not a YYYY-MM-DD date
         */
        inline CivilDate parse(const std::string &s)
        {
            if (!is_valid(s))
            {
                throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: '" + s + "'");
            }
            return CivilDate{std::stoi(s.substr(0, 4)), std::stoi(s.substr(5, 2)), std::stoi(s.substr(8, 2))};
        }

        inline std::string format(const CivilDate &d)
        {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", d.year, d.month, d.day);
            return std::string(buffer);
        }

        /// Days since 1970-01-01.
        inline long long days_from_civil(const CivilDate &d)
        {
            long long y = d.year - (d.month <= 2 ? 1 : 0);
            const long long m = d.month;
            const long long era = (y >= 0 ? y : y - 399) / 400;
            const long long yoe = y - era * 400;
            const long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d.day - 1;
            const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + doe - 719468;
        }

        inline CivilDate civil_from_days(long long z)
        {
            z += 719468;
            const long long era = (z >= 0 ? z : z - 146096) / 146097;
            const long long doe = z - era * 146097;
            const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
            const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
            const long long mp = (5 * doy + 2) / 153;
            const int day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
            const int month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
            const int year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
            return CivilDate{year, month, day};
        }

        inline long long days_since_epoch(const std::string &s)
        {
            return days_from_civil(parse(s));
        }

        inline std::string add_days(const std::string &s, long long offset)
        {
            return format(civil_from_days(days_since_epoch(s) + offset));
        }

        /// 0 = Monday ... 6 = Sunday.
        inline int day_of_week(const std::string &s)
        {
            const long long days = days_since_epoch(s);
            // 1970-01-01 was a Thursday
            const long long w = (days + 3) % 7;
            return static_cast<int>(w < 0 ? w + 7 : w);
        }

        /// Monday-aligned week number.
        inline long long week_index(const std::string &s)
        {
            const long long days = days_since_epoch(s) + 3;
            return days >= 0 ? days / 7 : (days - 6) / 7;
        }

    } // namespace dates
} // namespace portsim
