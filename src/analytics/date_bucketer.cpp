/**
 * @file date_bucketer.cpp
 * @brief Implementation of DateBucketer
 */

#include "analytics/date_bucketer.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace budget
{
    namespace analytics
    {

        namespace
        {
            bool all_digits(const std::string &s, size_t pos, size_t len)
            {
                for (size_t i = pos; i < pos + len; ++i)
                {
                    if (!std::isdigit(static_cast<unsigned char>(s[i])))
                        return false;
                }
                return true;
            }

            int to_int(const std::string &s, size_t pos, size_t len)
            {
                int value = 0;
                for (size_t i = pos; i < pos + len; ++i)
                {
                    value = value * 10 + (s[i] - '0');
                }
                return value;
            }
        } // anonymous namespace

        // ===================================================================
        // DateParseStats
        // ===================================================================

        void DateParseStats::record(DateFormat format)
        {
            switch (format)
            {
            case DateFormat::ISO:
                ++iso;
                break;
            case DateFormat::COMPACT:
                ++compact;
                break;
            case DateFormat::FALLBACK:
                ++fallback;
                break;
            }
        }

        nlohmann::json DateParseStats::to_json() const
        {
            return nlohmann::json{
                {"iso", iso},
                {"compact", compact},
                {"fallback", fallback}};
        }

        // ===================================================================
        // Constructors
        // ===================================================================

        DateBucketer::DateBucketer() : today_(utc_today())
        {
        }

        DateBucketer::DateBucketer(const CalendarDate &today) : today_(today)
        {
        }

        // ===================================================================
        // Bucketing
        // ===================================================================

        BucketedDate DateBucketer::bucket(const std::optional<std::string> &raw) const
        {
            if (raw)
            {
                if (auto iso = parse_iso(*raw))
                {
                    return {format_month(iso->year, iso->month), DateFormat::ISO};
                }
                if (auto compact = parse_compact(*raw))
                {
                    return {format_month(compact->year, compact->month), DateFormat::COMPACT};
                }
            }
            return {format_month(today_.year, today_.month), DateFormat::FALLBACK};
        }

        // ===================================================================
        // Static helpers
        // ===================================================================

        std::optional<CalendarDate> DateBucketer::parse_iso(const std::string &raw)
        {
            if (raw.size() != 10 || raw[4] != '-' || raw[7] != '-')
                return std::nullopt;
            if (!all_digits(raw, 0, 4) || !all_digits(raw, 5, 2) || !all_digits(raw, 8, 2))
                return std::nullopt;

            CalendarDate date{to_int(raw, 0, 4), to_int(raw, 5, 2), to_int(raw, 8, 2)};
            if (!is_valid_date(date.year, date.month, date.day))
                return std::nullopt;
            return date;
        }

        std::optional<CalendarDate> DateBucketer::parse_compact(const std::string &raw)
        {
            if (raw.size() != 8 || !all_digits(raw, 0, 8))
                return std::nullopt;

            CalendarDate date{to_int(raw, 0, 4), to_int(raw, 4, 2), to_int(raw, 6, 2)};
            if (!is_valid_date(date.year, date.month, date.day))
                return std::nullopt;
            return date;
        }

        MonthKey DateBucketer::format_month(int year, int month)
        {
            char buffer[16];
            std::snprintf(buffer, sizeof(buffer), "%04d-%02d", year, month);
            return MonthKey(buffer);
        }

        int DateBucketer::days_in_month(int year, int month)
        {
            static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            if (month == 2)
            {
                bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
                return leap ? 29 : 28;
            }
            return DAYS[month - 1];
        }

        bool DateBucketer::is_valid_date(int year, int month, int day)
        {
            if (year < 1 || month < 1 || month > 12 || day < 1)
                return false;
            return day <= days_in_month(year, month);
        }

        CalendarDate DateBucketer::utc_today()
        {
            std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc{};
            gmtime_r(&now, &utc);
            return CalendarDate{utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday};
        }

    } // namespace analytics
} // namespace budget
