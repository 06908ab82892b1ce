/**
 * @file date_bucketer.hpp
 * @brief Normalizes transaction dates into YYYY-MM month keys.
 *
 * Accepts ISO-8601 calendar dates (YYYY-MM-DD) and the compact
 * YYYYMMDD form produced by direct database exports. Anything else,
 * including an absent date, falls back to the current UTC date. The
 * fallback is a known approximation: it keeps malformed records in the
 * aggregate at the cost of placing them in the current month. Every
 * fallback is counted in DateParseStats so callers can surface it.
 */

#ifndef BUDGET_ANALYTICS_DATE_BUCKETER_HPP
#define BUDGET_ANALYTICS_DATE_BUCKETER_HPP

#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace budget
{
    namespace analytics
    {

        /// Month key "YYYY-MM"; lexicographic order equals chronological order
        using MonthKey = std::string;

        /**
         * @struct CalendarDate
         * @brief A validated Gregorian calendar date.
         */
        struct CalendarDate
        {
            int year = 1970;
            int month = 1;
            int day = 1;

            bool operator==(const CalendarDate &other) const
            {
                return year == other.year && month == other.month && day == other.day;
            }
        };

        /**
         * @enum DateFormat
         * @brief How a raw date field was interpreted.
         */
        enum class DateFormat
        {
            ISO,     ///< YYYY-MM-DD
            COMPACT, ///< YYYYMMDD
            FALLBACK ///< Unparseable or absent; current date substituted
        };

        /**
         * @struct BucketedDate
         * @brief Month key plus the format that produced it.
         */
        struct BucketedDate
        {
            MonthKey month;
            DateFormat format;
        };

        /**
         * @struct DateParseStats
         * @brief Per-aggregation counts of how dates were interpreted.
         */
        struct DateParseStats
        {
            size_t iso = 0;
            size_t compact = 0;
            size_t fallback = 0;

            void record(DateFormat format);
            size_t total() const { return iso + compact + fallback; }

            nlohmann::json to_json() const;
        };

        /**
         * @class DateBucketer
         * @brief Maps raw transaction dates to month keys.
         *
         * The fallback date is captured once at construction so that a whole
         * aggregation pass buckets unparseable dates into the same month.
         *
         * Thread safety: immutable after construction.
         */
        class DateBucketer
        {
        public:
            /**
             * @brief Construct using today's UTC date as the fallback.
             */
            DateBucketer();

            /**
             * @brief Construct with a fixed fallback date (for reproducible runs and tests).
             */
            explicit DateBucketer(const CalendarDate &today);

            /**
             * @brief Bucket a raw date field.
             * @param raw Date string, or nullopt when the field is absent.
             * @return Month key and the format that was recognized.
             */
            BucketedDate bucket(const std::optional<std::string> &raw) const;

            /**
             * @brief Bucket a raw date field, discarding the format.
             */
            MonthKey month_key(const std::optional<std::string> &raw) const
            {
                return bucket(raw).month;
            }

            const CalendarDate &today() const { return today_; }

            // ---------------------------------------------------------------
            // Static helpers
            // ---------------------------------------------------------------

            /**
             * @brief Parse a strict YYYY-MM-DD date.
             * @return The date, or nullopt if the string is malformed or the day does not exist.
             */
            static std::optional<CalendarDate> parse_iso(const std::string &raw);

            /**
             * @brief Parse an 8-digit YYYYMMDD date by fixed-width slicing.
             */
            static std::optional<CalendarDate> parse_compact(const std::string &raw);

            /**
             * @brief Format "YYYY-MM" with a zero-padded month.
             */
            static MonthKey format_month(int year, int month);

            static bool is_valid_date(int year, int month, int day);
            static int days_in_month(int year, int month);

            /**
             * @brief Current date in UTC.
             */
            static CalendarDate utc_today();

        private:
            CalendarDate today_;
        };

    } // namespace analytics
} // namespace budget

#endif // BUDGET_ANALYTICS_DATE_BUCKETER_HPP
