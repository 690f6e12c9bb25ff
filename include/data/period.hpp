/**
 * @file period.hpp
 * @brief Calendar date and year-month value types.
 *
 * Provides the minimal calendar arithmetic needed by the analytics layer:
 * parsing and validating YYYY-MM-DD dates, stepping across months, and
 * building the date ranges that bound aggregation windows.
 *
 * All types are plain values with no time zone information. A "trailing
 * window" of N months always covers whole calendar months, ending with the
 * month of the anchor date.
 */

#ifndef BUDGET_DATA_PERIOD_HPP
#define BUDGET_DATA_PERIOD_HPP

#include <string>

namespace budget {
namespace data {

struct YearMonth;

/**
 * @brief Number of days in a calendar month (Gregorian rules).
 * @throws std::invalid_argument if month is outside 1-12
 */
int days_in_month(int year, int month);

/**
 * @struct Date
 * @brief Calendar day, ordered chronologically.
 */
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;

    /**
     * @brief Construct and validate a date
     * @throws std::invalid_argument if the day does not exist
     */
    Date(int y, int m, int d);

    /**
     * @brief Parse a YYYY-MM-DD string
     * @throws std::invalid_argument on malformed input
     */
    static Date parse(const std::string& text);

    /**
     * @brief Check YYYY-MM-DD format and calendar validity
     */
    static bool is_valid(const std::string& text);

    /**
     * @brief Current local date
     */
    static Date today();

    YearMonth year_month() const;

    /** @brief Format as YYYY-MM-DD */
    std::string to_string() const;

    bool operator==(const Date& other) const;
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const;
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator>=(const Date& other) const { return !(*this < other); }
};

/**
 * @struct YearMonth
 * @brief Calendar month used as an aggregation bucket.
 */
struct YearMonth {
    int year = 1970;
    int month = 1;

    YearMonth() = default;

    /**
     * @throws std::invalid_argument if month is outside 1-12
     */
    YearMonth(int y, int m);

    /**
     * @brief Shift by a signed number of months
     */
    YearMonth plus_months(int months) const;

    /**
     * @brief Monotonic month counter (year * 12 + month - 1)
     */
    int index() const { return year * 12 + (month - 1); }

    /**
     * @brief Inverse of index()
     */
    static YearMonth from_index(int index);

    Date first_day() const;
    Date last_day() const;

    /** @brief Format as YYYY-MM */
    std::string to_string() const;

    bool operator==(const YearMonth& other) const { return index() == other.index(); }
    bool operator!=(const YearMonth& other) const { return index() != other.index(); }
    bool operator<(const YearMonth& other) const { return index() < other.index(); }
    bool operator<=(const YearMonth& other) const { return index() <= other.index(); }
};

/**
 * @struct DateRange
 * @brief Closed interval [start, end] of calendar days.
 */
struct DateRange {
    Date start;
    Date end;

    bool contains(const Date& date) const { return start <= date && date <= end; }

    /**
     * @brief Whole calendar month
     */
    static DateRange month(const YearMonth& period);

    /**
     * @brief The N calendar months ending with the anchor's month
     *
     * Covers the first day of month (anchor - months + 1) up to and
     * including the anchor date itself.
     *
     * @throws std::invalid_argument if months < 1
     */
    static DateRange trailing_months(const Date& anchor, int months);

    std::string to_string() const;
};

} // namespace data
} // namespace budget

#endif // BUDGET_DATA_PERIOD_HPP
