/**
 * @file period.cpp
 * @brief Implementation of Date, YearMonth and DateRange
 */

#include "data/period.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace budget {
namespace data {

int days_in_month(int year, int month)
{
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    if (month < 1 || month > 12)
    {
        throw std::invalid_argument("Month must be in 1-12, got: " + std::to_string(month));
    }

    if (month == 2)
    {
        bool leap = (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

// =============================================
// Date
// =============================================

Date::Date(int y, int m, int d)
    : year(y), month(m), day(d)
{
    if (d < 1 || d > days_in_month(y, m))
    {
        throw std::invalid_argument(
            "Invalid day " + std::to_string(d) + " for " +
            std::to_string(y) + "-" + std::to_string(m));
    }
}

Date Date::parse(const std::string& text)
{
    if (text.length() != 10 || text[4] != '-' || text[7] != '-')
    {
        throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: '" + text + "'");
    }

    for (size_t i = 0; i < text.length(); ++i)
    {
        if (i == 4 || i == 7)
            continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i])))
        {
            throw std::invalid_argument("Expected date in YYYY-MM-DD format, got: '" + text + "'");
        }
    }

    int y = std::stoi(text.substr(0, 4));
    int m = std::stoi(text.substr(5, 2));
    int d = std::stoi(text.substr(8, 2));
    return Date(y, m, d);
}

bool Date::is_valid(const std::string& text)
{
    try
    {
        parse(text);
        return true;
    }
    catch (const std::invalid_argument&)
    {
        return false;
    }
}

Date Date::today()
{
    std::time_t now = std::time(nullptr);
    std::tm* local = std::localtime(&now);
    return Date(local->tm_year + 1900, local->tm_mon + 1, local->tm_mday);
}

YearMonth Date::year_month() const
{
    return YearMonth(year, month);
}

std::string Date::to_string() const
{
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << "-"
       << std::setw(2) << month << "-"
       << std::setw(2) << day;
    return ss.str();
}

bool Date::operator==(const Date& other) const
{
    return year == other.year && month == other.month && day == other.day;
}

bool Date::operator<(const Date& other) const
{
    if (year != other.year)
        return year < other.year;
    if (month != other.month)
        return month < other.month;
    return day < other.day;
}

// =============================================
// YearMonth
// =============================================

YearMonth::YearMonth(int y, int m)
    : year(y), month(m)
{
    if (m < 1 || m > 12)
    {
        throw std::invalid_argument("Month must be in 1-12, got: " + std::to_string(m));
    }
}

YearMonth YearMonth::plus_months(int months) const
{
    return from_index(index() + months);
}

YearMonth YearMonth::from_index(int index)
{
    int y = index / 12;
    int m = index % 12;
    if (m < 0)
    {
        m += 12;
        y -= 1;
    }
    return YearMonth(y, m + 1);
}

Date YearMonth::first_day() const
{
    return Date(year, month, 1);
}

Date YearMonth::last_day() const
{
    return Date(year, month, days_in_month(year, month));
}

std::string YearMonth::to_string() const
{
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << month;
    return ss.str();
}

// =============================================
// DateRange
// =============================================

DateRange DateRange::month(const YearMonth& period)
{
    return DateRange{period.first_day(), period.last_day()};
}

DateRange DateRange::trailing_months(const Date& anchor, int months)
{
    if (months < 1)
    {
        throw std::invalid_argument(
            "Trailing window must cover at least 1 month, got: " + std::to_string(months));
    }

    YearMonth first = anchor.year_month().plus_months(-(months - 1));
    return DateRange{first.first_day(), anchor};
}

std::string DateRange::to_string() const
{
    return start.to_string() + " to " + end.to_string();
}

} // namespace data
} // namespace budget
