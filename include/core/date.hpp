#pragma once

#include <string>

namespace lpi {

// Calendar date parsed from "YYYY-MM-DD".
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    // Days since 1970-01-01 (proleptic Gregorian)
    long to_days() const;
    static Date from_days(long days);

    // 0 = Monday ... 6 = Sunday
    int weekday() const;

    std::string to_string() const;

    bool operator<(const Date& other) const { return to_days() < other.to_days(); }
    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
};

/**
 * @brief Parse an ISO-8601 calendar date ("2024-03-18")
 * @throws std::invalid_argument if the text is not a valid date
 */
Date parse_iso_date(const std::string& text);

// "Monday" ... "Sunday"
const std::string& weekday_name(int weekday);

} // namespace lpi
