#include "core/date.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lpi {

namespace {

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return table[m - 1];
}

} // anonymous namespace

long Date::to_days() const {
    // civil-to-days over 400-year eras
    int y = year - (month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    unsigned yoe = static_cast<unsigned>(y - era * 400);
    unsigned mp = static_cast<unsigned>(month + (month > 2 ? -3 : 9));
    unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(day) - 1;
    unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

Date Date::from_days(long z) {
    z += 719468;
    long era = (z >= 0 ? z : z - 146096) / 146097;
    unsigned doe = static_cast<unsigned>(z - era * 146097);
    unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    unsigned mp = (5 * doy + 2) / 153;

    Date d;
    d.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    d.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    d.year = static_cast<int>(yoe) + static_cast<int>(era * 400) + (d.month <= 2 ? 1 : 0);
    return d;
}

int Date::weekday() const {
    // 1970-01-01 was a Thursday (index 3)
    long days = to_days();
    long wd = (days + 3) % 7;
    if (wd < 0) wd += 7;
    return static_cast<int>(wd);
}

std::string Date::to_string() const {
    std::stringstream ss;
    ss << std::setfill('0') << std::setw(4) << year << "-"
       << std::setw(2) << month << "-" << std::setw(2) << day;
    return ss.str();
}

Date parse_iso_date(const std::string& text) {
    // Accept "YYYY-MM-DD" optionally followed by a time part ("T..." or " ...")
    std::string s = text.substr(0, std::min<size_t>(text.size(), 10));
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') {
        throw std::invalid_argument("Invalid ISO date: '" + text + "'");
    }
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            throw std::invalid_argument("Invalid ISO date: '" + text + "'");
        }
    }
    if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        throw std::invalid_argument("Invalid ISO date: '" + text + "'");
    }

    Date d;
    d.year = std::stoi(s.substr(0, 4));
    d.month = std::stoi(s.substr(5, 2));
    d.day = std::stoi(s.substr(8, 2));

    if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > days_in_month(d.year, d.month)) {
        throw std::invalid_argument("Invalid ISO date: '" + text + "'");
    }
    return d;
}

const std::string& weekday_name(int weekday) {
    static const std::array<std::string, 7> names = {
        "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
    };
    return names.at(static_cast<size_t>(weekday));
}

} // namespace lpi
