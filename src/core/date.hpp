#pragma once

#include <cstdio>
#include <optional>
#include <string>

namespace lotledger::core {

/// Calendar date without a time component.
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    /// Days since 1970-01-01 (proleptic Gregorian).
    long serial() const {
        int y = year - (month <= 2 ? 1 : 0);
        long era = (y >= 0 ? y : y - 399) / 400;
        long yoe = y - era * 400;
        long mp = (month + 9) % 12;
        long doy = (153 * mp + 2) / 5 + day - 1;
        long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }

    /// DD/MM/YYYY, the format trade files use.
    std::string to_string() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%02d/%02d/%04d", day, month, year);
        return buf;
    }

    std::string to_iso() const {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
        return buf;
    }

    friend bool operator==(const Date& a, const Date& b) {
        return a.year == b.year && a.month == b.month && a.day == b.day;
    }
    friend bool operator!=(const Date& a, const Date& b) { return !(a == b); }
    friend bool operator<(const Date& a, const Date& b) {
        if (a.year != b.year) return a.year < b.year;
        if (a.month != b.month) return a.month < b.month;
        return a.day < b.day;
    }
    friend bool operator>(const Date& a, const Date& b) { return b < a; }
    friend bool operator<=(const Date& a, const Date& b) { return !(b < a); }
    friend bool operator>=(const Date& a, const Date& b) { return !(a < b); }
};

inline bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

inline std::optional<Date> make_date(int year, int month, int day) {
    if (year < 1 || year > 9999) return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    return Date{year, month, day};
}

/// Parse a day/month/year date ("05/01/2023", "5/1/2023", "05-01-2023").
/// Surrounding whitespace is ignored. Returns nullopt for anything else,
/// including dates that do not exist on the calendar.
inline std::optional<Date> parse_dmy(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return std::nullopt;
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string s = text.substr(begin, end - begin + 1);

    int parts[3] = {0, 0, 0};
    int digits[3] = {0, 0, 0};
    int idx = 0;
    char sep = 0;

    for (char c : s) {
        if (c >= '0' && c <= '9') {
            if (digits[idx] >= 4) return std::nullopt;
            parts[idx] = parts[idx] * 10 + (c - '0');
            ++digits[idx];
        } else if (c == '/' || c == '-') {
            if (sep == 0) sep = c;
            if (c != sep || idx == 2 || digits[idx] == 0) return std::nullopt;
            ++idx;
        } else {
            return std::nullopt;
        }
    }

    if (idx != 2) return std::nullopt;
    if (digits[0] > 2 || digits[1] > 2 || digits[2] != 4) return std::nullopt;

    return make_date(parts[2], parts[1], parts[0]);
}

}  // namespace lotledger::core
