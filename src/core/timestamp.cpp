#include "core/timestamp.h"
#include "core/errors.h"

#include <cstdio>
#include <cstring>
#include <string>

namespace heatcast {

namespace {

const char* const kMonths[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

const char* const kWeekdays[] = {
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"
};

int monthIndex(const char* name) {
    for (int i = 0; i < 12; ++i) {
        if (std::strcmp(name, kMonths[i]) == 0) return i + 1;
    }
    return 0;
}

int weekdayIndex(const char* name) {
    for (int i = 0; i < 7; ++i) {
        if (std::strcmp(name, kWeekdays[i]) == 0) return i;
    }
    return -1;
}

/// Exactly n ASCII digits at p, or -1.
int digits(const char* p, int n) {
    int v = 0;
    for (int i = 0; i < n; ++i) {
        if (p[i] < '0' || p[i] > '9') return -1;
        v = v * 10 + (p[i] - '0');
    }
    return v;
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeap(y)) ? 29 : kDays[m - 1];
}

[[noreturn]] void fail(const std::string& text, const char* why) {
    throw TimestampParseError("cannot parse timestamp '" + text + "': " + why);
}

}  // namespace

// Howard Hinnant's days_from_civil: proleptic Gregorian, 1970-01-01 = day 0.
int64_t daysFromCivil(int year, int month, int day) {
    const int64_t y = static_cast<int64_t>(year) - (month <= 2 ? 1 : 0);
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t mp = (month + 9) % 12;
    const int64_t doy = (153 * mp + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civilFromDays(int64_t days, int& year, int& month, int& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const int64_t doe = days - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

int64_t parseCreatedAt(const std::string& text) {
    // Fixed layout, 30 bytes: "Www Mmm DD HH:MM:SS +HHMM YYYY"
    if (text.size() != 30)
        fail(text, "expected 'Www Mmm DD HH:MM:SS +HHMM YYYY'");
    const char* p = text.c_str();
    if (p[3] != ' ' || p[7] != ' ' || p[10] != ' ' || p[19] != ' ' || p[25] != ' ' ||
        p[13] != ':' || p[16] != ':')
        fail(text, "expected 'Www Mmm DD HH:MM:SS +HHMM YYYY'");

    if (weekdayIndex(std::string(p, 3).c_str()) < 0) fail(text, "unknown weekday");
    const int month = monthIndex(std::string(p + 4, 3).c_str());
    if (month == 0) fail(text, "unknown month");

    const int day   = digits(p + 8, 2);
    const int hh    = digits(p + 11, 2);
    const int mm    = digits(p + 14, 2);
    const int ss    = digits(p + 17, 2);
    const char sign = p[20];
    const int off_h = digits(p + 21, 2);
    const int off_m = digits(p + 23, 2);
    const int year  = digits(p + 26, 4);
    if (day < 0 || hh < 0 || mm < 0 || ss < 0 || off_h < 0 || off_m < 0 || year < 0)
        fail(text, "non-digit in numeric field");

    if (sign != '+' && sign != '-') fail(text, "bad UTC offset sign");
    if (year < 1970) fail(text, "year out of range");
    if (day < 1 || day > daysInMonth(year, month)) fail(text, "day out of range");
    if (hh > 23 || mm > 59 || ss > 60)
        fail(text, "time of day out of range");
    if (off_h > 23 || off_m > 59)
        fail(text, "UTC offset out of range");

    const int64_t offset = (sign == '-' ? -1 : 1) * (off_h * 3600 + off_m * 60);
    return daysFromCivil(year, month, day) * 86400
         + hh * 3600 + mm * 60 + ss
         - offset;
}

std::string formatCreatedAt(int64_t epoch_sec) {
    int64_t days = epoch_sec / 86400;
    int64_t secs = epoch_sec % 86400;
    if (secs < 0) {
        secs += 86400;
        days -= 1;
    }
    int year = 0, month = 0, day = 0;
    civilFromDays(days, year, month, day);
    const int wd = static_cast<int>(((days % 7) + 7 + 4) % 7);  // 1970-01-01 was a Thursday

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%s %s %02d %02d:%02d:%02d +0000 %04d",
                  kWeekdays[wd], kMonths[month - 1], day,
                  static_cast<int>(secs / 3600),
                  static_cast<int>((secs % 3600) / 60),
                  static_cast<int>(secs % 60),
                  year);
    return buf;
}

}  // namespace heatcast
