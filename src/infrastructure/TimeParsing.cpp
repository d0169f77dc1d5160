/**
 * @file TimeParsing.cpp
 * @brief Implementation of TimeParsing.
 */

#include "infrastructure/TimeParsing.hpp"
#include <cctype>
#include <ctime>

namespace chatstamp::infrastructure {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::time_t TimegmCompat(std::tm* tm) {
#if defined(_WIN32)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

bool ReadDigits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) return false;
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

std::optional<domain::DateSample> TimeParsing::ParseLocal(const std::string& text, const char* format) {
    std::tm tm = {};
    const char* end = strptime(text.c_str(), format, &tm);
    if (end == nullptr || *end != '\0') {
        return std::nullopt;
    }

    const int year = tm.tm_year;
    const int month = tm.tm_mon;
    const int day = tm.tm_mday;

    tm.tm_isdst = -1;
    std::time_t tt = std::mktime(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    if (tm.tm_year != year || tm.tm_mon != month || tm.tm_mday != day) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

std::optional<domain::DateSample> TimeParsing::ParseInternetDateTime(const std::string& text) {
    int year, month, day, hour, minute, second;
    if (!ReadDigits(text, 0, 4, year) || text.size() < 20 || text[4] != '-' ||
        !ReadDigits(text, 5, 2, month) || text[7] != '-' ||
        !ReadDigits(text, 8, 2, day) || text[10] != 'T' ||
        !ReadDigits(text, 11, 2, hour) || text[13] != ':' ||
        !ReadDigits(text, 14, 2, minute) || text[16] != ':' ||
        !ReadDigits(text, 17, 2, second) || text[19] != '.') {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    // Fractional seconds: at least one digit, nanosecond precision kept.
    size_t pos = 20;
    long long nanos = 0;
    int fractionDigits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (fractionDigits < 9) {
            nanos = nanos * 10 + (text[pos] - '0');
            ++fractionDigits;
        }
        ++pos;
    }
    if (pos == 20) return std::nullopt;
    for (int i = fractionDigits; i < 9; ++i) nanos *= 10;

    long offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z') && pos + 1 == text.size()) {
        offsetSeconds = 0;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        int offHours = 0;
        int offMinutes = 0;
        if (!ReadDigits(text, pos + 1, 2, offHours)) return std::nullopt;
        size_t minutePos = pos + 3;
        if (minutePos < text.size() && text[minutePos] == ':') ++minutePos;
        if (!ReadDigits(text, minutePos, 2, offMinutes) || minutePos + 2 != text.size()) return std::nullopt;
        if (offHours > 23 || offMinutes > 59) return std::nullopt;
        offsetSeconds = sign * (offHours * 3600L + offMinutes * 60L);
    } else {
        return std::nullopt;
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t tt = TimegmCompat(&tm);
    if (tt == static_cast<std::time_t>(-1) || tm.tm_mday != day) {
        return std::nullopt;
    }
    tt -= offsetSeconds;

    return std::chrono::system_clock::from_time_t(tt) +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos));
}

std::string TimeParsing::FormatLocal(const domain::DateSample& sample) {
    std::time_t tt = std::chrono::system_clock::to_time_t(sample);
    std::tm tm = ToLocalTime(tt);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace chatstamp::infrastructure
