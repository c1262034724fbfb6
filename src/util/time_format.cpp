#include "util/time_format.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace asap::util {

Timestamp truncate_to_micros(Timestamp tp) {
    return std::chrono::time_point_cast<std::chrono::microseconds>(tp);
}

std::string format_iso8601(Timestamp tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count();
    long long secs = micros / 1000000;
    long long frac = micros % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return buf;
}

Timestamp parse_iso8601(const std::string& text) {
    int year, mon, day, hour, min, sec;
    char sep;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
            &year, &mon, &day, &sep, &hour, &min, &sec, &consumed) != 7 ||
        (sep != 'T' && sep != 't' && sep != ' ')) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }
    if (mon < 1 || mon > 12 || day < 1 || day > 31 ||
        hour > 23 || min > 59 || sec > 60) {
        throw std::invalid_argument("Timestamp field out of range: " + text);
    }

    size_t pos = static_cast<size_t>(consumed);

    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            digits++;
            pos++;
        }
        if (digits == 0) {
            throw std::invalid_argument("Empty fraction in timestamp: " + text);
        }
        for (int i = digits; i < 6; i++) micros *= 10;
    }

    long offset_sec = 0;
    if (pos < text.size()) {
        char c = text[pos];
        if (c == 'Z' || c == 'z') {
            pos++;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            int n = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n", &oh, &om, &n) != 2 ||
                oh > 23 || om > 59) {
                throw std::invalid_argument("Invalid UTC offset in timestamp: " + text);
            }
            offset_sec = (oh * 3600L + om * 60L) * (c == '+' ? 1 : -1);
            pos += 1 + static_cast<size_t>(n);
        }
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Trailing characters in timestamp: " + text);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    std::time_t t = timegm(&tm);

    auto since_epoch = std::chrono::seconds(static_cast<long long>(t) - offset_sec) +
                       std::chrono::microseconds(micros);
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(since_epoch));
}

} // namespace asap::util
