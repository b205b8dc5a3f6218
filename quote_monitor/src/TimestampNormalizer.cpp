#include "TimestampNormalizer.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <ctime>
#include <limits>

namespace {

constexpr std::int64_t kMillisThresholdI  = 1000000000000LL;  // 1e12
constexpr std::int64_t kSecondsThresholdI = 1000000000LL;     // 1e9
constexpr double kMaxMicros = 9.2e18;                         // ~INT64_MAX

std::optional<Instant> from_integer(std::int64_t v) {
    if (v > kMillisThresholdI) {
        if (v > std::numeric_limits<std::int64_t>::max() / 1000)
            return std::nullopt;
        return from_epoch_us(v * 1000);
    }
    if (v > kSecondsThresholdI)
        return from_epoch_us(v * 1000000);
    return std::nullopt;
}

std::optional<Instant> from_floating(double v) {
    if (!std::isfinite(v))
        return std::nullopt;

    double micros = 0.0;
    if (v > TimestampNormalizer::kMillisThreshold)
        micros = v * 1000.0;
    else if (v > TimestampNormalizer::kSecondsThreshold)
        micros = v * 1000000.0;
    else
        return std::nullopt;

    if (micros >= kMaxMicros)
        return std::nullopt;
    return from_epoch_us(static_cast<std::int64_t>(std::llround(micros)));
}

bool read_digits(const std::string& s, std::size_t& pos, int width, int& out) {
    if (pos + static_cast<std::size_t>(width) > s.size())
        return false;
    int v = 0;
    for (int i = 0; i < width; ++i) {
        const char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
        v = v * 10 + (c - '0');
    }
    pos += width;
    out = v;
    return true;
}

bool expect_char(const std::string& s, std::size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c)
        return false;
    ++pos;
    return true;
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string trim_copy(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

std::optional<Instant> TimestampNormalizer::parse_iso8601(const std::string& text) {
    const std::string s = trim_copy(text);
    std::size_t pos = 0;

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(s, pos, 4, year))   return std::nullopt;
    if (!expect_char(s, pos, '-'))       return std::nullopt;
    if (!read_digits(s, pos, 2, month))  return std::nullopt;
    if (!expect_char(s, pos, '-'))       return std::nullopt;
    if (!read_digits(s, pos, 2, day))    return std::nullopt;

    if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' '))
        return std::nullopt;
    ++pos;

    if (!read_digits(s, pos, 2, hour))   return std::nullopt;
    if (!expect_char(s, pos, ':'))       return std::nullopt;
    if (!read_digits(s, pos, 2, minute)) return std::nullopt;

    // seconds are optional: "2023-07-22T07:26"
    bool has_seconds = false;
    if (pos < s.size() && s[pos] == ':') {
        ++pos;
        if (!read_digits(s, pos, 2, second)) return std::nullopt;
        has_seconds = true;
    }

    if (month < 1 || month > 12)                     return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 60)     return std::nullopt;

    // ---- fraction: keep microseconds, ignore finer digits ----
    std::int64_t micros = 0;
    if (has_seconds && pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (s[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0)
            return std::nullopt;
        for (int i = digits; i < 6; ++i) micros *= 10;
    }

    // ---- zone designator ----
    std::int64_t offset_sec = 0;
    bool has_zone = false;
    if (pos < s.size()) {
        has_zone = true;
        const char z = s[pos];
        if (z == 'Z' || z == 'z') {
            ++pos;
        } else if (z == '+' || z == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!read_digits(s, pos, 2, oh))
                return std::nullopt;
            if (pos < s.size() && s[pos] == ':')
                ++pos;
            if (!read_digits(s, pos, 2, om))
                return std::nullopt;
            if (oh > 23 || om > 59)
                return std::nullopt;
            offset_sec = (oh * 3600 + om * 60) * (z == '-' ? -1 : 1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != s.size())
        return std::nullopt;

    if (!has_zone) {
        // Zone-naive wall time is local time (ALOR sends Moscow time)
        std::tm tm{};
        tm.tm_year  = year - 1900;
        tm.tm_mon   = month - 1;
        tm.tm_mday  = day;
        tm.tm_hour  = hour;
        tm.tm_min   = minute;
        tm.tm_sec   = second;
        tm.tm_isdst = -1;
        const std::time_t local = std::mktime(&tm);
        if (local == static_cast<std::time_t>(-1))
            return std::nullopt;
        return from_epoch_us(static_cast<std::int64_t>(local) * 1000000 + micros);
    }

    const std::int64_t days = days_from_civil(year, month, day);
    const std::int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_sec;
    return from_epoch_us(secs * 1000000 + micros);
}

TimestampEncoding TimestampNormalizer::detect_encoding(const RawTimestamp& raw) {
    if (const auto* i = std::get_if<std::int64_t>(&raw)) {
        if (*i > kMillisThresholdI)  return TimestampEncoding::EpochMilliseconds;
        if (*i > kSecondsThresholdI) return TimestampEncoding::EpochSeconds;
        return TimestampEncoding::Invalid;
    }
    if (const auto* d = std::get_if<double>(&raw)) {
        if (!std::isfinite(*d))      return TimestampEncoding::Invalid;
        if (*d > kMillisThreshold)   return TimestampEncoding::EpochMilliseconds;
        if (*d > kSecondsThreshold)  return TimestampEncoding::EpochSeconds;
        return TimestampEncoding::Invalid;
    }
    const auto& text = std::get<std::string>(raw);
    return parse_iso8601(text) ? TimestampEncoding::Iso8601 : TimestampEncoding::Invalid;
}

std::optional<Instant> TimestampNormalizer::normalize(const RawTimestamp& raw) {
    if (const auto* i = std::get_if<std::int64_t>(&raw))
        return from_integer(*i);
    if (const auto* d = std::get_if<double>(&raw))
        return from_floating(*d);
    return parse_iso8601(std::get<std::string>(raw));
}

const char* TimestampNormalizer::encoding_name(TimestampEncoding e) {
    switch (e) {
        case TimestampEncoding::EpochMilliseconds: return "epoch_ms";
        case TimestampEncoding::EpochSeconds:      return "epoch_s";
        case TimestampEncoding::Iso8601:           return "iso8601";
        case TimestampEncoding::Invalid:
        default:                                   return "invalid";
    }
}
