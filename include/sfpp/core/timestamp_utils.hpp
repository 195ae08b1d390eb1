#pragma once

#include "sfpp/core/detail/conversion_utils.hpp"
#include "sfpp/core/exception.hpp"
#include "sfpp/core/extended_types.hpp"
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

namespace sfpp::core::timestamp_utils {

constexpr int64_t NANOS_PER_SECOND = 1'000'000'000;

constexpr int64_t SECONDS_PER_DAY = 86'400;

// TIMESTAMP_TZ offsets travel as minutes + 1440 so they are never negative
constexpr int TZ_OFFSET_BIAS = 1440;

inline int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

/**
 * Splits "seconds[.fraction]" into whole seconds and nanoseconds.
 * The fraction is zero-padded or truncated to 9 digits; a leading minus
 * applies to the whole number, so "-1.5" is 1.5 seconds before epoch.
 * @return (seconds, nanos) with nanos in [0, 1e9)
 */
inline std::pair<int64_t, int64_t> extract_timestamp(std::string_view text,
                                                     const std::string& column = {}) {
    auto fail = [&]() {
        throw DataFormatException("Invalid epoch time value", ERR_INVALID_DATETIME,
                                  column, std::string(text));
    };
    if (text.empty()) fail();

    bool negative = text.front() == '-';
    size_t dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    std::string_view frac = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

    int64_t sec = 0;
    int64_t nsec = 0;
    try {
        sec = detail::parse_int64(whole, column);
        if (!frac.empty()) {
            std::string padded(frac.substr(0, 9));
            padded.append(9 - padded.size(), '0');
            for (char c : padded) {
                if (c < '0' || c > '9') fail();
            }
            nsec = detail::parse_int64(padded, column);
        }
    } catch (const DataFormatException&) {
        fail();
    }

    if (negative && nsec > 0) {
        // -1.25 is -2 seconds + 0.75
        return {sec - 1, NANOS_PER_SECOND - nsec};
    }
    return {sec, nsec};
}

/// Inverse of extract_timestamp: "seconds.fffffffff"
inline std::string epoch_text(int64_t seconds, int64_t nanos) {
    bool negative = seconds < 0;
    uint64_t abs_seconds;
    int64_t frac;
    if (negative && nanos > 0) {
        abs_seconds = static_cast<uint64_t>(-(seconds + 1));
        frac = NANOS_PER_SECOND - nanos;
    } else if (negative) {
        abs_seconds = static_cast<uint64_t>(0) - static_cast<uint64_t>(seconds);
        frac = 0;
    } else {
        abs_seconds = static_cast<uint64_t>(seconds);
        frac = nanos;
    }
    char buf[48];
    std::snprintf(buf, sizeof buf, "%s%llu.%09lld", negative ? "-" : "",
                  static_cast<unsigned long long>(abs_seconds), static_cast<long long>(frac));
    return buf;
}

/**
 * Converts DATE days since epoch to midnight UTC of that day
 */
inline Timestamp decode_date(int64_t days) {
    return Timestamp(days * SECONDS_PER_DAY, 0, Location::utc());
}

/**
 * Days since epoch of the timestamp's calendar day in its own location
 */
inline int64_t encode_date_days(const Timestamp& ts) {
    return floor_div(ts.unixSeconds() + ts.offsetSeconds(), SECONDS_PER_DAY);
}

/**
 * Converts a scaled TIME integer (units of 10^-scale s) to time of day
 */
inline TimeOfDay decode_time(int64_t raw, int scale, const std::string& column = {}) {
    if (scale < 0 || scale > 9) {
        throw DataFormatException("Unsupported TIME scale " + std::to_string(scale),
                                  ERR_INVALID_DATETIME, column, std::to_string(raw));
    }
    return TimeOfDay(std::chrono::nanoseconds{raw * detail::pow10_i64(9 - scale)});
}

inline TimeOfDay decode_time_text(std::string_view text, const std::string& column = {}) {
    auto [sec, nsec] = extract_timestamp(text, column);
    return TimeOfDay(std::chrono::nanoseconds{sec * NANOS_PER_SECOND + nsec});
}

inline std::string encode_time_text(const TimeOfDay& tod) {
    return epoch_text(floor_div(tod.nanos(), NANOS_PER_SECOND),
                      tod.nanos() - floor_div(tod.nanos(), NANOS_PER_SECOND) * NANOS_PER_SECOND);
}

inline Timestamp decode_timestamp_ntz(std::string_view text, const std::string& column = {}) {
    auto [sec, nsec] = extract_timestamp(text, column);
    return Timestamp(sec, nsec, Location::utc());
}

inline Timestamp decode_timestamp_ltz(std::string_view text, const Location& location,
                                      const std::string& column = {}) {
    auto [sec, nsec] = extract_timestamp(text, column);
    return Timestamp(sec, nsec, location);
}

/**
 * Parses "seconds.fraction biased_offset" where the offset is minutes + 1440
 */
inline Timestamp decode_timestamp_tz(std::string_view text, const std::string& column = {}) {
    size_t space = text.find(' ');
    if (space == std::string_view::npos || text.find(' ', space + 1) != std::string_view::npos) {
        throw DataFormatException("Invalid TIMESTAMP_TZ value: expected 2 tokens", ERR_INVALID_TIMESTAMP_TZ,
                                  column, std::string(text));
    }
    int64_t biased = 0;
    try {
        biased = detail::parse_int64(text.substr(space + 1), column);
    } catch (const DataFormatException&) {
        throw DataFormatException("Invalid TIMESTAMP_TZ offset", ERR_INVALID_TIMESTAMP_TZ,
                                  column, std::string(text));
    }
    auto [sec, nsec] = extract_timestamp(text.substr(0, space), column);
    return Timestamp(sec, nsec, Location::fromOffsetMinutes(static_cast<int>(biased - TZ_OFFSET_BIAS)));
}

/// Biased offset token for a TIMESTAMP_TZ value: offset_seconds / 60 + 1440
inline int tz_biased_offset(const Timestamp& ts) {
    return ts.offsetSeconds() / 60 + TZ_OFFSET_BIAS;
}

inline std::string encode_timestamp_text(const Timestamp& ts) {
    return epoch_text(ts.unixSeconds(), ts.nanosecond());
}

inline std::string encode_timestamp_tz_text(const Timestamp& ts) {
    return encode_timestamp_text(ts) + " " + std::to_string(tz_biased_offset(ts));
}

/// Whole seconds of a value scaled by 10^scale
inline int64_t extract_epoch(int64_t value, int scale) {
    return value / detail::pow10_i64(scale);
}

/// Nanosecond part of a value scaled by 10^scale (sign follows value)
inline int64_t extract_fraction(int64_t value, int scale) {
    return (value % detail::pow10_i64(scale)) * detail::pow10_i64(9 - scale);
}

inline Timestamp timestamp_from_scaled(int64_t value, int scale, const Location& location) {
    return Timestamp(extract_epoch(value, scale), extract_fraction(value, scale), location);
}

/**
 * Epoch nanoseconds, failing if the value is outside the int64 range
 */
inline int64_t unix_nanos_or_throw(const Timestamp& ts, const std::string& column = {}) {
    auto nanos = ts.unixNanos();
    if (!nanos) {
        throw TimestampPrecisionException(
            "Cannot represent " + ts.toString() + " as epoch nanoseconds", column);
    }
    return *nanos;
}

/// Bind form of DATE: milliseconds of the wall clock reading
inline int64_t date_bind_millis(const Timestamp& ts) {
    return (ts.unixSeconds() + ts.offsetSeconds()) * 1000;
}

/// Nanoseconds since midnight of the wall clock reading
inline int64_t time_of_day_nanos(const Timestamp& ts) {
    CivilTime c = ts.civil();
    return (c.hour * 3600LL + c.minute * 60LL + c.second) * NANOS_PER_SECOND + c.nanosecond;
}

/**
 * "YYYY-MM-DD HH:MM:SS[.fraction]" with trailing fraction zeros removed
 */
inline std::string format_stream_timestamp(const Timestamp& ts) {
    CivilTime c = ts.civil();
    char buf[64];
    std::snprintf(buf, sizeof buf, "%04d-%02u-%02u %02d:%02d:%02d",
                  c.year, c.month, c.day, c.hour, c.minute, c.second);
    std::string out = buf;
    if (c.nanosecond > 0) {
        std::snprintf(buf, sizeof buf, "%09lld", static_cast<long long>(c.nanosecond));
        std::string frac = buf;
        frac.erase(frac.find_last_not_of('0') + 1);
        out += "." + frac;
    }
    return out;
}

/// "HH:MM:SS" or "HH:MM:SS.fffffffff"
inline std::string format_stream_time(int hour, int minute, int second, int64_t nanos, bool withFraction) {
    char buf[32];
    if (withFraction) {
        std::snprintf(buf, sizeof buf, "%02d:%02d:%02d.%09lld",
                      hour, minute, second, static_cast<long long>(nanos));
    } else {
        std::snprintf(buf, sizeof buf, "%02d:%02d:%02d", hour, minute, second);
    }
    return buf;
}

} // namespace sfpp::core::timestamp_utils
