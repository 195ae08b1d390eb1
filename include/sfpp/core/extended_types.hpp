#pragma once

#include <ttmath/ttmath.h>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sfpp::core {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Arbitrary precision integer for NUMBER(38, 0) and wider
 *
 * 256-bit ttmath integer; the server never sends more than 38 digits.
 */
class BigInt {
public:
    using IntType = ttmath::Int<TTMATH_BITS(256)>;

    BigInt() { value_.SetZero(); }
    explicit BigInt(int64_t value);
    explicit BigInt(const IntType& value) : value_(value) {}

    /**
     * @brief Parse decimal integer text ("-123")
     * @throws DataFormatException on anything but an optional sign and digits
     */
    static BigInt fromString(std::string_view text);

    std::string toString() const;

    /// Value as int64 if it fits
    std::optional<int64_t> toInt64() const;

    bool isNegative() const { return value_.IsSign(); }
    bool isZero() const { return value_.IsZero(); }

    const IntType& raw() const { return value_; }

    /// this * 10^exponent (exponent >= 0); throws on overflow
    BigInt scaledUp(int exponent) const;

    bool operator==(const BigInt& other) const { return value_ == other.value_; }
    bool operator!=(const BigInt& other) const { return !(*this == other); }
    bool operator<(const BigInt& other) const { return value_ < other.value_; }

private:
    IntType value_;
};

/**
 * @brief Exact fixed-point number: unscaled integer and a scale
 *
 * Logical equality ignores representation: 1.50 (150, 2) == 1.5 (15, 1).
 */
class Decimal {
public:
    Decimal() = default;
    Decimal(BigInt unscaled, int scale) : unscaled_(std::move(unscaled)), scale_(scale) {}

    /**
     * @brief Parse decimal text at a given scale
     *
     * Extra fraction digits are truncated, missing ones padded.
     * @throws DataFormatException on malformed text
     */
    static Decimal fromString(std::string_view text, int scale);

    const BigInt& unscaled() const { return unscaled_; }
    int scale() const { return scale_; }

    /// Text with exactly scale() fraction digits ("-0.050")
    std::string toString() const;

    double toDouble() const;

    Decimal rescaled(int scale) const;

    bool operator==(const Decimal& other) const;
    bool operator!=(const Decimal& other) const { return !(*this == other); }

private:
    BigInt unscaled_;
    int scale_ = 0;
};

/**
 * @brief Time zone attached to a timestamp
 *
 * UTC, a fixed offset (TIMESTAMP_TZ) or an IANA zone (session TIMEZONE).
 */
class Location {
public:
    enum class Kind { Utc, Fixed, Zone };

    Location() = default;

    static Location utc();
    static Location fixedOffset(int offsetSeconds);

    /// Fixed offset given in minutes, named like "+0800"
    static Location fromOffsetMinutes(int offsetMinutes) { return fixedOffset(offsetMinutes * 60); }

    /**
     * @brief IANA zone ("America/Los_Angeles")
     * @throws DataFormatException if the zone database does not know the name
     */
    static Location named(std::string_view name);

    /// The host's current zone; UTC if the zone database is unavailable
    static Location local();

    Kind kind() const { return kind_; }

    /// UTC offset in effect at the given instant
    int offsetSecondsAt(int64_t unixSeconds) const;

    /// Instant of a wall clock reading in this location (earliest on overlap)
    int64_t localToUnixSeconds(int64_t localSeconds) const;

    std::string name() const;

    bool operator==(const Location& other) const;
    bool operator!=(const Location& other) const { return !(*this == other); }

private:
    Kind kind_ = Kind::Utc;
    int offsetSeconds_ = 0;
    const std::chrono::time_zone* zone_ = nullptr;
};

/// Broken-down wall clock
struct CivilTime {
    int year = 1970;
    unsigned month = 1;
    unsigned day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int64_t nanosecond = 0;
};

/**
 * @brief Instant with nanosecond precision and a location
 *
 * Seconds and nanoseconds are kept apart so years beyond the int64
 * nanosecond range (after 2262) stay representable.
 */
class Timestamp {
public:
    Timestamp() = default;
    Timestamp(int64_t unixSeconds, int64_t nanos, Location location = Location::utc());

    static Timestamp fromCivil(const CivilTime& civil, const Location& location);

    int64_t unixSeconds() const { return seconds_; }
    int32_t nanosecond() const { return nanos_; }
    const Location& location() const { return location_; }

    int offsetSeconds() const { return location_.offsetSecondsAt(seconds_); }

    /// Nanoseconds since epoch, nullopt if out of int64 range
    std::optional<int64_t> unixNanos() const;

    /// Wall clock in this timestamp's location
    CivilTime civil() const;

    /// Wall clock in UTC
    CivilTime utcCivil() const;

    Timestamp withLocation(Location location) const {
        return Timestamp(seconds_, nanos_, std::move(location));
    }

    /// "YYYY-MM-DD HH:MM:SS.fffffffff +HH:MM"
    std::string toString() const;

    /// Same instant and same offset
    bool operator==(const Timestamp& other) const;
    bool operator!=(const Timestamp& other) const { return !(*this == other); }

private:
    int64_t seconds_ = 0;
    int32_t nanos_ = 0;
    Location location_;
};

/**
 * @brief Time of day without date or zone
 */
class TimeOfDay {
public:
    TimeOfDay() = default;
    explicit TimeOfDay(std::chrono::nanoseconds sinceMidnight) : since_midnight_(sinceMidnight) {}

    static TimeOfDay fromParts(int hour, int minute, int second, int64_t nanos = 0);

    std::chrono::nanoseconds sinceMidnight() const { return since_midnight_; }
    int64_t nanos() const { return since_midnight_.count(); }

    int hour() const;
    int minute() const;
    int second() const;
    int64_t nanosecond() const;

    /// "HH:MM:SS.fffffffff"
    std::string toString() const;

    bool operator==(const TimeOfDay& other) const { return since_midnight_ == other.since_midnight_; }
    bool operator!=(const TimeOfDay& other) const { return !(*this == other); }

private:
    std::chrono::nanoseconds since_midnight_{0};
};

} // namespace sfpp::core
