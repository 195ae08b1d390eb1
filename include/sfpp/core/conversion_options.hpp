#pragma once

namespace sfpp {
namespace core {

/// Output unit for timestamp columns in a rewritten batch
enum class TimestampOption {
    Nanosecond,
    Microsecond,
    Millisecond,
    Second,
    Original    // keep the server's struct/int encoding untouched
};

/**
 * @brief Per-call conversion switches
 *
 * Passed by value through every decode/encode call; there is no
 * process-wide numeric mode.
 */
struct ConversionOptions {
    bool higherPrecision = false;      // BigInt/Decimal instead of int64/double/string
    bool mapValuesNullable = false;    // keep NULL map values as Null instead of zero values
    bool utf8Validation = false;       // sanitize text columns in convertBatch
    TimestampOption timestampOption = TimestampOption::Nanosecond;
    int maxStructuredDepth = 64;
};

} // namespace core
} // namespace sfpp
