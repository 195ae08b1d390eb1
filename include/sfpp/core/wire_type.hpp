#pragma once

#include <string>
#include <string_view>

namespace sfpp {
namespace core {

/**
 * @brief Column/parameter types as the server names them
 *
 * Slice, Change, Null and Unsupported only appear on the bind side.
 */
enum class WireType {
    Fixed,
    Real,
    Text,
    Date,
    Variant,
    TimestampLtz,
    TimestampNtz,
    TimestampTz,
    Object,
    Array,
    Map,
    Binary,
    Time,
    Boolean,
    Null,
    Slice,
    Change,
    Unsupported
};

/// Time zone variant tag attached to bound time values
enum class TimezoneVariant {
    TimestampNtz,
    TimestampLtz,
    TimestampTz,
    Date,
    Time
};

/// Case-insensitive lookup of a server type tag; unknown tags map to Unsupported
WireType wireTypeFromString(std::string_view tag);

/// Upper-case server tag ("FIXED", "TIMESTAMP_TZ", ...)
std::string_view toString(WireType type);

WireType timezoneVariantToWireType(TimezoneVariant variant);

inline bool isTimestampType(WireType type) {
    return type == WireType::TimestampNtz ||
           type == WireType::TimestampLtz ||
           type == WireType::TimestampTz;
}

inline bool isTemporalType(WireType type) {
    return isTimestampType(type) || type == WireType::Date || type == WireType::Time;
}

inline bool isStructuredType(WireType type) {
    return type == WireType::Object || type == WireType::Array || type == WireType::Map;
}

} // namespace core
} // namespace sfpp
