#include "sfpp/core/wire_type.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace sfpp {
namespace core {

namespace {
    constexpr std::array<std::pair<WireType, std::string_view>, 18> WIRE_TYPE_NAMES = {{
        {WireType::Fixed,        "FIXED"},
        {WireType::Real,         "REAL"},
        {WireType::Text,         "TEXT"},
        {WireType::Date,         "DATE"},
        {WireType::Variant,      "VARIANT"},
        {WireType::TimestampLtz, "TIMESTAMP_LTZ"},
        {WireType::TimestampNtz, "TIMESTAMP_NTZ"},
        {WireType::TimestampTz,  "TIMESTAMP_TZ"},
        {WireType::Object,       "OBJECT"},
        {WireType::Array,        "ARRAY"},
        {WireType::Map,          "MAP"},
        {WireType::Binary,       "BINARY"},
        {WireType::Time,         "TIME"},
        {WireType::Boolean,      "BOOLEAN"},
        {WireType::Null,         "NULL"},
        {WireType::Slice,        "SLICE"},
        {WireType::Change,       "CHANGE_TYPE"},
        {WireType::Unsupported,  "NOT_SUPPORTED"}
    }};
}

WireType wireTypeFromString(std::string_view tag) {
    std::string upper(tag);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (const auto& [type, name] : WIRE_TYPE_NAMES) {
        if (name == upper) {
            return type;
        }
    }
    return WireType::Unsupported;
}

std::string_view toString(WireType type) {
    for (const auto& [t, name] : WIRE_TYPE_NAMES) {
        if (t == type) {
            return name;
        }
    }
    return "NOT_SUPPORTED";
}

WireType timezoneVariantToWireType(TimezoneVariant variant) {
    switch (variant) {
        case TimezoneVariant::TimestampNtz: return WireType::TimestampNtz;
        case TimezoneVariant::TimestampLtz: return WireType::TimestampLtz;
        case TimezoneVariant::TimestampTz:  return WireType::TimestampTz;
        case TimezoneVariant::Date:         return WireType::Date;
        case TimezoneVariant::Time:         return WireType::Time;
    }
    return WireType::Unsupported;
}

} // namespace core
} // namespace sfpp
