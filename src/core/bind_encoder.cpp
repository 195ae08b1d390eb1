#include "sfpp/core/bind_encoder.hpp"
#include "sfpp/core/detail/conversion_utils.hpp"
#include "sfpp/core/exception.hpp"
#include "sfpp/core/timestamp_utils.hpp"
#include <sfpp_util/logging.h>
#include <type_traits>

namespace sfpp {
namespace core {

namespace {

    std::string nanosText(const Timestamp& ts) {
        return std::to_string(timestamp_utils::unix_nanos_or_throw(ts));
    }

    std::string tzPairText(const Timestamp& ts) {
        return nanosText(ts) + " " + std::to_string(timestamp_utils::tz_biased_offset(ts));
    }

    // typed time slice path
    std::string timeText(const Timestamp& ts, TimezoneVariant variant, bool stream) {
        switch (variant) {
            case TimezoneVariant::TimestampNtz:
            case TimezoneVariant::TimestampLtz:
                return nanosText(ts);
            case TimezoneVariant::TimestampTz:
                return stream ? timestamp_utils::format_stream_timestamp(ts) : tzPairText(ts);
            case TimezoneVariant::Date:
                return std::to_string(timestamp_utils::date_bind_millis(ts));
            case TimezoneVariant::Time:
                if (stream) {
                    CivilTime c = ts.civil();
                    return timestamp_utils::format_stream_time(c.hour, c.minute, c.second, c.nanosecond, true);
                }
                return std::to_string(timestamp_utils::time_of_day_nanos(ts));
        }
        return nanosText(ts);
    }

    // element of an any-slice: streamed TIME drops the fraction
    std::string anyTimeText(const Timestamp& ts, TimezoneVariant variant, bool stream) {
        if (variant == TimezoneVariant::Time && stream) {
            CivilTime c = ts.civil();
            return timestamp_utils::format_stream_time(c.hour, c.minute, c.second, 0, false);
        }
        return timeText(ts, variant, stream);
    }

    [[noreturn]] void missingVariant() {
        throw UnsupportedTypeException("Time values in a bind array need a time zone variant");
    }

    BindResult encodeAnySlice(const std::vector<AnyElement>& elements,
                              const std::optional<TimezoneVariant>& variant,
                              bool stream) {
        BindResult result;
        result.values.reserve(elements.size());

        for (const auto& element : elements) {
            std::visit([&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, Null>) {
                    result.values.emplace_back(std::nullopt);
                } else if constexpr (std::is_same_v<T, bool>) {
                    result.type = WireType::Boolean;
                    result.values.emplace_back(v ? "true" : "false");
                } else if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
                    result.type = WireType::Fixed;
                    result.values.emplace_back(std::to_string(v));
                } else if constexpr (std::is_same_v<T, float>) {
                    result.type = WireType::Real;
                    result.values.emplace_back(detail::format_float(v));
                } else if constexpr (std::is_same_v<T, double>) {
                    result.type = WireType::Real;
                    result.values.emplace_back(detail::format_double(v));
                } else if constexpr (std::is_same_v<T, std::string>) {
                    result.type = WireType::Text;
                    result.values.emplace_back(v);
                } else if constexpr (std::is_same_v<T, Bytes>) {
                    result.type = WireType::Binary;
                    result.values.emplace_back(detail::hex_encode(v));
                } else if constexpr (std::is_same_v<T, Timestamp>) {
                    if (!variant) missingVariant();
                    result.type = timezoneVariantToWireType(*variant);
                    result.values.emplace_back(anyTimeText(v, *variant, stream));
                } else {
                    result.type = WireType::Time;
                    if (stream) {
                        result.values.emplace_back(timestamp_utils::format_stream_time(
                            v.hour(), v.minute(), v.second(), v.nanosecond(), true));
                    } else {
                        result.values.emplace_back(std::to_string(v.nanos()));
                    }
                }
            }, element);
        }
        return result;
    }

    // ValueList bound as an any-slice
    AnyElement toAnyElement(const Value& value) {
        return std::visit([&value](const auto& v) -> AnyElement {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null> || std::is_same_v<T, bool> ||
                          std::is_same_v<T, int64_t> || std::is_same_v<T, double> ||
                          std::is_same_v<T, std::string> || std::is_same_v<T, Bytes> ||
                          std::is_same_v<T, Timestamp> || std::is_same_v<T, TimeOfDay>) {
                return v;
            } else {
                throw UnsupportedTypeException(std::string("Cannot bind array element of kind ") +
                                               toString(kindOf(value)), {}, describe(value));
            }
        }, value);
    }
}

size_t BindArray::size() const {
    return std::visit([](const auto& values) { return values.size(); }, payload_);
}

BindResult encodeBindArray(const BindArray& array, bool stream) {
    const auto& variant = array.variant();

    BindResult result = std::visit([&](const auto& values) -> BindResult {
        using V = std::decay_t<decltype(values)>;
        BindResult out;
        if constexpr (std::is_same_v<V, std::vector<AnyElement>>) {
            return encodeAnySlice(values, variant, stream);
        } else {
            out.values.reserve(values.size());
            for (const auto& v : values) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, int64_t>) {
                    out.values.emplace_back(std::to_string(v));
                } else if constexpr (std::is_same_v<T, float>) {
                    out.values.emplace_back(detail::format_float(v));
                } else if constexpr (std::is_same_v<T, double>) {
                    out.values.emplace_back(detail::format_double(v));
                } else if constexpr (std::is_same_v<T, std::string>) {
                    out.values.emplace_back(v);
                } else if constexpr (std::is_same_v<T, Bytes>) {
                    out.values.emplace_back(detail::hex_encode(v));
                } else if constexpr (std::is_same_v<T, Timestamp>) {
                    if (!variant) missingVariant();
                    out.values.emplace_back(timeText(v, *variant, stream));
                } else {
                    out.values.emplace_back(static_cast<bool>(v) ? "true" : "false");
                }
            }
            // element kind decides the type even when the slice is empty
            if constexpr (std::is_same_v<V, std::vector<int32_t>> || std::is_same_v<V, std::vector<int64_t>>) {
                out.type = WireType::Fixed;
            } else if constexpr (std::is_same_v<V, std::vector<float>> || std::is_same_v<V, std::vector<double>>) {
                out.type = WireType::Real;
            } else if constexpr (std::is_same_v<V, std::vector<bool>>) {
                out.type = WireType::Boolean;
            } else if constexpr (std::is_same_v<V, std::vector<std::string>>) {
                out.type = WireType::Text;
            } else if constexpr (std::is_same_v<V, std::vector<Bytes>>) {
                out.type = WireType::Binary;
            } else {
                if (!variant) missingVariant();
                out.type = timezoneVariantToWireType(*variant);
            }
            return out;
        }
    }, array.payload());

    sfpp_util::Logging::get()->debug("bind array of {} as {}{}", result.values.size(),
                                     toString(result.type), stream ? " (stream)" : "");
    return result;
}

std::optional<std::string> valueToString(const Value& value, WireType type) {
    return std::visit([&](const auto& v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return detail::format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return detail::hex_encode(v);
        } else if constexpr (std::is_same_v<T, BigInt> || std::is_same_v<T, Decimal>) {
            return v.toString();
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            switch (type) {
                case WireType::Date:
                    return std::to_string(timestamp_utils::date_bind_millis(v));
                case WireType::Time:
                    return std::to_string(timestamp_utils::time_of_day_nanos(v));
                case WireType::TimestampNtz:
                case WireType::TimestampLtz:
                    return nanosText(v);
                case WireType::TimestampTz:
                    return tzPairText(v);
                default:
                    throw UnsupportedTypeException("Cannot bind a timestamp as " +
                                                   std::string(toString(type)), {}, v.toString());
            }
        } else if constexpr (std::is_same_v<T, TimeOfDay>) {
            return std::to_string(v.nanos());
        } else {
            throw UnsupportedTypeException(std::string("Cannot bind a value of kind ") +
                                           toString(kindOf(value)));
        }
    }, value);
}

WireType inferWireType(const Value& value, WireType tsMode) {
    switch (kindOf(value)) {
        case NativeKind::Null:      return WireType::Null;
        case NativeKind::Bool:      return WireType::Boolean;
        case NativeKind::Int64:
        case NativeKind::BigInt:
        case NativeKind::Decimal:   return WireType::Fixed;
        case NativeKind::Double:    return WireType::Real;
        case NativeKind::String:    return WireType::Text;
        case NativeKind::Bytes:     return WireType::Binary;
        case NativeKind::Timestamp: return isTemporalType(tsMode) ? tsMode : WireType::TimestampNtz;
        case NativeKind::TimeOfDay: return WireType::Time;
        case NativeKind::List:      return WireType::Slice;
        default:                    return WireType::Unsupported;
    }
}

WireType inferWireType(const BindValue& value, WireType tsMode) {
    if (const auto* v = std::get_if<Value>(&value)) {
        return inferWireType(*v, tsMode);
    }
    if (const auto* n = std::get_if<TypedNullTime>(&value)) {
        return timezoneVariantToWireType(n->variant);
    }
    return WireType::Slice;
}

BindResult buildBindParameters(const BindValue& value,
                               std::optional<TimezoneVariant> variant,
                               bool stream) {
    if (const auto* n = std::get_if<TypedNullTime>(&value)) {
        return BindResult{timezoneVariantToWireType(n->variant), {std::nullopt}};
    }

    if (const auto* array = std::get_if<BindArray>(&value)) {
        if (variant && !array->variant()) {
            return encodeBindArray(BindArray(array->payload(), variant), stream);
        }
        return encodeBindArray(*array, stream);
    }

    const Value& v = std::get<Value>(value);
    if (const auto* list = std::get_if<ValueListPtr>(&v)) {
        std::vector<AnyElement> elements;
        elements.reserve((*list)->size());
        for (const auto& item : (*list)->items()) {
            elements.push_back(toAnyElement(item));
        }
        return encodeBindArray(BindArray(std::move(elements), variant), stream);
    }

    WireType tsMode = variant ? timezoneVariantToWireType(*variant) : WireType::TimestampNtz;
    WireType type = inferWireType(v, tsMode);
    if (type == WireType::Unsupported) {
        throw UnsupportedTypeException(std::string("Cannot bind a value of kind ") + toString(kindOf(v)));
    }
    return BindResult{type, {valueToString(v, type)}};
}

} // namespace core
} // namespace sfpp
