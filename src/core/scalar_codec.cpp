#include "sfpp/core/scalar_codec.hpp"
#include "sfpp/core/detail/conversion_utils.hpp"
#include "sfpp/core/exception.hpp"
#include "sfpp/core/timestamp_utils.hpp"
#include <sfpp_util/logging.h>
#include <algorithm>
#include <cctype>
#include <type_traits>

namespace sfpp {
namespace core {

namespace detail {

Value decode_fixed(const BigInt& unscaled, int scale, bool higherPrecision, bool nested,
                   const std::string& column) {
    if (scale == 0) {
        if (higherPrecision) {
            return unscaled;
        }
        if (auto v = unscaled.toInt64()) {
            return *v;
        }
        if (nested) {
            throw DataFormatException("Integer value out of int64 range", ERR_INVALID_NUMBER,
                                      column, unscaled.toString());
        }
        return unscaled.toString();
    }

    Decimal decimal(unscaled, scale);
    if (higherPrecision) {
        return decimal;
    }
    if (nested) {
        return decimal.toDouble();
    }
    return decimal.toString();
}

Value decode_fixed(int64_t unscaled, int scale, bool higherPrecision, bool nested,
                   const std::string& column) {
    if (!higherPrecision) {
        if (scale == 0) {
            return unscaled;
        }
        if (!nested) {
            return format_scaled(std::to_string(unscaled), scale);
        }
    }
    return decode_fixed(BigInt(unscaled), scale, higherPrecision, nested, column);
}

BigInt parse_fixed_text(std::string_view text, int scale, const std::string& column) {
    std::string digits = scaled_integer_text(text, scale, column);
    try {
        return BigInt::fromString(digits);
    } catch (const DataFormatException& e) {
        throw DataFormatException(e.getErrorMessages().front(), e.getErrorCode(),
                                  column, std::string(text));
    }
}

bool parse_bool_text(std::string_view text, const std::string& column) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true") return true;
    if (lower == "0" || lower == "false") return false;
    throw DataFormatException("Invalid boolean value", ERR_INVALID_NUMBER, column, std::string(text));
}

} // namespace detail

Value decodeScalar(const FieldMetadata& field,
                   const std::optional<std::string>& raw,
                   const ConversionContext& ctx,
                   bool nested) {
    if (!raw) {
        return Null{};
    }
    const std::string& text = *raw;
    const std::string& column = field.name;
    const bool hp = ctx.options.higherPrecision;

    sfpp_util::Logging::get()->debug("decode {} column '{}': '{}'",
                                     toString(field.type), column, text);

    switch (field.type) {
        case WireType::Fixed:
            return detail::decode_fixed(detail::parse_fixed_text(text, field.scale, column),
                                        field.scale, hp, nested, column);
        case WireType::Real:
            return detail::parse_double(text, column);
        case WireType::Text:
        case WireType::Variant:
            return text;
        case WireType::Object:
        case WireType::Array:
        case WireType::Map:
            if (field.fields.empty()) {
                return text;
            }
            break;
        case WireType::Boolean:
            return detail::parse_bool_text(text, column);
        case WireType::Binary:
            return detail::hex_decode(text, column);
        case WireType::Date:
            try {
                return timestamp_utils::decode_date(detail::parse_int64(text, column));
            } catch (const DataFormatException&) {
                throw DataFormatException("Invalid DATE value", ERR_INVALID_DATETIME, column, text);
            }
        case WireType::Time:
            return timestamp_utils::decode_time_text(text, column);
        case WireType::TimestampNtz:
            return timestamp_utils::decode_timestamp_ntz(text, column);
        case WireType::TimestampLtz:
            return timestamp_utils::decode_timestamp_ltz(text, ctx.location, column);
        case WireType::TimestampTz:
            return timestamp_utils::decode_timestamp_tz(text, column);
        default:
            break;
    }
    throw UnsupportedTypeException("No scalar decoding for type " + std::string(toString(field.type)),
                                   column, text);
}

std::optional<std::string> encodeScalar(const Value& value, WireType type, int scale) {
    if (isNull(value)) {
        return std::nullopt;
    }

    auto unsupported = [&]() -> std::optional<std::string> {
        throw UnsupportedTypeException(std::string("Cannot encode ") + toString(kindOf(value)) +
                                       " as " + std::string(toString(type)), {}, describe(value));
    };

    return std::visit([&](const auto& v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        switch (type) {
            case WireType::Fixed:
                if constexpr (std::is_same_v<T, int64_t>) {
                    if (scale == 0) return std::to_string(v);
                    return Decimal(BigInt(v).scaledUp(scale), scale).toString();
                } else if constexpr (std::is_same_v<T, BigInt>) {
                    if (scale == 0) return v.toString();
                    return Decimal(v.scaledUp(scale), scale).toString();
                } else if constexpr (std::is_same_v<T, Decimal>) {
                    return v.rescaled(scale).toString();
                } else if constexpr (std::is_same_v<T, double>) {
                    return Decimal::fromString(detail::format_double(v), scale).toString();
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return Decimal::fromString(v, scale).toString();
                }
                break;
            case WireType::Real:
                if constexpr (std::is_same_v<T, double>) {
                    return detail::format_double(v);
                } else if constexpr (std::is_same_v<T, int64_t>) {
                    return std::to_string(v);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return detail::format_double(detail::parse_double(v));
                }
                break;
            case WireType::Text:
            case WireType::Variant:
            case WireType::Object:
            case WireType::Array:
            case WireType::Map:
                if constexpr (std::is_same_v<T, std::string>) {
                    return v;
                }
                break;
            case WireType::Boolean:
                if constexpr (std::is_same_v<T, bool>) {
                    return std::string(v ? "true" : "false");
                }
                break;
            case WireType::Binary:
                if constexpr (std::is_same_v<T, Bytes>) {
                    return detail::hex_encode(v);
                }
                break;
            case WireType::Date:
                if constexpr (std::is_same_v<T, Timestamp>) {
                    return std::to_string(timestamp_utils::encode_date_days(v));
                }
                break;
            case WireType::Time:
                if constexpr (std::is_same_v<T, TimeOfDay>) {
                    return timestamp_utils::encode_time_text(v);
                } else if constexpr (std::is_same_v<T, Timestamp>) {
                    return timestamp_utils::encode_time_text(
                        TimeOfDay(std::chrono::nanoseconds{timestamp_utils::time_of_day_nanos(v)}));
                }
                break;
            case WireType::TimestampNtz:
            case WireType::TimestampLtz:
                if constexpr (std::is_same_v<T, Timestamp>) {
                    return timestamp_utils::encode_timestamp_text(v);
                }
                break;
            case WireType::TimestampTz:
                if constexpr (std::is_same_v<T, Timestamp>) {
                    return timestamp_utils::encode_timestamp_tz_text(v);
                }
                break;
            default:
                break;
        }
        return unsupported();
    }, value);
}

} // namespace core
} // namespace sfpp
