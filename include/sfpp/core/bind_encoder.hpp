#pragma once

#include "sfpp/core/extended_types.hpp"
#include "sfpp/core/value.hpp"
#include "sfpp/core/wire_type.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sfpp {
namespace core {

/// Element of a heterogeneous bind array
using AnyElement = std::variant<
    Null,
    bool,
    int32_t,
    int64_t,
    float,
    double,
    std::string,
    Bytes,
    Timestamp,
    TimeOfDay
>;

/**
 * @brief Array bound to a single parameter
 *
 * Either a typed slice of one primitive kind or a slice of AnyElement.
 * Time values need a time zone variant to pick their wire type.
 */
class BindArray {
public:
    using Payload = std::variant<
        std::vector<int32_t>,
        std::vector<int64_t>,
        std::vector<float>,
        std::vector<double>,
        std::vector<bool>,
        std::vector<std::string>,
        std::vector<Bytes>,
        std::vector<Timestamp>,
        std::vector<AnyElement>
    >;

    explicit BindArray(Payload payload, std::optional<TimezoneVariant> variant = std::nullopt)
        : payload_(std::move(payload)), variant_(variant) {}

    const Payload& payload() const { return payload_; }
    const std::optional<TimezoneVariant>& variant() const { return variant_; }
    size_t size() const;

private:
    Payload payload_;
    std::optional<TimezoneVariant> variant_;
};

/// Typed bind array; variant is required for Timestamp elements
template <typename T>
BindArray makeBindArray(std::vector<T> values, std::optional<TimezoneVariant> variant = std::nullopt) {
    return BindArray(BindArray::Payload(std::move(values)), variant);
}

/// NULL for a time-typed parameter that still carries its wire type
struct TypedNullTime {
    TimezoneVariant variant = TimezoneVariant::TimestampNtz;
};

using BindValue = std::variant<Value, BindArray, TypedNullTime>;

/// Wire type and per-row wire strings (nullopt = NULL) of one parameter
struct BindResult {
    WireType type = WireType::Text;
    std::vector<std::optional<std::string>> values;
};

/**
 * @brief Encode an array parameter
 *
 * Time values are rendered as text for stream upload
 * ("YYYY-MM-DD HH:MM:SS.fffffffff", "HH:MM:SS.fffffffff") and as epoch
 * numbers otherwise (NTZ/LTZ nanoseconds, TZ "nanos offset+1440",
 * DATE milliseconds, TIME nanoseconds since midnight).
 * @throws UnsupportedTypeException for time values without a variant
 */
BindResult encodeBindArray(const BindArray& array, bool stream);

/**
 * @brief Render a single bound value for a wire type
 * @return nullopt for Null
 */
std::optional<std::string> valueToString(const Value& value, WireType type);

/// Wire type of a single value; timestamps take tsMode
WireType inferWireType(const Value& value, WireType tsMode = WireType::TimestampNtz);

WireType inferWireType(const BindValue& value, WireType tsMode = WireType::TimestampNtz);

/**
 * @brief Wire type and strings for one statement parameter
 * @param variant time zone variant for time values (overrides the array's own)
 */
BindResult buildBindParameters(const BindValue& value,
                               std::optional<TimezoneVariant> variant = std::nullopt,
                               bool stream = false);

} // namespace core
} // namespace sfpp
