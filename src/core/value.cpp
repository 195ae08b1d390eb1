#include "sfpp/core/value.hpp"
#include "sfpp/core/detail/conversion_utils.hpp"
#include "sfpp/core/exception.hpp"
#include "sfpp/core/structured_value.hpp"
#include <type_traits>

namespace sfpp {
namespace core {

const char* toString(NativeKind kind) {
    switch (kind) {
        case NativeKind::Null:      return "null";
        case NativeKind::Bool:      return "bool";
        case NativeKind::Int64:     return "int64";
        case NativeKind::Double:    return "double";
        case NativeKind::String:    return "string";
        case NativeKind::Bytes:     return "bytes";
        case NativeKind::BigInt:    return "bigint";
        case NativeKind::Decimal:   return "decimal";
        case NativeKind::Timestamp: return "timestamp";
        case NativeKind::TimeOfDay: return "time";
        case NativeKind::Object:    return "object";
        case NativeKind::List:      return "list";
        case NativeKind::Map:       return "map";
    }
    return "unknown";
}

NativeKind kindOf(const Value& value) {
    return std::visit([](const auto& v) -> NativeKind {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) return NativeKind::Null;
        else if constexpr (std::is_same_v<T, bool>) return NativeKind::Bool;
        else if constexpr (std::is_same_v<T, int64_t>) return NativeKind::Int64;
        else if constexpr (std::is_same_v<T, double>) return NativeKind::Double;
        else if constexpr (std::is_same_v<T, std::string>) return NativeKind::String;
        else if constexpr (std::is_same_v<T, Bytes>) return NativeKind::Bytes;
        else if constexpr (std::is_same_v<T, BigInt>) return NativeKind::BigInt;
        else if constexpr (std::is_same_v<T, Decimal>) return NativeKind::Decimal;
        else if constexpr (std::is_same_v<T, Timestamp>) return NativeKind::Timestamp;
        else if constexpr (std::is_same_v<T, TimeOfDay>) return NativeKind::TimeOfDay;
        else if constexpr (std::is_same_v<T, StructuredPtr>) return NativeKind::Object;
        else if constexpr (std::is_same_v<T, ValueListPtr>) return NativeKind::List;
        else return NativeKind::Map;
    }, value);
}

NativeKind nativeKindFor(const FieldMetadata& field, bool higherPrecision, bool nested) {
    switch (field.type) {
        case WireType::Fixed:
            if (field.scale == 0) {
                return higherPrecision ? NativeKind::BigInt : NativeKind::Int64;
            }
            if (higherPrecision) return NativeKind::Decimal;
            return nested ? NativeKind::Double : NativeKind::String;
        case WireType::Real:
            return NativeKind::Double;
        case WireType::Text:
        case WireType::Variant:
            return NativeKind::String;
        case WireType::Boolean:
            return NativeKind::Bool;
        case WireType::Binary:
            return NativeKind::Bytes;
        case WireType::Date:
        case WireType::TimestampNtz:
        case WireType::TimestampLtz:
        case WireType::TimestampTz:
            return NativeKind::Timestamp;
        case WireType::Time:
            return NativeKind::TimeOfDay;
        case WireType::Object:
            return field.fields.empty() ? NativeKind::String : NativeKind::Object;
        case WireType::Array:
            return field.fields.empty() ? NativeKind::String : NativeKind::List;
        case WireType::Map:
            return field.fields.empty() ? NativeKind::String : NativeKind::Map;
        default:
            break;
    }
    throw UnsupportedTypeException("No native mapping for type " + std::string(toString(field.type)),
                                   field.name);
}

Value zeroValue(NativeKind kind) {
    switch (kind) {
        case NativeKind::Bool:      return false;
        case NativeKind::Int64:     return int64_t{0};
        case NativeKind::Double:    return 0.0;
        case NativeKind::String:    return std::string();
        case NativeKind::Bytes:     return Bytes();
        case NativeKind::BigInt:    return BigInt();
        case NativeKind::Decimal:   return Decimal();
        case NativeKind::Timestamp: return Timestamp();
        case NativeKind::TimeOfDay: return TimeOfDay();
        default:                    return Null{};
    }
}

bool valuesEqual(const Value& a, const Value& b) {
    if (a.index() != b.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b);
        if constexpr (std::is_same_v<T, StructuredPtr> ||
                      std::is_same_v<T, ValueListPtr> ||
                      std::is_same_v<T, ValueMapPtr>) {
            if (!lhs || !rhs) return lhs == rhs;
            return *lhs == *rhs;
        } else {
            return lhs == rhs;
        }
    }, a);
}

std::string describe(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Null>) return "NULL";
        else if constexpr (std::is_same_v<T, bool>) return v ? "true" : "false";
        else if constexpr (std::is_same_v<T, int64_t>) return std::to_string(v);
        else if constexpr (std::is_same_v<T, double>) return detail::format_double(v);
        else if constexpr (std::is_same_v<T, std::string>) return v;
        else if constexpr (std::is_same_v<T, Bytes>) return detail::hex_encode(v);
        else if constexpr (std::is_same_v<T, BigInt> ||
                           std::is_same_v<T, Decimal> ||
                           std::is_same_v<T, Timestamp> ||
                           std::is_same_v<T, TimeOfDay>) return v.toString();
        else if constexpr (std::is_same_v<T, StructuredPtr>) return "<object>";
        else if constexpr (std::is_same_v<T, ValueListPtr>)
            return "<list of " + std::to_string(v ? v->size() : 0) + ">";
        else return "<map of " + std::to_string(v ? v->size() : 0) + ">";
    }, value);
}

bool ValueList::operator==(const ValueList& other) const {
    if (items_.size() != other.items_.size()) {
        return false;
    }
    for (size_t i = 0; i < items_.size(); ++i) {
        if (!valuesEqual(items_[i], other.items_[i])) {
            return false;
        }
    }
    return true;
}

bool ValueMap::operator==(const ValueMap& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& [key, value] : entries_) {
        auto it = other.entries_.find(key);
        if (it == other.entries_.end() || !valuesEqual(value, it->second)) {
            return false;
        }
    }
    return true;
}

} // namespace core
} // namespace sfpp
