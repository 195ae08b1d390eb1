#pragma once

#include "sfpp/core/extended_types.hpp"
#include "sfpp/core/field_metadata.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace sfpp {
namespace core {

/// SQL NULL at any level
struct Null {
    bool operator==(const Null&) const { return true; }
};

class StructuredValue;
class ValueList;
class ValueMap;

using StructuredPtr = std::shared_ptr<const StructuredValue>;
using ValueListPtr  = std::shared_ptr<const ValueList>;
using ValueMapPtr   = std::shared_ptr<const ValueMap>;

/**
 * @brief Native value produced by decoding (or consumed by encoding)
 *
 * Containers are immutable and shared.
 */
using Value = std::variant<
    Null,
    bool,
    int64_t,
    double,
    std::string,
    Bytes,
    BigInt,
    Decimal,
    Timestamp,
    TimeOfDay,
    StructuredPtr,
    ValueListPtr,
    ValueMapPtr
>;

/// Runtime kind of a Value; also the element kind of typed lists and maps
enum class NativeKind {
    Null,
    Bool,
    Int64,
    Double,
    String,
    Bytes,
    BigInt,
    Decimal,
    Timestamp,
    TimeOfDay,
    Object,
    List,
    Map
};

const char* toString(NativeKind kind);

NativeKind kindOf(const Value& value);

inline bool isNull(const Value& value) {
    return std::holds_alternative<Null>(value);
}

/**
 * @brief Native kind a field decodes to
 *
 * Nested fields (array elements, map values, struct fields) decode
 * fractional fixed values to double in default mode; top-level columns
 * keep the exact decimal string.
 * @throws UnsupportedTypeException for types with no native mapping
 */
NativeKind nativeKindFor(const FieldMetadata& field, bool higherPrecision, bool nested);

/// Value used for a NULL map entry when map values are not nullable
Value zeroValue(NativeKind kind);

/// Deep equality (containers compared by content)
bool valuesEqual(const Value& a, const Value& b);

/// Short human readable rendering for logs and error messages
std::string describe(const Value& value);

/**
 * @brief Typed slice: every non-null item has the element kind
 */
class ValueList {
public:
    ValueList(NativeKind elementKind, std::vector<Value> items)
        : element_kind_(elementKind), items_(std::move(items)) {}

    NativeKind elementKind() const { return element_kind_; }
    const std::vector<Value>& items() const { return items_; }
    size_t size() const { return items_.size(); }
    const Value& at(size_t index) const { return items_.at(index); }

    bool operator==(const ValueList& other) const;

private:
    NativeKind element_kind_;
    std::vector<Value> items_;
};

/// Map keys are text or integer only
using MapKey = std::variant<int64_t, std::string>;

/**
 * @brief Typed map with text or integer keys
 */
class ValueMap {
public:
    ValueMap(NativeKind keyKind, NativeKind valueKind, bool valuesNullable,
             std::map<MapKey, Value> entries)
        : key_kind_(keyKind)
        , value_kind_(valueKind)
        , values_nullable_(valuesNullable)
        , entries_(std::move(entries)) {}

    NativeKind keyKind() const { return key_kind_; }
    NativeKind valueKind() const { return value_kind_; }
    bool valuesNullable() const { return values_nullable_; }
    const std::map<MapKey, Value>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }

    /// Entry for a key; throws std::out_of_range if missing
    const Value& at(const MapKey& key) const { return entries_.at(key); }
    bool contains(const MapKey& key) const { return entries_.count(key) != 0; }

    bool operator==(const ValueMap& other) const;

private:
    NativeKind key_kind_;
    NativeKind value_kind_;
    bool values_nullable_;
    std::map<MapKey, Value> entries_;
};

} // namespace core
} // namespace sfpp
