#pragma once

#include "sfpp/core/field_metadata.hpp"
#include "sfpp/core/session_params.hpp"
#include "sfpp/core/value.hpp"
#include <map>
#include <string>
#include <vector>

namespace sfpp {
namespace core {

/**
 * @brief Object column value with on-demand field conversion
 *
 * Holds the raw field mapping (JSON leaves as text, columnar leaves
 * already converted, containers built), the object's metadata subtree
 * and the session context. Each getter converts one field and throws
 * if the field's shape does not match the request.
 */
class StructuredValue {
public:
    StructuredValue(MetadataPtr metadata,
                    std::map<std::string, Value> fields,
                    ConversionContext ctx);

    const FieldMetadata& metadata() const { return *metadata_; }
    const ConversionContext& context() const { return ctx_; }

    /// Field names in metadata order
    std::vector<std::string> fieldNames() const;

    bool contains(const std::string& name) const;
    bool isNull(const std::string& name) const;

    /// Stored value as received (text for JSON leaves)
    const Value& getRaw(const std::string& name) const;

    /// Field converted to its native kind
    Value getValue(const std::string& name) const;

    std::string getString(const std::string& name) const;
    int64_t getInt64(const std::string& name) const;
    double getDouble(const std::string& name) const;
    bool getBool(const std::string& name) const;
    Bytes getBytes(const std::string& name) const;
    BigInt getBigInt(const std::string& name) const;
    Decimal getDecimal(const std::string& name) const;
    Timestamp getTimestamp(const std::string& name) const;
    TimeOfDay getTimeOfDay(const std::string& name) const;
    /// Containers read as nullptr when the field is NULL or absent
    StructuredPtr getObject(const std::string& name) const;
    ValueListPtr getArray(const std::string& name) const;
    ValueMapPtr getMap(const std::string& name) const;

    /// Logical equality of every field, regardless of JSON or columnar origin
    bool operator==(const StructuredValue& other) const;
    bool operator!=(const StructuredValue& other) const { return !(*this == other); }

private:
    const FieldMetadata& field(const std::string& name) const;
    [[noreturn]] void mismatch(const std::string& name, const char* requested) const;

    MetadataPtr metadata_;
    std::map<std::string, Value> fields_;
    ConversionContext ctx_;
};

} // namespace core
} // namespace sfpp
