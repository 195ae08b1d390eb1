#pragma once

#include "sfpp/core/wire_type.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sfpp {
namespace core {

/**
 * @brief Column or nested field description from the server's row type
 *
 * One tree per response; rows only ever read it.
 */
struct FieldMetadata {
    std::string name;          // Column/field name
    std::string typeName;      // Raw server type tag
    WireType type = WireType::Text;
    int scale = 0;             // Digits after the decimal point (fixed, time, timestamps)
    int precision = 0;
    int64_t length = 0;
    bool nullable = true;
    std::vector<FieldMetadata> fields;  // array: 1 child, map: key+value, object: N

    static FieldMetadata make(std::string name,
                              WireType type,
                              int scale = 0,
                              std::vector<FieldMetadata> fields = {});

    /**
     * @brief Load one field from the server's JSON description
     *
     * Accepts {name, type, scale, precision, length, nullable, fields}.
     * Throws ConversionException on a negative scale or a container
     * with the wrong number of children.
     */
    static FieldMetadata fromJson(const nlohmann::json& j);

    /// Load the top-level row type (JSON array of fields)
    static std::vector<FieldMetadata> fromRowType(const nlohmann::json& rowType);

    nlohmann::json toJson() const;

    /// True for object/array/map columns that carry child metadata
    bool hasStructure() const { return isStructuredType(type) && !fields.empty(); }

    const FieldMetadata* findField(const std::string& fieldName) const;

    void validate() const;
};

using MetadataPtr = std::shared_ptr<const FieldMetadata>;

/// Child metadata sharing ownership with the root of its tree
inline MetadataPtr childMetadata(const MetadataPtr& parent, size_t index) {
    return MetadataPtr(parent, &parent->fields.at(index));
}

inline MetadataPtr makeMetadataPtr(FieldMetadata field) {
    return std::make_shared<const FieldMetadata>(std::move(field));
}

} // namespace core
} // namespace sfpp
