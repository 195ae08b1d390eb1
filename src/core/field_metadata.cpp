#include "sfpp/core/field_metadata.hpp"
#include "sfpp/core/exception.hpp"
#include <sfpp_util/logging.h>

namespace sfpp {
namespace core {

FieldMetadata FieldMetadata::make(std::string name,
                                  WireType type,
                                  int scale,
                                  std::vector<FieldMetadata> fields) {
    FieldMetadata field;
    field.name = std::move(name);
    field.typeName = std::string(toString(type));
    field.type = type;
    field.scale = scale;
    field.fields = std::move(fields);
    field.validate();
    return field;
}

FieldMetadata FieldMetadata::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConversionException("Field metadata must be a JSON object, got: " + j.dump());
    }

    FieldMetadata field;
    field.name = j.value("name", "");
    field.typeName = j.value("type", "");
    field.type = wireTypeFromString(field.typeName);
    field.scale = j.value("scale", 0);
    field.precision = j.value("precision", 0);
    field.length = j.value("length", static_cast<int64_t>(0));
    field.nullable = j.value("nullable", true);

    if (field.type == WireType::Unsupported) {
        sfpp_util::Logging::get()->warn("Unknown type tag '{}' for field '{}'",
                                        field.typeName, field.name);
    }

    if (j.contains("fields") && j["fields"].is_array()) {
        for (const auto& child : j["fields"]) {
            field.fields.push_back(fromJson(child));
        }
    }

    field.validate();
    return field;
}

std::vector<FieldMetadata> FieldMetadata::fromRowType(const nlohmann::json& rowType) {
    if (!rowType.is_array()) {
        throw ConversionException("Row type must be a JSON array");
    }
    std::vector<FieldMetadata> columns;
    columns.reserve(rowType.size());
    for (const auto& column : rowType) {
        columns.push_back(fromJson(column));
    }
    return columns;
}

nlohmann::json FieldMetadata::toJson() const {
    nlohmann::json j = {
        {"name", name},
        {"type", typeName.empty() ? std::string(toString(type)) : typeName},
        {"scale", scale},
        {"precision", precision},
        {"length", length},
        {"nullable", nullable}
    };
    if (!fields.empty()) {
        auto children = nlohmann::json::array();
        for (const auto& child : fields) {
            children.push_back(child.toJson());
        }
        j["fields"] = std::move(children);
    }
    return j;
}

const FieldMetadata* FieldMetadata::findField(const std::string& fieldName) const {
    for (const auto& child : fields) {
        if (child.name == fieldName) {
            return &child;
        }
    }
    return nullptr;
}

void FieldMetadata::validate() const {
    if (scale < 0) {
        throw ConversionException("Negative scale " + std::to_string(scale) +
                                  " for field '" + name + "'");
    }
    if (type == WireType::Array && fields.size() > 1) {
        throw ConversionException("Array field '" + name + "' must have exactly one child, got " +
                                  std::to_string(fields.size()));
    }
    if (type == WireType::Map && !fields.empty() && fields.size() != 2) {
        throw ConversionException("Map field '" + name + "' must have key and value children, got " +
                                  std::to_string(fields.size()));
    }
}

} // namespace core
} // namespace sfpp
