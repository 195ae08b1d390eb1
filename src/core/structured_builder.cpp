#include "sfpp/core/structured_builder.hpp"
#include "sfpp/core/datetime_format.hpp"
#include "sfpp/core/detail/conversion_utils.hpp"
#include "sfpp/core/detail/json_decoder.hpp"
#include "sfpp/core/exception.hpp"
#include "sfpp/core/scalar_codec.hpp"
#include <sfpp_util/logging.h>

namespace sfpp {
namespace core {

namespace {

    // JSON leaf as stored in a StructuredValue before conversion
    Value rawLeaf(const nlohmann::json& node) {
        if (node.is_null()) {
            return Null{};
        }
        if (node.is_boolean()) {
            return node.get<bool>();
        }
        if (node.is_string()) {
            return node.get<std::string>();
        }
        if (detail::is_number_text(node)) {
            return detail::number_text(node);
        }
        // semistructured child (VARIANT, OBJECT without metadata)
        return detail::dump_preserving_numbers(node);
    }

    Value buildElement(const MetadataPtr& element,
                       const nlohmann::json& node,
                       const ConversionContext& ctx,
                       int depth) {
        if (element->hasStructure()) {
            return buildStructuredFromJson(element, node, ctx, depth);
        }
        return convertStructuredLeaf(*element, rawLeaf(node), ctx);
    }

    [[noreturn]] void shapeMismatch(const FieldMetadata& field, const char* expected,
                                    const nlohmann::json& node) {
        throw UnsupportedTypeException(std::string("Expected JSON ") + expected + " for " +
                                       std::string(toString(field.type)) + " field",
                                       field.name, detail::dump_preserving_numbers(node));
    }

    Value buildObject(const MetadataPtr& field, const nlohmann::json& node,
                      const ConversionContext& ctx, int depth) {
        if (!node.is_object()) {
            shapeMismatch(*field, "object", node);
        }
        std::map<std::string, Value> values;
        for (size_t i = 0; i < field->fields.size(); ++i) {
            auto child = childMetadata(field, i);
            auto it = node.find(child->name);
            if (it == node.end() || it->is_null()) {
                values.emplace(child->name, Null{});
            } else if (child->hasStructure()) {
                values.emplace(child->name, buildStructuredFromJson(child, *it, ctx, depth + 1));
            } else {
                values.emplace(child->name, rawLeaf(*it));
            }
        }
        return std::make_shared<const StructuredValue>(field, std::move(values), ctx);
    }

    Value buildArray(const MetadataPtr& field, const nlohmann::json& node,
                     const ConversionContext& ctx, int depth) {
        if (!node.is_array()) {
            shapeMismatch(*field, "array", node);
        }
        auto element = childMetadata(field, 0);
        NativeKind kind = nativeKindFor(*element, ctx.options.higherPrecision, true);

        std::vector<Value> items;
        items.reserve(node.size());
        for (const auto& item : node) {
            items.push_back(buildElement(element, item, ctx, depth + 1));
        }
        return std::make_shared<const ValueList>(kind, std::move(items));
    }

    Value buildMap(const MetadataPtr& field, const nlohmann::json& node,
                   const ConversionContext& ctx, int depth) {
        if (!node.is_object()) {
            shapeMismatch(*field, "object", node);
        }
        const FieldMetadata& keyField = field->fields[0];
        checkMapKeyType(keyField);
        auto valueField = childMetadata(field, 1);
        NativeKind keyKind = keyField.type == WireType::Fixed ? NativeKind::Int64 : NativeKind::String;
        NativeKind valueKind = nativeKindFor(*valueField, ctx.options.higherPrecision, true);
        const bool nullable = ctx.options.mapValuesNullable;

        std::map<MapKey, Value> entries;
        for (auto it = node.begin(); it != node.end(); ++it) {
            MapKey key = mapKeyFromText(keyField, it.key());
            if (it.value().is_null()) {
                entries.emplace(std::move(key), nullable ? Value(Null{}) : zeroValue(valueKind));
            } else {
                entries.emplace(std::move(key), buildElement(valueField, it.value(), ctx, depth + 1));
            }
        }
        return std::make_shared<const ValueMap>(keyKind, valueKind, nullable, std::move(entries));
    }

    Timestamp parseFormatted(const FieldMetadata& field, const std::string& text,
                             const ConversionContext& ctx, const Location& defaultLocation) {
        auto format = DateTimeFormat::compile(ctx.params->dateTimeOutputFormat(field.type));
        try {
            return format.parse(text).toTimestamp(defaultLocation);
        } catch (const DataFormatException& e) {
            throw DataFormatException(e.getErrorMessages().front(), e.getErrorCode(), field.name, text);
        }
    }
}

void checkStructuredDepth(const FieldMetadata& field, int depth, const ConversionContext& ctx) {
    if (depth > ctx.options.maxStructuredDepth) {
        throw UnsupportedTypeException("Structured value nested deeper than " +
                                       std::to_string(ctx.options.maxStructuredDepth) + " levels",
                                       field.name);
    }
}

void checkMapKeyType(const FieldMetadata& keyField) {
    if (keyField.type != WireType::Text && keyField.type != WireType::Fixed) {
        throw UnsupportedTypeException("Unsupported map key type " + std::string(toString(keyField.type)),
                                       keyField.name);
    }
}

MapKey mapKeyFromText(const FieldMetadata& keyField, const std::string& key) {
    switch (keyField.type) {
        case WireType::Text:
            return key;
        case WireType::Fixed:
            return detail::parse_int64(key, keyField.name);
        default:
            throw UnsupportedTypeException("Unsupported map key type " + std::string(toString(keyField.type)),
                                           keyField.name, key);
    }
}

Value buildStructuredFromJson(const MetadataPtr& field,
                              const nlohmann::json& node,
                              const ConversionContext& ctx,
                              int depth) {
    checkStructuredDepth(*field, depth, ctx);
    if (node.is_null()) {
        return Null{};
    }
    if (!field->hasStructure()) {
        return node.is_string() ? node.get<std::string>() : detail::dump_preserving_numbers(node);
    }

    switch (field->type) {
        case WireType::Object:
            return buildObject(field, node, ctx, depth);
        case WireType::Array:
            return buildArray(field, node, ctx, depth);
        case WireType::Map:
            return buildMap(field, node, ctx, depth);
        default:
            break;
    }
    throw UnsupportedTypeException("Not a structured type: " + std::string(toString(field->type)),
                                   field->name);
}

Value buildStructured(const MetadataPtr& field, std::string_view json, const ConversionContext& ctx) {
    sfpp_util::Logging::get()->debug("build {} column '{}': {}",
                                     toString(field->type), field->name, json);
    if (!field->hasStructure()) {
        return std::string(json);
    }
    return buildStructuredFromJson(field, detail::parse_json_preserving_numbers(json, field->name), ctx);
}

Value convertStructuredLeaf(const FieldMetadata& field, const Value& raw, const ConversionContext& ctx) {
    if (isNull(raw)) {
        return Null{};
    }
    const auto* text = std::get_if<std::string>(&raw);
    if (!text) {
        if (std::holds_alternative<bool>(raw) && field.type != WireType::Boolean) {
            throw UnsupportedTypeException("Boolean JSON value for " + std::string(toString(field.type)) +
                                           " field", field.name, describe(raw));
        }
        return raw;
    }

    switch (field.type) {
        case WireType::Date:
            return parseFormatted(field, *text, ctx, Location::utc());
        case WireType::Time: {
            auto format = DateTimeFormat::compile(ctx.params->dateTimeOutputFormat(WireType::Time));
            try {
                return format.parse(*text).toTimeOfDay();
            } catch (const DataFormatException& e) {
                throw DataFormatException(e.getErrorMessages().front(), e.getErrorCode(), field.name, *text);
            }
        }
        case WireType::TimestampNtz:
            return parseFormatted(field, *text, ctx, Location::utc());
        case WireType::TimestampLtz:
            return parseFormatted(field, *text, ctx, ctx.location).withLocation(ctx.location);
        case WireType::TimestampTz:
            return parseFormatted(field, *text, ctx, Location::utc());
        default:
            return decodeScalar(field, *text, ctx, true);
    }
}

} // namespace core
} // namespace sfpp
