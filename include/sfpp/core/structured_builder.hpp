#pragma once

#include "sfpp/core/field_metadata.hpp"
#include "sfpp/core/session_params.hpp"
#include "sfpp/core/structured_value.hpp"
#include "sfpp/core/value.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace sfpp {
namespace core {

/**
 * @brief Build an object, array or map column value from its JSON text
 *
 * Numbers are parsed as text, never through a double. Objects become
 * StructuredValue (leaves converted on access), arrays ValueList, maps
 * ValueMap; containers inside are rebuilt recursively.
 * @throws DataFormatException on malformed JSON or leaf text
 * @throws UnsupportedTypeException on unsupported map keys, depth overflow
 *         or a JSON shape that does not match the metadata
 */
Value buildStructured(const MetadataPtr& field, std::string_view json, const ConversionContext& ctx);

/// Same as buildStructured, from an already decoded node at a given depth
Value buildStructuredFromJson(const MetadataPtr& field,
                              const nlohmann::json& node,
                              const ConversionContext& ctx,
                              int depth = 1);

/**
 * @brief Convert one stored object field to its native kind
 *
 * Text leaves (JSON numbers, hex, formatted dates) are decoded per the
 * field metadata; values that are already native pass through.
 */
Value convertStructuredLeaf(const FieldMetadata& field, const Value& raw, const ConversionContext& ctx);

/// Throws UnsupportedTypeException unless the key field is TEXT or FIXED
void checkMapKeyType(const FieldMetadata& keyField);

/// Map key from text for a TEXT or FIXED key field
MapKey mapKeyFromText(const FieldMetadata& keyField, const std::string& key);

/// Throws if depth exceeds options.maxStructuredDepth
void checkStructuredDepth(const FieldMetadata& field, int depth, const ConversionContext& ctx);

} // namespace core
} // namespace sfpp
