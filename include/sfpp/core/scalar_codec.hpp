#pragma once

#include "sfpp/core/field_metadata.hpp"
#include "sfpp/core/session_params.hpp"
#include "sfpp/core/value.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace sfpp {
namespace core {

/**
 * @brief Decode one primitive value from its row-format text
 *
 * nullopt decodes to Null. Object, array and map columns with child
 * metadata go through the structured builder instead.
 * @throws DataFormatException on malformed text
 * @throws UnsupportedTypeException on a type with no scalar mapping
 */
Value decodeScalar(const FieldMetadata& field,
                   const std::optional<std::string>& raw,
                   const ConversionContext& ctx,
                   bool nested = false);

/**
 * @brief Encode a native value in the row wire format of a type
 *
 * Null encodes to nullopt. decodeScalar(encodeScalar(v, t)) reproduces v.
 */
std::optional<std::string> encodeScalar(const Value& value, WireType type, int scale = 0);

namespace detail {

/**
 * @brief Fixed-point value from its unscaled integer
 *
 * Shared by the text path and every columnar integer encoding:
 * scale 0 gives BigInt (higher precision) or int64, falling back to the
 * digit string at top level; scale > 0 gives Decimal (higher precision),
 * double (nested) or exact decimal text (top level).
 */
Value decode_fixed(const BigInt& unscaled, int scale, bool higherPrecision, bool nested,
                   const std::string& column = {});

Value decode_fixed(int64_t unscaled, int scale, bool higherPrecision, bool nested,
                   const std::string& column = {});

/// Unscaled integer of fixed text at the column's scale
BigInt parse_fixed_text(std::string_view text, int scale, const std::string& column = {});

bool parse_bool_text(std::string_view text, const std::string& column = {});

} // namespace detail

} // namespace core
} // namespace sfpp
