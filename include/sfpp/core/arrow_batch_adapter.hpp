#pragma once

#include "sfpp/core/field_metadata.hpp"
#include "sfpp/core/session_params.hpp"
#include "sfpp/core/value.hpp"
#include <arrow/api.h>
#include <memory>
#include <optional>
#include <vector>

namespace sfpp {
namespace core {

/**
 * @brief Convert one cell of a columnar result
 *
 * FIXED may arrive as int8/16/32/64 or decimal128; TIME as a scaled
 * int32/int64; timestamps as a scaled int64 or an
 * {epoch, fraction[, tz]} struct; OBJECT/ARRAY/MAP as JSON text or as
 * native struct/list/map arrays.
 * @param nested true for array elements, map values and struct fields
 */
Value arrowToValue(const arrow::Array& column,
                   int64_t row,
                   const MetadataPtr& field,
                   const ConversionContext& ctx,
                   bool nested = false);

/// Every row of a column
std::vector<Value> arrowToValues(const arrow::Array& column,
                                 const MetadataPtr& field,
                                 const ConversionContext& ctx);

/// One cell of a record batch
Value cellToValue(const arrow::RecordBatch& batch,
                  int column,
                  int64_t row,
                  const MetadataPtr& field,
                  const ConversionContext& ctx);

/**
 * @brief Decode a timestamp cell in its server encoding
 *
 * NTZ is returned in UTC, LTZ in the given location, TZ in its own
 * fixed offset.
 * @return nullopt for NULL
 */
std::optional<Timestamp> arrowSnowflakeTimestampToTime(const arrow::Array& column,
                                                       WireType type,
                                                       int scale,
                                                       int64_t row,
                                                       const Location& location);

/**
 * @brief Schema of a batch after convertBatch
 *
 * decimal128 becomes int64 (scale 0) or float64 unless higher precision;
 * scaled integers become float64; TIME becomes time64[ns]; timestamps
 * become timestamp[unit] (LTZ carries the session zone name) unless the
 * timestamp option is Original.
 */
std::shared_ptr<arrow::Schema> recordToSchema(const arrow::Schema& schema,
                                              const std::vector<FieldMetadata>& columns,
                                              const ConversionContext& ctx);

/**
 * @brief Rewrite a server batch into standard Arrow types
 * @throws TimestampPrecisionException if a timestamp does not fit the
 *         nanosecond unit
 */
std::shared_ptr<arrow::RecordBatch> convertBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                                                 const std::vector<FieldMetadata>& columns,
                                                 const ConversionContext& ctx,
                                                 arrow::MemoryPool* pool = arrow::default_memory_pool());

namespace detail {

/// Unscaled integer of a FIXED cell from any integer or decimal128 array
BigInt fixed_unscaled_at(const arrow::Array& column, int64_t row, const std::string& name = {});

} // namespace detail

} // namespace core
} // namespace sfpp
