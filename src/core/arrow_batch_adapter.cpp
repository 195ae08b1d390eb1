#include "sfpp/core/arrow_batch_adapter.hpp"
#include "sfpp/core/detail/conversion_utils.hpp"
#include "sfpp/core/exception.hpp"
#include "sfpp/core/scalar_codec.hpp"
#include "sfpp/core/structured_builder.hpp"
#include "sfpp/core/structured_value.hpp"
#include "sfpp/core/timestamp_utils.hpp"
#include <sfpp_util/logging.h>

namespace sfpp {
namespace core {

namespace {

    void checkArrow(const arrow::Status& status, const std::string& column) {
        if (!status.ok()) {
            throw ConversionException("Arrow error in column '" + column + "': " + status.ToString());
        }
    }

    [[noreturn]] void unsupportedEncoding(const FieldMetadata& field, const arrow::Array& column) {
        throw UnsupportedTypeException("Unsupported Arrow encoding " + column.type()->ToString() +
                                       " for " + std::string(toString(field.type)) + " column",
                                       field.name);
    }

    std::optional<int64_t> intAt(const arrow::Array& column, int64_t row) {
        switch (column.type_id()) {
            case arrow::Type::INT8:
                return static_cast<const arrow::Int8Array&>(column).Value(row);
            case arrow::Type::INT16:
                return static_cast<const arrow::Int16Array&>(column).Value(row);
            case arrow::Type::INT32:
                return static_cast<const arrow::Int32Array&>(column).Value(row);
            case arrow::Type::INT64:
                return static_cast<const arrow::Int64Array&>(column).Value(row);
            default:
                return std::nullopt;
        }
    }

    bool isIntegerType(arrow::Type::type id) {
        return id == arrow::Type::INT8 || id == arrow::Type::INT16 ||
               id == arrow::Type::INT32 || id == arrow::Type::INT64;
    }

    Value toValue(const arrow::Array& column, int64_t row, const MetadataPtr& field,
                  const ConversionContext& ctx, bool nested, int depth);

    Value structToObject(const arrow::StructArray& column, int64_t row, const MetadataPtr& field,
                         const ConversionContext& ctx, int depth) {
        const auto& structType = static_cast<const arrow::StructType&>(*column.type());
        std::map<std::string, Value> values;
        for (size_t i = 0; i < field->fields.size(); ++i) {
            auto child = childMetadata(field, i);
            int index = structType.GetFieldIndex(child->name);
            if (index < 0) {
                index = static_cast<int>(i);
            }
            if (index >= column.num_fields()) {
                throw UnsupportedTypeException("Struct has no child for field '" + child->name + "'",
                                               field->name);
            }
            values.emplace(child->name, toValue(*column.field(index), row, child, ctx, true, depth + 1));
        }
        return std::make_shared<const StructuredValue>(field, std::move(values), ctx);
    }

    Value listToValues(const arrow::ListArray& column, int64_t row, const MetadataPtr& field,
                       const ConversionContext& ctx, int depth) {
        auto element = childMetadata(field, 0);
        NativeKind kind = nativeKindFor(*element, ctx.options.higherPrecision, true);
        const auto& values = *column.values();
        int64_t start = column.value_offset(row);
        int64_t end = column.value_offset(row + 1);

        std::vector<Value> items;
        items.reserve(static_cast<size_t>(end - start));
        for (int64_t j = start; j < end; ++j) {
            items.push_back(toValue(values, j, element, ctx, true, depth + 1));
        }
        return std::make_shared<const ValueList>(kind, std::move(items));
    }

    MapKey mapKeyAt(const arrow::Array& keys, int64_t j, const FieldMetadata& keyField) {
        switch (keyField.type) {
            case WireType::Text:
                if (keys.type_id() == arrow::Type::STRING) {
                    return static_cast<const arrow::StringArray&>(keys).GetString(j);
                }
                break;
            case WireType::Fixed: {
                BigInt key = detail::fixed_unscaled_at(keys, j, keyField.name);
                if (auto v = key.toInt64()) {
                    return *v;
                }
                throw DataFormatException("Map key out of int64 range", ERR_INVALID_NUMBER,
                                          keyField.name, key.toString());
            }
            default:
                throw UnsupportedTypeException("Unsupported map key type " +
                                               std::string(toString(keyField.type)), keyField.name);
        }
        unsupportedEncoding(keyField, keys);
    }

    Value mapToValues(const arrow::MapArray& column, int64_t row, const MetadataPtr& field,
                      const ConversionContext& ctx, int depth) {
        const FieldMetadata& keyField = field->fields[0];
        checkMapKeyType(keyField);
        auto valueField = childMetadata(field, 1);
        NativeKind keyKind = keyField.type == WireType::Fixed ? NativeKind::Int64 : NativeKind::String;
        NativeKind valueKind = nativeKindFor(*valueField, ctx.options.higherPrecision, true);
        const bool nullable = ctx.options.mapValuesNullable;

        const auto& keys = *column.keys();
        const auto& items = *column.items();
        int64_t start = column.value_offset(row);
        int64_t end = column.value_offset(row + 1);

        std::map<MapKey, Value> entries;
        for (int64_t j = start; j < end; ++j) {
            MapKey key = mapKeyAt(keys, j, keyField);
            if (items.IsNull(j)) {
                entries.emplace(std::move(key), nullable ? Value(Null{}) : zeroValue(valueKind));
            } else {
                entries.emplace(std::move(key), toValue(items, j, valueField, ctx, true, depth + 1));
            }
        }
        return std::make_shared<const ValueMap>(keyKind, valueKind, nullable, std::move(entries));
    }

    Value toValue(const arrow::Array& column, int64_t row, const MetadataPtr& field,
                  const ConversionContext& ctx, bool nested, int depth) {
        if (column.IsNull(row)) {
            return Null{};
        }
        const FieldMetadata& meta = *field;
        const bool hp = ctx.options.higherPrecision;

        switch (meta.type) {
            case WireType::Fixed:
                if (auto v = intAt(column, row)) {
                    return detail::decode_fixed(*v, meta.scale, hp, nested, meta.name);
                }
                return detail::decode_fixed(detail::fixed_unscaled_at(column, row, meta.name),
                                            meta.scale, hp, nested, meta.name);

            case WireType::Real:
                if (column.type_id() == arrow::Type::DOUBLE) {
                    return static_cast<const arrow::DoubleArray&>(column).Value(row);
                }
                if (column.type_id() == arrow::Type::FLOAT) {
                    return static_cast<double>(static_cast<const arrow::FloatArray&>(column).Value(row));
                }
                break;

            case WireType::Text:
            case WireType::Variant:
                if (column.type_id() == arrow::Type::STRING) {
                    return static_cast<const arrow::StringArray&>(column).GetString(row);
                }
                break;

            case WireType::Boolean:
                if (column.type_id() == arrow::Type::BOOL) {
                    return static_cast<const arrow::BooleanArray&>(column).Value(row);
                }
                break;

            case WireType::Binary:
                if (column.type_id() == arrow::Type::BINARY) {
                    auto view = static_cast<const arrow::BinaryArray&>(column).GetView(row);
                    return Bytes(view.begin(), view.end());
                }
                if (column.type_id() == arrow::Type::FIXED_SIZE_BINARY) {
                    auto view = static_cast<const arrow::FixedSizeBinaryArray&>(column).GetView(row);
                    return Bytes(view.begin(), view.end());
                }
                break;

            case WireType::Date:
                if (column.type_id() == arrow::Type::DATE32) {
                    return timestamp_utils::decode_date(static_cast<const arrow::Date32Array&>(column).Value(row));
                }
                if (column.type_id() == arrow::Type::DATE64) {
                    int64_t millis = static_cast<const arrow::Date64Array&>(column).Value(row);
                    return timestamp_utils::decode_date(timestamp_utils::floor_div(millis, 86'400'000));
                }
                break;

            case WireType::Time:
                if (auto v = intAt(column, row)) {
                    return timestamp_utils::decode_time(*v, meta.scale, meta.name);
                }
                break;

            case WireType::TimestampNtz:
            case WireType::TimestampLtz:
            case WireType::TimestampTz:
                return *arrowSnowflakeTimestampToTime(column, meta.type, meta.scale, row, ctx.location);

            case WireType::Object:
            case WireType::Array:
            case WireType::Map:
                checkStructuredDepth(meta, depth, ctx);
                if (column.type_id() == arrow::Type::STRING) {
                    auto text = static_cast<const arrow::StringArray&>(column).GetString(row);
                    if (!meta.hasStructure()) {
                        return text;
                    }
                    return buildStructuredFromJson(
                        field, detail::parse_json_preserving_numbers(text, meta.name), ctx, depth);
                }
                if (meta.type == WireType::Object && column.type_id() == arrow::Type::STRUCT &&
                    meta.hasStructure()) {
                    return structToObject(static_cast<const arrow::StructArray&>(column), row, field, ctx, depth);
                }
                if (meta.type == WireType::Array && column.type_id() == arrow::Type::LIST &&
                    meta.hasStructure()) {
                    return listToValues(static_cast<const arrow::ListArray&>(column), row, field, ctx, depth);
                }
                if (meta.type == WireType::Map && column.type_id() == arrow::Type::MAP &&
                    meta.hasStructure()) {
                    return mapToValues(static_cast<const arrow::MapArray&>(column), row, field, ctx, depth);
                }
                break;

            default:
                throw UnsupportedTypeException("No columnar decoding for type " +
                                               std::string(toString(meta.type)), meta.name);
        }
        unsupportedEncoding(meta, column);
    }

    int64_t toTimeUnit(const Timestamp& ts, TimestampOption option, const std::string& column) {
        switch (option) {
            case TimestampOption::Nanosecond:
                return timestamp_utils::unix_nanos_or_throw(ts, column);
            case TimestampOption::Microsecond:
                return ts.unixSeconds() * 1'000'000 + ts.nanosecond() / 1'000;
            case TimestampOption::Millisecond:
                return ts.unixSeconds() * 1'000 + ts.nanosecond() / 1'000'000;
            case TimestampOption::Second:
            case TimestampOption::Original:
                break;
        }
        return ts.unixSeconds();
    }

    arrow::TimeUnit::type arrowTimeUnit(TimestampOption option) {
        switch (option) {
            case TimestampOption::Microsecond: return arrow::TimeUnit::MICRO;
            case TimestampOption::Millisecond: return arrow::TimeUnit::MILLI;
            case TimestampOption::Second:      return arrow::TimeUnit::SECOND;
            default:                           return arrow::TimeUnit::NANO;
        }
    }

    // Arrow spells fixed offsets "+08:00"
    std::string arrowZoneName(const Location& location) {
        std::string name = location.name();
        if (location.kind() == Location::Kind::Fixed && name.size() == 5) {
            name.insert(3, ":");
        }
        return name;
    }

    std::shared_ptr<arrow::Array> rewriteFixed(const arrow::Array& column, const FieldMetadata& meta,
                                               arrow::MemoryPool* pool) {
        std::shared_ptr<arrow::Array> out;
        if (column.type_id() == arrow::Type::DECIMAL128 && meta.scale == 0) {
            arrow::Int64Builder builder(pool);
            checkArrow(builder.Reserve(column.length()), meta.name);
            for (int64_t i = 0; i < column.length(); ++i) {
                if (column.IsNull(i)) {
                    checkArrow(builder.AppendNull(), meta.name);
                    continue;
                }
                BigInt v = detail::fixed_unscaled_at(column, i, meta.name);
                auto narrow = v.toInt64();
                if (!narrow) {
                    throw DataFormatException("Value out of int64 range", ERR_INVALID_NUMBER,
                                              meta.name, v.toString());
                }
                checkArrow(builder.Append(*narrow), meta.name);
            }
            checkArrow(builder.Finish(&out), meta.name);
            return out;
        }

        arrow::DoubleBuilder builder(pool);
        checkArrow(builder.Reserve(column.length()), meta.name);
        for (int64_t i = 0; i < column.length(); ++i) {
            if (column.IsNull(i)) {
                checkArrow(builder.AppendNull(), meta.name);
                continue;
            }
            Decimal v(detail::fixed_unscaled_at(column, i, meta.name), meta.scale);
            checkArrow(builder.Append(v.toDouble()), meta.name);
        }
        checkArrow(builder.Finish(&out), meta.name);
        return out;
    }

    std::shared_ptr<arrow::Array> rewriteTime(const arrow::Array& column, const FieldMetadata& meta,
                                              arrow::MemoryPool* pool) {
        arrow::Time64Builder builder(arrow::time64(arrow::TimeUnit::NANO), pool);
        checkArrow(builder.Reserve(column.length()), meta.name);
        for (int64_t i = 0; i < column.length(); ++i) {
            auto v = column.IsNull(i) ? std::nullopt : intAt(column, i);
            if (!v) {
                checkArrow(builder.AppendNull(), meta.name);
                continue;
            }
            checkArrow(builder.Append(timestamp_utils::decode_time(*v, meta.scale, meta.name).nanos()),
                       meta.name);
        }
        std::shared_ptr<arrow::Array> out;
        checkArrow(builder.Finish(&out), meta.name);
        return out;
    }

    std::shared_ptr<arrow::Array> rewriteTimestamp(const arrow::Array& column, const FieldMetadata& meta,
                                                   const std::shared_ptr<arrow::DataType>& type,
                                                   const ConversionContext& ctx,
                                                   arrow::MemoryPool* pool) {
        arrow::TimestampBuilder builder(type, pool);
        checkArrow(builder.Reserve(column.length()), meta.name);
        for (int64_t i = 0; i < column.length(); ++i) {
            auto ts = arrowSnowflakeTimestampToTime(column, meta.type, meta.scale, i, ctx.location);
            if (!ts) {
                checkArrow(builder.AppendNull(), meta.name);
                continue;
            }
            checkArrow(builder.Append(toTimeUnit(*ts, ctx.options.timestampOption, meta.name)), meta.name);
        }
        std::shared_ptr<arrow::Array> out;
        checkArrow(builder.Finish(&out), meta.name);
        return out;
    }

    std::shared_ptr<arrow::Array> sanitizeText(const std::shared_ptr<arrow::Array>& column,
                                               const FieldMetadata& meta,
                                               arrow::MemoryPool* pool) {
        const auto& strings = static_cast<const arrow::StringArray&>(*column);
        arrow::StringBuilder builder(pool);
        checkArrow(builder.Reserve(strings.length()), meta.name);
        std::string clean;
        for (int64_t i = 0; i < strings.length(); ++i) {
            if (strings.IsNull(i)) {
                checkArrow(builder.AppendNull(), meta.name);
                continue;
            }
            auto view = strings.GetView(i);
            if (detail::to_valid_utf8(view, clean)) {
                sfpp_util::Logging::get()->error(
                    "Invalid UTF-8 in column '{}' row {}, replaced with U+FFFD", meta.name, i);
                checkArrow(builder.Append(clean), meta.name);
            } else {
                checkArrow(builder.Append(view), meta.name);
            }
        }
        std::shared_ptr<arrow::Array> out;
        checkArrow(builder.Finish(&out), meta.name);
        return out;
    }
}

namespace detail {

BigInt fixed_unscaled_at(const arrow::Array& column, int64_t row, const std::string& name) {
    if (auto v = intAt(column, row)) {
        return BigInt(*v);
    }
    if (column.type_id() == arrow::Type::DECIMAL128) {
        arrow::Decimal128 value(static_cast<const arrow::Decimal128Array&>(column).GetValue(row));
        return BigInt::fromString(value.ToIntegerString());
    }
    throw UnsupportedTypeException("Unsupported Arrow encoding " + column.type()->ToString() +
                                   " for FIXED column", name);
}

} // namespace detail

Value arrowToValue(const arrow::Array& column,
                   int64_t row,
                   const MetadataPtr& field,
                   const ConversionContext& ctx,
                   bool nested) {
    return toValue(column, row, field, ctx, nested, 1);
}

std::vector<Value> arrowToValues(const arrow::Array& column,
                                 const MetadataPtr& field,
                                 const ConversionContext& ctx) {
    std::vector<Value> out;
    out.reserve(static_cast<size_t>(column.length()));
    for (int64_t row = 0; row < column.length(); ++row) {
        out.push_back(toValue(column, row, field, ctx, false, 1));
    }
    return out;
}

Value cellToValue(const arrow::RecordBatch& batch,
                  int column,
                  int64_t row,
                  const MetadataPtr& field,
                  const ConversionContext& ctx) {
    if (column < 0 || column >= batch.num_columns() || row < 0 || row >= batch.num_rows()) {
        throw ConversionException("Cell (" + std::to_string(column) + ", " + std::to_string(row) +
                                  ") outside batch");
    }
    return toValue(*batch.column(column), row, field, ctx, false, 1);
}

std::optional<Timestamp> arrowSnowflakeTimestampToTime(const arrow::Array& column,
                                                       WireType type,
                                                       int scale,
                                                       int64_t row,
                                                       const Location& location) {
    if (column.IsNull(row)) {
        return std::nullopt;
    }

    switch (type) {
        case WireType::TimestampNtz:
        case WireType::TimestampLtz: {
            const Location& loc = type == WireType::TimestampNtz ? Location::utc() : location;
            if (column.type_id() == arrow::Type::INT64) {
                int64_t value = static_cast<const arrow::Int64Array&>(column).Value(row);
                return timestamp_utils::timestamp_from_scaled(value, scale, loc);
            }
            if (column.type_id() == arrow::Type::STRUCT) {
                const auto& parts = static_cast<const arrow::StructArray&>(column);
                int64_t epoch = static_cast<const arrow::Int64Array&>(*parts.field(0)).Value(row);
                int32_t fraction = static_cast<const arrow::Int32Array&>(*parts.field(1)).Value(row);
                return Timestamp(epoch, fraction, loc);
            }
            break;
        }
        case WireType::TimestampTz: {
            if (column.type_id() != arrow::Type::STRUCT) {
                break;
            }
            const auto& parts = static_cast<const arrow::StructArray&>(column);
            int64_t epoch = static_cast<const arrow::Int64Array&>(*parts.field(0)).Value(row);
            if (parts.num_fields() == 2) {
                int32_t tz = static_cast<const arrow::Int32Array&>(*parts.field(1)).Value(row);
                auto loc = Location::fromOffsetMinutes(tz - timestamp_utils::TZ_OFFSET_BIAS);
                return timestamp_utils::timestamp_from_scaled(epoch, scale, loc);
            }
            int32_t fraction = static_cast<const arrow::Int32Array&>(*parts.field(1)).Value(row);
            int32_t tz = static_cast<const arrow::Int32Array&>(*parts.field(2)).Value(row);
            return Timestamp(epoch, fraction,
                             Location::fromOffsetMinutes(tz - timestamp_utils::TZ_OFFSET_BIAS));
        }
        default:
            break;
    }
    throw UnsupportedTypeException("Unsupported Arrow encoding " + column.type()->ToString() +
                                   " for " + std::string(toString(type)));
}

std::shared_ptr<arrow::Schema> recordToSchema(const arrow::Schema& schema,
                                              const std::vector<FieldMetadata>& columns,
                                              const ConversionContext& ctx) {
    if (static_cast<size_t>(schema.num_fields()) != columns.size()) {
        throw ConversionException("Schema has " + std::to_string(schema.num_fields()) +
                                  " fields but metadata describes " + std::to_string(columns.size()));
    }

    const auto option = ctx.options.timestampOption;
    arrow::FieldVector fields;
    fields.reserve(columns.size());
    for (int i = 0; i < schema.num_fields(); ++i) {
        const auto& field = schema.field(i);
        const FieldMetadata& meta = columns[static_cast<size_t>(i)];
        std::shared_ptr<arrow::DataType> type;

        switch (meta.type) {
            case WireType::Fixed:
                if (ctx.options.higherPrecision) break;
                if (field->type()->id() == arrow::Type::DECIMAL128) {
                    type = meta.scale == 0 ? arrow::int64() : arrow::float64();
                } else if (isIntegerType(field->type()->id()) && meta.scale > 0) {
                    type = arrow::float64();
                }
                break;
            case WireType::Time:
                type = arrow::time64(arrow::TimeUnit::NANO);
                break;
            case WireType::TimestampNtz:
            case WireType::TimestampTz:
                if (option != TimestampOption::Original) {
                    type = arrow::timestamp(arrowTimeUnit(option));
                }
                break;
            case WireType::TimestampLtz:
                if (option != TimestampOption::Original) {
                    type = arrow::timestamp(arrowTimeUnit(option), arrowZoneName(ctx.location));
                }
                break;
            default:
                break;
        }
        fields.push_back(type ? field->WithType(type) : field);
    }
    return arrow::schema(std::move(fields), schema.metadata());
}

std::shared_ptr<arrow::RecordBatch> convertBatch(const std::shared_ptr<arrow::RecordBatch>& batch,
                                                 const std::vector<FieldMetadata>& columns,
                                                 const ConversionContext& ctx,
                                                 arrow::MemoryPool* pool) {
    auto schema = recordToSchema(*batch->schema(), columns, ctx);
    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.reserve(columns.size());

    for (int i = 0; i < batch->num_columns(); ++i) {
        const auto& column = batch->column(i);
        const FieldMetadata& meta = columns[static_cast<size_t>(i)];
        const auto& target = schema->field(i)->type();

        if (target->Equals(*column->type())) {
            if (meta.type == WireType::Text && ctx.options.utf8Validation &&
                column->type_id() == arrow::Type::STRING) {
                arrays.push_back(sanitizeText(column, meta, pool));
            } else {
                arrays.push_back(column);
            }
            continue;
        }

        switch (meta.type) {
            case WireType::Fixed:
                arrays.push_back(rewriteFixed(*column, meta, pool));
                break;
            case WireType::Time:
                arrays.push_back(rewriteTime(*column, meta, pool));
                break;
            case WireType::TimestampNtz:
            case WireType::TimestampLtz:
            case WireType::TimestampTz:
                arrays.push_back(rewriteTimestamp(*column, meta, target, ctx, pool));
                break;
            default:
                arrays.push_back(column);
                break;
        }
    }

    sfpp_util::Logging::get()->debug("converted batch of {} rows, {} columns",
                                     batch->num_rows(), batch->num_columns());
    return arrow::RecordBatch::Make(std::move(schema), batch->num_rows(), std::move(arrays));
}

} // namespace core
} // namespace sfpp
