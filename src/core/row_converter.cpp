#include "sfpp/core/row_converter.hpp"
#include "sfpp/core/arrow_batch_adapter.hpp"
#include "sfpp/core/exception.hpp"
#include "sfpp/core/scalar_codec.hpp"
#include "sfpp/core/structured_builder.hpp"
#include <sfpp_util/logging.h>

namespace sfpp {
namespace core {

Value stringToValue(const MetadataPtr& field,
                    const std::optional<std::string>& raw,
                    const ConversionContext& ctx) {
    if (!raw) {
        return Null{};
    }
    if (field->hasStructure()) {
        return buildStructured(field, *raw, ctx);
    }
    return decodeScalar(*field, raw, ctx);
}

RowConverter::RowConverter(std::vector<FieldMetadata> columns, ConversionContext ctx)
    : columns_(std::make_shared<const std::vector<FieldMetadata>>(std::move(columns)))
    , ctx_(std::move(ctx)) {
    for (const auto& column : *columns_) {
        column.validate();
    }
    sfpp_util::Logging::get()->debug("row converter for {} columns, higher precision {}",
                                     columns_->size(), ctx_.options.higherPrecision);
}

RowConverter RowConverter::fromRowType(const nlohmann::json& rowType, ConversionContext ctx) {
    return RowConverter(FieldMetadata::fromRowType(rowType), std::move(ctx));
}

MetadataPtr RowConverter::column(size_t index) const {
    return MetadataPtr(columns_, &columns_->at(index));
}

void RowConverter::checkWidth(size_t width) const {
    if (width != columns_->size()) {
        throw ConversionException("Row has " + std::to_string(width) + " values but metadata describes " +
                                  std::to_string(columns_->size()) + " columns");
    }
}

std::vector<Value> RowConverter::convertRow(const std::vector<std::optional<std::string>>& raw) const {
    checkWidth(raw.size());
    std::vector<Value> out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        out.push_back(stringToValue(column(i), raw[i], ctx_));
    }
    return out;
}

std::vector<Value> RowConverter::convertRow(const arrow::RecordBatch& batch, int64_t row) const {
    checkWidth(static_cast<size_t>(batch.num_columns()));
    std::vector<Value> out;
    out.reserve(columns_->size());
    for (int i = 0; i < batch.num_columns(); ++i) {
        out.push_back(cellToValue(batch, i, row, column(static_cast<size_t>(i)), ctx_));
    }
    return out;
}

std::shared_ptr<arrow::RecordBatch> RowConverter::convertBatch(
    const std::shared_ptr<arrow::RecordBatch>& batch,
    arrow::MemoryPool* pool) const {
    checkWidth(static_cast<size_t>(batch->num_columns()));
    return core::convertBatch(batch, *columns_, ctx_, pool);
}

} // namespace core
} // namespace sfpp
