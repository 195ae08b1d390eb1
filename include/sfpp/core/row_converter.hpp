#pragma once

#include "sfpp/core/field_metadata.hpp"
#include "sfpp/core/session_params.hpp"
#include "sfpp/core/value.hpp"
#include <arrow/api.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sfpp {
namespace core {

/**
 * @brief Decode one row-format cell
 *
 * Object, array and map columns with child metadata are built from
 * their JSON text; everything else goes through the scalar codec.
 */
Value stringToValue(const MetadataPtr& field,
                    const std::optional<std::string>& raw,
                    const ConversionContext& ctx);

/**
 * @brief Converts whole rows of one result set
 *
 * Owns the column metadata for the result and shares it with every
 * structured value it produces.
 */
class RowConverter {
public:
    RowConverter(std::vector<FieldMetadata> columns, ConversionContext ctx);

    /// From the server's JSON row type description
    static RowConverter fromRowType(const nlohmann::json& rowType, ConversionContext ctx);

    size_t columnCount() const { return columns_->size(); }
    const std::vector<FieldMetadata>& columns() const { return *columns_; }
    MetadataPtr column(size_t index) const;
    const ConversionContext& context() const { return ctx_; }

    /**
     * @brief Convert a row of raw strings (nullopt = NULL)
     * @throws ConversionException if the row width does not match the metadata
     */
    std::vector<Value> convertRow(const std::vector<std::optional<std::string>>& raw) const;

    /// Convert one row of a columnar batch
    std::vector<Value> convertRow(const arrow::RecordBatch& batch, int64_t row) const;

    /// Rewrite a columnar batch into standard Arrow types
    std::shared_ptr<arrow::RecordBatch> convertBatch(
        const std::shared_ptr<arrow::RecordBatch>& batch,
        arrow::MemoryPool* pool = arrow::default_memory_pool()) const;

private:
    void checkWidth(size_t width) const;

    std::shared_ptr<const std::vector<FieldMetadata>> columns_;
    ConversionContext ctx_;
};

} // namespace core
} // namespace sfpp
