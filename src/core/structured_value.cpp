#include "sfpp/core/structured_value.hpp"
#include "sfpp/core/detail/conversion_utils.hpp"
#include "sfpp/core/exception.hpp"
#include "sfpp/core/scalar_codec.hpp"
#include "sfpp/core/structured_builder.hpp"

namespace sfpp {
namespace core {

StructuredValue::StructuredValue(MetadataPtr metadata,
                                 std::map<std::string, Value> fields,
                                 ConversionContext ctx)
    : metadata_(std::move(metadata))
    , fields_(std::move(fields))
    , ctx_(std::move(ctx)) {
    if (!metadata_) {
        throw ConversionException("Structured value requires metadata");
    }
}

std::vector<std::string> StructuredValue::fieldNames() const {
    std::vector<std::string> names;
    names.reserve(metadata_->fields.size());
    for (const auto& f : metadata_->fields) {
        names.push_back(f.name);
    }
    return names;
}

const FieldMetadata& StructuredValue::field(const std::string& name) const {
    const FieldMetadata* f = metadata_->findField(name);
    if (!f) {
        throw ConversionException("Unknown field '" + name + "' in object '" + metadata_->name + "'");
    }
    return *f;
}

void StructuredValue::mismatch(const std::string& name, const char* requested) const {
    const FieldMetadata& f = field(name);
    throw UnsupportedTypeException(std::string("Field is ") + std::string(toString(f.type)) +
                                   ", cannot read it as " + requested, name, describe(getRaw(name)));
}

bool StructuredValue::contains(const std::string& name) const {
    return metadata_->findField(name) != nullptr;
}

bool StructuredValue::isNull(const std::string& name) const {
    field(name);
    auto it = fields_.find(name);
    return it == fields_.end() || core::isNull(it->second);
}

const Value& StructuredValue::getRaw(const std::string& name) const {
    static const Value null_value = Null{};
    field(name);
    auto it = fields_.find(name);
    return it == fields_.end() ? null_value : it->second;
}

Value StructuredValue::getValue(const std::string& name) const {
    return convertStructuredLeaf(field(name), getRaw(name), ctx_);
}

std::string StructuredValue::getString(const std::string& name) const {
    const FieldMetadata& f = field(name);
    if (f.type != WireType::Text && f.type != WireType::Variant && !isStructuredType(f.type)) {
        mismatch(name, "string");
    }
    Value v = getValue(name);
    if (auto* s = std::get_if<std::string>(&v)) {
        return *s;
    }
    mismatch(name, "string");
}

int64_t StructuredValue::getInt64(const std::string& name) const {
    Value v = getValue(name);
    if (auto* i = std::get_if<int64_t>(&v)) {
        return *i;
    }
    if (auto* b = std::get_if<BigInt>(&v)) {
        if (auto i = b->toInt64()) {
            return *i;
        }
    }
    mismatch(name, "int64");
}

double StructuredValue::getDouble(const std::string& name) const {
    Value v = getValue(name);
    if (auto* d = std::get_if<double>(&v)) {
        return *d;
    }
    if (auto* i = std::get_if<int64_t>(&v)) {
        return static_cast<double>(*i);
    }
    if (auto* dec = std::get_if<Decimal>(&v)) {
        return dec->toDouble();
    }
    if (auto* b = std::get_if<BigInt>(&v)) {
        return detail::parse_double(b->toString(), name);
    }
    mismatch(name, "double");
}

bool StructuredValue::getBool(const std::string& name) const {
    Value v = getValue(name);
    if (auto* b = std::get_if<bool>(&v)) {
        return *b;
    }
    mismatch(name, "bool");
}

Bytes StructuredValue::getBytes(const std::string& name) const {
    Value v = getValue(name);
    if (auto* b = std::get_if<Bytes>(&v)) {
        return *b;
    }
    mismatch(name, "bytes");
}

BigInt StructuredValue::getBigInt(const std::string& name) const {
    const FieldMetadata& f = field(name);
    const Value& raw = getRaw(name);
    if (f.type == WireType::Fixed && f.scale == 0) {
        if (auto* s = std::get_if<std::string>(&raw)) {
            return detail::parse_fixed_text(*s, 0, name);
        }
        if (auto* i = std::get_if<int64_t>(&raw)) {
            return BigInt(*i);
        }
        if (auto* b = std::get_if<BigInt>(&raw)) {
            return *b;
        }
    }
    mismatch(name, "bigint");
}

Decimal StructuredValue::getDecimal(const std::string& name) const {
    const FieldMetadata& f = field(name);
    const Value& raw = getRaw(name);
    if (f.type == WireType::Fixed) {
        // exact digits come from the raw text, not the converted double
        if (auto* s = std::get_if<std::string>(&raw)) {
            return Decimal(detail::parse_fixed_text(*s, f.scale, name), f.scale);
        }
        if (auto* d = std::get_if<Decimal>(&raw)) {
            return *d;
        }
        if (auto* i = std::get_if<int64_t>(&raw)) {
            return Decimal(BigInt(*i), 0).rescaled(f.scale);
        }
        if (auto* b = std::get_if<BigInt>(&raw)) {
            return Decimal(*b, 0).rescaled(f.scale);
        }
        if (auto* d = std::get_if<double>(&raw)) {
            return Decimal::fromString(detail::format_double(*d), f.scale);
        }
    }
    mismatch(name, "decimal");
}

Timestamp StructuredValue::getTimestamp(const std::string& name) const {
    Value v = getValue(name);
    if (auto* ts = std::get_if<Timestamp>(&v)) {
        return *ts;
    }
    mismatch(name, "timestamp");
}

TimeOfDay StructuredValue::getTimeOfDay(const std::string& name) const {
    Value v = getValue(name);
    if (auto* t = std::get_if<TimeOfDay>(&v)) {
        return *t;
    }
    mismatch(name, "time");
}

StructuredPtr StructuredValue::getObject(const std::string& name) const {
    const Value& raw = getRaw(name);
    if (core::isNull(raw)) {
        return nullptr;
    }
    if (auto* obj = std::get_if<StructuredPtr>(&raw)) {
        return *obj;
    }
    mismatch(name, "object");
}

ValueListPtr StructuredValue::getArray(const std::string& name) const {
    const Value& raw = getRaw(name);
    if (core::isNull(raw)) {
        return nullptr;
    }
    if (auto* list = std::get_if<ValueListPtr>(&raw)) {
        return *list;
    }
    mismatch(name, "array");
}

ValueMapPtr StructuredValue::getMap(const std::string& name) const {
    const Value& raw = getRaw(name);
    if (core::isNull(raw)) {
        return nullptr;
    }
    if (auto* map = std::get_if<ValueMapPtr>(&raw)) {
        return *map;
    }
    mismatch(name, "map");
}

bool StructuredValue::operator==(const StructuredValue& other) const {
    if (metadata_->fields.size() != other.metadata_->fields.size()) {
        return false;
    }
    for (const auto& f : metadata_->fields) {
        if (!other.contains(f.name)) {
            return false;
        }
        if (!valuesEqual(getValue(f.name), other.getValue(f.name))) {
            return false;
        }
    }
    return true;
}

} // namespace core
} // namespace sfpp
