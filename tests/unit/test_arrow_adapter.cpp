#include "../test_base.hpp"
#include "sfpp/core/arrow_batch_adapter.hpp"
#include "sfpp/core/structured_builder.hpp"
#include "sfpp/core/structured_value.hpp"
#include <gtest/gtest.h>

using namespace sfpp::core;
using namespace sfpp::test;

class ArrowAdapterTest : public SfppTestBase {
protected:
    static std::shared_ptr<arrow::Array> decimalArray(const std::vector<std::optional<std::string>>& values,
                                                      int32_t scale = 0) {
        arrow::Decimal128Builder builder(arrow::decimal128(38, scale));
        for (const auto& v : values) {
            if (v) {
                EXPECT_TRUE(builder.Append(arrow::Decimal128::FromString(*v).ValueOrDie()).ok());
            } else {
                EXPECT_TRUE(builder.AppendNull().ok());
            }
        }
        std::shared_ptr<arrow::Array> out;
        EXPECT_TRUE(builder.Finish(&out).ok());
        return out;
    }

    static std::shared_ptr<arrow::Array> structArray(const arrow::ArrayVector& children,
                                                     const std::vector<std::string>& names) {
        return arrow::StructArray::Make(children, names).ValueOrDie();
    }

    static std::shared_ptr<arrow::RecordBatch> batchOf(const std::vector<std::string>& names,
                                                       const arrow::ArrayVector& columns) {
        arrow::FieldVector fields;
        for (size_t i = 0; i < names.size(); ++i) {
            fields.push_back(arrow::field(names[i], columns[i]->type()));
        }
        return arrow::RecordBatch::Make(arrow::schema(fields), columns[0]->length(), columns);
    }

    static int64_t secondsOfYear(int year) {
        CivilTime c;
        c.year = year;
        return Timestamp::fromCivil(c, Location::utc()).unixSeconds();
    }
};

// ============== Primitive cells ==============

TEST_F(ArrowAdapterTest, FixedFromScaledInteger) {
    auto array = int64Array({12345, std::nullopt});
    auto field = column("AMOUNT", WireType::Fixed, 2);

    EXPECT_EQ(arrowToValue(*array, 0, field, ctx_), Value(std::string("123.45")));
    EXPECT_DOUBLE_EQ(std::get<double>(arrowToValue(*array, 0, field, ctx_, true)), 123.45);
    EXPECT_TRUE(isNull(arrowToValue(*array, 1, field, ctx_)));

    ConversionOptions options;
    options.higherPrecision = true;
    auto precise = arrowToValue(*array, 0, field, contextWith(options));
    EXPECT_EQ(std::get<Decimal>(precise), Decimal(BigInt(12345), 2));
}

TEST_F(ArrowAdapterTest, FixedFromNarrowIntegers) {
    auto small = buildArray<arrow::Int8Builder, int8_t>({int8_t{-5}});
    EXPECT_EQ(arrowToValue(*small, 0, column("S", WireType::Fixed), ctx_), Value(int64_t{-5}));

    auto medium = buildArray<arrow::Int16Builder, int16_t>({int16_t{250}});
    EXPECT_EQ(arrowToValue(*medium, 0, column("M", WireType::Fixed, 1), ctx_), Value(std::string("25.0")));
}

TEST_F(ArrowAdapterTest, FixedFromDecimal128) {
    auto array = decimalArray({"12345678901234567890123", "42"});
    auto field = column("BIG", WireType::Fixed, 0);

    EXPECT_EQ(arrowToValue(*array, 0, field, ctx_), Value(std::string("12345678901234567890123")));
    EXPECT_EQ(arrowToValue(*array, 1, field, ctx_), Value(int64_t{42}));

    ConversionOptions options;
    options.higherPrecision = true;
    auto big = std::get<BigInt>(arrowToValue(*array, 0, field, contextWith(options)));
    EXPECT_EQ(big.toString(), "12345678901234567890123");
}

TEST_F(ArrowAdapterTest, OtherPrimitives) {
    auto reals = doubleArray({2.5});
    EXPECT_EQ(arrowToValue(*reals, 0, column("R", WireType::Real), ctx_), Value(2.5));

    auto texts = stringArray({std::string("hi")});
    EXPECT_EQ(arrowToValue(*texts, 0, column("T", WireType::Text), ctx_), Value(std::string("hi")));

    auto flags = buildArray<arrow::BooleanBuilder, bool>({true});
    EXPECT_EQ(arrowToValue(*flags, 0, column("B", WireType::Boolean), ctx_), Value(true));

    arrow::BinaryBuilder binaryBuilder;
    ASSERT_TRUE(binaryBuilder.Append(std::string("\x01\xff", 2)).ok());
    std::shared_ptr<arrow::Array> binary;
    ASSERT_TRUE(binaryBuilder.Finish(&binary).ok());
    EXPECT_EQ(arrowToValue(*binary, 0, column("BIN", WireType::Binary), ctx_), Value(Bytes{0x01, 0xff}));
}

TEST_F(ArrowAdapterTest, UnsupportedEncoding) {
    auto texts = stringArray({std::string("1.5")});
    EXPECT_THROW(arrowToValue(*texts, 0, column("R", WireType::Real), ctx_), UnsupportedTypeException);
}

// ============== Temporal cells ==============

TEST_F(ArrowAdapterTest, DateAndTime) {
    auto dates = buildArray<arrow::Date32Builder, int32_t>({0, -1});
    auto field = column("D", WireType::Date);
    EXPECT_EQ(std::get<Timestamp>(arrowToValue(*dates, 0, field, ctx_)).unixSeconds(), 0);
    EXPECT_EQ(std::get<Timestamp>(arrowToValue(*dates, 1, field, ctx_)).civil().day, 31u);

    auto times = int64Array({12345});
    auto time = std::get<TimeOfDay>(arrowToValue(*times, 0, column("T", WireType::Time, 5), ctx_));
    EXPECT_EQ(time.nanos(), 123'450'000);
}

TEST_F(ArrowAdapterTest, TimestampNtzAndLtz) {
    auto scaled = int64Array({1'700'000'000'123});
    auto ntz = arrowSnowflakeTimestampToTime(*scaled, WireType::TimestampNtz, 3, 0, Location::utc());
    ASSERT_TRUE(ntz.has_value());
    EXPECT_EQ(ntz->unixSeconds(), 1'700'000'000);
    EXPECT_EQ(ntz->nanosecond(), 123'000'000);

    auto parts = structArray({int64Array({1'700'000'000}), int32Array({5})}, {"epoch", "fraction"});
    auto plusTwo = Location::fromOffsetMinutes(120);
    auto ltz = arrowSnowflakeTimestampToTime(*parts, WireType::TimestampLtz, 9, 0, plusTwo);
    ASSERT_TRUE(ltz.has_value());
    EXPECT_EQ(ltz->nanosecond(), 5);
    EXPECT_EQ(ltz->offsetSeconds(), 7200);
}

TEST_F(ArrowAdapterTest, TimestampTzEncodings) {
    auto twoField = structArray({int64Array({1'700'000'000'500}), int32Array({960})}, {"epoch", "timezone"});
    auto tz = arrowSnowflakeTimestampToTime(*twoField, WireType::TimestampTz, 3, 0, Location::utc());
    ASSERT_TRUE(tz.has_value());
    EXPECT_EQ(tz->unixSeconds(), 1'700'000'000);
    EXPECT_EQ(tz->nanosecond(), 500'000'000);
    EXPECT_EQ(tz->offsetSeconds(), -480 * 60);

    auto threeField = structArray({int64Array({1'700'000'000}), int32Array({7}), int32Array({1500})},
                                  {"epoch", "fraction", "timezone"});
    auto tz3 = arrowSnowflakeTimestampToTime(*threeField, WireType::TimestampTz, 9, 0, Location::utc());
    ASSERT_TRUE(tz3.has_value());
    EXPECT_EQ(tz3->nanosecond(), 7);
    EXPECT_EQ(tz3->offsetSeconds(), 60 * 60);

    auto nulls = int64Array({std::nullopt});
    EXPECT_FALSE(arrowSnowflakeTimestampToTime(*nulls, WireType::TimestampNtz, 9, 0, Location::utc()));
}

// ============== Structured cells ==============

TEST_F(ArrowAdapterTest, NativeStructMatchesJson) {
    auto field = column("ITEM", WireType::Object, 0, {
        FieldMetadata::make("city", WireType::Text),
        FieldMetadata::make("qty", WireType::Fixed, 0),
        FieldMetadata::make("price", WireType::Fixed, 2)
    });
    auto array = structArray({stringArray({std::string("Oslo")}), int64Array({3}), int64Array({125})},
                             {"city", "qty", "price"});

    auto fromArrow = std::get<StructuredPtr>(arrowToValue(*array, 0, field, ctx_));
    EXPECT_EQ(fromArrow->getString("city"), "Oslo");
    EXPECT_EQ(fromArrow->getInt64("qty"), 3);
    EXPECT_DOUBLE_EQ(fromArrow->getDouble("price"), 1.25);

    auto fromJson = std::get<StructuredPtr>(
        buildStructured(field, R"({"city": "Oslo", "qty": 3, "price": 1.25})", ctx_));
    EXPECT_EQ(*fromArrow, *fromJson);
}

TEST_F(ArrowAdapterTest, NativeListMatchesJson) {
    auto field = column("NUMS", WireType::Array, 0, {FieldMetadata::make("", WireType::Fixed, 0)});
    auto offsets = int32Array({0, 2, 3});
    auto values = int64Array({1, 2, std::nullopt});
    auto list = arrow::ListArray::FromArrays(*offsets, *values).ValueOrDie();

    auto first = arrowToValue(*list, 0, field, ctx_);
    EXPECT_TRUE(valuesEqual(first, buildStructured(field, "[1, 2]", ctx_)));

    auto second = std::get<ValueListPtr>(arrowToValue(*list, 1, field, ctx_));
    ASSERT_EQ(second->size(), 1u);
    EXPECT_TRUE(isNull(second->at(0)));
}

TEST_F(ArrowAdapterTest, NativeMapMatchesJson) {
    auto field = column("SCORES", WireType::Map, 0, {
        FieldMetadata::make("key", WireType::Text),
        FieldMetadata::make("value", WireType::Fixed, 0)
    });
    auto offsets = int32Array({0, 2});
    auto keys = stringArray({std::string("math"), std::string("art")});
    auto items = int64Array({5, std::nullopt});
    auto map = arrow::MapArray::FromArrays(offsets, keys, items).ValueOrDie();

    auto fromArrow = arrowToValue(*map, 0, field, ctx_);
    auto fromJson = buildStructured(field, R"({"math": 5, "art": null})", ctx_);
    EXPECT_TRUE(valuesEqual(fromArrow, fromJson));
    EXPECT_EQ(std::get<ValueMapPtr>(fromArrow)->at(MapKey{std::string("art")}), Value(int64_t{0}));

    ConversionOptions options;
    options.mapValuesNullable = true;
    auto nullable = std::get<ValueMapPtr>(arrowToValue(*map, 0, field, contextWith(options)));
    EXPECT_TRUE(isNull(nullable->at(MapKey{std::string("art")})));
}

TEST_F(ArrowAdapterTest, MapKeyTypeCheckedForEmptyRows) {
    auto field = column("FLAGS", WireType::Map, 0, {
        FieldMetadata::make("key", WireType::Boolean),
        FieldMetadata::make("value", WireType::Fixed, 0)
    });
    auto offsets = int32Array({0, 0});
    auto keys = buildArray<arrow::BooleanBuilder, bool>({});
    auto items = int64Array({});
    auto map = arrow::MapArray::FromArrays(offsets, keys, items).ValueOrDie();
    ASSERT_EQ(map->length(), 1);

    EXPECT_THROW(arrowToValue(*map, 0, field, ctx_), UnsupportedTypeException);
}

TEST_F(ArrowAdapterTest, StructuredAsJsonText) {
    auto field = column("NUMS", WireType::Array, 0, {FieldMetadata::make("", WireType::Text)});
    auto array = stringArray({std::string(R"(["x", "y"])"), std::nullopt});

    auto values = arrowToValues(*array, field, ctx_);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(std::get<ValueListPtr>(values[0])->size(), 2u);
    EXPECT_TRUE(isNull(values[1]));

    auto plain = column("DOC", WireType::Object);
    EXPECT_EQ(arrowToValue(*array, 0, plain, ctx_), Value(std::string(R"(["x", "y"])")));
}

TEST_F(ArrowAdapterTest, CellOutsideBatch) {
    auto batch = batchOf({"A"}, {int64Array({1})});
    auto field = column("A", WireType::Fixed);
    EXPECT_EQ(cellToValue(*batch, 0, 0, field, ctx_), Value(int64_t{1}));
    EXPECT_THROW(cellToValue(*batch, 1, 0, field, ctx_), ConversionException);
    EXPECT_THROW(cellToValue(*batch, 0, 5, field, ctx_), ConversionException);
}

// ============== Batch rewrite ==============

TEST_F(ArrowAdapterTest, ConvertBatchSchema) {
    std::vector<FieldMetadata> columns = {
        FieldMetadata::make("AMOUNT", WireType::Fixed, 2),
        FieldMetadata::make("ID", WireType::Fixed, 0),
        FieldMetadata::make("T", WireType::Time, 3),
        FieldMetadata::make("TS", WireType::TimestampNtz, 9),
        FieldMetadata::make("NAME", WireType::Text)
    };
    auto batch = batchOf({"AMOUNT", "ID", "T", "TS", "NAME"}, {
        int64Array({12345, std::nullopt}),
        decimalArray({"7", "-8"}),
        int64Array({3'723'500, 0}),
        int64Array({1'700'000'000'000'000'001, std::nullopt}),
        stringArray({std::string("a"), std::string("b")})
    });

    auto out = convertBatch(batch, columns, ctx_);
    ASSERT_EQ(out->num_columns(), 5);
    EXPECT_TRUE(out->schema()->field(0)->type()->Equals(*arrow::float64()));
    EXPECT_TRUE(out->schema()->field(1)->type()->Equals(*arrow::int64()));
    EXPECT_TRUE(out->schema()->field(2)->type()->Equals(*arrow::time64(arrow::TimeUnit::NANO)));
    EXPECT_TRUE(out->schema()->field(3)->type()->Equals(*arrow::timestamp(arrow::TimeUnit::NANO)));
    EXPECT_TRUE(out->schema()->field(4)->type()->Equals(*arrow::utf8()));

    auto amounts = std::static_pointer_cast<arrow::DoubleArray>(out->column(0));
    EXPECT_DOUBLE_EQ(amounts->Value(0), 123.45);
    EXPECT_TRUE(amounts->IsNull(1));

    auto ids = std::static_pointer_cast<arrow::Int64Array>(out->column(1));
    EXPECT_EQ(ids->Value(1), -8);

    auto times = std::static_pointer_cast<arrow::Time64Array>(out->column(2));
    EXPECT_EQ(times->Value(0), 3'723'500'000'000);

    auto stamps = std::static_pointer_cast<arrow::TimestampArray>(out->column(3));
    EXPECT_EQ(stamps->Value(0), 1'700'000'000'000'000'001);
    EXPECT_TRUE(stamps->IsNull(1));
}

TEST_F(ArrowAdapterTest, HigherPrecisionKeepsDecimals) {
    std::vector<FieldMetadata> columns = {FieldMetadata::make("ID", WireType::Fixed, 0)};
    auto batch = batchOf({"ID"}, {decimalArray({"12345678901234567890123"})});

    ConversionOptions options;
    options.higherPrecision = true;
    auto out = convertBatch(batch, columns, contextWith(options));
    EXPECT_EQ(out->schema()->field(0)->type()->id(), arrow::Type::DECIMAL128);

    EXPECT_THROW(convertBatch(batch, columns, ctx_), DataFormatException);
}

TEST_F(ArrowAdapterTest, PrecisionOverflowNamesColumn) {
    std::vector<FieldMetadata> columns = {FieldMetadata::make("FAR", WireType::TimestampNtz, 9)};
    int64_t far = secondsOfYear(2263);
    auto batch = batchOf({"FAR"}, {
        structArray({int64Array({far}), int32Array({0})}, {"epoch", "fraction"})
    });

    try {
        convertBatch(batch, columns, ctx_);
        FAIL() << "Expected TimestampPrecisionException";
    } catch (const TimestampPrecisionException& e) {
        EXPECT_EQ(e.getErrorCode(), ERR_TOO_HIGH_TIMESTAMP_PRECISION);
        EXPECT_EQ(e.getColumn(), "FAR");
    }

    ConversionOptions micro;
    micro.timestampOption = TimestampOption::Microsecond;
    auto out = convertBatch(batch, columns, contextWith(micro));
    EXPECT_TRUE(out->schema()->field(0)->type()->Equals(*arrow::timestamp(arrow::TimeUnit::MICRO)));
    EXPECT_EQ(std::static_pointer_cast<arrow::TimestampArray>(out->column(0))->Value(0), far * 1'000'000);

    ConversionOptions original;
    original.timestampOption = TimestampOption::Original;
    auto passthrough = convertBatch(batch, columns, contextWith(original));
    EXPECT_EQ(passthrough->schema()->field(0)->type()->id(), arrow::Type::STRUCT);

    // Cell access is not bound to the nanosecond unit
    auto cell = std::get<Timestamp>(cellToValue(*batch, 0, 0, makeMetadataPtr(columns[0]), ctx_));
    EXPECT_EQ(cell.civil().year, 2263);
}

TEST_F(ArrowAdapterTest, LtzSchemaCarriesZone) {
    std::vector<FieldMetadata> columns = {FieldMetadata::make("AT", WireType::TimestampLtz, 3)};
    auto schema = arrow::schema({arrow::field("AT", arrow::int64())});

    auto converted = recordToSchema(*schema, columns, ctx_);
    auto type = std::static_pointer_cast<arrow::TimestampType>(converted->field(0)->type());
    EXPECT_EQ(type->unit(), arrow::TimeUnit::NANO);
    EXPECT_EQ(type->timezone(), ctx_.location.name());

    EXPECT_THROW(recordToSchema(*schema, {}, ctx_), ConversionException);
}

TEST_F(ArrowAdapterTest, LtzSchemaFixedOffsetZone) {
    std::vector<FieldMetadata> columns = {FieldMetadata::make("AT", WireType::TimestampLtz, 3)};
    auto schema = arrow::schema({arrow::field("AT", arrow::int64())});

    auto zoneOf = [&](int offsetMinutes) {
        ConversionContext ctx = ctx_;
        ctx.location = Location::fromOffsetMinutes(offsetMinutes);
        auto converted = recordToSchema(*schema, columns, ctx);
        return std::static_pointer_cast<arrow::TimestampType>(converted->field(0)->type())->timezone();
    };
    EXPECT_EQ(zoneOf(480), "+08:00");
    EXPECT_EQ(zoneOf(-330), "-05:30");
}

TEST_F(ArrowAdapterTest, Utf8Sanitization) {
    std::vector<FieldMetadata> columns = {FieldMetadata::make("NAME", WireType::Text)};
    auto batch = batchOf({"NAME"}, {
        stringArray({std::string("ok"), std::string("bad\xff\xfe!"), std::nullopt})
    });

    auto untouched = convertBatch(batch, columns, ctx_);
    EXPECT_EQ(untouched->column(0), batch->column(0));

    ConversionOptions options;
    options.utf8Validation = true;
    auto out = convertBatch(batch, columns, contextWith(options));
    auto names = std::static_pointer_cast<arrow::StringArray>(out->column(0));
    EXPECT_EQ(names->GetString(0), "ok");
    EXPECT_EQ(names->GetString(1), "bad\xEF\xBF\xBD!");
    EXPECT_TRUE(names->IsNull(2));
}
