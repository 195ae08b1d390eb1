#include <gtest/gtest.h>
#include "sfpp/core/exception.hpp"
#include "sfpp/core/field_metadata.hpp"
#include "sfpp/core/value.hpp"
#include "sfpp/core/wire_type.hpp"
#include <nlohmann/json.hpp>

using namespace sfpp::core;
using json = nlohmann::json;

TEST(WireTypeTest, ParsesServerTagsCaseInsensitively) {
    EXPECT_EQ(wireTypeFromString("FIXED"), WireType::Fixed);
    EXPECT_EQ(wireTypeFromString("timestamp_tz"), WireType::TimestampTz);
    EXPECT_EQ(wireTypeFromString("Timestamp_Ltz"), WireType::TimestampLtz);
    EXPECT_EQ(wireTypeFromString("change_type"), WireType::Change);
    EXPECT_EQ(wireTypeFromString("GEOGRAPHY"), WireType::Unsupported);
}

TEST(WireTypeTest, NamesRoundTrip) {
    for (auto type : {WireType::Fixed, WireType::Real, WireType::Text, WireType::Date,
                      WireType::Variant, WireType::TimestampLtz, WireType::TimestampNtz,
                      WireType::TimestampTz, WireType::Object, WireType::Array, WireType::Map,
                      WireType::Binary, WireType::Time, WireType::Boolean}) {
        EXPECT_EQ(wireTypeFromString(toString(type)), type) << toString(type);
    }
}

TEST(WireTypeTest, TimezoneVariants) {
    EXPECT_EQ(timezoneVariantToWireType(TimezoneVariant::TimestampNtz), WireType::TimestampNtz);
    EXPECT_EQ(timezoneVariantToWireType(TimezoneVariant::Date), WireType::Date);
    EXPECT_EQ(timezoneVariantToWireType(TimezoneVariant::Time), WireType::Time);
    EXPECT_TRUE(isTemporalType(WireType::Date));
    EXPECT_FALSE(isTimestampType(WireType::Time));
    EXPECT_TRUE(isStructuredType(WireType::Map));
}

TEST(FieldMetadataTest, LoadsRowType) {
    json rowType = json::parse(R"([
        {"name": "ID", "type": "fixed", "scale": 0, "precision": 38, "nullable": false},
        {"name": "PRICE", "type": "fixed", "scale": 2, "precision": 10},
        {"name": "TAGS", "type": "array", "fields": [
            {"name": "", "type": "text", "length": 16}
        ]},
        {"name": "ATTRS", "type": "map", "fields": [
            {"name": "key", "type": "text"},
            {"name": "value", "type": "fixed", "scale": 0}
        ]}
    ])");

    auto columns = FieldMetadata::fromRowType(rowType);
    ASSERT_EQ(columns.size(), 4u);

    EXPECT_EQ(columns[0].name, "ID");
    EXPECT_EQ(columns[0].type, WireType::Fixed);
    EXPECT_EQ(columns[0].precision, 38);
    EXPECT_FALSE(columns[0].nullable);

    EXPECT_EQ(columns[1].scale, 2);

    EXPECT_TRUE(columns[2].hasStructure());
    EXPECT_EQ(columns[2].fields[0].type, WireType::Text);
    EXPECT_EQ(columns[2].fields[0].length, 16);

    EXPECT_EQ(columns[3].fields.size(), 2u);
    EXPECT_NE(columns[3].findField("value"), nullptr);
    EXPECT_EQ(columns[3].findField("missing"), nullptr);
}

TEST(FieldMetadataTest, ToJsonRoundTrip) {
    auto field = FieldMetadata::make("OBJ", WireType::Object, 0, {
        FieldMetadata::make("a", WireType::Fixed, 3),
        FieldMetadata::make("b", WireType::Text)
    });

    auto copy = FieldMetadata::fromJson(field.toJson());
    EXPECT_EQ(copy.name, "OBJ");
    EXPECT_EQ(copy.type, WireType::Object);
    ASSERT_EQ(copy.fields.size(), 2u);
    EXPECT_EQ(copy.fields[0].scale, 3);
    EXPECT_EQ(copy.fields[1].typeName, "TEXT");
}

TEST(FieldMetadataTest, RejectsMalformedContainers) {
    EXPECT_THROW(FieldMetadata::make("ARR", WireType::Array, 0, {
        FieldMetadata::make("x", WireType::Text),
        FieldMetadata::make("y", WireType::Text)
    }), ConversionException);

    EXPECT_THROW(FieldMetadata::make("M", WireType::Map, 0, {
        FieldMetadata::make("key", WireType::Text)
    }), ConversionException);

    EXPECT_THROW(FieldMetadata::fromJson(json{{"name", "N"}, {"type", "fixed"}, {"scale", -1}}),
                 ConversionException);
    EXPECT_THROW(FieldMetadata::fromRowType(json::object()), ConversionException);
}

TEST(FieldMetadataTest, ChildMetadataSharesOwnership) {
    MetadataPtr child;
    {
        auto root = makeMetadataPtr(FieldMetadata::make("ARR", WireType::Array, 0, {
            FieldMetadata::make("", WireType::Fixed, 2)
        }));
        child = childMetadata(root, 0);
    }
    ASSERT_TRUE(child);
    EXPECT_EQ(child->type, WireType::Fixed);
    EXPECT_EQ(child->scale, 2);
}

TEST(NativeKindTest, FixedDependsOnScaleAndMode) {
    auto integer = FieldMetadata::make("I", WireType::Fixed, 0);
    auto scaled = FieldMetadata::make("S", WireType::Fixed, 2);

    EXPECT_EQ(nativeKindFor(integer, false, false), NativeKind::Int64);
    EXPECT_EQ(nativeKindFor(integer, true, false), NativeKind::BigInt);
    EXPECT_EQ(nativeKindFor(scaled, false, false), NativeKind::String);
    EXPECT_EQ(nativeKindFor(scaled, false, true), NativeKind::Double);
    EXPECT_EQ(nativeKindFor(scaled, true, true), NativeKind::Decimal);
}

TEST(NativeKindTest, StructuredWithoutFieldsIsText) {
    EXPECT_EQ(nativeKindFor(FieldMetadata::make("O", WireType::Object), false, false), NativeKind::String);
    EXPECT_EQ(nativeKindFor(FieldMetadata::make("T", WireType::Time), false, false), NativeKind::TimeOfDay);
    EXPECT_THROW(nativeKindFor(FieldMetadata::make("U", WireType::Unsupported), false, false),
                 UnsupportedTypeException);
}
