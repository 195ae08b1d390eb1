#include "../test_base.hpp"
#include "sfpp/core/detail/json_decoder.hpp"
#include "sfpp/core/structured_builder.hpp"
#include "sfpp/core/structured_value.hpp"
#include <gtest/gtest.h>

using namespace sfpp::core;
using namespace sfpp::test;

class StructuredBuilderTest : public SfppTestBase {
protected:
    static MetadataPtr personColumn() {
        return column("PERSON", WireType::Object, 0, {
            FieldMetadata::make("id", WireType::Fixed, 0),
            FieldMetadata::make("big", WireType::Fixed, 0),
            FieldMetadata::make("price", WireType::Fixed, 2),
            FieldMetadata::make("name", WireType::Text),
            FieldMetadata::make("active", WireType::Boolean),
            FieldMetadata::make("avatar", WireType::Binary),
            FieldMetadata::make("born", WireType::Date),
            FieldMetadata::make("seen", WireType::TimestampNtz),
            FieldMetadata::make("wakeup", WireType::Time),
            FieldMetadata::make("meta", WireType::Variant),
            FieldMetadata::make("tags", WireType::Array, 0, {
                FieldMetadata::make("", WireType::Text)
            }),
            FieldMetadata::make("scores", WireType::Map, 0, {
                FieldMetadata::make("key", WireType::Text),
                FieldMetadata::make("value", WireType::Fixed, 0)
            }),
            FieldMetadata::make("address", WireType::Object, 0, {
                FieldMetadata::make("city", WireType::Text),
                FieldMetadata::make("lat", WireType::Real)
            })
        });
    }

    static constexpr const char* PERSON_JSON = R"({
        "id": 42,
        "big": 123456789012345678901234567890,
        "price": 12.50,
        "name": "Ann",
        "active": true,
        "avatar": "0a0B",
        "born": "1990-05-17",
        "seen": "2024-03-01 08:15:30.123456789",
        "wakeup": "06:30:00.000000000",
        "meta": {"k": 1.10, "list": [1, "two"]},
        "tags": ["a", "b", null],
        "scores": {"math": 5, "art": null},
        "address": {"city": "Oslo", "lat": 59.91}
    })";

    StructuredPtr buildPerson(const ConversionContext& ctx) {
        auto v = buildStructured(personColumn(), PERSON_JSON, ctx);
        EXPECT_TRUE(std::holds_alternative<StructuredPtr>(v));
        return std::get<StructuredPtr>(v);
    }
};

// ============== Objects ==============

TEST_F(StructuredBuilderTest, ObjectPrimitiveFields) {
    auto person = buildPerson(ctx_);

    EXPECT_EQ(person->getInt64("id"), 42);
    EXPECT_DOUBLE_EQ(person->getDouble("price"), 12.5);
    EXPECT_EQ(person->getDecimal("price"), Decimal(BigInt(1250), 2));
    EXPECT_EQ(person->getString("name"), "Ann");
    EXPECT_TRUE(person->getBool("active"));
    EXPECT_EQ(person->getBytes("avatar"), (Bytes{0x0a, 0x0b}));
}

TEST_F(StructuredBuilderTest, NumbersNeverPassThroughDouble) {
    auto person = buildPerson(ctx_);

    EXPECT_EQ(person->getRaw("big"), Value(std::string("123456789012345678901234567890")));
    EXPECT_EQ(person->getBigInt("big").toString(), "123456789012345678901234567890");
    // Nested fixed values beyond int64 need higher precision
    EXPECT_THROW(person->getValue("big"), DataFormatException);

    ConversionOptions options;
    options.higherPrecision = true;
    auto precise = buildPerson(contextWith(options));
    EXPECT_TRUE(std::holds_alternative<BigInt>(precise->getValue("big")));
    EXPECT_TRUE(std::holds_alternative<Decimal>(precise->getValue("price")));
}

TEST_F(StructuredBuilderTest, TemporalFieldsUseSessionFormats) {
    auto person = buildPerson(ctx_);

    auto born = person->getTimestamp("born").civil();
    EXPECT_EQ(born.year, 1990);
    EXPECT_EQ(born.month, 5u);
    EXPECT_EQ(born.day, 17u);

    auto seen = person->getTimestamp("seen");
    EXPECT_EQ(seen.nanosecond(), 123'456'789);
    EXPECT_EQ(seen.offsetSeconds(), 0);

    EXPECT_EQ(person->getTimeOfDay("wakeup"), TimeOfDay::fromParts(6, 30, 0));
}

TEST_F(StructuredBuilderTest, LtzFieldTakesSessionLocation) {
    auto field = column("EVENT", WireType::Object, 0, {
        FieldMetadata::make("at", WireType::TimestampLtz)
    });
    ConversionContext ctx = ctx_;
    ctx.location = Location::fromOffsetMinutes(120);

    auto event = std::get<StructuredPtr>(
        buildStructured(field, R"({"at": "2024-03-01 08:00:00.000000000 +0100"})", ctx));
    auto at = event->getTimestamp("at");
    EXPECT_EQ(at.unixSeconds(), 1709276400);  // 07:00 UTC
    EXPECT_EQ(at.offsetSeconds(), 7200);
}

TEST_F(StructuredBuilderTest, SemistructuredChildKeepsJsonText) {
    auto person = buildPerson(ctx_);
    EXPECT_EQ(person->getString("meta"), R"({"k":1.10,"list":[1,"two"]})");
}

TEST_F(StructuredBuilderTest, NestedContainers) {
    auto person = buildPerson(ctx_);

    auto tags = person->getArray("tags");
    ASSERT_EQ(tags->size(), 3u);
    EXPECT_EQ(tags->elementKind(), NativeKind::String);
    EXPECT_EQ(tags->at(0), Value(std::string("a")));
    EXPECT_TRUE(isNull(tags->at(2)));

    auto address = person->getObject("address");
    EXPECT_EQ(address->getString("city"), "Oslo");
    EXPECT_DOUBLE_EQ(address->getDouble("lat"), 59.91);
}

TEST_F(StructuredBuilderTest, FieldAccessErrors) {
    auto person = buildPerson(ctx_);

    EXPECT_THROW(person->getValue("nope"), ConversionException);
    EXPECT_THROW(person->getString("id"), UnsupportedTypeException);
    EXPECT_THROW(person->getBool("name"), UnsupportedTypeException);
    EXPECT_THROW(person->getArray("scores"), UnsupportedTypeException);
    EXPECT_FALSE(person->contains("nope"));
}

TEST_F(StructuredBuilderTest, MissingAndNullFields) {
    auto person = std::get<StructuredPtr>(
        buildStructured(personColumn(), R"({"id": 1, "name": null})", ctx_));
    EXPECT_FALSE(person->isNull("id"));
    EXPECT_TRUE(person->isNull("name"));
    EXPECT_TRUE(person->isNull("address"));
    EXPECT_EQ(person->fieldNames().size(), 13u);

    EXPECT_EQ(person->getObject("address"), nullptr);
    EXPECT_EQ(person->getArray("tags"), nullptr);
    EXPECT_EQ(person->getMap("scores"), nullptr);

    auto withNulls = std::get<StructuredPtr>(buildStructured(
        personColumn(), R"({"tags": null, "scores": null, "address": null})", ctx_));
    EXPECT_EQ(withNulls->getObject("address"), nullptr);
    EXPECT_EQ(withNulls->getArray("tags"), nullptr);
    EXPECT_EQ(withNulls->getMap("scores"), nullptr);
}

TEST_F(StructuredBuilderTest, NullColumnAndWrongShape) {
    EXPECT_TRUE(isNull(buildStructured(personColumn(), "null", ctx_)));
    EXPECT_THROW(buildStructured(personColumn(), "[1, 2]", ctx_), UnsupportedTypeException);
}

TEST_F(StructuredBuilderTest, MalformedJson) {
    try {
        buildStructured(personColumn(), R"({"id": )", ctx_);
        FAIL() << "Expected DataFormatException";
    } catch (const DataFormatException& e) {
        EXPECT_EQ(e.getErrorCode(), ERR_INVALID_JSON);
        EXPECT_EQ(e.getColumn(), "PERSON");
    }
}

TEST_F(StructuredBuilderTest, EqualityByContent) {
    ConversionOptions options;
    options.higherPrecision = true;
    auto ctx = contextWith(options);

    auto a = buildPerson(ctx);
    auto b = buildPerson(ctx);
    EXPECT_EQ(*a, *b);

    auto other = std::get<StructuredPtr>(buildStructured(personColumn(), R"({"id": 43})", ctx));
    EXPECT_NE(*a, *other);
}

// ============== Arrays ==============

TEST_F(StructuredBuilderTest, ArrayOfFixed) {
    auto field = column("NUMS", WireType::Array, 0, {FieldMetadata::make("", WireType::Fixed, 0)});
    auto list = std::get<ValueListPtr>(buildStructured(field, "[1, null, -3]", ctx_));

    EXPECT_EQ(list->elementKind(), NativeKind::Int64);
    ASSERT_EQ(list->size(), 3u);
    EXPECT_EQ(list->at(0), Value(int64_t{1}));
    EXPECT_TRUE(isNull(list->at(1)));
    EXPECT_EQ(list->at(2), Value(int64_t{-3}));
}

TEST_F(StructuredBuilderTest, ArrayOfScaledFixedByMode) {
    auto field = column("NUMS", WireType::Array, 0, {FieldMetadata::make("", WireType::Fixed, 2)});

    auto doubles = std::get<ValueListPtr>(buildStructured(field, "[1.25]", ctx_));
    EXPECT_EQ(doubles->elementKind(), NativeKind::Double);
    EXPECT_DOUBLE_EQ(std::get<double>(doubles->at(0)), 1.25);

    ConversionOptions options;
    options.higherPrecision = true;
    auto decimals = std::get<ValueListPtr>(buildStructured(field, "[1.25]", contextWith(options)));
    EXPECT_EQ(decimals->elementKind(), NativeKind::Decimal);
    EXPECT_EQ(std::get<Decimal>(decimals->at(0)).toString(), "1.25");
}

TEST_F(StructuredBuilderTest, ArrayOfObjects) {
    auto field = column("ITEMS", WireType::Array, 0, {
        FieldMetadata::make("", WireType::Object, 0, {
            FieldMetadata::make("sku", WireType::Text),
            FieldMetadata::make("qty", WireType::Fixed, 0)
        })
    });
    auto list = std::get<ValueListPtr>(
        buildStructured(field, R"([{"sku": "x", "qty": 2}, null])", ctx_));
    ASSERT_EQ(list->size(), 2u);
    EXPECT_EQ(list->elementKind(), NativeKind::Object);

    auto first = std::get<StructuredPtr>(list->at(0));
    EXPECT_EQ(first->getString("sku"), "x");
    EXPECT_EQ(first->getInt64("qty"), 2);
    EXPECT_TRUE(isNull(list->at(1)));
}

TEST_F(StructuredBuilderTest, DepthGuard) {
    auto field = column("DEEP", WireType::Array, 0, {
        FieldMetadata::make("", WireType::Array, 0, {
            FieldMetadata::make("", WireType::Array, 0, {
                FieldMetadata::make("", WireType::Fixed, 0)
            })
        })
    });

    EXPECT_NO_THROW(buildStructured(field, "[[[1]]]", ctx_));

    ConversionOptions options;
    options.maxStructuredDepth = 2;
    EXPECT_THROW(buildStructured(field, "[[[1]]]", contextWith(options)), UnsupportedTypeException);
}

// ============== Maps ==============

TEST_F(StructuredBuilderTest, MapNullValuesBecomeZero) {
    auto person = buildPerson(ctx_);
    auto scores = person->getMap("scores");

    EXPECT_EQ(scores->keyKind(), NativeKind::String);
    EXPECT_EQ(scores->valueKind(), NativeKind::Int64);
    EXPECT_FALSE(scores->valuesNullable());
    EXPECT_EQ(scores->at(MapKey{std::string("math")}), Value(int64_t{5}));
    EXPECT_EQ(scores->at(MapKey{std::string("art")}), Value(int64_t{0}));
}

TEST_F(StructuredBuilderTest, MapNullValuesWhenNullable) {
    ConversionOptions options;
    options.mapValuesNullable = true;
    auto person = buildPerson(contextWith(options));
    auto scores = person->getMap("scores");

    EXPECT_TRUE(scores->valuesNullable());
    EXPECT_TRUE(isNull(scores->at(MapKey{std::string("art")})));
}

TEST_F(StructuredBuilderTest, MapWithIntegerKeys) {
    auto field = column("M", WireType::Map, 0, {
        FieldMetadata::make("key", WireType::Fixed, 0),
        FieldMetadata::make("value", WireType::Text)
    });
    auto map = std::get<ValueMapPtr>(buildStructured(field, R"({"1": "one", "-2": "minus two"})", ctx_));

    EXPECT_EQ(map->keyKind(), NativeKind::Int64);
    EXPECT_EQ(map->size(), 2u);
    EXPECT_EQ(map->at(MapKey{int64_t{-2}}), Value(std::string("minus two")));
    EXPECT_TRUE(map->contains(MapKey{int64_t{1}}));

    EXPECT_THROW(buildStructured(field, R"({"x": "bad"})", ctx_), DataFormatException);
}

TEST_F(StructuredBuilderTest, MapWithUnsupportedKeyType) {
    auto field = column("M", WireType::Map, 0, {
        FieldMetadata::make("key", WireType::Boolean),
        FieldMetadata::make("value", WireType::Text)
    });
    EXPECT_THROW(buildStructured(field, R"({"true": "x"})", ctx_), UnsupportedTypeException);
    EXPECT_THROW(buildStructured(field, "{}", ctx_), UnsupportedTypeException);
    EXPECT_TRUE(isNull(buildStructured(field, "null", ctx_)));
}

// ============== Number preserving parser ==============

TEST(JsonDecoderTest, KeepsNumberText) {
    auto node = detail::parse_json_preserving_numbers(R"({"a": 1.50, "b": [18446744073709551616, -1e3]})");
    EXPECT_TRUE(detail::is_number_text(node["a"]));
    EXPECT_EQ(detail::number_text(node["a"]), "1.50");
    EXPECT_EQ(detail::number_text(node["b"][0]), "18446744073709551616");
    EXPECT_EQ(detail::dump_preserving_numbers(node), R"({"a":1.50,"b":[18446744073709551616,-1e3]})");
}
