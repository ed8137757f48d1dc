// tests/unit/schema/test_value.cpp - IntValue, LabelValue and keyword tables

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <set>

#include "itl/schema/type_enums.hpp"
#include "itl/schema/value.hpp"

using namespace itl;

TEST(SchemaIntValue, SignedAndUnsignedExtremes)
{
  const IntValue min = IntValue::from_signed(std::numeric_limits<int64_t>::min());
  EXPECT_TRUE(min.is_negative());
  EXPECT_EQ(min.magnitude(), uint64_t{1} << 63);
  ASSERT_TRUE(min.as_int64().has_value());
  EXPECT_EQ(*min.as_int64(), std::numeric_limits<int64_t>::min());

  const IntValue max = IntValue::from_unsigned(std::numeric_limits<uint64_t>::max());
  EXPECT_FALSE(max.is_negative());
  EXPECT_FALSE(max.as_int64().has_value());
  EXPECT_EQ(max.to_string(), "18446744073709551615");

  EXPECT_EQ(IntValue::from_signed(-42).to_string(), "-42");
  EXPECT_FALSE(IntValue::from_signed(0).is_negative());
}

TEST(SchemaIntValue, FitsBits)
{
  EXPECT_TRUE(IntValue::from_signed(255).fits_bits(8, true));
  EXPECT_FALSE(IntValue::from_signed(256).fits_bits(8, true));
  EXPECT_FALSE(IntValue::from_signed(-1).fits_bits(8, true));

  EXPECT_TRUE(IntValue::from_signed(127).fits_bits(8, false));
  EXPECT_FALSE(IntValue::from_signed(128).fits_bits(8, false));
  EXPECT_TRUE(IntValue::from_signed(-128).fits_bits(8, false));
  EXPECT_FALSE(IntValue::from_signed(-129).fits_bits(8, false));

  EXPECT_TRUE(IntValue::from_unsigned(std::numeric_limits<uint64_t>::max()).fits_bits(64, true));
  EXPECT_FALSE(IntValue::from_unsigned(std::numeric_limits<uint64_t>::max()).fits_bits(64, false));
  EXPECT_TRUE(IntValue::from_signed(std::numeric_limits<int64_t>::min()).fits_bits(64, false));
  EXPECT_TRUE(IntValue::from_unsigned(std::numeric_limits<uint64_t>::max()).fits_bits(65, false));

  EXPECT_FALSE(IntValue::from_signed(0).fits_bits(0, true));
}

TEST(SchemaIntValue, Ordering)
{
  EXPECT_LT(IntValue::from_signed(-5), IntValue::from_signed(-1));
  EXPECT_LT(IntValue::from_signed(-1), IntValue::from_signed(0));
  EXPECT_LT(IntValue::from_signed(3), IntValue::from_unsigned(4));
  EXPECT_EQ(IntValue::from_signed(7), IntValue::from_unsigned(7));
}

TEST(SchemaLabelValue, KindsCompareSeparately)
{
  const LabelValue one = LabelValue::make_integer(IntValue::from_signed(1));
  const LabelValue yes = LabelValue::make_bool(true);
  const LabelValue text = LabelValue::make_string("1");

  EXPECT_NE(one, yes);
  EXPECT_NE(one, text);

  std::set<LabelValue> labels{one, yes, text, LabelValue::make_integer(IntValue::from_unsigned(1))};
  EXPECT_EQ(labels.size(), 3u);

  EXPECT_EQ(one.to_string(), "1");
  EXPECT_EQ(yes.to_string(), "true");
  EXPECT_EQ(text.to_string(), "\"1\"");
}

TEST(SchemaTypeEnums, KindKeywords)
{
  EXPECT_EQ(type_kind_from_keyword("record"), TypeKind::Record);
  EXPECT_EQ(type_kind_from_keyword("bitset"), TypeKind::Bitset);
  EXPECT_FALSE(type_kind_from_keyword("struct").has_value());
  EXPECT_EQ(to_string(TypeKind::Sequence), "sequence");

  EXPECT_TRUE(is_legacy_kind(TypeKind::Rune));
  EXPECT_TRUE(is_legacy_kind(TypeKind::Enum));
  EXPECT_FALSE(is_legacy_kind(TypeKind::Union));
}

TEST(SchemaTypeEnums, FloatModels)
{
  EXPECT_EQ(float_model_from_string("binary64"), FloatModel::Binary64);
  EXPECT_EQ(float_model_from_string("decimal128"), FloatModel::Decimal128);
  EXPECT_FALSE(float_model_from_string("binary8").has_value());
  EXPECT_EQ(to_string(FloatModel::Decimal32), "decimal32");
}

TEST(SchemaTypeEnums, IntEncodings)
{
  const auto u8 = parse_int_encoding("uint8");
  ASSERT_TRUE(u8.has_value());
  EXPECT_EQ(u8->bits, 8);
  EXPECT_TRUE(u8->is_unsigned);

  const auto i32 = parse_int_encoding("int32");
  ASSERT_TRUE(i32.has_value());
  EXPECT_EQ(i32->bits, 32);
  EXPECT_FALSE(i32->is_unsigned);

  EXPECT_FALSE(parse_int_encoding("int").has_value());
  EXPECT_FALSE(parse_int_encoding("int0").has_value());
  EXPECT_FALSE(parse_int_encoding("varint").has_value());
  EXPECT_FALSE(parse_int_encoding("uint8le").has_value());
}
