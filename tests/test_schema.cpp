/**
 * @file test_schema.cpp
 * @brief Tests for field formats, field values and schema validation.
 *
 * Validates:
 *  - Format token parsing (integers, byte strings, tuples, dynamic, Triggerlist)
 *  - Derived tables (name lookup, defaults, aggregate format, fixed length)
 *  - Every definition-time validation error
 */

#include <gtest/gtest.h>
#include <string>

#include "strata/schema/field_format.hpp"
#include "strata/schema/field_value.hpp"
#include "strata/schema/schema.hpp"

using strata::Bytes;
using strata::schema::FieldFormat;
using strata::schema::FieldValue;
using strata::schema::FormatKind;
using strata::schema::Schema;
using strata::schema::SchemaError;
namespace flags = strata::schema::flags;

// ---------------------------------------------------------------- Formats

/**
 * @test FieldFormat_Parse_Tokens
 * @brief Known tokens map to kind/width/count/size; junk is rejected.
 */
TEST(FieldFormat, FieldFormat_Parse_Tokens) {
  auto b = FieldFormat::parse("B");
  ASSERT_TRUE(b);
  EXPECT_EQ(b->kind(), FormatKind::UInt);
  EXPECT_EQ(b->size(), 1u);
  EXPECT_TRUE(b->is_scalar_uint());

  auto q = FieldFormat::parse("Q");
  ASSERT_TRUE(q);
  EXPECT_EQ(q->size(), 8u);

  auto s = FieldFormat::parse("6s");
  ASSERT_TRUE(s);
  EXPECT_EQ(s->kind(), FormatKind::Bytes);
  EXPECT_EQ(s->size(), 6u);

  auto t = FieldFormat::parse("2H");
  ASSERT_TRUE(t);
  EXPECT_TRUE(t->is_tuple());
  EXPECT_FALSE(t->is_scalar_uint());
  EXPECT_EQ(t->size(), 4u);

  auto d = FieldFormat::parse("*");
  ASSERT_TRUE(d);
  EXPECT_EQ(d->kind(), FormatKind::Dynamic);
  EXPECT_FALSE(d->fixed());

  auto tl = FieldFormat::parse("[]");
  ASSERT_TRUE(tl);
  EXPECT_EQ(tl->kind(), FormatKind::TriggerList);

  EXPECT_FALSE(FieldFormat::parse(""));
  EXPECT_FALSE(FieldFormat::parse("x"));
  EXPECT_FALSE(FieldFormat::parse("0B"));
  EXPECT_FALSE(FieldFormat::parse("2"));
}

/**
 * @test FieldFormat_Accepts_WidthAndKind
 * @brief Values are accepted only if kind and width fit.
 */
TEST(FieldFormat, FieldFormat_Accepts_WidthAndKind) {
  auto h = *FieldFormat::parse("H");
  EXPECT_TRUE(h.accepts(FieldValue(0xffff)));
  EXPECT_FALSE(h.accepts(FieldValue(0x10000)));
  EXPECT_FALSE(h.accepts(FieldValue(Bytes{1, 2})));
  EXPECT_TRUE(h.accepts(FieldValue::absent()));

  auto s4 = *FieldFormat::parse("4s");
  EXPECT_TRUE(s4.accepts(FieldValue(Bytes(4, 0))));
  EXPECT_FALSE(s4.accepts(FieldValue(Bytes(3, 0))));

  auto t = *FieldFormat::parse("2B");
  EXPECT_TRUE(t.accepts(FieldValue(FieldValue::Tuple{1, 2})));
  EXPECT_FALSE(t.accepts(FieldValue(FieldValue::Tuple{1, 2, 3})));
  EXPECT_FALSE(t.accepts(FieldValue(FieldValue::Tuple{1, 256})));

  auto d = *FieldFormat::parse("*");
  EXPECT_EQ(d.encoded_len(FieldValue(Bytes(7, 0))), 7u);
  EXPECT_EQ(d.encoded_len(FieldValue::absent()), 0u);
}

TEST(FieldValue, ToString_Kinds) {
  EXPECT_EQ(FieldValue::absent().to_string(), "None");
  EXPECT_EQ(FieldValue(0x12).to_string(), "0x12");
  EXPECT_EQ(FieldValue(Bytes{0xab, 0x01}).to_string(), "\\xAB\\x01");
  EXPECT_EQ(FieldValue(FieldValue::Tuple{1, 2}).to_string(), "(0x1, 0x2)");
}

// ---------------------------------------------------------------- Schema

/**
 * @test Schema_Build_DerivedTables
 * @brief Lookup tables, aggregate format and fixed length come from active defaults.
 */
TEST(Schema, Schema_Build_DerivedTables) {
  auto s = Schema::build("Proto", {
      {"type", "B",  0x12, flags::kTypeField},
      {"src",  "4s", Bytes(4, 0xff)},
      {"opt",  "H",  {}},
      {"len",  "H",  0, flags::kAutoUpdate},
      {"data", "*",  Bytes{}},
      {"opts", "[]"},
  });
  ASSERT_TRUE(s);
  EXPECT_EQ(s->name(), "Proto");
  EXPECT_EQ(s->field_count(), 6u);
  EXPECT_EQ(s->format_string(), ">B4sH");
  EXPECT_EQ(s->header_len(), 7u);
  ASSERT_TRUE(s->type_field());
  EXPECT_EQ(*s->type_field(), 0u);
  EXPECT_EQ(s->index_of("len"), std::optional<std::size_t>(3));
  EXPECT_FALSE(s->index_of("nope"));
  ASSERT_NE(s->default_of("src"), nullptr);
  EXPECT_EQ(*s->default_of("src"), FieldValue(Bytes(4, 0xff)));
  EXPECT_TRUE(s->field(3).is_auto_update());
  EXPECT_TRUE(s->field(5).is_triggerlist());
  EXPECT_FALSE(s->src_field());
}

TEST(Schema, Schema_LittleEndian_Prefix) {
  auto s = Schema::build("Le", {{"a", "H", 1}}, {strata::schema::ByteOrder::Little});
  ASSERT_TRUE(s);
  EXPECT_EQ(s->format_string(), "<H");
}

/**
 * @test Schema_Build_Rejects_BadTables
 * @brief Each definition error is reported by value.
 */
TEST(Schema, Schema_Build_Rejects_BadTables) {
  EXPECT_EQ(Schema::build("", {{"a", "B", 0}}).error(), SchemaError::EmptyName);
  EXPECT_EQ(Schema::build("P", {{"", "B", 0}}).error(), SchemaError::EmptyName);
  EXPECT_EQ(Schema::build("P", {{"a", "B", 0}, {"a", "H", 0}}).error(), SchemaError::DuplicateField);
  EXPECT_EQ(Schema::build("P", {{"a", "Z", 0}}).error(), SchemaError::BadFormat);
  EXPECT_EQ(Schema::build("P", {{"a", "B", 0x100}}).error(), SchemaError::BadDefault);
  EXPECT_EQ(Schema::build("P", {{"a", "2s", Bytes{1}}}).error(), SchemaError::BadDefault);
  EXPECT_EQ(Schema::build("P", {{"a", "[]", Bytes{1}}}).error(), SchemaError::BadDefault);
  EXPECT_EQ(Schema::build("P", {{"a", "B", 0, flags::kTypeField},
                                {"b", "B", 0, flags::kTypeField}}).error(),
            SchemaError::MultipleTypeFields);
  EXPECT_EQ(Schema::build("P", {{"a", "4s", Bytes(4, 0), flags::kTypeField}}).error(),
            SchemaError::TypeFieldNotScalar);
  EXPECT_EQ(Schema::build("P", {{"a", "*", Bytes{}, flags::kAutoUpdate}}).error(),
            SchemaError::AutoUpdateNotFixed);
  EXPECT_EQ(Schema::build("P", {{"a", "H", {}, flags::kAutoUpdate}}).error(),
            SchemaError::AutoUpdateNotFixed);
  EXPECT_EQ(Schema::build("P", {{"a", "B", 0}}, {strata::schema::ByteOrder::Big, "a", "b"}).error(),
            SchemaError::BadAddressField);
  EXPECT_EQ(Schema::build("P", {{"a", "*", Bytes{}}, {"b", "B", 0}},
                          {strata::schema::ByteOrder::Big, "a", "b"}).error(),
            SchemaError::BadAddressField);
}

TEST(Schema, Schema_AddressPair_Resolved) {
  auto s = Schema::build("P", {{"s", "4s", Bytes(4, 0)}, {"d", "4s", Bytes(4, 0)}},
                         {strata::schema::ByteOrder::Big, "s", "d"});
  ASSERT_TRUE(s);
  EXPECT_EQ(s->src_field(), std::optional<std::size_t>(0));
  EXPECT_EQ(s->dst_field(), std::optional<std::size_t>(1));
}

TEST(Schema, ErrorLabels) {
  EXPECT_STREQ(strata::schema::to_string(SchemaError::BadFormat), "bad_format");
  EXPECT_STREQ(strata::schema::to_string(SchemaError::AutoUpdateNotFixed), "auto_update_not_fixed");
}
