/**
 * @file test_codec.cpp
 * @brief Tests for HeaderLayout and the header encode/decode algorithms.
 *
 * Validates:
 *  - Integer primitives in both byte orders
 *  - Decode of active fields only; NeedData on short buffers
 *  - Inactive fields contribute zero bytes; relayout bookkeeping
 *  - PackFailed for values that do not fit their format
 */

#include <gtest/gtest.h>
#include <cstdint>

#include "strata/codec/header_codec.hpp"
#include "strata/schema/schema.hpp"

using strata::Bytes;
using strata::ByteView;
using strata::CodecError;
using strata::Result;
using strata::codec::HeaderLayout;
using strata::schema::ByteOrder;
using strata::schema::FieldFormat;
using strata::schema::FieldSpec;
using strata::schema::FieldValue;
using strata::schema::Schema;
namespace codec = strata::codec;

namespace {

/// Layouts in these tests carry no Triggerlist regions.
class NoRegions final : public codec::RegionSource {
public:
  std::size_t region_len(std::size_t) const override { return 0; }
  Result<Bytes> region_bytes(std::size_t) override { return Bytes{}; }
};

const Schema& sample_schema() {
  static const Schema s = strata::schema::define("Sample", {
      {"type", "B",  0x12},
      {"opt",  "H",  {}},
      {"len",  "H",  0},
      {"addr", "4s", Bytes{10, 0, 0, 1}},
      {"pair", "2B", FieldValue::Tuple{1, 2}},
  });
  return s;
}

} // namespace

// ---------------------------------------------------------------- Primitives

TEST(Codec, ReadWrite_Uint_BothOrders) {
  Bytes out;
  codec::write_uint(out, 0x1234, 2, ByteOrder::Big);
  codec::write_uint(out, 0x1234, 2, ByteOrder::Little);
  EXPECT_EQ(out, (Bytes{0x12, 0x34, 0x34, 0x12}));

  auto be = codec::read_uint(out, 0, 2, ByteOrder::Big);
  auto le = codec::read_uint(out, 2, 2, ByteOrder::Little);
  ASSERT_TRUE(be && le);
  EXPECT_EQ(*be, 0x1234u);
  EXPECT_EQ(*le, 0x1234u);

  auto past = codec::read_uint(out, 3, 2, ByteOrder::Big);
  ASSERT_FALSE(past);
  EXPECT_EQ(past.error(), CodecError::NeedData);
}

/**
 * @test Codec_EncodeValue_PackFailed
 * @brief Oversized integers and wrong-length byte strings do not pack.
 */
TEST(Codec, Codec_EncodeValue_PackFailed) {
  Bytes out;
  auto h = *FieldFormat::parse("H");
  auto st = codec::encode_value(h, FieldValue(std::uint64_t{0x1122334455667788}), ByteOrder::Big, out);
  ASSERT_FALSE(st);
  EXPECT_EQ(st.error(), CodecError::PackFailed);

  auto s4 = *FieldFormat::parse("4s");
  st = codec::encode_value(s4, FieldValue(Bytes{1, 2, 3}), ByteOrder::Big, out);
  ASSERT_FALSE(st);
  EXPECT_EQ(st.error(), CodecError::PackFailed);
  EXPECT_TRUE(out.empty());
}

// ---------------------------------------------------------------- Layout

/**
 * @test Layout_Defaults_FormatAndLength
 * @brief A fresh layout activates every non-absent default.
 */
TEST(Codec, Layout_Defaults_FormatAndLength) {
  HeaderLayout l(sample_schema());
  EXPECT_EQ(l.format_string(), ">BH4s2B");
  EXPECT_EQ(l.fixed_len(), 1u + 2u + 4u + 2u);
  EXPECT_EQ(l.active().size(), 4u);
  EXPECT_EQ(l.relayouts(), 0u);
}

/**
 * @test Layout_InactiveField_ZeroBytes
 * @brief Activating adds exactly the field width; deactivating removes it again.
 */
TEST(Codec, Layout_InactiveField_ZeroBytes) {
  HeaderLayout l(sample_schema());
  NoRegions r;
  const auto base = codec::header_len(l, r);

  const auto opt = *l.index_of("opt");
  EXPECT_TRUE(l.assign(opt, FieldValue(7)));
  EXPECT_EQ(codec::header_len(l, r), base + 2);
  EXPECT_EQ(l.format_string(), ">BHH4s2B");

  // Same activity state: no relayout.
  EXPECT_FALSE(l.assign(opt, FieldValue(8)));

  EXPECT_TRUE(l.assign(opt, FieldValue::absent()));
  EXPECT_EQ(codec::header_len(l, r), base);
  EXPECT_EQ(l.relayouts(), 2u);

  auto packed = codec::encode(l, r);
  ASSERT_TRUE(packed);
  EXPECT_EQ(packed->size(), base);
}

TEST(Codec, Layout_Encode_FlattensTuples) {
  HeaderLayout l(sample_schema());
  NoRegions r;
  l.assign(*l.index_of("len"), FieldValue(0x0102));
  auto packed = codec::encode(l, r);
  ASSERT_TRUE(packed);
  EXPECT_EQ(*packed, (Bytes{0x12, 0x01, 0x02, 10, 0, 0, 1, 1, 2}));
}

/**
 * @test Layout_Decode_ActiveOnly
 * @brief Decode consumes the active fixed header and leaves inactive fields absent.
 */
TEST(Codec, Layout_Decode_ActiveOnly) {
  HeaderLayout l(sample_schema());
  NoRegions r;
  const Bytes wire{0x33, 0x00, 0x10, 192, 168, 0, 1, 9, 8, 0xee, 0xff};

  auto n = codec::decode(l, wire, r);
  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 9u);
  EXPECT_EQ(l.slot(0).value, FieldValue(0x33));
  EXPECT_TRUE(l.slot(*l.index_of("opt")).value.is_absent());
  EXPECT_EQ(l.slot(*l.index_of("len")).value, FieldValue(0x10));
  EXPECT_EQ(l.slot(*l.index_of("addr")).value, FieldValue(Bytes{192, 168, 0, 1}));
  EXPECT_EQ(l.slot(*l.index_of("pair")).value, FieldValue(FieldValue::Tuple{9, 8}));
}

TEST(Codec, Layout_Decode_NeedData) {
  HeaderLayout l(sample_schema());
  NoRegions r;
  const Bytes shortbuf{0x12, 0x00, 0x04};
  auto n = codec::decode(l, shortbuf, r);
  ASSERT_FALSE(n);
  EXPECT_EQ(n.error(), CodecError::NeedData);
  EXPECT_TRUE(strata::is_unpack_error(n.error()));
}

/**
 * @test Layout_Append_DynamicField
 * @brief Appended fields extend format and length; dynamic fields decode by current length.
 */
TEST(Codec, Layout_Append_DynamicField) {
  HeaderLayout l(sample_schema());
  NoRegions r;
  const auto i = l.append(FieldSpec{"tail", *FieldFormat::parse("*"), {}, 0});
  EXPECT_EQ(l.index_of("tail"), std::optional<std::size_t>(i));
  EXPECT_EQ(l.format_string(), ">BH4s2B");

  l.assign(i, FieldValue(Bytes(3, 0)));
  EXPECT_EQ(l.format_string(), ">BH4s2B*");
  EXPECT_EQ(l.dynamic_len(), 3u);

  const Bytes wire{0x12, 0, 4, 1, 2, 3, 4, 5, 6, 0xaa, 0xbb, 0xcc, 0xdd};
  auto n = codec::decode(l, wire, r);
  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 12u);
  EXPECT_EQ(l.slot(i).value, FieldValue(Bytes{0xaa, 0xbb, 0xcc}));
}
