/**
 * @file test_layering.cpp
 * @brief Tests for layer composition, dispatch, callbacks and relations.
 *
 * Validates:
 *  - Concatenation attaches to the innermost layer; bin() = header + body bin()
 *  - Body writes are rejected while a layer is attached; take_body() detaches
 *  - Dispatch on the type field, unknown types and failing handlers degrade to raw
 *  - Depth guard, callback lookup surviving a body swap
 *  - Relation and direction policy (same / reverse / unknown)
 */

#include <gtest/gtest.h>
#include <memory>

#include "capture_sink.hpp"
#include "strata/config/config_loader.hpp"
#include "strata/packet/packet.hpp"

using strata::Bytes;
using strata::ByteView;
using strata::CodecError;
using strata::Result;
using strata::obs::EventKind;
using strata::packet::Packet;
using strata::packet::PacketPtr;
namespace packet = strata::packet;
namespace config = strata::config;
namespace flags  = strata::schema::flags;

namespace {

/// Leaf: one-byte header, answers nothing.
class Leaf : public Packet {
public:
  Leaf() : Packet(header_schema()) {}
  static const strata::schema::Schema& header_schema() {
    static const strata::schema::Schema s =
        strata::schema::define("Leaf", {{"tag", "B", 0xaa}}, {});
    return s;
  }
};

/// Leaf that always fails to decode.
class Broken : public Packet {
public:
  Broken() : Packet(Leaf::header_schema()) {}
protected:
  strata::Status dissect(ByteView) override { return strata::fail(CodecError::Malformed); }
};

/// Middle layer: type byte + src/dst; 1 -> Leaf, 2 -> Broken, 3 -> Middle.
class Middle : public Packet {
public:
  Middle() : Packet(header_schema()) {}
  static const strata::schema::Schema& header_schema() {
    static const strata::schema::Schema s = strata::schema::define("Middle", {
        {"type", "B", 1, flags::kTypeField},
        {"src",  "B", 1},
        {"dst",  "B", 2},
    }, {strata::schema::ByteOrder::Big, "src", "dst"});
    return s;
  }

protected:
  const packet::HandlerMap& handlers() const override {
    static const packet::HandlerMap map = {
        {1, &packet::parse_layer<Leaf>},
        {2, &packet::parse_layer<Broken>},
        {3, &packet::parse_layer<Middle>},
    };
    return map;
  }
  std::optional<Bytes> callback_impl(std::string_view id) const override {
    if (id == "addr") return Bytes{static_cast<std::uint8_t>(get_uint("src")),
                                   static_cast<std::uint8_t>(get_uint("dst"))};
    return std::nullopt;
  }
};

/// Restores the default codec configuration after a test changes it.
struct ConfigGuard {
  ~ConfigGuard() { config::apply(config::CodecConfig{}); }
};

template <class L, class R>
concept Stackable = requires(L& l, R r) { l / std::move(r); };

} // namespace

static_assert(Stackable<Packet, PacketPtr>);
static_assert(!Stackable<Packet, Bytes>, "raw bytes must go through set_raw_body()");
static_assert(!Stackable<Packet, ByteView>);

// ---------------------------------------------------------------- Composition

/**
 * @test Layering_Concat_BodyAndBin
 * @brief layer1 / layer2 exposes layer2 as body and bin() = pack_header() + layer2.bin().
 */
TEST(Layering, Layering_Concat_BodyAndBin) {
  Middle l1;
  ASSERT_TRUE(l1.set_raw_body(Bytes{0x01, 0x02}));
  auto l2 = std::make_unique<Leaf>();
  Leaf* l2p = l2.get();

  l1 / std::move(l2);
  ASSERT_EQ(l1.upper(), l2p);
  EXPECT_TRUE(std::holds_alternative<PacketPtr>(l1.body()));
  EXPECT_TRUE(l1.changed());

  auto whole = l1.bin();
  ASSERT_TRUE(whole);
  auto hdr = l1.pack_header();
  auto body = l2p->bin();
  ASSERT_TRUE(hdr && body);
  Bytes expect = *hdr;
  expect.insert(expect.end(), body->begin(), body->end());
  EXPECT_EQ(*whole, expect);
  EXPECT_EQ(*whole, (Bytes{0x01, 0x01, 0x02, 0xaa}));
}

TEST(Layering, Layering_Chain_Innermost_And_Lookup) {
  Middle a;
  a / std::make_unique<Middle>() / std::make_unique<Leaf>();

  ASSERT_NE(a.upper(), nullptr);
  ASSERT_NE(a.upper()->upper(), nullptr);
  EXPECT_EQ(&a.innermost(), a.upper()->upper());
  EXPECT_NE(a.layer<Leaf>(), nullptr);
  EXPECT_EQ(a.layer<Middle>(), &a);
  EXPECT_EQ(a.layer<Broken>(), nullptr);
  EXPECT_EQ(a.size(), 3u + 3u + 1u);
}

TEST(Layering, Layering_Stack_NullLayer_Reported) {
  strata_test::ScopedCapture cap;
  Middle a;
  a / PacketPtr{};
  EXPECT_EQ(a.upper(), nullptr);
  EXPECT_EQ(cap.sink.count_of(EventKind::PackFailed), 1u);
  EXPECT_EQ(a.set_body(nullptr).error(), CodecError::NullLayer);
}

/**
 * @test Layering_RawBody_Rejected_While_Attached
 * @brief set_raw_body() fails with a layer attached and works again after take_body().
 */
TEST(Layering, Layering_RawBody_Rejected_While_Attached) {
  Middle a;
  ASSERT_TRUE(a.set_body(std::make_unique<Leaf>()));
  auto st = a.set_raw_body(Bytes{1});
  ASSERT_FALSE(st);
  EXPECT_EQ(st.error(), CodecError::BodyHandlerAttached);

  PacketPtr detached = a.take_body();
  ASSERT_TRUE(detached != nullptr);
  EXPECT_EQ(a.upper(), nullptr);
  EXPECT_FALSE(detached->query_callback("addr"));
  EXPECT_TRUE(a.set_raw_body(Bytes{1}));
  EXPECT_TRUE(a.take_body() == nullptr);
}

// ---------------------------------------------------------------- Dispatch

TEST(Layering, Layering_Dispatch_KnownType) {
  auto p = packet::parse<Middle>(Bytes{0x03, 9, 8, 0x01, 5, 6, 0xaa, 0xff});
  ASSERT_TRUE(p);
  auto* mid = dynamic_cast<Middle*>((*p)->upper());
  ASSERT_NE(mid, nullptr);
  auto* leaf = dynamic_cast<Leaf*>(mid->upper());
  ASSERT_NE(leaf, nullptr);
  EXPECT_EQ(leaf->get_uint("tag"), 0xaau);
  EXPECT_EQ(Bytes(leaf->raw_body().begin(), leaf->raw_body().end()), Bytes{0xff});

  auto round = (*p)->bin();
  ASSERT_TRUE(round);
  EXPECT_EQ(*round, (Bytes{0x03, 9, 8, 0x01, 5, 6, 0xaa, 0xff}));
}

/**
 * @test Layering_Dispatch_UnknownType_Raw
 * @brief An unregistered type keeps the rest as raw bytes without error.
 */
TEST(Layering, Layering_Dispatch_UnknownType_Raw) {
  strata_test::ScopedCapture cap;
  auto p = packet::parse<Middle>(Bytes{0x7f, 1, 2, 0xde, 0xad});
  ASSERT_TRUE(p);
  EXPECT_EQ((*p)->upper(), nullptr);
  EXPECT_EQ(Bytes((*p)->raw_body().begin(), (*p)->raw_body().end()), (Bytes{0xde, 0xad}));
  EXPECT_EQ(cap.sink.snapshot().dispatch_fallbacks, 1u);
}

TEST(Layering, Layering_Dispatch_FailedHandler_Degrades) {
  strata_test::ScopedCapture cap;
  auto p = packet::parse<Middle>(Bytes{0x02, 1, 2, 0x55});
  ASSERT_TRUE(p);
  EXPECT_EQ((*p)->upper(), nullptr);
  EXPECT_EQ((*p)->raw_body().size(), 1u);
  EXPECT_EQ(cap.sink.snapshot().dispatch_fallbacks, 1u);
}

TEST(Layering, Layering_Dispatch_FailedHandler_Propagates) {
  ConfigGuard restore;
  config::CodecConfig cfg;
  cfg.degrade_failed_handlers = false;
  config::apply(cfg);

  auto p = packet::parse<Middle>(Bytes{0x02, 1, 2, 0x55});
  ASSERT_FALSE(p);
  EXPECT_EQ(p.error(), CodecError::Malformed);
}

/**
 * @test Layering_Dispatch_DepthLimit
 * @brief Self-nesting stops at max_layer_depth and keeps the remainder raw.
 */
TEST(Layering, Layering_Dispatch_DepthLimit) {
  ConfigGuard restore;
  config::CodecConfig cfg;
  cfg.max_layer_depth = 2;
  config::apply(cfg);
  strata_test::ScopedCapture cap;

  Bytes wire;
  for (int i = 0; i < 5; ++i) wire.insert(wire.end(), {0x03, 1, 2});
  auto p = packet::parse<Middle>(wire);
  ASSERT_TRUE(p);

  int depth = 0;
  for (Packet* l = p->get(); l != nullptr; l = l->upper()) ++depth;
  EXPECT_EQ(depth, 3);
  EXPECT_EQ(cap.sink.count_of(EventKind::DepthLimit), 1u);
  EXPECT_EQ((*p)->size(), wire.size());
}

// ---------------------------------------------------------------- Callback

/**
 * @test Layering_Callback_Survives_BodySwap
 * @brief A replacement layer keeps reaching the same lower layer.
 */
TEST(Layering, Layering_Callback_Survives_BodySwap) {
  Middle lower;
  ASSERT_TRUE(lower.set("src", 7));
  ASSERT_TRUE(lower.set_body(std::make_unique<Leaf>()));
  auto via_first = lower.upper()->query_callback("addr");
  ASSERT_TRUE(via_first);
  EXPECT_EQ(*via_first, (Bytes{7, 2}));

  ASSERT_TRUE(lower.set_body(std::make_unique<Leaf>()));
  auto via_second = lower.upper()->query_callback("addr");
  ASSERT_TRUE(via_second);
  EXPECT_EQ(*via_second, (Bytes{7, 2}));
  EXPECT_FALSE(lower.upper()->query_callback("other"));

  Leaf alone;
  EXPECT_FALSE(alone.query_callback("addr"));
}

// ---------------------------------------------------------------- Relations

/**
 * @test Layering_Relation_RawMatchesAnything
 * @brief Raw bodies relate to anything; nested bodies of different types do not.
 */
TEST(Layering, Layering_Relation_RawMatchesAnything) {
  Middle a;
  Middle b;
  EXPECT_TRUE(a.is_related(b));

  a / std::make_unique<Leaf>();
  EXPECT_TRUE(a.is_related(b));
  EXPECT_TRUE(b.is_related(a));

  b / std::make_unique<Leaf>();
  EXPECT_TRUE(a.is_related(b));

  Middle c;
  c / std::make_unique<Middle>();
  EXPECT_FALSE(a.is_related(c));
}

/**
 * @test Layering_Direction_Classification
 * @brief Address pairs classify as same, reverse or unknown; same wins when both match.
 */
TEST(Layering, Layering_Direction_Classification) {
  Middle a;
  Middle b;
  EXPECT_EQ(a.direction(b), packet::Direction::Same);

  ASSERT_TRUE(b.assign({{"src", 2}, {"dst", 1}}));
  EXPECT_EQ(a.direction(b), packet::Direction::Reverse);
  EXPECT_EQ(b.direction(a), packet::Direction::Reverse);

  b.reverse_address();
  EXPECT_EQ(a.direction(b), packet::Direction::Same);

  ASSERT_TRUE(b.set("dst", 9));
  EXPECT_EQ(a.direction(b), packet::Direction::Unknown);

  // No address pair on the layer at all.
  Leaf x;
  Leaf y;
  EXPECT_EQ(x.direction(y), packet::Direction::Unknown);

  // src == dst on both sides: same and reverse both match.
  ASSERT_TRUE(a.set("dst", 1));
  ASSERT_TRUE(b.assign({{"src", 1}, {"dst", 1}}));
  EXPECT_EQ(a.direction(b), packet::Direction::Same);

  EXPECT_STREQ(packet::to_string(packet::Direction::Same), "same");
  EXPECT_STREQ(packet::to_string(packet::Direction::Reverse), "reverse");
  EXPECT_STREQ(packet::to_string(packet::Direction::Unknown), "unknown");
}
