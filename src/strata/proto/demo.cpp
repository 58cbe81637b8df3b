/**
 * @file demo.cpp
 * @brief Demo protocol hooks (dissection, auto-update, padding).
 */
#include "strata/proto/demo.hpp"
#include "strata/proto/ip4.hpp"

namespace strata::proto {

using schema::FieldValue;
using schema::flags::kAutoUpdate;
using schema::flags::kTypeField;

namespace {
constexpr std::size_t kExtOffset = 10; // type + flags + src + dst
constexpr std::size_t kChunk     = 2;
}

const schema::Schema& Demo::header_schema() {
  static const schema::Schema s = schema::define("Demo", {
      {"type",    "B",  0x12, kTypeField},
      {"flags",   "B",  0},
      {"src",     "4s", Bytes(4, 0xff)},
      {"dst",     "4s", Bytes(4, 0xff)},
      {"ext",     "H",  {}},
      {"hlen",    "H",  17, kAutoUpdate},
      {"ylen",    "B",  4, kAutoUpdate},
      {"yolo",    "*",  to_bytes("1234")},
      {"options", "[]"},
  }, {schema::ByteOrder::Big, "src", "dst"});
  return s;
}

Demo::Demo() : Packet(header_schema()) {
  if (auto* tl = triggerlist("options")) tl->set_codec(&Demo::parse_options);
}

Status Demo::set_ext_flag(bool on) {
  const auto flags = get_uint("flags");
  if (auto st = set("flags", on ? (flags | kFlagExt) : (flags & ~std::uint64_t{kFlagExt})); !st) return st;
  if (on == is_active("ext")) return {};
  return set("ext", on ? FieldValue(0) : FieldValue::absent());
}

Result<packet::Triggerlist::Elements> Demo::parse_options(ByteView buf) {
  if (buf.size() % kChunk != 0) return fail(CodecError::Malformed);
  packet::Triggerlist::Elements out;
  for (std::size_t off = 0; off < buf.size(); off += kChunk) {
    const auto chunk = buf.subspan(off, kChunk);
    out.emplace_back(Bytes(chunk.begin(), chunk.end()));
  }
  return out;
}

Status Demo::dissect(ByteView buf) {
  auto flags = codec::read_uint(buf, 1, 1, schema::ByteOrder::Big);
  if (!flags) return fail(flags.error());

  // Activation and dynamic lengths first, so decode_header() sees the real layout.
  const bool ext = (*flags & kFlagExt) != 0;
  if (ext != is_active("ext")) {
    if (auto st = set("ext", ext ? FieldValue(0) : FieldValue::absent()); !st) return st;
  }
  const std::size_t off = kExtOffset + (ext ? 2 : 0);
  auto hlen = codec::read_uint(buf, off, 2, schema::ByteOrder::Big);
  if (!hlen) return fail(hlen.error());
  auto ylen = codec::read_uint(buf, off + 2, 1, schema::ByteOrder::Big);
  if (!ylen) return fail(ylen.error());
  if (auto st = set("yolo", Bytes(*ylen)); !st) return st;

  const std::size_t opts_off = off + 3 + *ylen;
  if (*hlen < opts_off) return fail(CodecError::Malformed);
  if (buf.size() < *hlen) return fail(CodecError::NeedData);
  if (auto st = init_triggerlist("options", buf.subspan(opts_off, *hlen - opts_off), &Demo::parse_options); !st) {
    return st;
  }

  auto n = decode_header(buf);
  if (!n) return fail(n.error());
  return init_handler(get_uint("type"), buf.subspan(*n));
}

Status Demo::update_fields() {
  if (auto_update_active("ylen")) {
    const auto yolo = get("yolo");
    const std::size_t n = yolo.bytes() ? yolo.bytes()->size() : 0;
    if (auto st = set("ylen", n); !st) return st;
  }
  if (auto_update_active("hlen")) {
    if (auto st = set("hlen", header_len()); !st) return st;
  }
  return {};
}

std::size_t Demo::trailer_len(std::size_t unpadded) const {
  return unpadded < kMinFrame ? kMinFrame - unpadded : 0;
}

Result<Bytes> Demo::bin(bool update_auto_fields) {
  auto out = Packet::bin(update_auto_fields);
  if (out) out->resize(out->size() + trailer_len(out->size()), 0);
  return out;
}

const packet::HandlerMap& Demo::handlers() const {
  static const packet::HandlerMap map = {
      {kTypeIp4, &packet::parse_layer<Ip4>},
  };
  return map;
}

} // namespace strata::proto
