/**
 * @file ip4.cpp
 * @brief IPv4 hooks.
 */
#include "strata/proto/ip4.hpp"
#include "strata/proto/options.hpp"
#include "strata/proto/tcp.hpp"
#include "strata/util/checksum.hpp"

#include <algorithm>

namespace strata::proto {

using schema::flags::kAutoUpdate;
using schema::flags::kTypeField;

const schema::Schema& Ip4::header_schema() {
  static const schema::Schema s = schema::define("Ip4", {
      {"v_hl", "B",  0x45},
      {"tos",  "B",  0},
      {"len",  "H",  20, kAutoUpdate},
      {"id",   "H",  0},
      {"off",  "H",  0},
      {"ttl",  "B",  64},
      {"p",    "B",  kProtoTcp, kTypeField},
      {"sum",  "H",  0, kAutoUpdate},
      {"src",  "4s", Bytes(4, 0)},
      {"dst",  "4s", Bytes(4, 0)},
      {"opts", "[]"},
  }, {schema::ByteOrder::Big, "src", "dst"});
  return s;
}

Ip4::Ip4() : Packet(header_schema()) {
  if (auto* tl = triggerlist("opts")) tl->set_codec(&parse_tlv_options, &pack_tlv_option);
}

Status Ip4::dissect(ByteView buf) {
  if (buf.size() < kMinHeader) return fail(CodecError::NeedData);
  const std::size_t hlen = (buf[0] & 0x0f) * 4;
  if (hlen < kMinHeader) return fail(CodecError::Malformed);
  if (buf.size() < hlen) return fail(CodecError::NeedData);

  if (auto st = init_triggerlist("opts", buf.subspan(kMinHeader, hlen - kMinHeader),
                                 &parse_tlv_options, &pack_tlv_option); !st) {
    return st;
  }
  auto n = decode_header(buf);
  if (!n) return fail(n.error());

  // Total length bounds the body; trailing link-layer padding is not ours.
  std::size_t end = buf.size();
  const std::size_t total = get_uint("len");
  if (total >= *n && total < end) end = total;
  return init_handler(get_uint("p"), buf.subspan(*n, end - *n));
}

Status Ip4::update_fields() {
  const std::size_t hlen = header_len();
  if (hlen % 4 == 0 && hlen / 4 <= 0x0f && hl() != hlen) {
    if (auto st = set("v_hl", (get_uint("v_hl") & 0xf0) | (hlen / 4)); !st) return st;
  }
  if (auto_update_active("len")) {
    if (auto st = set("len", size()); !st) return st;
  }
  if (auto_update_active("sum")) {
    if (auto st = set("sum", 0); !st) return st;
    auto hdr = pack_header();
    if (!hdr) return fail(hdr.error());
    if (auto st = set("sum", util::in_cksum(*hdr)); !st) return st;
  }
  return {};
}

const packet::HandlerMap& Ip4::handlers() const {
  static const packet::HandlerMap map = {
      {kProtoTcp, &packet::parse_layer<Tcp>},
  };
  return map;
}

std::optional<Bytes> Ip4::callback_impl(std::string_view id) const {
  if (id != kPseudoHeader) return std::nullopt;
  const auto src = get("src");
  const auto dst = get("dst");
  if (!src.bytes() || !dst.bytes()) return std::nullopt;
  Bytes out = *src.bytes();
  append(out, *dst.bytes());
  out.push_back(0);
  out.push_back(static_cast<std::uint8_t>(get_uint("p")));
  return out;
}

bool Ip4::is_related(const packet::Packet& other) const {
  if (direction(other) == packet::Direction::Unknown) return false;
  return Packet::is_related(other);
}

} // namespace strata::proto
