/**
 * @file tcp.cpp
 * @brief TCP hooks.
 */
#include "strata/proto/tcp.hpp"
#include "strata/proto/ip4.hpp"
#include "strata/proto/options.hpp"
#include "strata/util/checksum.hpp"

namespace strata::proto {

using schema::flags::kAutoUpdate;

const schema::Schema& Tcp::header_schema() {
  static const schema::Schema s = schema::define("Tcp", {
      {"sport",  "H", 0xdead},
      {"dport",  "H", 0},
      {"seq",    "I", 0xdeadbeef},
      {"ack",    "I", 0},
      {"off_x2", "B", 0x50},
      {"flags",  "B", kSyn},
      {"win",    "H", 0xffff},
      {"sum",    "H", 0, kAutoUpdate},
      {"urp",    "H", 0},
      {"opts",   "[]"},
  }, {schema::ByteOrder::Big, "sport", "dport"});
  return s;
}

Tcp::Tcp() : Packet(header_schema()) {
  if (auto* tl = triggerlist("opts")) tl->set_codec(&parse_tlv_options, &pack_tlv_option);
}

Status Tcp::dissect(ByteView buf) {
  if (buf.size() < kMinHeader) return fail(CodecError::NeedData);
  const std::size_t hlen = (buf[12] >> 4) * 4;
  if (hlen < kMinHeader) return fail(CodecError::Malformed);
  if (buf.size() < hlen) return fail(CodecError::NeedData);

  if (auto st = init_triggerlist("opts", buf.subspan(kMinHeader, hlen - kMinHeader),
                                 &parse_tlv_options, &pack_tlv_option); !st) {
    return st;
  }
  auto n = decode_header(buf);
  if (!n) return fail(n.error());
  const auto rest = buf.subspan(*n);
  return set_raw_body(Bytes(rest.begin(), rest.end()));
}

Status Tcp::update_fields() {
  const std::size_t hlen = header_len();
  if (hlen % 4 == 0 && hlen / 4 <= 0x0f && off() != hlen) {
    if (auto st = set("off_x2", ((hlen / 4) << 4) | (get_uint("off_x2") & 0x0f)); !st) return st;
  }
  if (!auto_update_active("sum")) return {};

  // Without an Ip4 below there is no pseudo header; the checksum is left alone.
  const auto pseudo = query_callback(Ip4::kPseudoHeader);
  if (!pseudo) return {};

  if (auto st = set("sum", 0); !st) return st;
  auto hdr = pack_header();
  if (!hdr) return fail(hdr.error());

  const std::size_t seg_len = size();
  const std::uint8_t len_be[2] = {static_cast<std::uint8_t>(seg_len >> 8),
                                  static_cast<std::uint8_t>(seg_len & 0xff)};
  std::uint32_t sum = util::in_cksum_add(0, *pseudo);
  sum = util::in_cksum_add(sum, len_be);
  sum = util::in_cksum_add(sum, *hdr);
  if (auto* up = upper()) {
    auto b = up->bin();
    if (!b) return fail(b.error());
    sum = util::in_cksum_add(sum, *b);
  } else {
    sum = util::in_cksum_add(sum, raw_body());
  }
  return set("sum", util::in_cksum_done(sum));
}

bool Tcp::is_related(const packet::Packet& other) const {
  if (direction(other) == packet::Direction::Unknown) return false;
  return Packet::is_related(other);
}

} // namespace strata::proto
