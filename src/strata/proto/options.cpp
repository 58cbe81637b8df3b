/**
 * @file options.cpp
 * @brief TLV option parsing/packing.
 */
#include "strata/proto/options.hpp"
#include "strata/packet/packet.hpp"

namespace strata::proto {

using packet::Triggerlist;

Result<Triggerlist::Elements> parse_tlv_options(ByteView buf) {
  Triggerlist::Elements out;
  std::size_t off = 0;
  while (off < buf.size()) {
    const std::uint8_t kind = buf[off];
    if (kind == kOptEnd || kind == kOptNop) {
      out.emplace_back(Triggerlist::KeyValue{Bytes{kind}, Bytes{}});
      ++off;
      continue;
    }
    if (off + 1 >= buf.size()) return fail(CodecError::Malformed);
    const std::size_t len = buf[off + 1];
    if (len < 2 || off + len > buf.size()) return fail(CodecError::Malformed);
    const auto value = buf.subspan(off + 2, len - 2);
    out.emplace_back(Triggerlist::KeyValue{Bytes{kind}, Bytes(value.begin(), value.end())});
    off += len;
  }
  return out;
}

Result<Bytes> pack_tlv_option(const Triggerlist::KeyValue& kv) {
  Bytes out = kv.key;
  if (kv.key.size() == 1 && (kv.key[0] == kOptEnd || kv.key[0] == kOptNop)) return out;
  const std::size_t len = kv.key.size() + 1 + kv.value.size();
  if (len > kOptMaxLen) return fail(CodecError::PackFailed);
  out.push_back(static_cast<std::uint8_t>(len));
  append(out, kv.value);
  return out;
}

} // namespace strata::proto
