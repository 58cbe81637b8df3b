#pragma once
/**
 * @file demo.hpp
 * @brief Demo protocol: exercises every header mechanism in one small layer.
 *
 * Layout (big endian):
 *   type   B   0x12      next layer type (0x66 -> Ip4)
 *   flags  B   0         0x80: ext present
 *   src    4s  ff*4
 *   dst    4s  ff*4
 *   ext    H   inactive  present only while flags & 0x80
 *   hlen   H   auto      header length
 *   ylen   B   auto      length of yolo
 *   yolo   *   "1234"    variable byte string
 *   options []           2-byte chunks up to hlen
 *
 * Frames shorter than kMinFrame are zero-padded by bin(); size() counts the padding.
 */

#include <cstddef>
#include <cstdint>

#include "strata/packet/packet.hpp"

namespace strata::proto {

class Demo : public packet::Packet {
public:
  static constexpr std::uint8_t  kTypeIp4  = 0x66;
  static constexpr std::uint8_t  kFlagExt  = 0x80;
  static constexpr std::size_t   kMinFrame = 20;

  Demo();

  static const schema::Schema& header_schema();

  /// ext flag (bit 0x80 of flags); toggling it activates/deactivates "ext".
  bool ext_flag() const noexcept { return (get_uint("flags") & kFlagExt) != 0; }
  Status set_ext_flag(bool on);

  Result<Bytes> bin(bool update_auto_fields = true) override;

  /// 2-byte chunks; Malformed on an odd length.
  static Result<packet::Triggerlist::Elements> parse_options(ByteView buf);

protected:
  Status dissect(ByteView buf) override;
  Status update_fields() override;
  std::size_t trailer_len(std::size_t unpadded) const override;
  const packet::HandlerMap& handlers() const override;
};

} // namespace strata::proto
