#pragma once
/**
 * @file tcp.hpp
 * @brief TCP layer: kind/length/value options, checksum over the Ip4 pseudo header.
 */

#include <cstddef>
#include <cstdint>

#include "strata/packet/packet.hpp"

namespace strata::proto {

class Tcp : public packet::Packet {
public:
  static constexpr std::uint8_t kFin = 0x01;
  static constexpr std::uint8_t kSyn = 0x02;
  static constexpr std::uint8_t kRst = 0x04;
  static constexpr std::uint8_t kPsh = 0x08;
  static constexpr std::uint8_t kAck = 0x10;

  static constexpr std::size_t kMinHeader = 20;

  Tcp();

  static const schema::Schema& header_schema();

  /// Header length in bytes as encoded in off_x2.
  std::size_t off() const noexcept { return (get_uint("off_x2") >> 4) * 4; }

  bool is_related(const packet::Packet& other) const override;

protected:
  Status dissect(ByteView buf) override;
  Status update_fields() override;
  bool needs_update() const noexcept override { return update_pending() || lower_header_changed(); }
};

} // namespace strata::proto
