#pragma once
/**
 * @file ip4.hpp
 * @brief IPv4 layer: options Triggerlist, auto length/checksum, dispatch on protocol.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "strata/packet/packet.hpp"

namespace strata::proto {

class Ip4 : public packet::Packet {
public:
  static constexpr std::uint8_t kProtoTcp  = 6;
  static constexpr std::size_t  kMinHeader = 20;

  /// Callback id answered for upper layers: src(4) dst(4) 0 proto.
  static constexpr std::string_view kPseudoHeader = "ip4.pseudo";

  Ip4();

  static const schema::Schema& header_schema();

  /// Header length in bytes as encoded in v_hl.
  std::size_t hl() const noexcept { return (get_uint("v_hl") & 0x0f) * 4; }

  bool is_related(const packet::Packet& other) const override;

protected:
  Status dissect(ByteView buf) override;
  Status update_fields() override;
  const packet::HandlerMap& handlers() const override;
  std::optional<Bytes> callback_impl(std::string_view id) const override;
};

} // namespace strata::proto
