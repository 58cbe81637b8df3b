#pragma once
/**
 * @file checksum.hpp
 * @brief RFC 1071 internet checksum over byte spans (IP/TCP/UDP/ICMP).
 */

#include <cstdint>

#include "strata/core/bytes.hpp"

namespace strata::util {

/// Add the 16-bit big-endian words of @p data to a running sum (odd tail padded with 0).
std::uint32_t in_cksum_add(std::uint32_t sum, ByteView data) noexcept;

/// Fold a running sum to 16 bits and complement it.
std::uint16_t in_cksum_done(std::uint32_t sum) noexcept;

/// One-shot checksum of @p data.
inline std::uint16_t in_cksum(ByteView data) noexcept {
  return in_cksum_done(in_cksum_add(0, data));
}

} // namespace strata::util
