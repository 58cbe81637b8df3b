/**
 * @file checksum.cpp
 * @brief Internet checksum (ones' complement sum of 16-bit words).
 */
#include "strata/util/checksum.hpp"

namespace strata::util {

std::uint32_t in_cksum_add(std::uint32_t sum, ByteView data) noexcept {
  for (std::size_t i = 0; i < data.size(); i += 2) {
    const std::uint32_t msb = data[i];
    const std::uint32_t lsb = i + 1 < data.size() ? data[i + 1] : 0;
    sum += msb << 8 | lsb;
    // Fold early so long buffers cannot overflow the accumulator.
    if (sum & 0x80000000u) sum = (sum & 0xffff) + (sum >> 16);
  }
  return sum;
}

std::uint16_t in_cksum_done(std::uint32_t sum) noexcept {
  while ((sum >> 16) != 0) sum = (sum & 0xffff) + (sum >> 16);
  return static_cast<std::uint16_t>(~sum & 0xffff);
}

} // namespace strata::util
