#pragma once
/**
 * @file options.hpp
 * @brief Kind/length/value option lists shared by Ip4 and Tcp.
 *
 * Kinds 0 (end of list) and 1 (no-op) are single bytes; every other kind is
 * followed by a length byte that counts kind + length + value, so a value
 * holds at most 253 bytes.
 */

#include <cstddef>
#include <cstdint>

#include "strata/core/bytes.hpp"
#include "strata/core/errors.hpp"
#include "strata/packet/triggerlist.hpp"

namespace strata::proto {

inline constexpr std::uint8_t kOptEnd = 0;
inline constexpr std::uint8_t kOptNop = 1;

/// Largest kind + length + value an option can declare.
inline constexpr std::size_t kOptMaxLen = 0xff;

/// Split @p buf into key/value elements (key = kind byte); Malformed on truncation.
Result<packet::Triggerlist::Elements> parse_tlv_options(ByteView buf);

/// Wire form of one option element; PackFailed if the length byte would overflow.
Result<Bytes> pack_tlv_option(const packet::Triggerlist::KeyValue& kv);

} // namespace strata::proto
