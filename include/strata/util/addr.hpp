#pragma once
/**
 * @file addr.hpp
 * @brief Text <-> wire conversion for address fields (IPv4, MAC).
 */

#include <string>
#include <string_view>

#include "strata/core/bytes.hpp"
#include "strata/core/errors.hpp"

namespace strata::util {

/// "192.168.0.1" for a 4-byte span, "" otherwise.
std::string ip4_to_string(ByteView b);

/// 4 network-order bytes; InvalidArgument if @p text is not a dotted quad.
Result<Bytes> ip4_from_string(std::string_view text);

/// "aa:bb:cc:dd:ee:ff" for a 6-byte span, "" otherwise.
std::string mac_to_string(ByteView b);

/// 6 bytes; InvalidArgument unless @p text is six ':'-separated hex octets.
Result<Bytes> mac_from_string(std::string_view text);

} // namespace strata::util
