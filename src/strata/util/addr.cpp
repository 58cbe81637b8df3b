/**
 * @file addr.cpp
 * @brief Address text conversion (inet_pton/inet_ntop for IPv4).
 */
#include "strata/util/addr.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <charconv>
#include <cstdio>
#include <cstring>
#include <system_error>

namespace strata::util {

namespace {
constexpr std::size_t kIp4Len  = 4;
constexpr std::size_t kMacLen  = 6;
constexpr std::size_t kMaxText = 64;
}

std::string ip4_to_string(ByteView b) {
  if (b.size() != kIp4Len) return {};
  char text[INET_ADDRSTRLEN] = {};
  if (inet_ntop(AF_INET, b.data(), text, sizeof(text)) == nullptr) return {};
  return text;
}

Result<Bytes> ip4_from_string(std::string_view text) {
  if (text.empty() || text.size() > kMaxText) return fail(CodecError::InvalidArgument);
  Bytes out(kIp4Len);
  if (inet_pton(AF_INET, std::string(text).c_str(), out.data()) != 1) {
    return fail(CodecError::InvalidArgument);
  }
  return out;
}

std::string mac_to_string(ByteView b) {
  if (b.size() != kMacLen) return {};
  char text[18] = {};
  std::snprintf(text, sizeof(text), "%02x:%02x:%02x:%02x:%02x:%02x",
                b[0], b[1], b[2], b[3], b[4], b[5]);
  return text;
}

Result<Bytes> mac_from_string(std::string_view text) {
  Bytes out;
  out.reserve(kMacLen);
  const char* p   = text.data();
  const char* end = text.data() + text.size();
  while (p < end && out.size() < kMacLen) {
    unsigned v = 0;
    auto [next, ec] = std::from_chars(p, end, v, 16);
    if (ec != std::errc{} || next - p != 2) return fail(CodecError::InvalidArgument);
    out.push_back(static_cast<std::uint8_t>(v));
    p = next;
    if (p < end) {
      if (*p != ':' || out.size() == kMacLen) return fail(CodecError::InvalidArgument);
      ++p;
    }
  }
  if (p != end || out.size() != kMacLen) return fail(CodecError::InvalidArgument);
  return out;
}

} // namespace strata::util
