/**
 * @file bytes.hpp
 * @brief Owning and non-owning byte buffer vocabulary shared by every layer.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/// Owning, contiguous byte buffer (wire bytes, raw bodies, byte-string fields).
using Bytes = std::vector<std::uint8_t>;

/// Read-only view into a byte buffer. Never outlives the buffer it points into.
using ByteView = std::span<const std::uint8_t>;

/// Build a byte buffer from text (no terminator), e.g. to_bytes("1234").
inline Bytes to_bytes(std::string_view s) {
    return Bytes(s.begin(), s.end());
}

/// Append @p tail to @p out.
inline void append(Bytes& out, ByteView tail) {
    out.insert(out.end(), tail.begin(), tail.end());
}

/// Render bytes as "\x12\x34" (debug only, not a wire format).
std::string byte2hex(ByteView buf);

} // namespace strata
