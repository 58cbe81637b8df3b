/**
 * @file field_format.hpp
 * @brief Wire encoding tag of a header field (struct-like tokens).
 *
 * Tokens:
 *  - "B" "H" "I" "Q"        unsigned 8/16/32/64-bit integer
 *  - "<n>B" ... "<n>Q"      tuple of n integers, flattened on the wire
 *  - "<n>s" (or "s")        fixed byte string of n bytes
 *  - kDynamic ("*")         variable byte string; its length is the value's length
 *  - kTriggerList ("[]")    Triggerlist slot (variable, lazily parsed)
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "strata/schema/field_value.hpp"

namespace strata::schema {

/// Sentinel format: variable-length byte string.
inline constexpr std::string_view kDynamic = "*";
/// Sentinel format: Triggerlist slot.
inline constexpr std::string_view kTriggerList = "[]";

/// Byte order of all integer fields in one schema.
enum class ByteOrder : std::uint8_t { Big, Little };

enum class FormatKind : std::uint8_t {
  UInt,        ///< One or more fixed-width unsigned integers
  Bytes,       ///< Fixed-length byte string
  Dynamic,     ///< Variable-length byte string
  TriggerList  ///< Triggerlist region
};

class FieldFormat {
public:
  /// Parse a token; std::nullopt if it is not a valid format.
  static std::optional<FieldFormat> parse(std::string_view token);

  FormatKind kind() const noexcept { return kind_; }

  /// Element width in bytes (1/2/4/8 for integers, 1 for byte strings, 0 otherwise).
  std::size_t width() const noexcept { return width_; }

  /// Element count (tuple arity or byte-string length).
  std::size_t count() const noexcept { return count_; }

  /// True for formats whose wire size is known from the format alone.
  bool fixed() const noexcept { return kind_ == FormatKind::UInt || kind_ == FormatKind::Bytes; }

  /// Wire size of a fixed format; 0 for Dynamic/TriggerList.
  std::size_t size() const noexcept { return fixed() ? width_ * count_ : 0; }

  bool is_tuple() const noexcept { return kind_ == FormatKind::UInt && count_ > 1; }

  /// Scalar unsigned integer (usable as a type discriminator).
  bool is_scalar_uint() const noexcept { return kind_ == FormatKind::UInt && count_ == 1; }

  /// Token this format was parsed from.
  const std::string& token() const noexcept { return token_; }

  /// Wire size @p v would occupy (absent -> 0, dynamic -> value length).
  std::size_t encoded_len(const FieldValue& v) const noexcept;

  /// True if @p v can be packed in this format (absent is always accepted).
  bool accepts(const FieldValue& v) const noexcept;

private:
  FieldFormat(FormatKind k, std::size_t width, std::size_t count, std::string token)
    : kind_(k), width_(static_cast<std::uint8_t>(width)),
      count_(static_cast<std::uint32_t>(count)), token_(std::move(token)) {}

  FormatKind    kind_{FormatKind::UInt};
  std::uint8_t  width_{0};
  std::uint32_t count_{0};
  std::string   token_;
};

/// True if @p v fits into an unsigned integer of @p width bytes.
constexpr bool fits_width(std::uint64_t v, std::size_t width) noexcept {
  return width >= 8 || v < (std::uint64_t{1} << (8 * width));
}

} // namespace strata::schema
