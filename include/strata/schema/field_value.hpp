/**
 * @file field_value.hpp
 * @brief Current value of one header field: absent, integer, tuple or byte string.
 *
 * The absent state is the "inactive field" sentinel: an absent field contributes
 * zero bytes on the wire. Any concrete value activates the field.
 */
#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "strata/core/bytes.hpp"

namespace strata::schema {

class FieldValue {
public:
  /// Flattened positional integers for multi-count formats (e.g. "2H").
  using Tuple = std::vector<std::uint64_t>;

  /// Absent (inactive field).
  FieldValue() noexcept = default;

  /// Integer value; stored widened, width is checked at pack time.
  template <class T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  FieldValue(T v) noexcept : v_(static_cast<std::uint64_t>(v)) {}

  FieldValue(Bytes b) : v_(std::move(b)) {}
  FieldValue(Tuple t) : v_(std::move(t)) {}

  static FieldValue absent() noexcept { return FieldValue{}; }

  bool is_absent() const noexcept { return std::holds_alternative<std::monostate>(v_); }
  bool is_uint()   const noexcept { return std::holds_alternative<std::uint64_t>(v_); }
  bool is_bytes()  const noexcept { return std::holds_alternative<Bytes>(v_); }
  bool is_tuple()  const noexcept { return std::holds_alternative<Tuple>(v_); }

  /// Integer value, 0 for any other kind.
  std::uint64_t as_uint() const noexcept {
    const auto* p = std::get_if<std::uint64_t>(&v_);
    return p ? *p : 0;
  }

  /// Byte string, nullptr for any other kind.
  const Bytes* bytes() const noexcept { return std::get_if<Bytes>(&v_); }

  /// Tuple, nullptr for any other kind.
  const Tuple* tuple() const noexcept { return std::get_if<Tuple>(&v_); }

  /// Debug text: 0x12, (1, 2), \x31\x32, or None.
  std::string to_string() const;

  bool operator==(const FieldValue&) const = default;

private:
  std::variant<std::monostate, std::uint64_t, Bytes, Tuple> v_{};
};

} // namespace strata::schema
