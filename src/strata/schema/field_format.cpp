/**
 * @file field_format.cpp
 * @brief Token parsing and value/format compatibility checks.
 */
#include "strata/schema/field_format.hpp"

#include <charconv>

namespace strata::schema {

std::optional<FieldFormat> FieldFormat::parse(std::string_view token) {
  if (token == kTriggerList) return FieldFormat(FormatKind::TriggerList, 0, 0, std::string(token));
  if (token == kDynamic)     return FieldFormat(FormatKind::Dynamic, 0, 0, std::string(token));
  if (token.empty()) return std::nullopt;

  // Optional repeat count, then exactly one code character.
  std::size_t count = 1;
  const char* first = token.data();
  const char* last  = token.data() + token.size() - 1;
  if (first != last) {
    const auto [p, ec] = std::from_chars(first, last, count);
    if (ec != std::errc{} || p != last || count == 0) return std::nullopt;
  }

  switch (*last) {
    case 'B': return FieldFormat(FormatKind::UInt, 1, count, std::string(token));
    case 'H': return FieldFormat(FormatKind::UInt, 2, count, std::string(token));
    case 'I': return FieldFormat(FormatKind::UInt, 4, count, std::string(token));
    case 'Q': return FieldFormat(FormatKind::UInt, 8, count, std::string(token));
    case 's': return FieldFormat(FormatKind::Bytes, 1, count, std::string(token));
    default:  return std::nullopt;
  }
}

std::size_t FieldFormat::encoded_len(const FieldValue& v) const noexcept {
  if (v.is_absent()) return 0;
  if (fixed()) return size();
  if (kind_ == FormatKind::Dynamic) {
    const auto* b = v.bytes();
    return b ? b->size() : 0;
  }
  return 0;
}

bool FieldFormat::accepts(const FieldValue& v) const noexcept {
  if (v.is_absent()) return true;
  switch (kind_) {
    case FormatKind::UInt:
      if (count_ == 1) return v.is_uint() && fits_width(v.as_uint(), width_);
      if (const auto* t = v.tuple()) {
        if (t->size() != count_) return false;
        for (auto x : *t) if (!fits_width(x, width_)) return false;
        return true;
      }
      return false;
    case FormatKind::Bytes:
      return v.is_bytes() && v.bytes()->size() == count_;
    case FormatKind::Dynamic:
      return v.is_bytes();
    case FormatKind::TriggerList:
      return false;
  }
  return false;
}

} // namespace strata::schema
