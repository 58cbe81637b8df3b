/**
 * @file field_value.cpp
 * @brief Debug formatting for field values.
 */
#include "strata/schema/field_value.hpp"

#include <cstdio>

namespace strata::schema {

namespace {
std::string hex(std::uint64_t v) {
  char buf[24];
  std::snprintf(buf, sizeof(buf), "0x%llx", static_cast<unsigned long long>(v));
  return buf;
}
}

std::string FieldValue::to_string() const {
  if (is_absent()) return "None";
  if (is_uint()) return hex(as_uint());
  if (const auto* b = bytes()) return byte2hex(*b);
  std::string out = "(";
  const auto& t = *tuple();
  for (std::size_t i = 0; i < t.size(); ++i) {
    if (i) out += ", ";
    out += hex(t[i]);
  }
  out += ")";
  return out;
}

} // namespace strata::schema
