#pragma once
/**
 * @file schema.hpp
 * @brief Static, per-protocol description of ordered header fields.
 *
 * A Schema is built once when a protocol type is defined and lives for the
 * process. Field order is the on-wire order. Derived lookup tables (name→index,
 * defaults, aggregate format string, nominal fixed header length) are computed
 * in build() and immutable afterwards, so one Schema may be read concurrently
 * by any number of packet instances without locking.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "strata/compat/expected.hpp"
#include "strata/schema/field_format.hpp"
#include "strata/schema/field_value.hpp"

namespace strata::schema {

/// Field flags (bit set).
namespace flags {
inline constexpr std::uint8_t kNone       = 0x00;
inline constexpr std::uint8_t kTypeField  = 0x01; ///< Selects the next layer's type
inline constexpr std::uint8_t kAutoUpdate = 0x02; ///< Recomputed before serialization
}

/// Definition-time validation failures.
enum class SchemaError : std::uint8_t {
  EmptyName = 1,       ///< Schema or field without a name
  DuplicateField,      ///< Two fields share a name
  BadFormat,           ///< Unknown format token
  BadDefault,          ///< Default value does not fit the format
  MultipleTypeFields,  ///< More than one type discriminator
  TypeFieldNotScalar,  ///< Discriminator is not a single unsigned integer
  AutoUpdateNotFixed,  ///< Auto-update field is variable-length or starts inactive
  BadAddressField      ///< Address pair names a missing or variable-length field
};

const char* to_string(SchemaError e) noexcept;

/// One row of a protocol's header table, as written by the protocol author.
struct FieldDef {
  std::string_view name;
  std::string_view format;
  FieldValue       default_value{};
  std::uint8_t     flags{flags::kNone};
};

/// Validated field entry.
struct FieldSpec {
  std::string  name;
  FieldFormat  format;
  FieldValue   default_value;
  std::uint8_t flags{flags::kNone};

  bool is_type_field()  const noexcept { return (flags & flags::kTypeField) != 0; }
  bool is_auto_update() const noexcept { return (flags & flags::kAutoUpdate) != 0; }
  bool is_triggerlist() const noexcept { return format.kind() == FormatKind::TriggerList; }
};

/// Per-schema options.
struct SchemaOptions {
  ByteOrder        order{ByteOrder::Big}; ///< Byte order of integer fields
  std::string_view src_field{};           ///< Address pair used by direction()/reverse_address()
  std::string_view dst_field{};
};

class Schema {
public:
  // Transparent hash/equal functors enable heterogeneous lookup with string_view.
  struct NameHash {
    using is_transparent = void;
    std::size_t operator()(std::string_view s) const noexcept {
      return std::hash<std::string_view>{}(s);
    }
  };
  struct NameEq {
    using is_transparent = void;
    bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
  };
  using IndexMap = std::unordered_map<std::string, std::size_t, NameHash, NameEq>;

  /**
   * @brief Validate a field table and compute the derived lookup tables.
   * @param name Protocol name (used in repr and diagnostics).
   * @param fields Ordered field table.
   * @param opts Byte order and optional address pair.
   */
  static strata_detail::expected<Schema, SchemaError>
  build(std::string name, const std::vector<FieldDef>& fields, SchemaOptions opts = {});

  const std::string& name() const noexcept { return name_; }
  ByteOrder order() const noexcept { return order_; }

  std::size_t field_count() const noexcept { return fields_.size(); }
  const FieldSpec& field(std::size_t i) const noexcept { return fields_[i]; }
  const std::vector<FieldSpec>& fields() const noexcept { return fields_; }

  std::optional<std::size_t> index_of(std::string_view name) const noexcept;
  const FieldValue* default_of(std::string_view name) const noexcept;

  std::optional<std::size_t> type_field() const noexcept { return type_field_; }
  std::optional<std::size_t> src_field() const noexcept { return src_field_; }
  std::optional<std::size_t> dst_field() const noexcept { return dst_field_; }

  /// Byte-order prefix + tokens of fixed fields active by default, e.g. ">B4s4sHB".
  const std::string& format_string() const noexcept { return format_string_; }

  /// Total wire size of fixed fields active by default.
  std::size_t header_len() const noexcept { return header_len_; }

private:
  Schema() = default;

  std::string                name_;
  ByteOrder                  order_{ByteOrder::Big};
  std::vector<FieldSpec>     fields_;
  IndexMap                   index_;
  std::optional<std::size_t> type_field_;
  std::optional<std::size_t> src_field_;
  std::optional<std::size_t> dst_field_;
  std::string                format_string_;
  std::size_t                header_len_{0};
};

/// Byte-order prefix used in format strings ('>' big, '<' little).
constexpr char order_prefix(ByteOrder o) noexcept { return o == ByteOrder::Big ? '>' : '<'; }

/**
 * @brief Build a schema for a protocol definition.
 *
 * An invalid table at protocol-definition time is a programming error: the
 * error is reported through the diagnostic sink and the process aborts
 * (bring-up fail-fast). Use Schema::build() to handle errors as values.
 */
Schema define(std::string name, const std::vector<FieldDef>& fields, SchemaOptions opts = {});

} // namespace strata::schema
