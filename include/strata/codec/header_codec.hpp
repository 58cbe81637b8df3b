#pragma once
/**
 * @file header_codec.hpp
 * @brief Per-instance header layout and the header encode/decode algorithms.
 *
 * HeaderLayout is the instance's effective field list: the schema's fields plus
 * any fields appended at run time, each with its current value. It caches the
 * list of active slots, the aggregate format string and the fixed part of the
 * header length. Every activate/deactivate/append invalidates and recomputes
 * those caches (relayout); batch such toggles before packing.
 *
 * Triggerlist slots are not owned by the codec: their wire bytes come from a
 * RegionSource supplied by the packet that owns the Triggerlists.
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/core/errors.hpp"
#include "strata/schema/schema.hpp"

namespace strata::codec {

using schema::FieldValue;

/// One field of one instance.
struct FieldSlot {
  const schema::FieldSpec* spec{nullptr}; ///< Schema entry or instance-level appended entry
  FieldValue               value{};       ///< Current value (absent = inactive)
  bool                     au_active{false}; ///< Auto-update switch (AUTO_UPDATE fields only)

  bool active() const noexcept { return spec->is_triggerlist() || !value.is_absent(); }
};

/// Supplies wire bytes for slots the codec does not own (Triggerlist regions).
class RegionSource {
public:
  virtual ~RegionSource() = default;
  /// Current packed length of region @p slot.
  virtual std::size_t region_len(std::size_t slot) const = 0;
  /// Packed bytes of region @p slot.
  virtual Result<Bytes> region_bytes(std::size_t slot) = 0;
};

class HeaderLayout {
public:
  explicit HeaderLayout(const schema::Schema& s);

  HeaderLayout(const HeaderLayout&)            = delete;
  HeaderLayout& operator=(const HeaderLayout&) = delete;
  HeaderLayout(HeaderLayout&&)                 = default;
  HeaderLayout& operator=(HeaderLayout&&)      = default;

  const schema::Schema& schema() const noexcept { return *schema_; }

  std::size_t size() const noexcept { return slots_.size(); }
  const FieldSlot& slot(std::size_t i) const noexcept { return slots_[i]; }

  std::optional<std::size_t> index_of(std::string_view name) const noexcept;

  /// Store a value; returns true if the field's active state flipped (relayout ran).
  bool assign(std::size_t i, FieldValue v);

  void set_auto_update(std::size_t i, bool on) noexcept { slots_[i].au_active = on; }

  /// Append an instance-level field (not shared with the schema); returns its index.
  std::size_t append(schema::FieldSpec spec);

  /// Indices of active slots in wire order.
  const std::vector<std::size_t>& active() const noexcept { return active_; }

  /// Wire size of all active fixed-format slots.
  std::size_t fixed_len() const noexcept { return fixed_len_; }

  /// Wire size of all active dynamic (variable byte string) slots.
  std::size_t dynamic_len() const noexcept;

  /// Aggregate format of the active slots, e.g. ">BB4s4sHB*[]".
  const std::string& format_string() const noexcept { return format_; }

  /// Number of relayouts since construction (cost of toggling optional fields).
  std::size_t relayouts() const noexcept { return relayouts_; }

private:
  void relayout();

  const schema::Schema*        schema_;
  std::vector<FieldSlot>       slots_;
  std::deque<schema::FieldSpec> appended_; ///< Stable storage for instance-level specs
  std::vector<std::size_t>     active_;
  std::string                  format_;
  std::size_t                  fixed_len_{0};
  std::size_t                  relayouts_{0};
};

// ---------------------------------------------------------------------------
// Primitives
// ---------------------------------------------------------------------------

/// Read an unsigned integer of @p width bytes at @p off; NeedData if out of range.
Result<std::uint64_t> read_uint(ByteView buf, std::size_t off, std::size_t width,
                                schema::ByteOrder order) noexcept;

/// Append @p v as @p width bytes.
void write_uint(Bytes& out, std::uint64_t v, std::size_t width, schema::ByteOrder order);

/// Decode one fixed-format value from exactly fmt.size() bytes.
FieldValue decode_fixed(const schema::FieldFormat& fmt, ByteView slice, schema::ByteOrder order);

/// Append the wire form of @p v; PackFailed if it does not fit @p fmt.
Status encode_value(const schema::FieldFormat& fmt, const FieldValue& v,
                    schema::ByteOrder order, Bytes& out);

// ---------------------------------------------------------------------------
// Header algorithms
// ---------------------------------------------------------------------------

/// Current header length: fixed + dynamic + Triggerlist regions.
std::size_t header_len(const HeaderLayout& layout, const RegionSource& regions);

/**
 * @brief Decode the active fields of @p layout from the front of @p buf.
 *
 * Inactive fields consume no bytes and keep their value. Dynamic fields consume
 * as many bytes as their current value is long (set by the dissection hook);
 * Triggerlist regions are skipped (initialized by the hook).
 * @return Bytes consumed, or NeedData if @p buf is shorter than the active header.
 */
Result<std::size_t> decode(HeaderLayout& layout, ByteView buf, const RegionSource& regions);

/// Pack the active fields of @p layout in order.
Result<Bytes> encode(const HeaderLayout& layout, RegionSource& regions);

} // namespace strata::codec
