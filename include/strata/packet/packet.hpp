#pragma once
/**
 * @file packet.hpp
 * @brief One protocol layer: header fields, body slot, dispatch and serialization.
 *
 * A Packet is an instance of a protocol type (a subclass that supplies a
 * Schema and optional hooks). Its body is either raw bytes or exactly one
 * owned upper layer; the chain of bodies forms the layer stack:
 *
 *   Demo ── body ──> Ip4 ── body ──> Tcp ── body ──> raw bytes
 *
 * Instances are created through parse<P>() / build<P>() (or a plain
 * std::make_unique<P>()) and are neither copyable nor movable: an upper layer
 * keeps a non-owning pointer to its lower layer for callbacks.
 *
 * Change tracking:
 *  - changed() is true after any field/body/Triggerlist mutation, or while an
 *    upper layer is changed. It is false after decoding and after bin().
 *  - Auto-update fields are recomputed by update_fields() during bin() only
 *    while the instance is pending an update (changed, or never serialized).
 *
 * Threading: an instance (and its layer stack) is single-owner. Schemas are
 * shared and read-only.
 */

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>

#include "strata/codec/header_codec.hpp"
#include "strata/core/bytes.hpp"
#include "strata/core/errors.hpp"
#include "strata/packet/triggerlist.hpp"
#include "strata/schema/schema.hpp"

namespace strata::packet {

using schema::FieldValue;

/// Constructs the next layer from the bytes following a header.
using LayerFactory = Result<PacketPtr> (*)(ByteView);

/// Type-field value -> next layer constructor.
using HandlerMap = std::unordered_map<std::uint64_t, LayerFactory>;

/// Body slot: raw bytes or one owned upper layer.
using Body = std::variant<Bytes, PacketPtr>;

/// Relative direction of two instances of the same layer.
enum class Direction : std::uint8_t {
  Same,    ///< Same source and destination
  Reverse, ///< Source and destination swapped
  Unknown  ///< Unrelated, or the layer has no address pair
};

const char* to_string(Direction d) noexcept;

/// One named field assignment (construction / batch update).
struct FieldInit {
  std::string_view name;
  FieldValue       value;
};

class Packet {
public:
  virtual ~Packet();

  Packet(const Packet&)            = delete;
  Packet& operator=(const Packet&) = delete;
  Packet(Packet&&)                 = delete;
  Packet& operator=(Packet&&)      = delete;

  const schema::Schema& schema() const noexcept { return layout_.schema(); }
  const std::string& name() const noexcept { return layout_.schema().name(); }

  // ---------------------------------------------------------------------------
  // Header fields
  // ---------------------------------------------------------------------------

  bool has_field(std::string_view name) const noexcept;

  /// Current value (absent if inactive, unknown, or a Triggerlist slot).
  FieldValue get(std::string_view name) const;

  /// Integer value of @p name, 0 if not an integer.
  std::uint64_t get_uint(std::string_view name) const noexcept;

  /**
   * @brief Assign a field value; an absent value deactivates the field.
   *
   * Values are not format-checked here: a value that does not fit its format
   * is reported as PackFailed by bin()/pack_header(). Assigning a byte string
   * to a Triggerlist slot re-initializes it from those bytes; absent clears it.
   * @return UnknownField, or FieldKindMismatch for a non-bytes Triggerlist value.
   */
  Status set(std::string_view name, FieldValue v);

  /// Batch set(); stops at the first error.
  Status assign(std::initializer_list<FieldInit> init);

  /// Construction-time assignment: like assign(), but the instance stays unchanged.
  Status init_fields(std::initializer_list<FieldInit> init);

  /// True if @p name currently contributes bytes to the header.
  bool is_active(std::string_view name) const noexcept;

  /// Toggle recomputation of an auto-update field (FieldKindMismatch otherwise).
  Status set_auto_update(std::string_view name, bool on);
  bool auto_update_active(std::string_view name) const noexcept;

  /**
   * @brief Append an instance-level field after the existing ones.
   * @param format Format token ("B", "4s", "*", "[]", ...).
   * @return DuplicateField, or InvalidArgument for a bad token or value.
   */
  Status add_field(std::string_view name, std::string_view format, FieldValue value = {});

  /// Triggerlist slot @p name, nullptr if the field is not a Triggerlist.
  Triggerlist* triggerlist(std::string_view name) noexcept;
  const Triggerlist* triggerlist(std::string_view name) const noexcept;

  /// Aggregate format of the active fields, e.g. ">BB4s4sHB*[]".
  const std::string& format_string() const noexcept { return layout_.format_string(); }

  /// Relayouts since construction (one per activate/deactivate/append).
  std::size_t relayouts() const noexcept { return layout_.relayouts(); }

  /// Dotted-quad view of a 4-byte field ("" if not a 4-byte string).
  std::string ip4_str(std::string_view name) const;
  Status set_ip4_str(std::string_view name, std::string_view text);

  /// Colon-separated view of a 6-byte field ("" if not a 6-byte string).
  std::string mac_str(std::string_view name) const;
  Status set_mac_str(std::string_view name, std::string_view text);

  // ---------------------------------------------------------------------------
  // Sizes
  // ---------------------------------------------------------------------------

  /// Current header length (active fixed fields + dynamic fields + Triggerlists).
  std::size_t header_len() const;

  /// Wire length of bin(): header, body (recursively) and any trailer.
  std::size_t size() const;

  // ---------------------------------------------------------------------------
  // Body
  // ---------------------------------------------------------------------------

  const Body& body() const noexcept { return body_; }

  /// Upper layer, nullptr if the body is raw.
  Packet* upper() noexcept;
  const Packet* upper() const noexcept;

  /// Raw body bytes (empty while an upper layer is attached).
  ByteView raw_body() const noexcept;

  /// Replace the raw body; BodyHandlerAttached if an upper layer is attached.
  Status set_raw_body(Bytes data);

  /// Attach @p layer as the body, replacing what was there (NullLayer if null).
  Status set_body(PacketPtr layer);

  /// Detach and return the upper layer (nullptr if the body is raw).
  PacketPtr take_body();

  /// Highest layer of the stack (this if the body is raw).
  Packet& innermost() noexcept;

  /// First layer of type @p P from this one upwards, nullptr if none.
  template <class P>
  P* layer() noexcept {
    for (Packet* p = this; p != nullptr; p = p->upper()) {
      if (auto* q = dynamic_cast<P*>(p)) return q;
    }
    return nullptr;
  }

  template <class P>
  const P* layer() const noexcept {
    for (const Packet* p = this; p != nullptr; p = p->upper()) {
      if (const auto* q = dynamic_cast<const P*>(p)) return q;
    }
    return nullptr;
  }

  // ---------------------------------------------------------------------------
  // Cross-layer data
  // ---------------------------------------------------------------------------

  /**
   * @brief Ask the lower layer for data identified by @p id.
   * @return nullopt if there is no lower layer or it does not answer @p id.
   */
  std::optional<Bytes> query_callback(std::string_view id) const;

  // ---------------------------------------------------------------------------
  // Change tracking / serialization
  // ---------------------------------------------------------------------------

  bool changed() const noexcept;

  /**
   * @brief Serialize header and body, recursively.
   * @param update_auto_fields Recompute auto-update fields of pending layers first.
   * @return Wire bytes, or PackFailed if a value does not fit its format.
   */
  virtual Result<Bytes> bin(bool update_auto_fields = true);

  /// Header bytes only (no auto-update).
  Result<Bytes> pack_header();

  /**
   * @brief Decode @p buf into this instance (header, Triggerlists, body).
   * @return NeedData if the buffer is shorter than the active header.
   */
  Status unpack(ByteView buf);

  // ---------------------------------------------------------------------------
  // Relations
  // ---------------------------------------------------------------------------

  /// Same-flow test; the default compares upper layers (raw bodies always match).
  virtual bool is_related(const Packet& other) const;

  /// Address-pair comparison; Same wins if both match.
  virtual Direction direction(const Packet& other) const;

  /// Swap the address pair (no-op without one).
  virtual void reverse_address();

  /// Debug text: Name(field=value, ..., body). Only non-default fields are listed.
  std::string repr() const;

protected:
  explicit Packet(const schema::Schema& s);

  /// Decode hook. Default: header, then dispatch on the type field (raw body otherwise).
  virtual Status dissect(ByteView buf);

  /// Recompute auto-update fields. Default: nothing.
  virtual Status update_fields() { return {}; }

  /// Whether bin() should call update_fields(). Default: update_pending().
  virtual bool needs_update() const noexcept { return update_pending(); }

  /**
   * @brief Bytes the layer's bin() appends after header and body (padding).
   * @param unpadded Header plus body length.
   * Layers that override bin() to add trailing bytes must report them here so
   * size() (and every length field built from it) matches the wire.
   */
  virtual std::size_t trailer_len(std::size_t /*unpadded*/) const { return 0; }

  /// Next-layer handlers keyed by the type field. Default: none.
  virtual const HandlerMap& handlers() const;

  /// Data served to the upper layer. Default: nothing.
  virtual std::optional<Bytes> callback_impl(std::string_view id) const;

  /// Decode the active fields; returns bytes consumed.
  Result<std::size_t> decode_header(ByteView buf);

  /// Set up Triggerlist slot @p name over @p raw.
  Status init_triggerlist(std::string_view name, ByteView raw, Triggerlist::Parser parser,
                          Triggerlist::KeyValuePacker packer = {});

  /// Attach the handler registered for @p type over @p rest (raw body if none or it fails).
  Status init_handler(std::uint64_t type, ByteView rest);

  bool update_pending() const noexcept { return changed() || !synced_; }

  /// True while the lower layer's header has unsent changes.
  bool lower_header_changed() const noexcept;

private:
  class Regions;

  std::optional<std::size_t> field_index(std::string_view name) const noexcept;
  Triggerlist* slot_triggerlist(std::size_t i) const noexcept;
  void clear_changed() noexcept;

  codec::HeaderLayout                                       layout_;
  std::unordered_map<std::size_t, std::unique_ptr<Triggerlist>> tlists_;
  Body                                                      body_{Bytes{}};
  const Packet*                                             callback_{nullptr}; ///< Lower layer (non-owning)
  bool                                                      header_changed_{false};
  bool                                                      body_changed_{false};
  bool                                                      synced_{false};
};

// -----------------------------------------------------------------------------
// Construction helpers
// -----------------------------------------------------------------------------

/// Decode @p buf as protocol @p P.
template <class P>
Result<std::unique_ptr<P>> parse(ByteView buf) {
  static_assert(std::is_base_of_v<Packet, P>, "parse<P>: P must derive from Packet");
  auto p = std::make_unique<P>();
  if (auto st = p->unpack(buf); !st) return fail(st.error());
  return Result<std::unique_ptr<P>>(std::move(p));
}

/// parse<P>() as a type-erased layer (fits LayerFactory).
template <class P>
Result<PacketPtr> parse_layer(ByteView buf) {
  auto p = parse<P>(buf);
  if (!p) return fail(p.error());
  return Result<PacketPtr>(PacketPtr(std::move(*p)));
}

/// New @p P with field assignments applied (unchanged, defaults elsewhere).
template <class P>
Result<std::unique_ptr<P>> build(std::initializer_list<FieldInit> init = {}) {
  static_assert(std::is_base_of_v<Packet, P>, "build<P>: P must derive from Packet");
  auto p = std::make_unique<P>();
  if (auto st = p->init_fields(init); !st) return fail(st.error());
  return Result<std::unique_ptr<P>>(std::move(p));
}

/**
 * @brief Stack @p upper on top of the highest layer of @p lower.
 *
 * lower / a / b attaches a to lower and b to a. Raw bytes cannot be stacked
 * (use set_raw_body()).
 */
Packet& operator/(Packet& lower, PacketPtr upper);
Packet& operator/(Packet& lower, Bytes raw) = delete;
Packet& operator/(Packet& lower, ByteView raw) = delete;

std::ostream& operator<<(std::ostream& os, const Packet& p);

} // namespace strata::packet
