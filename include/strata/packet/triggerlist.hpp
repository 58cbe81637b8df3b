#pragma once
/**
 * @file triggerlist.hpp
 * @brief Lazily parsed, lazily packed list for variable header regions (options etc).
 *
 * A Triggerlist starts as raw bytes plus a protocol-supplied parser. The parser
 * runs on first access; until then pack returns the raw bytes untouched. Once
 * materialized, any mutation marks the list changed and the next bin()
 * re-flattens the elements. The owning Packet reports itself changed while
 * any of its Triggerlists is.
 *
 * Element kinds:
 *  - raw byte span (packed as-is)
 *  - key/value pair (packed by the list's KeyValuePacker; key||value by default)
 *  - nested Packet (packed via its own bin())
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "strata/core/bytes.hpp"
#include "strata/core/errors.hpp"

namespace strata::packet {

class Packet;
using PacketPtr = std::unique_ptr<Packet>;

class Triggerlist final {
public:
  struct KeyValue {
    Bytes key;
    Bytes value;
    bool operator==(const KeyValue&) const = default;
  };

  using Element  = std::variant<Bytes, KeyValue, PacketPtr>;
  using Elements = std::vector<Element>;

  /// Splits a raw region into elements (protocol-defined).
  using Parser = std::function<Result<Elements>(ByteView)>;
  /// Wire form of a key/value element (protocol-defined); PackFailed if it has none.
  using KeyValuePacker = std::function<Result<Bytes>(const KeyValue&)>;

  /// Empty list, nothing to parse.
  Triggerlist();

  /// Deferred list over @p raw; @p parser runs on first access.
  Triggerlist(Bytes raw, Parser parser, KeyValuePacker packer = {});

  ~Triggerlist();
  Triggerlist(Triggerlist&&) noexcept;
  Triggerlist& operator=(Triggerlist&&) noexcept;
  Triggerlist(const Triggerlist&)            = delete;
  Triggerlist& operator=(const Triggerlist&) = delete;

  /// True once the parser has run (or the list was mutated).
  bool materialized() const noexcept { return elements_.has_value(); }

  std::size_t size() const;
  bool empty() const { return size() == 0; }

  /// Element access (materializes, never marks the list changed). @pre i < size()
  const Element& at(std::size_t i) const;

  /// Element for in-place editing; marks the list changed. @pre i < size()
  Element& edit(std::size_t i);

  Elements::const_iterator begin() const;
  Elements::const_iterator end() const;

  void append(Element e);
  void insert(std::size_t pos, Element e);
  void erase(std::size_t pos);
  void replace(std::size_t pos, Element e);
  void clear();

  /// Drop the elements and start over from @p raw with the same parser.
  void reset(Bytes raw);

  /// Replace the element parser and key/value packer (protocol constructors).
  void set_codec(Parser parser, KeyValuePacker packer = {});

  /// Sum of the packed lengths of all elements (raw length while unparsed).
  /// A key/value element its packer rejects counts as zero; bin() reports it.
  std::size_t packed_len() const;

  /// Packed bytes; re-flattens only if the contents changed.
  Result<Bytes> bin();

  /// True if mutated (or a nested packet element changed) since the last bin().
  bool changed() const noexcept;

  /// Debug text, e.g. "[\x01\x02, (\x02: \x05\xb4), Tcp(...)]".
  std::string to_string() const;

private:
  friend class Packet;

  void materialize() const;
  std::size_t element_len(const Element& e) const;
  Result<Bytes> pack_kv(const KeyValue& kv) const;
  void touch();

  mutable Bytes                   raw_;
  Parser                          parser_;
  KeyValuePacker                  packer_;
  mutable std::optional<Elements> elements_;
  bool                            dirty_{false};
};

} // namespace strata::packet
