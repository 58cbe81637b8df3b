/**
 * @file triggerlist.cpp
 * @brief Parse-on-demand / pack-on-change implementation.
 */
#include "strata/packet/triggerlist.hpp"
#include "strata/packet/packet.hpp"
#include "strata/obs/observability.hpp"

#include <cassert>

namespace strata::packet {

Triggerlist::Triggerlist() = default;

Triggerlist::Triggerlist(Bytes raw, Parser parser, KeyValuePacker packer)
  : raw_(std::move(raw)), parser_(std::move(parser)), packer_(std::move(packer)) {}

Triggerlist::~Triggerlist() = default;
Triggerlist::Triggerlist(Triggerlist&&) noexcept = default;
Triggerlist& Triggerlist::operator=(Triggerlist&&) noexcept = default;

void Triggerlist::materialize() const {
  if (elements_) return;
  elements_.emplace();
  if (raw_.empty()) return;
  if (!parser_) {
    elements_->emplace_back(raw_);
    return;
  }
  auto parsed = parser_(ByteView(raw_));
  if (!parsed) {
    // Keep the region byte-exact: one opaque element holding everything.
    obs::emit(obs::EventKind::TriggerlistFallback, obs::Level::Debug, "triggerlist",
              std::string("parser failed: ") + strata::to_string(parsed.error()));
    elements_->emplace_back(raw_);
    return;
  }
  *elements_ = std::move(*parsed);
}

void Triggerlist::touch() {
  materialize();
  dirty_ = true;
}

std::size_t Triggerlist::size() const {
  materialize();
  return elements_->size();
}

const Triggerlist::Element& Triggerlist::at(std::size_t i) const {
  materialize();
  assert(i < elements_->size() && "Triggerlist::at: index out of range");
  return (*elements_)[i];
}

Triggerlist::Element& Triggerlist::edit(std::size_t i) {
  touch();
  assert(i < elements_->size() && "Triggerlist::edit: index out of range");
  return (*elements_)[i];
}

Triggerlist::Elements::const_iterator Triggerlist::begin() const {
  materialize();
  return elements_->cbegin();
}

Triggerlist::Elements::const_iterator Triggerlist::end() const {
  materialize();
  return elements_->cend();
}

void Triggerlist::append(Element e) {
  touch();
  elements_->push_back(std::move(e));
}

void Triggerlist::insert(std::size_t pos, Element e) {
  touch();
  assert(pos <= elements_->size() && "Triggerlist::insert: position out of range");
  elements_->insert(elements_->begin() + static_cast<std::ptrdiff_t>(pos), std::move(e));
}

void Triggerlist::erase(std::size_t pos) {
  touch();
  assert(pos < elements_->size() && "Triggerlist::erase: position out of range");
  elements_->erase(elements_->begin() + static_cast<std::ptrdiff_t>(pos));
}

void Triggerlist::replace(std::size_t pos, Element e) {
  touch();
  assert(pos < elements_->size() && "Triggerlist::replace: position out of range");
  (*elements_)[pos] = std::move(e);
}

void Triggerlist::clear() {
  touch();
  elements_->clear();
}

void Triggerlist::reset(Bytes raw) {
  raw_ = std::move(raw);
  elements_.reset();
  dirty_ = true;
}

void Triggerlist::set_codec(Parser parser, KeyValuePacker packer) {
  parser_ = std::move(parser);
  packer_ = std::move(packer);
}

Result<Bytes> Triggerlist::pack_kv(const KeyValue& kv) const {
  if (packer_) return packer_(kv);
  Bytes out = kv.key;
  strata::append(out, kv.value);
  return out;
}

std::size_t Triggerlist::element_len(const Element& e) const {
  if (const auto* b = std::get_if<Bytes>(&e)) return b->size();
  if (const auto* kv = std::get_if<KeyValue>(&e)) {
    const auto packed = pack_kv(*kv);
    return packed ? packed->size() : 0;
  }
  const auto& p = std::get<PacketPtr>(e);
  return p ? p->size() : 0;
}

std::size_t Triggerlist::packed_len() const {
  if (!elements_) return raw_.size();
  std::size_t n = 0;
  for (const auto& e : *elements_) n += element_len(e);
  return n;
}

bool Triggerlist::changed() const noexcept {
  if (dirty_) return true;
  if (!elements_) return false;
  for (const auto& e : *elements_) {
    if (const auto* p = std::get_if<PacketPtr>(&e); p && *p && (*p)->changed()) return true;
  }
  return false;
}

Result<Bytes> Triggerlist::bin() {
  if (!changed()) return raw_;
  if (!elements_) {
    // Reset but never parsed: raw_ is already the wire form.
    dirty_ = false;
    return raw_;
  }

  Bytes out;
  out.reserve(packed_len());
  for (auto& e : *elements_) {
    if (const auto* b = std::get_if<Bytes>(&e)) {
      strata::append(out, *b);
    } else if (const auto* kv = std::get_if<KeyValue>(&e)) {
      auto packed = pack_kv(*kv);
      if (!packed) return fail(packed.error());
      strata::append(out, *packed);
    } else if (auto& p = std::get<PacketPtr>(e); p) {
      auto nested = p->bin();
      if (!nested) return fail(nested.error());
      strata::append(out, *nested);
    }
  }
  raw_   = out;
  dirty_ = false;
  return out;
}

std::string Triggerlist::to_string() const {
  materialize();
  std::string out = "[";
  bool first = true;
  for (const auto& e : *elements_) {
    if (!first) out += ", ";
    first = false;
    if (const auto* b = std::get_if<Bytes>(&e)) {
      out += byte2hex(*b);
    } else if (const auto* kv = std::get_if<KeyValue>(&e)) {
      out += "(" + byte2hex(kv->key) + ": " + byte2hex(kv->value) + ")";
    } else if (const auto& p = std::get<PacketPtr>(e); p) {
      out += p->repr();
    }
  }
  out += "]";
  return out;
}

} // namespace strata::packet
