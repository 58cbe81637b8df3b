/**
 * @file packet.cpp
 * @brief Field access, body composition, dispatch and serialization of one layer.
 */
#include "strata/packet/packet.hpp"

#include <cctype>
#include <ostream>
#include <typeinfo>

#include "strata/config/config_loader.hpp"
#include "strata/obs/observability.hpp"
#include "strata/util/addr.hpp"

namespace strata::packet {

namespace {

// Nesting depth of dispatches currently running on this thread.
thread_local std::size_t t_dispatch_depth = 0;

struct DepthGuard {
  DepthGuard() noexcept { ++t_dispatch_depth; }
  ~DepthGuard() { --t_dispatch_depth; }
  DepthGuard(const DepthGuard&)            = delete;
  DepthGuard& operator=(const DepthGuard&) = delete;
};

std::string lowercase(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace

const char* to_string(Direction d) noexcept {
  switch (d) {
    case Direction::Same:    return "same";
    case Direction::Reverse: return "reverse";
    case Direction::Unknown: return "unknown";
  }
  return "unknown";
}

/// Feeds Triggerlist bytes/lengths to the header codec.
class Packet::Regions final : public codec::RegionSource {
public:
  explicit Regions(const Packet& p) noexcept : p_(p) {}

  std::size_t region_len(std::size_t slot) const override {
    const auto* tl = p_.slot_triggerlist(slot);
    return tl ? tl->packed_len() : 0;
  }

  Result<Bytes> region_bytes(std::size_t slot) override {
    auto* tl = p_.slot_triggerlist(slot);
    if (!tl) return Bytes{};
    return tl->bin();
  }

private:
  const Packet& p_;
};

//------------------------------- Lifecycle ------------------------------------

Packet::Packet(const schema::Schema& s) : layout_(s) {
  for (std::size_t i = 0; i < layout_.size(); ++i) {
    if (layout_.slot(i).spec->is_triggerlist()) tlists_.emplace(i, std::make_unique<Triggerlist>());
  }
}

Packet::~Packet() = default;

//------------------------------- Fields ---------------------------------------

std::optional<std::size_t> Packet::field_index(std::string_view name) const noexcept {
  return layout_.index_of(name);
}

Triggerlist* Packet::slot_triggerlist(std::size_t i) const noexcept {
  auto it = tlists_.find(i);
  return it == tlists_.end() ? nullptr : it->second.get();
}

bool Packet::has_field(std::string_view name) const noexcept {
  return field_index(name).has_value();
}

FieldValue Packet::get(std::string_view name) const {
  auto i = field_index(name);
  if (!i) return FieldValue::absent();
  return layout_.slot(*i).value;
}

std::uint64_t Packet::get_uint(std::string_view name) const noexcept {
  auto i = field_index(name);
  return i ? layout_.slot(*i).value.as_uint() : 0;
}

Status Packet::set(std::string_view name, FieldValue v) {
  auto i = field_index(name);
  if (!i) return fail(CodecError::UnknownField);

  if (layout_.slot(*i).spec->is_triggerlist()) {
    auto* tl = slot_triggerlist(*i);
    if (v.is_absent()) {
      tl->reset(Bytes{});
    } else if (const auto* b = v.bytes()) {
      tl->reset(*b);
    } else {
      return fail(CodecError::FieldKindMismatch);
    }
    header_changed_ = true;
    return {};
  }

  layout_.assign(*i, std::move(v));
  header_changed_ = true;
  return {};
}

Status Packet::assign(std::initializer_list<FieldInit> init) {
  for (const auto& f : init) {
    if (auto st = set(f.name, f.value); !st) return st;
  }
  return {};
}

Status Packet::init_fields(std::initializer_list<FieldInit> init) {
  if (auto st = assign(init); !st) return st;
  clear_changed();
  return {};
}

bool Packet::is_active(std::string_view name) const noexcept {
  auto i = field_index(name);
  return i && layout_.slot(*i).active();
}

Status Packet::set_auto_update(std::string_view name, bool on) {
  auto i = field_index(name);
  if (!i) return fail(CodecError::UnknownField);
  if (!layout_.slot(*i).spec->is_auto_update()) return fail(CodecError::FieldKindMismatch);
  layout_.set_auto_update(*i, on);
  return {};
}

bool Packet::auto_update_active(std::string_view name) const noexcept {
  auto i = field_index(name);
  if (!i) return false;
  const auto& s = layout_.slot(*i);
  return s.spec->is_auto_update() && s.au_active;
}

Status Packet::add_field(std::string_view name, std::string_view format, FieldValue value) {
  if (name.empty()) return fail(CodecError::InvalidArgument);
  if (field_index(name)) return fail(CodecError::DuplicateField);
  auto fmt = schema::FieldFormat::parse(format);
  if (!fmt) return fail(CodecError::InvalidArgument);

  if (fmt->kind() == schema::FormatKind::TriggerList) {
    if (!value.is_absent() && !value.is_bytes()) return fail(CodecError::InvalidArgument);
    const auto i = layout_.append(schema::FieldSpec{std::string(name), *fmt, {}, schema::flags::kNone});
    const auto* raw = value.bytes();
    tlists_.emplace(i, raw ? std::make_unique<Triggerlist>(*raw, nullptr)
                           : std::make_unique<Triggerlist>());
  } else {
    if (!fmt->accepts(value)) return fail(CodecError::InvalidArgument);
    const auto i = layout_.append(schema::FieldSpec{std::string(name), *fmt, {}, schema::flags::kNone});
    layout_.assign(i, std::move(value));
  }
  header_changed_ = true;
  return {};
}

Triggerlist* Packet::triggerlist(std::string_view name) noexcept {
  auto i = field_index(name);
  return i ? slot_triggerlist(*i) : nullptr;
}

const Triggerlist* Packet::triggerlist(std::string_view name) const noexcept {
  auto i = field_index(name);
  return i ? slot_triggerlist(*i) : nullptr;
}

std::string Packet::ip4_str(std::string_view name) const {
  auto i = field_index(name);
  if (!i) return {};
  const auto* b = layout_.slot(*i).value.bytes();
  return b ? util::ip4_to_string(*b) : std::string{};
}

Status Packet::set_ip4_str(std::string_view name, std::string_view text) {
  auto raw = util::ip4_from_string(text);
  if (!raw) return fail(raw.error());
  return set(name, std::move(*raw));
}

std::string Packet::mac_str(std::string_view name) const {
  auto i = field_index(name);
  if (!i) return {};
  const auto* b = layout_.slot(*i).value.bytes();
  return b ? util::mac_to_string(*b) : std::string{};
}

Status Packet::set_mac_str(std::string_view name, std::string_view text) {
  auto raw = util::mac_from_string(text);
  if (!raw) return fail(raw.error());
  return set(name, std::move(*raw));
}

//------------------------------- Sizes ----------------------------------------

std::size_t Packet::header_len() const {
  return codec::header_len(layout_, Regions(*this));
}

std::size_t Packet::size() const {
  const auto* up = upper();
  const std::size_t n = header_len() + (up ? up->size() : std::get<Bytes>(body_).size());
  return n + trailer_len(n);
}

//------------------------------- Body -----------------------------------------

Packet* Packet::upper() noexcept {
  auto* p = std::get_if<PacketPtr>(&body_);
  return p ? p->get() : nullptr;
}

const Packet* Packet::upper() const noexcept {
  const auto* p = std::get_if<PacketPtr>(&body_);
  return p ? p->get() : nullptr;
}

ByteView Packet::raw_body() const noexcept {
  const auto* b = std::get_if<Bytes>(&body_);
  return b ? ByteView(*b) : ByteView{};
}

Status Packet::set_raw_body(Bytes data) {
  if (upper()) return fail(CodecError::BodyHandlerAttached);
  body_         = std::move(data);
  body_changed_ = true;
  return {};
}

Status Packet::set_body(PacketPtr layer) {
  if (!layer) return fail(CodecError::NullLayer);
  // A replaced layer hands its callback target on to the new one.
  const Packet* target = this;
  if (const auto* prev = upper(); prev && prev->callback_) target = prev->callback_;
  layer->callback_ = target;
  body_            = std::move(layer);
  body_changed_    = true;
  return {};
}

PacketPtr Packet::take_body() {
  auto* slot = std::get_if<PacketPtr>(&body_);
  if (!slot) return nullptr;
  PacketPtr out = std::move(*slot);
  out->callback_ = nullptr;
  body_          = Bytes{};
  body_changed_  = true;
  return out;
}

Packet& Packet::innermost() noexcept {
  Packet* p = this;
  while (Packet* up = p->upper()) p = up;
  return *p;
}

//------------------------------- Callback -------------------------------------

std::optional<Bytes> Packet::query_callback(std::string_view id) const {
  if (!callback_) return std::nullopt;
  return callback_->callback_impl(id);
}

std::optional<Bytes> Packet::callback_impl(std::string_view) const {
  return std::nullopt;
}

bool Packet::lower_header_changed() const noexcept {
  return callback_ && callback_->header_changed_;
}

//------------------------------- Change tracking ------------------------------

bool Packet::changed() const noexcept {
  if (header_changed_ || body_changed_) return true;
  for (const auto& [slot, tl] : tlists_) {
    if (tl->changed()) return true;
  }
  const auto* up = upper();
  return up && up->changed();
}

void Packet::clear_changed() noexcept {
  header_changed_ = false;
  body_changed_   = false;
  for (auto& [slot, tl] : tlists_) tl->dirty_ = false;
}

//------------------------------- Serialization --------------------------------

Result<Bytes> Packet::pack_header() {
  Regions regions(*this);
  auto out = codec::encode(layout_, regions);
  if (!out) {
    obs::emit(obs::EventKind::PackFailed, obs::Level::Warn, name(),
              std::string("header: ") + strata::to_string(out.error()) + " format=" + format_string());
  }
  return out;
}

Result<Bytes> Packet::bin(bool update_auto_fields) {
  if (update_auto_fields && needs_update()) {
    if (auto st = update_fields(); !st) return fail(st.error());
  }

  auto out = pack_header();
  if (!out) return out;

  if (auto* up = upper()) {
    auto b = up->bin(update_auto_fields);
    if (!b) return fail(b.error());
    strata::append(*out, *b);
  } else {
    strata::append(*out, std::get<Bytes>(body_));
  }

  clear_changed();
  synced_ = true;
  obs::emit(obs::EventKind::Encoded, obs::Level::Trace, name(), std::to_string(out->size()) + " bytes");
  return out;
}

Status Packet::unpack(ByteView buf) {
  if (auto st = dissect(buf); !st) {
    obs::emit(obs::EventKind::DecodeFailed, obs::Level::Debug, name(),
              std::string(strata::to_string(st.error())) + " (" + std::to_string(buf.size()) + " bytes)");
    return st;
  }
  clear_changed();
  synced_ = true;
  obs::emit(obs::EventKind::Decoded, obs::Level::Trace, name(), format_string());
  return {};
}

Result<std::size_t> Packet::decode_header(ByteView buf) {
  return codec::decode(layout_, buf, Regions(*this));
}

Status Packet::dissect(ByteView buf) {
  auto n = decode_header(buf);
  if (!n) return fail(n.error());
  const auto rest = buf.subspan(*n);
  if (auto t = schema().type_field()) return init_handler(layout_.slot(*t).value.as_uint(), rest);
  body_ = Bytes(rest.begin(), rest.end());
  return {};
}

const HandlerMap& Packet::handlers() const {
  static const HandlerMap kNone;
  return kNone;
}

Status Packet::init_triggerlist(std::string_view name, ByteView raw, Triggerlist::Parser parser,
                                Triggerlist::KeyValuePacker packer) {
  auto i = field_index(name);
  if (!i) return fail(CodecError::UnknownField);
  if (!layout_.slot(*i).spec->is_triggerlist()) return fail(CodecError::FieldKindMismatch);
  tlists_[*i] = std::make_unique<Triggerlist>(Bytes(raw.begin(), raw.end()), std::move(parser),
                                              std::move(packer));
  return {};
}

Status Packet::init_handler(std::uint64_t type, ByteView rest) {
  const auto& map = handlers();
  auto it = map.find(type);
  if (it == map.end()) {
    body_ = Bytes(rest.begin(), rest.end());
    if (!map.empty()) {
      obs::emit(obs::EventKind::DispatchFallback, obs::Level::Debug, name(),
                "no handler for type " + std::to_string(type));
    }
    return {};
  }

  if (t_dispatch_depth >= config::active().max_layer_depth) {
    body_ = Bytes(rest.begin(), rest.end());
    obs::emit(obs::EventKind::DepthLimit, obs::Level::Warn, name(),
              "layer depth " + std::to_string(t_dispatch_depth) + " reached, body kept raw");
    return {};
  }

  Result<PacketPtr> layer = [&] {
    DepthGuard guard;
    return it->second(rest);
  }();

  if (!layer) {
    if (!config::active().degrade_failed_handlers) return fail(layer.error());
    body_ = Bytes(rest.begin(), rest.end());
    obs::emit(obs::EventKind::DispatchFallback, obs::Level::Debug, name(),
              "handler for type " + std::to_string(type) + " failed: " + strata::to_string(layer.error()));
    return {};
  }

  (*layer)->callback_ = this;
  body_               = std::move(*layer);
  return {};
}

//------------------------------- Relations ------------------------------------

bool Packet::is_related(const Packet& other) const {
  const Packet* a = upper();
  const Packet* b = other.upper();
  if (!a || !b) return true; // raw data matches anything
  if (typeid(*a) != typeid(*b)) return false;
  return a->is_related(*b);
}

Direction Packet::direction(const Packet& other) const {
  const auto src = schema().src_field();
  const auto dst = schema().dst_field();
  if (!src || !dst || &other.schema() != &schema()) return Direction::Unknown;

  const auto& a_src = layout_.slot(*src).value;
  const auto& a_dst = layout_.slot(*dst).value;
  const auto& b_src = other.layout_.slot(*src).value;
  const auto& b_dst = other.layout_.slot(*dst).value;

  if (a_src == b_src && a_dst == b_dst) return Direction::Same;
  if (a_src == b_dst && a_dst == b_src) return Direction::Reverse;
  return Direction::Unknown;
}

void Packet::reverse_address() {
  const auto src = schema().src_field();
  const auto dst = schema().dst_field();
  if (!src || !dst) return;
  FieldValue s = layout_.slot(*src).value;
  layout_.assign(*src, layout_.slot(*dst).value);
  layout_.assign(*dst, std::move(s));
  header_changed_ = true;
}

std::string Packet::repr() const {
  std::string out = name() + "(";
  bool first = true;
  auto sep = [&] {
    if (!first) out += ", ";
    first = false;
  };

  for (std::size_t i = 0; i < layout_.size(); ++i) {
    const auto& s = layout_.slot(i);
    if (s.spec->is_triggerlist()) {
      const auto* tl = slot_triggerlist(i);
      if (!tl || tl->packed_len() == 0) continue;
      sep();
      out += s.spec->name + "=" + tl->to_string();
      continue;
    }
    if (s.value == s.spec->default_value) continue;
    sep();
    out += s.spec->name + "=" + s.value.to_string();
  }

  if (const auto* up = upper()) {
    sep();
    out += lowercase(up->name()) + "=" + up->repr();
  } else if (const auto& raw = std::get<Bytes>(body_); !raw.empty()) {
    sep();
    out += "body=" + byte2hex(raw);
  }
  out += ")";
  return out;
}

//------------------------------- Free functions -------------------------------

Packet& operator/(Packet& lower, PacketPtr upper) {
  if (auto st = lower.innermost().set_body(std::move(upper)); !st) {
    obs::emit(obs::EventKind::PackFailed, obs::Level::Error, lower.name(),
              std::string("cannot stack layer: ") + strata::to_string(st.error()));
  }
  return lower;
}

std::ostream& operator<<(std::ostream& os, const Packet& p) {
  return os << p.repr();
}

} // namespace strata::packet
