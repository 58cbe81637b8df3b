/**
 * @file header_codec.cpp
 * @brief Header layout bookkeeping and fixed-width field encode/decode.
 */
#include "strata/codec/header_codec.hpp"

namespace strata::codec {

using schema::ByteOrder;
using schema::FieldFormat;
using schema::FormatKind;

//------------------------------- Layout ---------------------------------------

HeaderLayout::HeaderLayout(const schema::Schema& s) : schema_(&s) {
  slots_.reserve(s.field_count());
  for (const auto& spec : s.fields()) {
    // Values are copied per instance; byte-string defaults are never shared.
    slots_.push_back(FieldSlot{&spec, spec.default_value, spec.is_auto_update()});
  }
  relayout();
  relayouts_ = 0; // construction is not a toggle
}

std::optional<std::size_t> HeaderLayout::index_of(std::string_view name) const noexcept {
  if (auto i = schema_->index_of(name)) return i;
  for (std::size_t i = schema_->field_count(); i < slots_.size(); ++i) {
    if (slots_[i].spec->name == name) return i;
  }
  return std::nullopt;
}

bool HeaderLayout::assign(std::size_t i, FieldValue v) {
  auto& s = slots_[i];
  const bool was_active = s.active();
  s.value = std::move(v);
  if (was_active == s.active()) return false;
  relayout();
  return true;
}

std::size_t HeaderLayout::append(schema::FieldSpec spec) {
  appended_.push_back(std::move(spec));
  const auto& stored = appended_.back();
  slots_.push_back(FieldSlot{&stored, stored.default_value, stored.is_auto_update()});
  relayout();
  return slots_.size() - 1;
}

std::size_t HeaderLayout::dynamic_len() const noexcept {
  std::size_t n = 0;
  for (auto i : active_) {
    const auto& s = slots_[i];
    if (s.spec->format.kind() == FormatKind::Dynamic) n += s.spec->format.encoded_len(s.value);
  }
  return n;
}

void HeaderLayout::relayout() {
  active_.clear();
  format_.assign(1, schema::order_prefix(schema_->order()));
  fixed_len_ = 0;
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    const auto& s = slots_[i];
    if (!s.active()) continue;
    active_.push_back(i);
    format_ += s.spec->format.token();
    fixed_len_ += s.spec->format.size();
  }
  ++relayouts_;
}

//------------------------------- Primitives -----------------------------------

Result<std::uint64_t> read_uint(ByteView buf, std::size_t off, std::size_t width,
                                ByteOrder order) noexcept {
  if (off > buf.size() || buf.size() - off < width) return fail(CodecError::NeedData);
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < width; ++i) {
    // Avoid sign extension
    const std::uint64_t b = buf[off + (order == ByteOrder::Big ? i : width - 1 - i)];
    v = (v << 8) | b;
  }
  return v;
}

void write_uint(Bytes& out, std::uint64_t v, std::size_t width, ByteOrder order) {
  for (std::size_t i = 0; i < width; ++i) {
    const std::size_t shift = (order == ByteOrder::Big) ? 8 * (width - 1 - i) : 8 * i;
    out.push_back(static_cast<std::uint8_t>((v >> shift) & 0xff));
  }
}

FieldValue decode_fixed(const FieldFormat& fmt, ByteView slice, ByteOrder order) {
  if (fmt.kind() == FormatKind::Bytes) return Bytes(slice.begin(), slice.end());

  // slice is exactly fmt.size() bytes, so the reads below cannot run short.
  if (!fmt.is_tuple()) return *read_uint(slice, 0, fmt.width(), order);
  FieldValue::Tuple t;
  t.reserve(fmt.count());
  for (std::size_t k = 0; k < fmt.count(); ++k) {
    t.push_back(*read_uint(slice, k * fmt.width(), fmt.width(), order));
  }
  return t;
}

Status encode_value(const FieldFormat& fmt, const FieldValue& v, ByteOrder order, Bytes& out) {
  if (v.is_absent()) return {};
  if (fmt.kind() == FormatKind::TriggerList) return fail(CodecError::FieldKindMismatch);
  if (!fmt.accepts(v)) return fail(CodecError::PackFailed);

  switch (fmt.kind()) {
    case FormatKind::UInt:
      if (const auto* t = v.tuple()) {
        for (auto x : *t) write_uint(out, x, fmt.width(), order); // flattened positional values
      } else {
        write_uint(out, v.as_uint(), fmt.width(), order);
      }
      return {};
    case FormatKind::Bytes:
    case FormatKind::Dynamic:
      append(out, *v.bytes());
      return {};
    case FormatKind::TriggerList:
      break;
  }
  return fail(CodecError::FieldKindMismatch);
}

//------------------------------- Header ---------------------------------------

std::size_t header_len(const HeaderLayout& layout, const RegionSource& regions) {
  std::size_t n = layout.fixed_len() + layout.dynamic_len();
  for (auto i : layout.active()) {
    if (layout.slot(i).spec->is_triggerlist()) n += regions.region_len(i);
  }
  return n;
}

Result<std::size_t> decode(HeaderLayout& layout, ByteView buf, const RegionSource& regions) {
  const std::size_t need = header_len(layout, regions);
  if (buf.size() < need) return fail(CodecError::NeedData);

  const auto order = layout.schema().order();
  std::size_t off = 0;
  for (auto i : layout.active()) {
    const auto& spec = *layout.slot(i).spec;
    switch (spec.format.kind()) {
      case FormatKind::UInt:
      case FormatKind::Bytes: {
        const auto n = spec.format.size();
        layout.assign(i, decode_fixed(spec.format, buf.subspan(off, n), order));
        off += n;
        break;
      }
      case FormatKind::Dynamic: {
        const auto n = spec.format.encoded_len(layout.slot(i).value);
        const auto slice = buf.subspan(off, n);
        layout.assign(i, Bytes(slice.begin(), slice.end()));
        off += n;
        break;
      }
      case FormatKind::TriggerList:
        off += regions.region_len(i);
        break;
    }
  }
  return off;
}

Result<Bytes> encode(const HeaderLayout& layout, RegionSource& regions) {
  Bytes out;
  out.reserve(layout.fixed_len() + layout.dynamic_len());
  const auto order = layout.schema().order();
  for (auto i : layout.active()) {
    const auto& s = layout.slot(i);
    if (s.spec->is_triggerlist()) {
      auto region = regions.region_bytes(i);
      if (!region) return fail(region.error());
      append(out, *region);
      continue;
    }
    if (auto st = encode_value(s.spec->format, s.value, order, out); !st) return fail(st.error());
  }
  return out;
}

} // namespace strata::codec
