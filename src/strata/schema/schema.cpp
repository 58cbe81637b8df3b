/**
 * @file schema.cpp
 * @brief Schema validation and derived lookup tables.
 */
#include "strata/schema/schema.hpp"
#include "strata/obs/observability.hpp"

#include <cstdlib>

namespace strata::schema {

const char* to_string(SchemaError e) noexcept {
  switch (e) {
    case SchemaError::EmptyName:          return "empty_name";
    case SchemaError::DuplicateField:     return "duplicate_field";
    case SchemaError::BadFormat:          return "bad_format";
    case SchemaError::BadDefault:         return "bad_default";
    case SchemaError::MultipleTypeFields: return "multiple_type_fields";
    case SchemaError::TypeFieldNotScalar: return "type_field_not_scalar";
    case SchemaError::AutoUpdateNotFixed: return "auto_update_not_fixed";
    case SchemaError::BadAddressField:    return "bad_address_field";
  }
  return "unknown";
}

strata_detail::expected<Schema, SchemaError>
Schema::build(std::string name, const std::vector<FieldDef>& fields, SchemaOptions opts) {
  using Err = strata_detail::unexpected<SchemaError>;
  if (name.empty()) return Err(SchemaError::EmptyName);

  Schema s;
  s.name_  = std::move(name);
  s.order_ = opts.order;
  s.fields_.reserve(fields.size());
  s.format_string_.push_back(order_prefix(opts.order));

  for (const auto& def : fields) {
    if (def.name.empty()) return Err(SchemaError::EmptyName);
    if (s.index_.find(def.name) != s.index_.end()) return Err(SchemaError::DuplicateField);

    auto fmt = FieldFormat::parse(def.format);
    if (!fmt) return Err(SchemaError::BadFormat);

    // Triggerlists start empty; everything else must fit its own format.
    if (fmt->kind() == FormatKind::TriggerList ? !def.default_value.is_absent()
                                               : !fmt->accepts(def.default_value)) {
      return Err(SchemaError::BadDefault);
    }

    if ((def.flags & flags::kTypeField) != 0) {
      if (s.type_field_) return Err(SchemaError::MultipleTypeFields);
      if (!fmt->is_scalar_uint()) return Err(SchemaError::TypeFieldNotScalar);
      s.type_field_ = s.fields_.size();
    }
    if ((def.flags & flags::kAutoUpdate) != 0 &&
        (!fmt->fixed() || def.default_value.is_absent())) {
      return Err(SchemaError::AutoUpdateNotFixed);
    }

    if (fmt->fixed() && !def.default_value.is_absent()) {
      s.format_string_ += fmt->token();
      s.header_len_    += fmt->size();
    }
    s.index_.emplace(std::string(def.name), s.fields_.size());
    s.fields_.push_back(FieldSpec{std::string(def.name), *fmt, def.default_value, def.flags});
  }

  if (!opts.src_field.empty() || !opts.dst_field.empty()) {
    const auto src = s.index_of(opts.src_field);
    const auto dst = s.index_of(opts.dst_field);
    if (!src || !dst || *src == *dst) return Err(SchemaError::BadAddressField);
    if (!s.fields_[*src].format.fixed() || !s.fields_[*dst].format.fixed()) {
      return Err(SchemaError::BadAddressField);
    }
    s.src_field_ = src;
    s.dst_field_ = dst;
  }
  return s;
}

std::optional<std::size_t> Schema::index_of(std::string_view name) const noexcept {
  auto it = index_.find(name);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

const FieldValue* Schema::default_of(std::string_view name) const noexcept {
  const auto i = index_of(name);
  return i ? &fields_[*i].default_value : nullptr;
}

Schema define(std::string name, const std::vector<FieldDef>& fields, SchemaOptions opts) {
  const std::string label = name;
  auto s = Schema::build(std::move(name), fields, opts);
  if (!s) {
    obs::emit(obs::EventKind::Config, obs::Level::Error, label,
              std::string("invalid header table: ") + to_string(s.error()));
    std::abort(); // protocol definition bug
  }
  return std::move(*s);
}

} // namespace strata::schema
