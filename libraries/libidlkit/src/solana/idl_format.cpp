// SPDX-License-Identifier: MIT
#include <idlkit/solana/idl_format.hpp>

#include <cmath>
#include <cstdlib>

#include <fmt/format.h>

#include <idlkit/int128.hpp>
#include <idlkit/variant_object.hpp>

namespace idlkit::solana::idl {

namespace {

idlkit::variant format_float(double d) {
   if (std::isnan(d))
      return idlkit::variant("NaN");
   if (std::isinf(d))
      return idlkit::variant(d > 0 ? "inf" : "-inf");
   return idlkit::variant(d);
}

// f32 renders through its shortest text so 0.1f shows as 0.1, not 0.10000000149011612
double widen(float f) {
   auto text = fmt::format("{}", f);
   return std::strtod(text.c_str(), nullptr);
}

idlkit::variant format_bytes(const std::vector<uint8_t>& bytes) {
   idlkit::variants arr;
   arr.reserve(bytes.size());
   for (auto b : bytes)
      arr.emplace_back(b);
   return idlkit::variant(std::move(arr));
}

idlkit::variant format_scalar(const value_node& value) {
   return std::visit(
      [&](const auto& s) -> idlkit::variant {
         using T = std::decay_t<decltype(s)>;
         if constexpr (std::is_same_v<T, std::monostate>) {
            return idlkit::variant();
         } else if constexpr (std::is_same_v<T, bool>) {
            return idlkit::variant(s);
         } else if constexpr (std::is_same_v<T, uint64_t> || std::is_same_v<T, int64_t>) {
            if (primitive_size(value.primitive) >= 8)
               return idlkit::variant(std::to_string(s));
            return idlkit::variant(s);
         } else if constexpr (std::is_same_v<T, float>) {
            return std::isfinite(s) ? idlkit::variant(widen(s)) : format_float(s);
         } else if constexpr (std::is_same_v<T, double>) {
            return format_float(s);
         } else if constexpr (std::is_same_v<T, std::string>) {
            return idlkit::variant(s);
         } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            return format_bytes(s);
         } else {
            idlkit::variant v;
            idlkit::to_variant(s, v);
            return v;
         }
      },
      value.scalar);
}

idlkit::variant format_children(const std::vector<value_node>& children) {
   idlkit::variants arr;
   arr.reserve(children.size());
   for (const auto& c : children)
      arr.push_back(format_value(c));
   return idlkit::variant(std::move(arr));
}

idlkit::variant format_fields(const std::vector<value_node>& children) {
   mutable_variant_object obj;
   obj.reserve(children.size());
   for (const auto& c : children)
      obj.set(c.name, format_value(c));
   return idlkit::variant(obj);
}

idlkit::variant format_field_types(const std::vector<schema_field>& fields) {
   mutable_variant_object obj;
   obj.reserve(fields.size());
   for (const auto& f : fields)
      obj.set(f.name, format_schema(*f.node));
   return idlkit::variant(obj);
}

idlkit::variant format_element_types(const std::vector<schema_field>& fields) {
   idlkit::variants arr;
   arr.reserve(fields.size());
   for (const auto& f : fields)
      arr.push_back(format_schema(*f.node));
   return idlkit::variant(std::move(arr));
}

}  // namespace

idlkit::variant format_value(const value_node& value) {
   switch (value.kind) {
      case schema_kind::empty:
         return idlkit::variant(variant_object());
      case schema_kind::primitive:
      case schema_kind::pubkey:
      case schema_kind::string:
      case schema_kind::bytes:
      case schema_kind::remaining_bytes:
         return format_scalar(value);
      case schema_kind::fixed_array:
      case schema_kind::vector:
      case schema_kind::small_vec:
      case schema_kind::tuple:
         return format_children(value.children);
      case schema_kind::option:
         return value.children.empty() ? idlkit::variant() : format_value(value.children.front());
      case schema_kind::structure:
         return format_fields(value.children);
      case schema_kind::enumeration: {
         mutable_variant_object obj("name", value.variant_name);
         if (value.shape == variant_shape::named)
            obj("value", format_fields(value.children));
         else if (value.shape == variant_shape::tuple)
            obj("value", format_children(value.children));
         return idlkit::variant(obj);
      }
      case schema_kind::defined:
         break;
   }
   IDLKIT_THROW_EXCEPTION(invalid_arg_exception, "Value of kind {} cannot be formatted", magic_enum::enum_name(value.kind));
}

idlkit::variant format_schema(const schema_node& schema) {
   switch (schema.kind) {
      case schema_kind::empty:
         return idlkit::variant();
      case schema_kind::primitive:
         return idlkit::variant(primitive_type_to_string(schema.primitive));
      case schema_kind::pubkey:
         return idlkit::variant("pubkey");
      case schema_kind::string:
         return idlkit::variant("string");
      case schema_kind::bytes:
         return idlkit::variant("bytes");
      case schema_kind::remaining_bytes:
         return idlkit::variant("bytes_remaining");
      case schema_kind::fixed_array:
         return idlkit::variant(mutable_variant_object("size", schema.length)("type", format_schema(*schema.element)));
      case schema_kind::vector:
         return idlkit::variant(mutable_variant_object("type:vec", format_schema(*schema.element)));
      case schema_kind::small_vec:
         return idlkit::variant(mutable_variant_object(
            "type:smallvec",
            mutable_variant_object("len", schema.length_width == 1 ? "u8" : "u16")("elem", format_schema(*schema.element))));
      case schema_kind::option:
         return idlkit::variant(mutable_variant_object("type:option", format_schema(*schema.element)));
      case schema_kind::tuple:
         return idlkit::variant(mutable_variant_object("type:tuple", format_element_types(schema.fields)));
      case schema_kind::structure:
         return format_field_types(schema.fields);
      case schema_kind::enumeration: {
         mutable_variant_object cases;
         cases.reserve(schema.variants.size());
         for (const auto& var : schema.variants) {
            switch (var.shape) {
               case variant_shape::unit:  cases.set(var.name, idlkit::variant()); break;
               case variant_shape::tuple: cases.set(var.name, format_element_types(var.fields)); break;
               case variant_shape::named: cases.set(var.name, format_field_types(var.fields)); break;
            }
         }
         return idlkit::variant(mutable_variant_object("type:enum", cases));
      }
      case schema_kind::defined:
         return idlkit::variant(mutable_variant_object("type:defined", schema.name));
   }
   return idlkit::variant(magic_enum::enum_name(schema.kind));
}

void to_variant(const value_node& value, idlkit::variant& v) {
   v = format_value(value);
}

void to_variant(const schema_node& schema, idlkit::variant& v) {
   v = format_schema(schema);
}

}  // namespace idlkit::solana::idl
