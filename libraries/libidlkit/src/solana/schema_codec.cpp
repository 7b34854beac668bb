// SPDX-License-Identifier: MIT
#include <idlkit/solana/schema_codec.hpp>
#include <idlkit/solana/solana_borsh.hpp>

#include <algorithm>

#include <magic_enum/magic_enum.hpp>

namespace idlkit::solana::idl {

namespace {

using tag = schema_codec::tag;

tag primitive_tag(primitive_type p) {
   switch (p) {
      case primitive_type::bool_t: return tag::bool_t;
      case primitive_type::u8:     return tag::u8;
      case primitive_type::u16:    return tag::u16;
      case primitive_type::u32:    return tag::u32;
      case primitive_type::u64:    return tag::u64;
      case primitive_type::u128:   return tag::u128;
      case primitive_type::u256:   return tag::u256;
      case primitive_type::i8:     return tag::i8;
      case primitive_type::i16:    return tag::i16;
      case primitive_type::i32:    return tag::i32;
      case primitive_type::i64:    return tag::i64;
      case primitive_type::i128:   return tag::i128;
      case primitive_type::i256:   return tag::i256;
      case primitive_type::f32:    return tag::f32;
      case primitive_type::f64:    return tag::f64;
      case primitive_type::string: return tag::string;
      case primitive_type::bytes:  return tag::bytes;
      case primitive_type::pubkey: return tag::pubkey;
   }
   IDLKIT_THROW_EXCEPTION(invalid_arg_exception, "Primitive {} has no tag", primitive_type_to_string(p));
}

void write_fields(borsh::encoder& out, const std::vector<schema_field>& fields, bool named);

void write_node(borsh::encoder& out, const schema_node& node) {
   switch (node.kind) {
      case schema_kind::empty:
         out.write_u16(static_cast<uint16_t>(tag::empty));
         out.write_string(node.name);
         return;
      case schema_kind::primitive:
         out.write_u16(static_cast<uint16_t>(primitive_tag(node.primitive)));
         return;
      case schema_kind::pubkey:
         out.write_u16(static_cast<uint16_t>(tag::pubkey));
         return;
      case schema_kind::string:
         out.write_u16(static_cast<uint16_t>(tag::string));
         return;
      case schema_kind::bytes:
         out.write_u16(static_cast<uint16_t>(tag::bytes));
         return;
      case schema_kind::remaining_bytes:
         out.write_u16(static_cast<uint16_t>(tag::remaining_bytes));
         return;
      case schema_kind::option:
         out.write_u16(static_cast<uint16_t>(tag::option));
         write_node(out, *node.element);
         return;
      case schema_kind::vector:
         out.write_u16(static_cast<uint16_t>(tag::vector));
         write_node(out, *node.element);
         return;
      case schema_kind::fixed_array:
         out.write_u16(static_cast<uint16_t>(tag::fixed_array));
         out.write_u64(node.length);
         write_node(out, *node.element);
         return;
      case schema_kind::small_vec:
         out.write_u16(static_cast<uint16_t>(tag::small_vec));
         out.write_u8(node.length_width);
         write_node(out, *node.element);
         return;
      case schema_kind::tuple:
         out.write_u16(static_cast<uint16_t>(tag::tuple));
         write_fields(out, node.fields, false);
         return;
      case schema_kind::structure:
         out.write_u16(static_cast<uint16_t>(tag::structure));
         out.write_string(node.name);
         write_fields(out, node.fields, true);
         return;
      case schema_kind::enumeration:
         out.write_u16(static_cast<uint16_t>(tag::enumeration));
         out.write_string(node.name);
         out.write_u8(node.discriminant_width);
         out.write_u32(static_cast<uint32_t>(node.variants.size()));
         for (const auto& var : node.variants) {
            out.write_string(var.name);
            out.write_u8(static_cast<uint8_t>(var.shape));
            write_fields(out, var.fields, var.shape == variant_shape::named);
         }
         return;
      case schema_kind::defined:
         out.write_u16(static_cast<uint16_t>(tag::defined));
         out.write_string(node.name);
         return;
   }
}

void write_fields(borsh::encoder& out, const std::vector<schema_field>& fields, bool named) {
   out.write_u32(static_cast<uint32_t>(fields.size()));
   for (const auto& f : fields) {
      if (named)
         out.write_string(f.name);
      write_node(out, *f.node);
   }
}

class node_reader {
public:
   explicit node_reader(borsh::decoder& in)
      : _in(in) {}

   schema_ptr read(size_t depth = 0) {
      IDLKIT_ASSERT(depth <= schema_codec::max_depth, parse_error_exception,
                    "Packed schema nests deeper than {} levels", schema_codec::max_depth);
      size_t   offset = _in.position();
      uint16_t raw    = _in.read_u16();
      auto     t      = magic_enum::enum_cast<tag>(raw);
      IDLKIT_ASSERT(t.has_value(), parse_error_exception, "Unknown schema tag {} at offset {}", raw, offset);

      switch (*t) {
         case tag::empty:           return schema_node::make_empty(_in.read_string());
         case tag::pubkey:          return schema_node::make_primitive(primitive_type::pubkey);
         case tag::string:          return schema_node::make_primitive(primitive_type::string);
         case tag::bytes:           return schema_node::make_primitive(primitive_type::bytes);
         case tag::remaining_bytes: return schema_node::make_remaining_bytes();
         case tag::bool_t:          return schema_node::make_primitive(primitive_type::bool_t);
         case tag::u8:              return schema_node::make_primitive(primitive_type::u8);
         case tag::u16:             return schema_node::make_primitive(primitive_type::u16);
         case tag::u32:             return schema_node::make_primitive(primitive_type::u32);
         case tag::u64:             return schema_node::make_primitive(primitive_type::u64);
         case tag::u128:            return schema_node::make_primitive(primitive_type::u128);
         case tag::u256:            return schema_node::make_primitive(primitive_type::u256);
         case tag::i8:              return schema_node::make_primitive(primitive_type::i8);
         case tag::i16:             return schema_node::make_primitive(primitive_type::i16);
         case tag::i32:             return schema_node::make_primitive(primitive_type::i32);
         case tag::i64:             return schema_node::make_primitive(primitive_type::i64);
         case tag::i128:            return schema_node::make_primitive(primitive_type::i128);
         case tag::i256:            return schema_node::make_primitive(primitive_type::i256);
         case tag::f32:             return schema_node::make_primitive(primitive_type::f32);
         case tag::f64:             return schema_node::make_primitive(primitive_type::f64);
         case tag::option:          return schema_node::make_option(read(depth + 1));
         case tag::vector:          return schema_node::make_vector(read(depth + 1));
         case tag::fixed_array: {
            uint64_t length = _in.read_u64();
            return schema_node::make_array(read(depth + 1), static_cast<size_t>(length));
         }
         case tag::small_vec: {
            uint8_t width = _in.read_u8();
            IDLKIT_ASSERT(width == 1 || width == 2, parse_error_exception,
                          "Invalid SmallVec length width {} at offset {}", width, offset);
            return schema_node::make_small_vec(width, read(depth + 1));
         }
         case tag::tuple: {
            std::vector<schema_ptr> elements;
            for (auto& f : read_fields(false, depth))
               elements.push_back(std::move(f.node));
            return schema_node::make_tuple(std::move(elements));
         }
         case tag::structure: {
            auto name = _in.read_string();
            return schema_node::make_struct(std::move(name), read_fields(true, depth));
         }
         case tag::enumeration: {
            auto    name  = _in.read_string();
            uint8_t width = _in.read_u8();
            IDLKIT_ASSERT(width == 1 || width == 2 || width == 4, parse_error_exception,
                          "Invalid enum discriminant width {} at offset {}", width, offset);
            uint32_t count = _in.read_u32();
            std::vector<schema_variant> variants;
            variants.reserve(std::min<size_t>(count, _in.remaining()));
            for (uint32_t i = 0; i < count; ++i) {
               schema_variant var;
               var.name   = _in.read_string();
               auto shape = magic_enum::enum_cast<variant_shape>(_in.read_u8());
               IDLKIT_ASSERT(shape.has_value(), parse_error_exception, "Invalid shape of variant '{}::{}'", name,
                             var.name);
               var.shape  = *shape;
               var.fields = read_fields(var.shape == variant_shape::named, depth);
               variants.push_back(std::move(var));
            }
            return schema_node::make_enum(std::move(name), std::move(variants), width);
         }
         case tag::defined:
            return schema_node::make_defined(_in.read_string());
      }
      IDLKIT_THROW_EXCEPTION(parse_error_exception, "Unknown schema tag {} at offset {}", raw, offset);
   }

private:
   borsh::decoder& _in;

   std::vector<schema_field> read_fields(bool named, size_t depth) {
      uint32_t count = _in.read_u32();
      std::vector<schema_field> fields;
      fields.reserve(std::min<size_t>(count, _in.remaining()));
      for (uint32_t i = 0; i < count; ++i) {
         schema_field f;
         if (named)
            f.name = _in.read_string();
         f.node = read(depth + 1);
         fields.push_back(std::move(f));
      }
      return fields;
   }
};

void expect_end(const borsh::decoder& in) {
   IDLKIT_ASSERT(!in.has_remaining(), parse_error_exception, "{} trailing bytes after packed schema at offset {}",
                 in.remaining(), in.position());
}

}  // namespace

std::vector<uint8_t> schema_codec::pack(const schema_node& node) {
   borsh::encoder out;
   write_node(out, node);
   return out.finish();
}

schema_ptr schema_codec::unpack(std::span<const uint8_t> data) {
   borsh::decoder in(data);
   auto           node = node_reader(in).read();
   expect_end(in);
   return node;
}

std::vector<uint8_t> schema_codec::pack_program(const program_schema& schema) {
   borsh::encoder out;
   out.write_u8(format_version);
   out.write_string(schema._name);
   out.write_string(schema._version);
   out.write_option(schema._address);
   out.write_u8(schema._account_discriminator_width);
   out.write_u8(schema._instruction_discriminator_width);

   out.write_u32(static_cast<uint32_t>(schema._types.size()));
   for (const auto& [name, node] : schema._types) {
      out.write_string(name);
      write_node(out, *node);
   }

   out.write_u32(static_cast<uint32_t>(schema._accounts.size()));
   for (const auto& a : schema._accounts) {
      out.write_string(a.name);
      out.write_bytes(a.discriminator);
      // account layouts are named types, stored once under types
      out.write_string(a.schema->name);
   }

   out.write_u32(static_cast<uint32_t>(schema._instructions.size()));
   for (const auto& i : schema._instructions) {
      out.write_string(i.name);
      out.write_bytes(i.discriminator);
      out.write_vec(i.accounts);
      write_node(out, *i.args);
   }
   return out.finish();
}

program_schema schema_codec::unpack_program(std::span<const uint8_t> data) {
   borsh::decoder in(data);
   node_reader    reader(in);

   uint8_t version = in.read_u8();
   IDLKIT_ASSERT(version == format_version, parse_error_exception, "Unsupported packed schema version {}", version);

   program_schema result;
   result._name                            = in.read_string();
   result._version                         = in.read_string();
   result._address                         = in.read_option<std::string>();
   result._account_discriminator_width     = in.read_u8();
   result._instruction_discriminator_width = in.read_u8();
   IDLKIT_ASSERT(result._account_discriminator_width > 0 && result._instruction_discriminator_width > 0,
                 parse_error_exception, "Packed program '{}' has a zero discriminator width", result._name);

   uint32_t type_count = in.read_u32();
   for (uint32_t i = 0; i < type_count; ++i) {
      auto name = in.read_string();
      result._types.emplace(std::move(name), reader.read());
   }

   uint32_t account_count = in.read_u32();
   for (uint32_t i = 0; i < account_count; ++i) {
      account_schema a;
      a.name          = in.read_string();
      a.discriminator = in.read_bytes();
      auto type_name  = in.read_string();
      auto itr        = result._types.find(type_name);
      IDLKIT_ASSERT(itr != result._types.end(), parse_error_exception, "Account '{}' refers to missing type '{}'",
                    a.name, type_name);
      a.schema = itr->second;
      result._accounts.push_back(std::move(a));
   }

   uint32_t instruction_count = in.read_u32();
   for (uint32_t i = 0; i < instruction_count; ++i) {
      instruction_schema instr;
      instr.name          = in.read_string();
      instr.discriminator = in.read_bytes();
      instr.accounts      = in.read_vec<std::string>();
      instr.args          = reader.read();
      result._instructions.push_back(std::move(instr));
   }

   expect_end(in);
   return result;
}

}  // namespace idlkit::solana::idl
