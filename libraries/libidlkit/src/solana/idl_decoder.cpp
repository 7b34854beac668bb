// SPDX-License-Identifier: MIT
#include <idlkit/solana/idl_decoder.hpp>
#include <idlkit/solana/idl_exceptions.hpp>
#include <idlkit/solana/solana_borsh.hpp>

#include <algorithm>
#include <limits>

#include <idlkit/variant_object.hpp>

namespace idlkit::solana::idl {

void from_variant(const idlkit::variant& v, decode_options& o) {
   const auto& obj = v.get_object();
   o = decode_options{};
   if (auto itr = obj.find("account_discriminator_width"); itr != obj.end())
      from_variant(itr->value(), o.account_discriminator_width);
   if (auto itr = obj.find("max_depth"); itr != obj.end()) {
      uint64_t depth = itr->value().as_uint64();
      o.max_depth = static_cast<size_t>(depth);
   }
}

namespace {

/**
 * One decode call: the cursor plus the context, walking the schema recursively.
 */
class schema_walker {
public:
   schema_walker(borsh::decoder& in, const decode_context& context)
      : _in(in)
      , _context(context) {}

   value_node decode(const schema_node& schema, size_t depth);

private:
   borsh::decoder& _in;
   const decode_context& _context;

   const schema_node& resolve(const schema_node& schema) const {
      if (!schema.is_defined())
         return schema;
      IDLKIT_ASSERT(_context.types != nullptr, unknown_type_name_exception,
                    "Type '{}' cannot be resolved without compiled types", schema.name);
      auto itr = _context.types->find(schema.name);
      IDLKIT_ASSERT(itr != _context.types->end(), unknown_type_name_exception, "Type '{}' is not compiled",
                    schema.name);
      return *itr->second;
   }

   value_node decode_primitive(const schema_node& schema);
   void       decode_elements(const schema_node& element, size_t count, value_node& out, size_t depth);
   value_node decode_sequence(const schema_node& schema, size_t count, size_t depth);
   void       decode_named(const std::vector<schema_field>& fields, value_node& out, size_t depth);
   value_node decode_enum(const schema_node& schema, size_t depth);

   // Fails before allocating when count elements cannot fit in what is left
   void check_count(const schema_node& element, size_t count, size_t count_offset, bool length_prefixed) const {
      size_t min = resolve(element).min_size;
      if (min == 0) {
         if (length_prefixed && count > 0)
            throw zero_size_elements_exception(count_offset, count);
         return;
      }
      size_t needed = count > std::numeric_limits<size_t>::max() / min ? std::numeric_limits<size_t>::max()
                                                                          : count * min;
      if (needed > _in.remaining())
         throw truncated_buffer_exception(count_offset, needed, _in.remaining());
   }
};

value_node schema_walker::decode_primitive(const schema_node& schema) {
   value_node out;
   out.kind      = schema_kind::primitive;
   out.primitive = schema.primitive;
   switch (schema.primitive) {
      case primitive_type::bool_t: out.scalar = _in.read_bool(); break;
      case primitive_type::u8:     out.scalar = uint64_t(_in.read_u8()); break;
      case primitive_type::u16:    out.scalar = uint64_t(_in.read_u16()); break;
      case primitive_type::u32:    out.scalar = uint64_t(_in.read_u32()); break;
      case primitive_type::u64:    out.scalar = _in.read_u64(); break;
      case primitive_type::u128:   out.scalar = _in.read_u128(); break;
      case primitive_type::u256:   out.scalar = _in.read_u256(); break;
      case primitive_type::i8:     out.scalar = int64_t(_in.read_i8()); break;
      case primitive_type::i16:    out.scalar = int64_t(_in.read_i16()); break;
      case primitive_type::i32:    out.scalar = int64_t(_in.read_i32()); break;
      case primitive_type::i64:    out.scalar = _in.read_i64(); break;
      case primitive_type::i128:   out.scalar = _in.read_i128(); break;
      case primitive_type::i256:   out.scalar = _in.read_i256(); break;
      case primitive_type::f32:    out.scalar = _in.read_f32(); break;
      case primitive_type::f64:    out.scalar = _in.read_f64(); break;
      case primitive_type::string:
      case primitive_type::bytes:
      case primitive_type::pubkey:
         IDLKIT_THROW_EXCEPTION(invalid_arg_exception, "Primitive node cannot hold {}",
                                primitive_type_to_string(schema.primitive));
   }
   return out;
}

void schema_walker::decode_elements(const schema_node& element, size_t count, value_node& out, size_t depth) {
   out.children.reserve(std::min(count, _in.remaining() + 1));
   for (size_t i = 0; i < count; ++i) {
      try {
         out.children.push_back(decode(element, depth));
      } catch (decode_exception& e) {
         e.prepend_path(fmt::format("[{}]", i));
         throw;
      }
   }
}

value_node schema_walker::decode_sequence(const schema_node& schema, size_t count, size_t depth) {
   const auto& element = resolve(*schema.element);
   value_node  out;
   if (element.is_primitive() && element.primitive == primitive_type::u8 && schema.kind != schema_kind::fixed_array) {
      // u8 sequences are byte strings
      out.kind   = schema_kind::bytes;
      out.scalar = _in.read_fixed_bytes(count);
      return out;
   }
   out.kind = schema.kind;
   decode_elements(*schema.element, count, out, depth);
   return out;
}

void schema_walker::decode_named(const std::vector<schema_field>& fields, value_node& out, size_t depth) {
   out.children.reserve(fields.size());
   for (const auto& f : fields) {
      try {
         auto child = decode(*f.node, depth);
         child.name = f.name;
         out.children.push_back(std::move(child));
      } catch (decode_exception& e) {
         e.prepend_path(f.name);
         throw;
      }
   }
}

value_node schema_walker::decode_enum(const schema_node& schema, size_t depth) {
   size_t   offset = _in.position();
   uint64_t index  = 0;
   switch (schema.discriminant_width) {
      case 1: index = _in.read_u8(); break;
      case 2: index = _in.read_u16(); break;
      case 4: index = _in.read_u32(); break;
      default:
         IDLKIT_THROW_EXCEPTION(invalid_arg_exception, "Enum '{}' has unsupported discriminant width {}", schema.name,
                                schema.discriminant_width);
   }
   if (index >= schema.variants.size())
      throw invalid_discriminant_exception(offset, index, schema.variants.size());

   const auto& var = schema.variants[index];
   value_node  out;
   out.kind          = schema_kind::enumeration;
   out.type_name     = schema.name;
   out.variant_name  = var.name;
   out.variant_index = static_cast<size_t>(index);
   out.shape         = var.shape;
   try {
      if (var.shape == variant_shape::named) {
         decode_named(var.fields, out, depth);
      } else if (var.shape == variant_shape::tuple) {
         out.children.reserve(var.fields.size());
         for (size_t i = 0; i < var.fields.size(); ++i) {
            try {
               out.children.push_back(decode(*var.fields[i].node, depth));
            } catch (decode_exception& e) {
               e.prepend_path(fmt::format("[{}]", i));
               throw;
            }
         }
      }
   } catch (decode_exception& e) {
      e.prepend_path("::" + var.name);
      throw;
   }
   return out;
}

value_node schema_walker::decode(const schema_node& node, size_t depth) {
   // Only re-entering a named type nests without a bound from the schema itself
   if (node.is_defined() && ++depth > _context.options.max_depth)
      throw depth_limit_exceeded_exception(_in.position(), _context.options.max_depth);

   const auto& schema = resolve(node);
   switch (schema.kind) {
      case schema_kind::empty: {
         value_node out;
         out.kind      = schema_kind::empty;
         out.type_name = schema.name;
         return out;
      }
      case schema_kind::primitive:
         return decode_primitive(schema);
      case schema_kind::pubkey: {
         value_node out;
         out.kind   = schema_kind::pubkey;
         out.scalar = _in.read_pubkey().to_base58();
         return out;
      }
      case schema_kind::string: {
         value_node out;
         out.kind   = schema_kind::string;
         out.scalar = _in.read_string();
         return out;
      }
      case schema_kind::bytes: {
         value_node out;
         out.kind   = schema_kind::bytes;
         out.scalar = _in.read_bytes();
         return out;
      }
      case schema_kind::remaining_bytes: {
         value_node out;
         out.kind   = schema_kind::remaining_bytes;
         out.scalar = _in.read_fixed_bytes(_in.remaining());
         return out;
      }
      case schema_kind::fixed_array:
         check_count(*schema.element, schema.length, _in.position(), false);
         return decode_sequence(schema, schema.length, depth);
      case schema_kind::vector: {
         size_t   count_offset = _in.position();
         uint32_t count        = _in.read_u32();
         check_count(*schema.element, count, count_offset, true);
         return decode_sequence(schema, count, depth);
      }
      case schema_kind::small_vec: {
         size_t count_offset = _in.position();
         size_t count        = schema.length_width == 1 ? _in.read_u8() : _in.read_u16();
         check_count(*schema.element, count, count_offset, true);
         return decode_sequence(schema, count, depth);
      }
      case schema_kind::tuple: {
         value_node out;
         out.kind = schema_kind::tuple;
         out.children.reserve(schema.fields.size());
         for (size_t i = 0; i < schema.fields.size(); ++i) {
            try {
               out.children.push_back(decode(*schema.fields[i].node, depth));
            } catch (decode_exception& e) {
               e.prepend_path(fmt::format("[{}]", i));
               throw;
            }
         }
         return out;
      }
      case schema_kind::option: {
         size_t  offset = _in.position();
         uint8_t tag    = _in.read_u8();
         value_node out;
         out.kind = schema_kind::option;
         if (tag == 1)
            out.children.push_back(decode(*schema.element, depth));
         else if (tag != 0)
            throw invalid_option_tag_exception(offset, tag);
         return out;
      }
      case schema_kind::structure: {
         value_node out;
         out.kind      = schema_kind::structure;
         out.type_name = schema.name;
         decode_named(schema.fields, out, depth);
         return out;
      }
      case schema_kind::enumeration:
         return decode_enum(schema, depth);
      case schema_kind::defined:
         break;
   }
   IDLKIT_THROW_EXCEPTION(invalid_arg_exception, "Unsupported schema node {}", schema.to_string());
}

}  // namespace

decode_result decode(const schema_node& schema, std::span<const uint8_t> data, bool skip_discriminator,
                     const decode_context& context, size_t offset) {
   borsh::decoder in(data, offset);
   if (skip_discriminator)
      in.skip(context.options.account_discriminator_width);

   schema_walker walker(in, context);
   decode_result result;
   result.value      = walker.decode(schema, 0);
   result.end_offset = in.position();
   return result;
}

}  // namespace idlkit::solana::idl
