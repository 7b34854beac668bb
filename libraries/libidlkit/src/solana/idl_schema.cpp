// SPDX-License-Identifier: MIT
#include <idlkit/solana/idl_schema.hpp>
#include <idlkit/solana/idl_exceptions.hpp>

#include <limits>

#include <idlkit/log/logger.hpp>
#include <idlkit/variant_object.hpp>

namespace idlkit::solana::idl {

namespace {

size_t saturating_add(size_t a, size_t b) {
   return a > std::numeric_limits<size_t>::max() - b ? std::numeric_limits<size_t>::max() : a + b;
}

size_t saturating_mul(size_t a, size_t b) {
   if (a == 0 || b == 0)
      return 0;
   return a > std::numeric_limits<size_t>::max() / b ? std::numeric_limits<size_t>::max() : a * b;
}

std::shared_ptr<schema_node> make_node(schema_kind kind) {
   auto node = std::make_shared<schema_node>();
   node->kind = kind;
   return node;
}

bool deep_equal(const schema_ptr& a, const schema_ptr& b) {
   if (a == b)
      return true;
   if (!a || !b)
      return false;
   return *a == *b;
}

bool fields_equal(const std::vector<schema_field>& a, const std::vector<schema_field>& b) {
   if (a.size() != b.size())
      return false;
   for (size_t i = 0; i < a.size(); ++i) {
      if (a[i].name != b[i].name || !deep_equal(a[i].node, b[i].node))
         return false;
   }
   return true;
}

}  // namespace

size_t primitive_size(primitive_type t) {
   switch (t) {
      case primitive_type::bool_t:
      case primitive_type::u8:
      case primitive_type::i8:     return 1;
      case primitive_type::u16:
      case primitive_type::i16:    return 2;
      case primitive_type::u32:
      case primitive_type::i32:
      case primitive_type::f32:    return 4;
      case primitive_type::u64:
      case primitive_type::i64:
      case primitive_type::f64:    return 8;
      case primitive_type::u128:
      case primitive_type::i128:   return 16;
      case primitive_type::u256:
      case primitive_type::i256:
      case primitive_type::pubkey: return 32;
      case primitive_type::string:
      case primitive_type::bytes:  return 0;
   }
   return 0;
}

//=============================================================================
// schema_node factories
//=============================================================================

schema_ptr schema_node::make_empty(std::string name) {
   auto node = make_node(schema_kind::empty);
   node->name = std::move(name);
   return node;
}

schema_ptr schema_node::make_primitive(primitive_type p) {
   switch (p) {
      case primitive_type::pubkey: {
         auto node = make_node(schema_kind::pubkey);
         node->min_size = 32;
         return node;
      }
      case primitive_type::string: {
         auto node = make_node(schema_kind::string);
         node->min_size = 4;
         return node;
      }
      case primitive_type::bytes: {
         auto node = make_node(schema_kind::bytes);
         node->min_size = 4;
         return node;
      }
      default: {
         auto node = make_node(schema_kind::primitive);
         node->primitive = p;
         node->min_size = primitive_size(p);
         return node;
      }
   }
}

schema_ptr schema_node::make_array(schema_ptr element, size_t length) {
   auto node = make_node(schema_kind::fixed_array);
   node->min_size = saturating_mul(element->min_size, length);
   node->element = std::move(element);
   node->length = length;
   return node;
}

schema_ptr schema_node::make_vector(schema_ptr element) {
   auto node = make_node(schema_kind::vector);
   node->element = std::move(element);
   node->min_size = 4;
   return node;
}

schema_ptr schema_node::make_small_vec(uint8_t length_width, schema_ptr element) {
   IDLKIT_ASSERT(length_width == 1 || length_width == 2, invalid_arg_exception,
                 "SmallVec length prefix must be 1 or 2 bytes, got {}", length_width);
   auto node = make_node(schema_kind::small_vec);
   node->element = std::move(element);
   node->length_width = length_width;
   node->min_size = length_width;
   return node;
}

schema_ptr schema_node::make_tuple(std::vector<schema_ptr> elements) {
   auto node = make_node(schema_kind::tuple);
   node->fields.reserve(elements.size());
   for (auto& e : elements) {
      node->min_size = saturating_add(node->min_size, e->min_size);
      node->fields.push_back(schema_field{{}, std::move(e)});
   }
   return node;
}

schema_ptr schema_node::make_option(schema_ptr inner) {
   auto node = make_node(schema_kind::option);
   node->element = std::move(inner);
   node->min_size = 1;
   return node;
}

schema_ptr schema_node::make_struct(std::string name, std::vector<schema_field> fields) {
   auto node = make_node(schema_kind::structure);
   node->name = std::move(name);
   for (const auto& f : fields)
      node->min_size = saturating_add(node->min_size, f.node->min_size);
   node->fields = std::move(fields);
   return node;
}

schema_ptr schema_node::make_enum(std::string name, std::vector<schema_variant> variants, uint8_t discriminant_width) {
   IDLKIT_ASSERT(discriminant_width == 1 || discriminant_width == 2 || discriminant_width == 4, invalid_arg_exception,
                 "Enum discriminant width must be 1, 2 or 4 bytes, got {}", discriminant_width);
   auto node = make_node(schema_kind::enumeration);
   node->name = std::move(name);
   node->variants = std::move(variants);
   node->discriminant_width = discriminant_width;
   node->min_size = discriminant_width;
   return node;
}

schema_ptr schema_node::make_remaining_bytes() {
   return make_node(schema_kind::remaining_bytes);
}

schema_ptr schema_node::make_defined(std::string name) {
   auto node = make_node(schema_kind::defined);
   node->name = std::move(name);
   return node;
}

const schema_node* schema_node::find_field(std::string_view field_name) const {
   for (const auto& f : fields) {
      if (f.name == field_name)
         return f.node.get();
   }
   return nullptr;
}

std::string schema_node::to_string() const {
   switch (kind) {
      case schema_kind::empty:           return "()";
      case schema_kind::primitive:       return std::string(primitive_type_to_string(primitive));
      case schema_kind::pubkey:          return "pubkey";
      case schema_kind::string:          return "string";
      case schema_kind::bytes:           return "bytes";
      case schema_kind::remaining_bytes: return "bytes_remaining";
      case schema_kind::fixed_array:     return fmt::format("[{}; {}]", element->to_string(), length);
      case schema_kind::vector:          return fmt::format("Vec<{}>", element->to_string());
      case schema_kind::small_vec:       return fmt::format("SmallVec<u{}, {}>", length_width * 8, element->to_string());
      case schema_kind::option:          return fmt::format("Option<{}>", element->to_string());
      case schema_kind::structure:
      case schema_kind::enumeration:
      case schema_kind::defined:         return name;
      case schema_kind::tuple: {
         std::string result = "(";
         for (size_t i = 0; i < fields.size(); ++i) {
            if (i)
               result += ", ";
            result += fields[i].node->to_string();
         }
         return result + ")";
      }
   }
   return std::string(magic_enum::enum_name(kind));
}

bool operator==(const schema_node& a, const schema_node& b) {
   if (a.kind != b.kind || a.name != b.name)
      return false;
   switch (a.kind) {
      case schema_kind::empty:
      case schema_kind::pubkey:
      case schema_kind::string:
      case schema_kind::bytes:
      case schema_kind::remaining_bytes:
      case schema_kind::defined:
         return true;
      case schema_kind::primitive:
         return a.primitive == b.primitive;
      case schema_kind::fixed_array:
         return a.length == b.length && deep_equal(a.element, b.element);
      case schema_kind::small_vec:
         return a.length_width == b.length_width && deep_equal(a.element, b.element);
      case schema_kind::vector:
      case schema_kind::option:
         return deep_equal(a.element, b.element);
      case schema_kind::tuple:
      case schema_kind::structure:
         return fields_equal(a.fields, b.fields);
      case schema_kind::enumeration:
         if (a.discriminant_width != b.discriminant_width || a.variants.size() != b.variants.size())
            return false;
         for (size_t i = 0; i < a.variants.size(); ++i) {
            const auto& va = a.variants[i];
            const auto& vb = b.variants[i];
            if (va.name != vb.name || va.shape != vb.shape || !fields_equal(va.fields, vb.fields))
               return false;
         }
         return true;
   }
   return false;
}

//=============================================================================
// compile_options
//=============================================================================

void from_variant(const idlkit::variant& v, compile_options& o) {
   const auto& obj = v.get_object();
   o = compile_options{};
   if (auto itr = obj.find("enum_discriminant_width"); itr != obj.end())
      from_variant(itr->value(), o.enum_discriminant_width);
   if (auto itr = obj.find("account_discriminator_width"); itr != obj.end())
      from_variant(itr->value(), o.account_discriminator_width);
   if (auto itr = obj.find("instruction_discriminator_width"); itr != obj.end())
      from_variant(itr->value(), o.instruction_discriminator_width);
   if (auto itr = obj.find("strict"); itr != obj.end())
      from_variant(itr->value(), o.strict);
}

//=============================================================================
// schema_compiler
//=============================================================================

namespace {

/** Counts a recursion boundary for the lifetime of the guard. */
class indirection_scope {
public:
   explicit indirection_scope(size_t& counter)
      : _counter(counter) {
      ++_counter;
   }
   ~indirection_scope() { --_counter; }

   indirection_scope(const indirection_scope&)            = delete;
   indirection_scope& operator=(const indirection_scope&) = delete;

private:
   size_t& _counter;
};

template <typename Stack>
class frame_scope {
public:
   frame_scope(Stack& stack, typename Stack::value_type f)
      : _stack(stack) {
      _stack.push_back(std::move(f));
   }
   ~frame_scope() { _stack.pop_back(); }

   frame_scope(const frame_scope&)            = delete;
   frame_scope& operator=(const frame_scope&) = delete;

private:
   Stack& _stack;
};

}  // namespace

schema_compiler::schema_compiler(const symbol_table& symbols, compile_options options)
   : _symbols(symbols)
   , _options(options) {
   IDLKIT_ASSERT(_options.enum_discriminant_width == 1 || _options.enum_discriminant_width == 2 ||
                    _options.enum_discriminant_width == 4,
                 invalid_arg_exception, "Enum discriminant width must be 1, 2 or 4 bytes, got {}",
                 _options.enum_discriminant_width);
}

schema_ptr schema_compiler::compile_type(const idl_type& type) {
   switch (type.kind) {
      case type_kind::primitive:
         return schema_node::make_primitive(type.get_primitive());
      case type_kind::defined:
         return compile_named(type.get_defined_name());
      case type_kind::option: {
         indirection_scope boundary(_indirection);
         return schema_node::make_option(compile_type(*type.element));
      }
      case type_kind::vec: {
         indirection_scope boundary(_indirection);
         return schema_node::make_vector(compile_type(*type.element));
      }
      case type_kind::small_vec: {
         indirection_scope boundary(_indirection);
         return schema_node::make_small_vec(type.length_width, compile_type(*type.element));
      }
      case type_kind::array: {
         // an empty array never holds its element, so it breaks a cycle like a vector does
         if (*type.array_len == 0) {
            indirection_scope boundary(_indirection);
            return schema_node::make_array(compile_type(*type.element), 0);
         }
         return schema_node::make_array(compile_type(*type.element), *type.array_len);
      }
      case type_kind::tuple: {
         std::vector<schema_ptr> elements;
         elements.reserve(type.tuple_elements->size());
         for (const auto& e : *type.tuple_elements)
            elements.push_back(compile_type(e));
         return schema_node::make_tuple(std::move(elements));
      }
      case type_kind::remaining_bytes:
         return schema_node::make_remaining_bytes();
   }
   IDLKIT_THROW_EXCEPTION(malformed_type_expression_exception, "Unsupported type expression {}", type.to_string());
}

schema_ptr schema_compiler::compile_named(std::string_view name) {
   if (auto itr = _cache.find(name); itr != _cache.end())
      return itr->second;

   // innermost frame for the name decides whether the cycle crossed a boundary
   for (auto itr = _active.rbegin(); itr != _active.rend(); ++itr) {
      if (itr->name != name)
         continue;
      IDLKIT_ASSERT(_indirection > itr->indirection, unresolvable_recursion_exception,
                    "Type '{}' contains itself without a Vec, Option or SmallVec in between", name);
      return schema_node::make_defined(std::string(name));
   }

   const auto& def = _symbols.get(name);
   frame_scope<std::vector<frame>> scope(_active, frame{def.name, _indirection});
   schema_ptr node;
   try {
      node = compile_declaration(def);
   } IDLKIT_CAPTURE_AND_RETHROW("while compiling type '{}'", def.name)

   _cache.emplace(def.name, node);
   return node;
}

schema_ptr schema_compiler::compile_declaration(const type_def& def) {
   if (def.is_struct())
      return compile_fields(def.name, *def.struct_fields);

   IDLKIT_ASSERT(def.is_enum(), malformed_declaration_exception, "Type '{}' is neither a struct nor an enum",
                 def.name);
   std::vector<schema_variant> variants;
   variants.reserve(def.enum_variants->size());
   for (const auto& var : *def.enum_variants)
      variants.push_back(compile_variant(def.name, var));
   return schema_node::make_enum(def.name, std::move(variants), _options.enum_discriminant_width);
}

schema_variant schema_compiler::compile_variant(const std::string& owner, const enum_variant& var) {
   schema_variant result;
   result.name  = var.name;
   result.shape = var.shape;
   try {
      if (var.shape == variant_shape::named) {
         for (const auto& f : var.fields)
            result.fields.push_back(schema_field{f.name, compile_type(f.type)});
      } else if (var.shape == variant_shape::tuple) {
         for (const auto& t : var.tuple_fields)
            result.fields.push_back(schema_field{{}, compile_type(t)});
      }
   } IDLKIT_CAPTURE_AND_RETHROW("while compiling variant '{}::{}'", owner, var.name)
   return result;
}

schema_ptr schema_compiler::compile_fields(std::string name, const std::vector<field>& fields) {
   std::vector<schema_field> compiled;
   compiled.reserve(fields.size());
   for (const auto& f : fields) {
      try {
         compiled.push_back(schema_field{f.name, compile_type(f.type)});
      } IDLKIT_CAPTURE_AND_RETHROW("while compiling field '{}.{}'", name, f.name)
   }
   return schema_node::make_struct(std::move(name), std::move(compiled));
}

const type_map& schema_compiler::compile_all() {
   for (const auto& def : _symbols) {
      if (_options.strict) {
         compile_named(def.name);
         continue;
      }
      try {
         compile_named(def.name);
      } catch (const compile_exception& e) {
         idlkit_wlog(logger::get("idl_compiler"), "Skipping type '{}': {}", def.name, e.top_message());
      }
   }
   idlkit_dlog(logger::get("idl_compiler"), "Compiled {} of {} declared types", _cache.size(), _symbols.size());
   return _cache;
}

}  // namespace idlkit::solana::idl
