// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/solana/solana_idl.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace idlkit::solana::idl {

struct schema_node;

/** Schema nodes are immutable once built and shared between every tree that uses them. */
using schema_ptr = std::shared_ptr<const schema_node>;

/** Compiled named types, looked up when a `defined` node is decoded. */
using type_map = std::map<std::string, schema_ptr, std::less<>>;

/**
 * @brief Kind of a compiled schema node
 */
enum class schema_kind : uint8_t {
   empty,            // no bytes; instructions without arguments
   primitive,        // integers, bool and floats
   pubkey,           // 32 raw bytes
   string,           // u32 length + UTF-8
   bytes,            // u32 length + raw bytes
   fixed_array,      // [T; N], no prefix
   vector,           // u32 length + elements
   small_vec,        // u8/u16 length + elements
   tuple,            // positional elements
   option,           // presence byte + value
   structure,        // named fields in declaration order
   enumeration,      // discriminant + variant payload
   remaining_bytes,  // everything to the end of the buffer
   defined           // reference to a named type, only at a recursion boundary
};

/**
 * @brief A named child of a struct, a struct-like variant or a tuple (empty name)
 */
struct schema_field {
   std::string name;
   schema_ptr node;
};

/**
 * @brief A compiled enum variant
 */
struct schema_variant {
   std::string name;
   variant_shape shape = variant_shape::unit;
   // named fields, or unnamed tuple elements
   std::vector<schema_field> fields;
};

/**
 * @brief Size in bytes of a fixed-width primitive (0 for string, bytes)
 */
size_t primitive_size(primitive_type t);

/**
 * @brief A node of a compiled binary layout
 *
 * A closed tree: every child is itself compiled, except `defined` nodes, which the compiler emits
 * only where a type refers back to itself through a vector, small vec, option or empty array.
 */
struct schema_node {
   schema_kind kind = schema_kind::empty;

   // For primitive nodes
   primitive_type primitive = primitive_type::u8;

   // Type name of a struct or enum, target of a defined node, instruction name for argument lists
   std::string name;

   // For fixed_array, vector, small_vec and option
   schema_ptr element;

   // For fixed_array
   size_t length = 0;

   // For small_vec - width of the length prefix (1 or 2)
   uint8_t length_width = 0;

   // For enumeration - width of the discriminant (1, 2 or 4)
   uint8_t discriminant_width = 1;

   // For structure and tuple
   std::vector<schema_field> fields;

   // For enumeration
   std::vector<schema_variant> variants;

   // Smallest number of bytes any encoding of this node occupies
   size_t min_size = 0;

   static schema_ptr make_empty(std::string name = {});
   static schema_ptr make_primitive(primitive_type p);
   static schema_ptr make_array(schema_ptr element, size_t length);
   static schema_ptr make_vector(schema_ptr element);
   static schema_ptr make_small_vec(uint8_t length_width, schema_ptr element);
   static schema_ptr make_tuple(std::vector<schema_ptr> elements);
   static schema_ptr make_option(schema_ptr inner);
   static schema_ptr make_struct(std::string name, std::vector<schema_field> fields);
   static schema_ptr make_enum(std::string name, std::vector<schema_variant> variants, uint8_t discriminant_width = 1);
   static schema_ptr make_remaining_bytes();
   static schema_ptr make_defined(std::string name);

   bool is_primitive() const { return kind == schema_kind::primitive; }
   bool is_struct() const { return kind == schema_kind::structure; }
   bool is_enum() const { return kind == schema_kind::enumeration; }
   bool is_defined() const { return kind == schema_kind::defined; }

   /**
    * @brief Find a struct field by name, nullptr if absent
    */
   const schema_node* find_field(std::string_view field_name) const;

   /**
    * @brief Type expression text, e.g. `Vec<Option<u64>>`; structs and enums show their name
    */
   std::string to_string() const;

   /** Structural equality over the whole tree. */
   friend bool operator==(const schema_node& a, const schema_node& b);
   friend bool operator!=(const schema_node& a, const schema_node& b) { return !(a == b); }
};

/**
 * @brief Schema compiler settings
 */
struct compile_options {
   // Width of every enum discriminant: 1, 2 or 4 bytes
   uint8_t enum_discriminant_width = 1;

   // Override the discriminator widths derived from the IDL
   std::optional<uint8_t> account_discriminator_width;
   std::optional<uint8_t> instruction_discriminator_width;

   // When false, a named type that fails to compile is logged and left out
   bool strict = true;
};

void from_variant(const idlkit::variant& v, compile_options& o);

/**
 * @brief Compiles symbol table declarations into schema nodes
 *
 * Named types are compiled once and memoized; recursion is detected along the active compile path.
 * An instance is single-use state and must not be shared between threads.
 *
 * @code
 * schema_compiler compiler(prog.symbols);
 * auto types = compiler.compile_all();
 * auto args = compiler.compile_fields("deposit", prog.instructions[0].args);
 * @endcode
 */
class schema_compiler {
public:
   explicit schema_compiler(const symbol_table& symbols, compile_options options = {});

   /**
    * @brief Compile a type expression
    * @throws unknown_type_name_exception, unresolvable_recursion_exception
    */
   schema_ptr compile_type(const idl_type& type);

   /**
    * @brief Compile a named declaration (memoized)
    */
   schema_ptr compile_named(std::string_view name);

   /**
    * @brief Compile an ordered field list into a struct node
    */
   schema_ptr compile_fields(std::string name, const std::vector<field>& fields);

   /**
    * @brief Compile every declaration of the symbol table
    *
    * In lenient mode a declaration that fails is logged at warn and left out of the result.
    */
   const type_map& compile_all();

   /**
    * @brief Named types compiled so far
    */
   const type_map& compiled() const { return _cache; }

   const compile_options& options() const { return _options; }

private:
   struct frame {
      std::string name;
      size_t indirection = 0;
   };

   schema_ptr compile_declaration(const type_def& def);
   schema_variant compile_variant(const std::string& owner, const enum_variant& var);

   const symbol_table& _symbols;
   compile_options _options;
   type_map _cache;
   std::vector<frame> _active;

   // Number of vector, small vec, option and empty array boundaries on the active path
   size_t _indirection = 0;
};

}  // namespace idlkit::solana::idl
