// SPDX-License-Identifier: MIT
#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <idlkit/variant.hpp>
#include <magic_enum/magic_enum.hpp>

namespace idlkit::solana::idl {

/**
 * @brief Primitive types supported in Solana/Anchor IDL
 */
enum class primitive_type {
   // Boolean
   bool_t,
   // Unsigned integers
   u8,
   u16,
   u32,
   u64,
   u128,
   u256,
   // Signed integers
   i8,
   i16,
   i32,
   i64,
   i128,
   i256,
   // Floating point
   f32,
   f64,
   // String and bytes
   string,
   bytes,
   // Solana pubkey (can be "publicKey" or "pubkey" in IDL)
   pubkey
};

/**
 * @brief Convert a string to primitive_type
 * @return The primitive type, or nullopt if not a valid primitive
 */
std::optional<primitive_type> primitive_type_from_string(std::string_view s);

/**
 * @brief Convert primitive_type to string representation used in IDL
 */
std::string_view primitive_type_to_string(primitive_type t);

/**
 * @brief Kind of IDL type (discriminant for the type union)
 */
enum class type_kind {
   primitive,       // A primitive type like u64, string, pubkey
   defined,         // A user-defined type (struct/enum)
   option,          // Option<T>
   vec,             // Vec<T>
   array,           // [T; N]
   tuple,           // (T1, T2, ...)
   small_vec,       // SmallVec<u8|u16, T>
   remaining_bytes  // every byte left in the buffer
};

/**
 * @brief IDL type expression
 *
 * Represents a type as written in an Anchor IDL, before any name is resolved. Accepted forms:
 *
 * - a primitive keyword (`"u64"`, `"publicKey"`, ...)
 * - `"bytes_remaining"` or `"rest"`
 * - `"[T; N]"` array shorthand
 * - `{"defined": "Name"}` or `{"defined": {"name": "Name"}}`, or a bare non-primitive name
 * - `{"defined": "SmallVec<u8, T>"}` (also `u16`)
 * - `{"option": T}`, `{"vec": T}`, `{"array": [T, N]}`, `{"tuple": [T, ...]}`
 */
struct idl_type {
   // The kind of type
   type_kind kind = type_kind::primitive;

   // For primitive types - which primitive
   std::optional<primitive_type> primitive;

   // For custom/defined types - the name of the defined type
   std::optional<std::string> defined_name;

   // For Option<T>, Vec<T>, [T; N] and SmallVec - the inner type
   std::shared_ptr<idl_type> element;

   // For fixed arrays [T; N] - the array length
   std::optional<size_t> array_len;

   // For SmallVec - width of the length prefix in bytes (1 or 2)
   uint8_t length_width = 0;

   // For tuple types - the element types
   std::optional<std::vector<idl_type>> tuple_elements;

   idl_type() = default;

   static idl_type make_primitive(primitive_type p);
   static idl_type make_defined(std::string name);
   static idl_type make_option(idl_type inner);
   static idl_type make_vec(idl_type element);
   static idl_type make_array(idl_type element, size_t len);
   static idl_type make_tuple(std::vector<idl_type> elements);
   static idl_type make_small_vec(uint8_t length_width, idl_type element);
   static idl_type make_remaining_bytes();

   bool is_primitive() const { return kind == type_kind::primitive; }
   bool is_defined() const { return kind == type_kind::defined; }
   bool is_option() const { return kind == type_kind::option; }
   bool is_vec() const { return kind == type_kind::vec; }
   bool is_array() const { return kind == type_kind::array; }
   bool is_tuple() const { return kind == type_kind::tuple; }
   bool is_small_vec() const { return kind == type_kind::small_vec; }
   bool is_remaining_bytes() const { return kind == type_kind::remaining_bytes; }

   /**
    * @brief Get the primitive type (throws if not primitive)
    */
   primitive_type get_primitive() const;

   /**
    * @brief Get the defined type name (throws if not defined)
    */
   const std::string& get_defined_name() const;

   /**
    * @brief Parse an IDL type from JSON variant
    * @throws malformed_type_expression_exception
    */
   static idl_type from_variant(const idlkit::variant& v);

   /**
    * @brief Parse the string forms: keywords, bracket arrays, SmallVec and defined names
    */
   static idl_type from_string(std::string_view s);

   /**
    * @brief Convert to string representation for debugging/display
    */
   std::string to_string() const;
};

/**
 * @brief Field definition for structs, struct-like variants and instruction arguments
 */
struct field {
   std::string name;
   idl_type type;
};

/**
 * @brief Payload shape of an enum variant
 */
enum class variant_shape {
   unit,   // no payload
   tuple,  // ordered unnamed types
   named   // ordered named fields
};

/**
 * @brief Enum variant definition
 */
struct enum_variant {
   std::string name;
   variant_shape shape = variant_shape::unit;

   // For named variants
   std::vector<field> fields;

   // For tuple variants
   std::vector<idl_type> tuple_fields;
};

/**
 * @brief Custom type definition (struct or enum)
 */
struct type_def {
   std::string name;

   // For structs - the fields
   std::optional<std::vector<field>> struct_fields;

   // For enums - the variants
   std::optional<std::vector<enum_variant>> enum_variants;

   bool is_struct() const { return struct_fields.has_value(); }
   bool is_enum() const { return enum_variants.has_value(); }
};

/**
 * @brief Account requirement for an instruction
 */
struct instruction_account {
   std::string name;
   bool is_mut = false;
   bool is_signer = false;
   bool is_optional = false;
};

/**
 * @brief Instruction definition from IDL
 */
struct instruction {
   std::string name;

   // Leading bytes of the instruction data that select this instruction
   std::vector<uint8_t> discriminator;

   // Instruction arguments
   std::vector<field> args;

   // Required accounts, in the order their keys appear in the transaction
   std::vector<instruction_account> accounts;

   // Documentation
   std::optional<std::string> docs;
};

/**
 * @brief Account type definition from IDL
 */
struct account {
   std::string name;

   // Leading bytes of the account data that select this account type
   std::vector<uint8_t> discriminator;

   // Layout declared inline on the account (legacy IDLs); newer IDLs declare it under `types`
   std::optional<type_def> inline_type;
};

/**
 * @brief Name to type declaration map
 *
 * Declarations keep their declaration order; lookups go through a name index.
 */
class symbol_table {
public:
   /**
    * @brief Add a declaration
    * @throws duplicate_type_name_exception if the name is already declared
    */
   void add(type_def def);

   /**
    * @brief Find a declaration, nullptr if absent
    */
   const type_def* find(std::string_view name) const;

   /**
    * @brief Get a declaration
    * @throws unknown_type_name_exception if absent
    */
   const type_def& get(std::string_view name) const;

   bool contains(std::string_view name) const { return find(name) != nullptr; }
   size_t size() const { return _defs.size(); }
   bool empty() const { return _defs.empty(); }

   auto begin() const { return _defs.begin(); }
   auto end() const { return _defs.end(); }

private:
   std::vector<type_def> _defs;
   std::map<std::string, size_t, std::less<>> _index;
};

/**
 * @brief Complete IDL program definition
 */
struct program {
   std::string name;
   std::string version;

   // Program address, from `address` or `metadata.address`
   std::optional<std::string> address;

   // Program instructions
   std::vector<instruction> instructions;

   // Account types
   std::vector<account> accounts;

   // Custom types, as declared under `types`
   std::vector<type_def> types;

   // Declarations from `types` plus legacy inline account layouts
   symbol_table symbols;

   // Discriminator widths shared by every account and every instruction
   uint8_t account_discriminator_width = 8;
   uint8_t instruction_discriminator_width = 8;

   // Program metadata
   std::optional<std::string> docs;

   /**
    * @brief Find an instruction by name
    */
   const instruction* find_instruction(std::string_view name) const;

   /**
    * @brief Find an account type by name
    */
   const account* find_account(std::string_view name) const;

   /**
    * @brief Find a type definition by name
    */
   const type_def* find_type(std::string_view name) const;
};

/**
 * @brief Parse an IDL from JSON variant
 * @throws malformed_declaration_exception, duplicate_type_name_exception,
 *         malformed_type_expression_exception
 */
program parse_idl(const idlkit::variant& json);

/**
 * @brief Parse an IDL from a JSON file
 */
program parse_idl_file(const std::filesystem::path& path);

/**
 * @brief Compute Anchor discriminator for instruction
 *
 * Returns the first 8 bytes of sha256("global:<snake_case name>")
 */
std::array<uint8_t, 8> compute_instruction_discriminator(std::string_view name);

/**
 * @brief Compute Anchor discriminator for account
 *
 * Returns the first 8 bytes of sha256("account:<name>")
 */
std::array<uint8_t, 8> compute_account_discriminator(std::string_view name);

}  // namespace idlkit::solana::idl
