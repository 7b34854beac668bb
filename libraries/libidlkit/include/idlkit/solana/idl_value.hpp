// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/solana/idl_schema.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <idlkit/exception/exception.hpp>
#include <idlkit/int128.hpp>

namespace idlkit::solana::idl {

/**
 * @brief A decoded value
 *
 * Mirrors the schema node it was decoded from (`defined` nodes are replaced by what they resolve
 * to). Leaves hold their value in `scalar`; containers hold their elements in `children`:
 *
 * - structure: one child per field, `name` set to the field name
 * - fixed_array, vector, small_vec, tuple: one child per element
 * - option: no child when absent, one when present
 * - enumeration: the payload of the selected variant, named children for a struct-like variant
 *
 * A vector or small vec of u8 decodes to a `bytes` node. Integers are exact at every width.
 */
struct value_node {
   using scalar_type = std::variant<std::monostate, bool, uint64_t, int64_t, idlkit::uint128, idlkit::int128,
                                    idlkit::uint256, idlkit::int256, float, double, std::string, std::vector<uint8_t>>;

   schema_kind kind = schema_kind::empty;

   // For primitive nodes
   primitive_type primitive = primitive_type::u8;

   // Field name when this node is a member of a struct or of a struct-like variant
   std::string name;

   // Type name of a struct or enum
   std::string type_name;

   // For enumeration
   std::string variant_name;
   size_t variant_index = 0;
   variant_shape shape = variant_shape::unit;

   scalar_type scalar;
   std::vector<value_node> children;

   /**
    * @brief The scalar as T
    * @throws bad_cast_exception when the node holds something else
    */
   template <typename T>
   const T& get() const {
      const T* v = std::get_if<T>(&scalar);
      IDLKIT_ASSERT(v != nullptr, bad_cast_exception, "Value of kind {} does not hold the requested type",
                    magic_enum::enum_name(kind));
      return *v;
   }

   bool is_null() const { return kind == schema_kind::option && children.empty(); }

   /**
    * @brief Exact decimal text of an integer of any width
    */
   std::string to_decimal_string() const;

   /**
    * @brief Find a named child, nullptr if absent
    */
   const value_node* find(std::string_view field_name) const;

   /**
    * @brief Named child access
    * @throws key_not_found_exception
    */
   const value_node& operator[](std::string_view field_name) const;

   size_t size() const { return children.size(); }

   friend bool operator==(const value_node& a, const value_node& b);
   friend bool operator!=(const value_node& a, const value_node& b) { return !(a == b); }
};

}  // namespace idlkit::solana::idl
