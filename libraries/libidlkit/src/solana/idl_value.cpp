// SPDX-License-Identifier: MIT
#include <idlkit/solana/idl_value.hpp>

namespace idlkit::solana::idl {

std::string value_node::to_decimal_string() const {
   return std::visit(
      [this](const auto& v) -> std::string {
         using T = std::decay_t<decltype(v)>;
         if constexpr (std::is_same_v<T, uint64_t> || std::is_same_v<T, int64_t>)
            return std::to_string(v);
         else if constexpr (std::is_same_v<T, idlkit::uint128> || std::is_same_v<T, idlkit::int128> ||
                            std::is_same_v<T, idlkit::uint256> || std::is_same_v<T, idlkit::int256>)
            return v.str();
         else
            IDLKIT_THROW_EXCEPTION(bad_cast_exception, "Value of kind {} is not an integer",
                                   magic_enum::enum_name(kind));
      },
      scalar);
}

const value_node* value_node::find(std::string_view field_name) const {
   for (const auto& child : children) {
      if (child.name == field_name)
         return &child;
   }
   return nullptr;
}

const value_node& value_node::operator[](std::string_view field_name) const {
   const auto* child = find(field_name);
   IDLKIT_ASSERT(child != nullptr, key_not_found_exception, "Value has no field '{}'", field_name);
   return *child;
}

bool operator==(const value_node& a, const value_node& b) {
   return a.kind == b.kind && a.primitive == b.primitive && a.name == b.name && a.type_name == b.type_name &&
          a.variant_name == b.variant_name && a.variant_index == b.variant_index && a.shape == b.shape &&
          a.scalar == b.scalar && a.children == b.children;
}

}  // namespace idlkit::solana::idl
