// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/solana/idl_schema.hpp>
#include <idlkit/solana/idl_value.hpp>
#include <idlkit/variant.hpp>

namespace idlkit::solana::idl {

/**
 * @brief Render a decoded value as a JSON-compatible tree
 *
 * Integers of 64 bits and wider render as decimal strings so no precision is lost; narrower
 * integers render as numbers. Floats that are not finite render as "NaN", "inf" or "-inf".
 * Structs keep their field order. An enum renders as `{"name": variant}` plus a `"value"` member
 * when the variant carries a payload.
 */
idlkit::variant format_value(const value_node& value);

/**
 * @brief Render a schema as a JSON-compatible description of its layout
 *
 * @code
 * {"owner": "pubkey", "levels": {"type:vec": {"size": 4, "type": "u16"}}}
 * @endcode
 */
idlkit::variant format_schema(const schema_node& schema);

void to_variant(const value_node& value, idlkit::variant& v);
void to_variant(const schema_node& schema, idlkit::variant& v);

}  // namespace idlkit::solana::idl
