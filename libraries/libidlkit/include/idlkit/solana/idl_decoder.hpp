// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/solana/idl_value.hpp>

#include <cstdint>
#include <span>

namespace idlkit::solana::idl {

/**
 * @brief Decoder settings
 */
struct decode_options {
   // Bytes skipped in front of an account payload when the discriminator is skipped
   uint8_t account_discriminator_width = 8;

   // Recursive types re-entered more often than this along one path fail with depth_limit_exceeded_exception
   size_t max_depth = 512;
};

void from_variant(const idlkit::variant& v, decode_options& o);

/**
 * @brief What a decode call needs besides the schema and the bytes
 */
struct decode_context {
   // Compiled named types, used to resolve `defined` nodes; may be null for closed schemas
   const type_map* types = nullptr;

   decode_options options;
};

struct decode_result {
   value_node value;

   // Absolute offset one past the last consumed byte
   size_t end_offset = 0;
};

/**
 * @brief Decode bytes against a compiled schema
 *
 * Walks the schema with a forward-only cursor starting at offset. With skip_discriminator the
 * cursor first steps over `account_discriminator_width` bytes, which are not part of the result.
 * Trailing bytes after the value are not an error; end_offset tells where decoding stopped.
 *
 * Thread safe: any number of threads may decode against one schema and one type map.
 *
 * @throws decode_exception (and derived) with the offset and field path of the failure,
 *         unknown_type_name_exception when a defined node is not in the type map
 */
decode_result decode(const schema_node& schema, std::span<const uint8_t> data, bool skip_discriminator = false,
                     const decode_context& context = {}, size_t offset = 0);

}  // namespace idlkit::solana::idl
