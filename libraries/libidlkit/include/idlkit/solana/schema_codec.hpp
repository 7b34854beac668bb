// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/solana/idl_program.hpp>
#include <idlkit/solana/idl_schema.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace idlkit::solana::idl {

/**
 * @brief Compact binary form of compiled schemas
 *
 * Every node starts with a u16 tag followed by its payload in Borsh encoding. A packed program
 * carries its named types, accounts and instructions, so it can be cached and reloaded without
 * parsing or compiling the IDL again.
 *
 * | tag | node           | payload                                               |
 * |-----|----------------|-------------------------------------------------------|
 * | 0   | empty          | name                                                  |
 * | 1   | pubkey         |                                                       |
 * | 2   | string         |                                                       |
 * | 3   | i8 .. 15 bool  | numeric primitives, see `tag`                         |
 * | 16  | option         | node                                                  |
 * | 17  | fixed array    | u64 length, node                                      |
 * | 18  | tuple          | u32 count, nodes                                      |
 * | 19  | vector         | node                                                  |
 * | 20  | struct         | name, u32 count, (name, node)...                      |
 * | 21  | enum           | name, u8 width, u32 count, (name, u8 shape, u32 count, (name, node)...)... |
 * | 22  | small vec      | u8 length width, node                                 |
 * | 23  | bytes          |                                                       |
 * | 24  | remaining bytes|                                                       |
 * | 25  | defined        | name                                                  |
 * | 26  | u256           |                                                       |
 * | 27  | i256           |                                                       |
 */
class schema_codec {
public:
   enum class tag : uint16_t {
      empty           = 0,
      pubkey          = 1,
      string          = 2,
      i8              = 3,
      u8              = 4,
      i16             = 5,
      u16             = 6,
      i32             = 7,
      u32             = 8,
      i64             = 9,
      u64             = 10,
      i128            = 11,
      u128            = 12,
      f32             = 13,
      f64             = 14,
      bool_t          = 15,
      option          = 16,
      fixed_array     = 17,
      tuple           = 18,
      vector          = 19,
      structure       = 20,
      enumeration     = 21,
      small_vec       = 22,
      bytes           = 23,
      remaining_bytes = 24,
      defined         = 25,
      u256            = 26,
      i256            = 27
   };

   static constexpr uint8_t format_version = 1;

   // Nesting deeper than this is rejected on unpack
   static constexpr size_t max_depth = 256;

   static std::vector<uint8_t> pack(const schema_node& node);

   /**
    * @throws parse_error_exception on an unknown tag, trailing bytes or nesting past max_depth,
    *         truncated_buffer_exception when the data ends early
    */
   static schema_ptr unpack(std::span<const uint8_t> data);

   static std::vector<uint8_t> pack_program(const program_schema& schema);
   static program_schema       unpack_program(std::span<const uint8_t> data);
};

}  // namespace idlkit::solana::idl
