// SPDX-License-Identifier: MIT
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace idlkit {

   /** Bitcoin-alphabet base58, as used for Solana addresses. Leading zero bytes encode as '1'. */
   std::string          to_base58( const char* d, size_t s );
   std::string          to_base58( const std::vector<uint8_t>& data );

   /** @throws parse_error_exception on a character outside the base58 alphabet */
   std::vector<uint8_t> from_base58( std::string_view base58_str );

}
