// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace idlkit {

   /**
    *  Offset of the first byte that does not begin a well-formed UTF-8 sequence: overlong
    *  encodings, surrogate code points, code points above U+10FFFF and truncated sequences are
    *  all rejected. Empty when the whole input is valid.
    */
   std::optional<size_t> find_invalid_utf8( std::string_view str );

   inline bool is_utf8( std::string_view str ) { return !find_invalid_utf8( str ).has_value(); }

}
