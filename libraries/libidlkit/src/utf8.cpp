// SPDX-License-Identifier: MIT
#include <idlkit/utf8.hpp>

#include <cstdint>

namespace idlkit {

std::optional<size_t> find_invalid_utf8( std::string_view str ) {
   auto s = reinterpret_cast<const uint8_t*>(str.data());
   const size_t n = str.size();
   size_t i = 0;
   while (i < n) {
      uint8_t c = s[i];
      if (c < 0x80) {
         ++i;
         continue;
      }

      size_t   len;
      uint8_t  lo = 0x80, hi = 0xBF; // allowed range of the second byte
      if (c >= 0xC2 && c <= 0xDF) {
         len = 2;
      } else if (c >= 0xE0 && c <= 0xEF) {
         len = 3;
         if (c == 0xE0) lo = 0xA0;      // overlong
         else if (c == 0xED) hi = 0x9F; // surrogates
      } else if (c >= 0xF0 && c <= 0xF4) {
         len = 4;
         if (c == 0xF0) lo = 0x90;      // overlong
         else if (c == 0xF4) hi = 0x8F; // above U+10FFFF
      } else {
         return i;
      }

      if (i + len > n)
         return i;
      if (s[i + 1] < lo || s[i + 1] > hi)
         return i;
      for (size_t k = 2; k < len; ++k) {
         if ((s[i + k] & 0xC0) != 0x80)
            return i;
      }
      i += len;
   }
   return std::nullopt;
}

}
