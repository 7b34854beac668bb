// SPDX-License-Identifier: MIT
#include <idlkit/crypto/hex.hpp>
#include <idlkit/exception/exception.hpp>

namespace idlkit {

uint8_t from_hex(char c) {
   if (c >= '0' && c <= '9')
      return c - '0';
   if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
   if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
   IDLKIT_THROW_EXCEPTION(parse_error_exception, "Invalid hex character '{}'", c);
}

std::string to_hex(const char* d, uint32_t s, bool add_prefix) {
   std::string r;
   r.reserve(s * 2 + (add_prefix ? 2 : 0));
   if (add_prefix) r += "0x";
   auto digits = "0123456789abcdef";
   auto c = reinterpret_cast<const uint8_t*>(d);
   for (uint32_t i = 0; i < s; ++i)
      (r += digits[(c[i] >> 4)]) += digits[(c[i] & 0x0f)];
   return r;
}

std::vector<uint8_t> from_hex(std::string_view hex, bool trim_prefix) {
   auto cleaned = trim_prefix ? trim_hex_prefix(hex) : hex;
   std::vector<uint8_t> out;
   out.reserve((cleaned.size() + 1) / 2);

   size_t i = 0;
   if (cleaned.size() % 2) {
      out.push_back(from_hex(cleaned[0]));
      i = 1;
   }
   for (; i < cleaned.size(); i += 2)
      out.push_back(static_cast<uint8_t>((from_hex(cleaned[i]) << 4) | from_hex(cleaned[i + 1])));
   return out;
}

std::string_view trim_hex_prefix(std::string_view hex) {
   if (hex.starts_with("0x") || hex.starts_with("0X"))
      return hex.substr(2);
   return hex;
}

} // namespace idlkit
