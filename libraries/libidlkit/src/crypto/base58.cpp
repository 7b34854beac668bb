// SPDX-License-Identifier: MIT
#include <idlkit/crypto/base58.hpp>
#include <idlkit/exception/exception.hpp>

#include <array>

namespace idlkit {

namespace {

   constexpr const char* alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

   constexpr std::array<int8_t, 128> make_reverse_alphabet() {
      std::array<int8_t, 128> map{};
      for (auto& m : map)
         m = -1;
      for (int i = 0; i < 58; ++i)
         map[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
      return map;
   }

   constexpr auto reverse_alphabet = make_reverse_alphabet();

} // namespace

std::string to_base58( const char* d, size_t s ) {
   auto data = reinterpret_cast<const uint8_t*>(d);

   size_t zeros = 0;
   while (zeros < s && data[zeros] == 0)
      ++zeros;

   // log(256) / log(58), rounded up
   std::vector<uint8_t> b58((s - zeros) * 138 / 100 + 1, 0);
   size_t length = 0;
   for (size_t i = zeros; i < s; ++i) {
      int carry = data[i];
      size_t j = 0;
      for (auto it = b58.rbegin(); (carry != 0 || j < length) && it != b58.rend(); ++it, ++j) {
         carry += 256 * (*it);
         *it = static_cast<uint8_t>(carry % 58);
         carry /= 58;
      }
      length = j;
   }

   auto it = b58.begin() + (b58.size() - length);
   while (it != b58.end() && *it == 0)
      ++it;

   std::string result;
   result.reserve(zeros + (b58.end() - it));
   result.assign(zeros, '1');
   for (; it != b58.end(); ++it)
      result += alphabet[*it];
   return result;
}

std::string to_base58( const std::vector<uint8_t>& data ) {
   return to_base58(reinterpret_cast<const char*>(data.data()), data.size());
}

std::vector<uint8_t> from_base58( std::string_view base58_str ) {
   size_t zeros = 0;
   while (zeros < base58_str.size() && base58_str[zeros] == '1')
      ++zeros;

   // log(58) / log(256), rounded up
   std::vector<uint8_t> b256((base58_str.size() - zeros) * 733 / 1000 + 1, 0);
   size_t length = 0;
   for (size_t i = zeros; i < base58_str.size(); ++i) {
      auto c = static_cast<unsigned char>(base58_str[i]);
      int  carry = c < 128 ? reverse_alphabet[c] : -1;
      IDLKIT_ASSERT(carry >= 0, parse_error_exception, "Invalid base58 character '{}' in '{}'", base58_str[i], base58_str);
      size_t j = 0;
      for (auto it = b256.rbegin(); (carry != 0 || j < length) && it != b256.rend(); ++it, ++j) {
         carry += 58 * (*it);
         *it = static_cast<uint8_t>(carry % 256);
         carry /= 256;
      }
      length = j;
   }

   auto it = b256.begin() + (b256.size() - length);
   while (it != b256.end() && *it == 0)
      ++it;

   std::vector<uint8_t> result;
   result.reserve(zeros + (b256.end() - it));
   result.assign(zeros, 0);
   result.insert(result.end(), it, b256.end());
   return result;
}

}
