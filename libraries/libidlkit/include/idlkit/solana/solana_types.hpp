// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace idlkit::solana {

/**
 * @brief 32-byte Solana public key (base58 encoded in Solana)
 */
struct pubkey {
   static constexpr size_t SIZE = 32;
   std::array<uint8_t, SIZE> data{};

   pubkey() = default;
   explicit pubkey(const std::array<uint8_t, SIZE>& d)
      : data(d) {}
   explicit pubkey(const uint8_t* d) { std::copy_n(d, SIZE, data.begin()); }

   /**
    * @brief Convert public key to base58 string
    */
   std::string to_base58() const;

   /**
    * @brief Create public key from base58 string
    * @throws invalid_arg_exception unless the text decodes to exactly 32 bytes
    */
   static pubkey from_base58(std::string_view str);

   /**
    * @brief Check if the public key is all zeros (the system program address)
    */
   bool is_zero() const;

   bool operator==(const pubkey& other) const { return data == other.data; }
   bool operator!=(const pubkey& other) const { return data != other.data; }
   bool operator<(const pubkey& other) const { return data < other.data; }
};

}  // namespace idlkit::solana
