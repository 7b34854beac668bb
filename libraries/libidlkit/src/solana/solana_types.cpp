// SPDX-License-Identifier: MIT
#include <idlkit/solana/solana_types.hpp>

#include <idlkit/crypto/base58.hpp>
#include <idlkit/exception/exception.hpp>

#include <cstring>

namespace idlkit::solana {

//=============================================================================
// pubkey implementation
//=============================================================================

std::string pubkey::to_base58() const {
   return idlkit::to_base58(reinterpret_cast<const char*>(data.data()), data.size());
}

pubkey pubkey::from_base58(std::string_view str) {
   auto bytes = idlkit::from_base58(str);
   IDLKIT_ASSERT(bytes.size() == SIZE, invalid_arg_exception, "Invalid Solana pubkey length: expected {}, got {}",
                 SIZE, bytes.size());
   pubkey result;
   std::memcpy(result.data.data(), bytes.data(), SIZE);
   return result;
}

bool pubkey::is_zero() const {
   return std::all_of(data.begin(), data.end(), [](uint8_t b) { return b == 0; });
}

}  // namespace idlkit::solana
