// SPDX-License-Identifier: MIT
#pragma once
#include <cstdint>
#include <limits>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace idlkit
{

   using int128    = boost::multiprecision::int128_t;
   using uint128   = boost::multiprecision::uint128_t;

   /** 256-bit integers; the signed type is sign-magnitude and covers the full two's complement i256 range. */
   using int256    = boost::multiprecision::int256_t;
   using uint256   = boost::multiprecision::uint256_t;

  class variant;

  /** Wide integers render as decimal strings. */
  void to_variant( const uint128& var,  variant& vo );
  void to_variant( const int128& var,  variant& vo );
  void to_variant( const uint256& var,  variant& vo );
  void to_variant( const int256& var,  variant& vo );

} // namespace idlkit
