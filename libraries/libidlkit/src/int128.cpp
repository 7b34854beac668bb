// SPDX-License-Identifier: MIT
#include <idlkit/int128.hpp>
#include <idlkit/variant.hpp>

namespace idlkit {

void to_variant(const uint128& var, variant& vo) { vo = var.str(); }
void to_variant(const int128& var, variant& vo) { vo = var.str(); }
void to_variant(const uint256& var, variant& vo) { vo = var.str(); }
void to_variant(const int256& var, variant& vo) { vo = var.str(); }

} // namespace idlkit
