// SPDX-License-Identifier: MIT
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace idlkit
{
  /**
   * Split a string by a provided delimiter
   *
   * @param str String to split
   * @param delim delimiter
   * @param max_split a maximum number of chunks allowed, the remainder are grouped as the final element, 0 denotes no limit
   * @return vector of split strings
   */
  std::vector<std::string> split(std::string_view str, char delim, std::size_t max_split = 0);

  /** Removes leading and trailing ASCII whitespace. */
  std::string_view trim(std::string_view s);

  std::string to_lower(std::string s);

  /**
   * Convert a camelCase or PascalCase identifier to snake_case, the way Anchor derives
   * instruction discriminators.
   *
   * An uppercase letter starts a new word when it is followed by a lowercase letter or a digit
   * ("NFTMetadataUpdate" becomes "nft_metadata_update", "mintV1" becomes "mint_v1").
   */
  std::string to_snake_case(std::string_view s);
}
