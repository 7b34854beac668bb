// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/variant.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace idlkit {

/**
 *  Provides interface for json serialization.
 *
 *  Numbers without a fraction or exponent parse as int64 (negative) or uint64; integers too large
 *  for 64 bits are kept as their decimal string so no precision is lost. Everything else numeric
 *  parses as double.
 */
class json {
public:
   /** Nesting deeper than this fails with parse_error_exception. */
   static constexpr uint32_t max_depth = 200;

   static variant from_string(std::string_view utf8_str);
   static variant from_file(const std::filesystem::path& p);

   template <typename T>
   static T from_file(const std::filesystem::path& p) {
      return json::from_file(p).as<T>();
   }

   static std::string to_string(const variant& v);
   static std::string to_pretty_string(const variant& v);

   static void save_to_file(const variant& v, const std::filesystem::path& fi, bool pretty = true);

   static bool is_valid(std::string_view json_str);
};

} // namespace idlkit
