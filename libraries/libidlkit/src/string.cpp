// SPDX-License-Identifier: MIT
#include <idlkit/string.hpp>

#include <algorithm>
#include <cctype>

namespace idlkit {

std::vector<std::string> split(std::string_view str, char delim, std::size_t max_split) {
   std::vector<std::string> out;
   size_t start = 0;
   while (true) {
      if (max_split && out.size() + 1 == max_split) {
         out.emplace_back(str.substr(start));
         break;
      }
      auto pos = str.find(delim, start);
      if (pos == std::string_view::npos) {
         out.emplace_back(str.substr(start));
         break;
      }
      out.emplace_back(str.substr(start, pos - start));
      start = pos + 1;
   }
   return out;
}

std::string_view trim(std::string_view s) {
   auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
   while (!s.empty() && is_space(s.front()))
      s.remove_prefix(1);
   while (!s.empty() && is_space(s.back()))
      s.remove_suffix(1);
   return s;
}

std::string to_lower(std::string s) {
   std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
   return s;
}

std::string to_snake_case(std::string_view s) {
   std::string out;
   out.reserve(s.size() + 4);
   for (size_t i = 0; i < s.size(); ++i) {
      auto c = static_cast<unsigned char>(s[i]);
      if (std::isupper(c)) {
         bool word_start = i + 1 < s.size() && (std::islower(static_cast<unsigned char>(s[i + 1])) ||
                                                std::isdigit(static_cast<unsigned char>(s[i + 1])));
         if (!out.empty() && word_start)
            out += '_';
         out += static_cast<char>(std::tolower(c));
      } else {
         out += static_cast<char>(c);
      }
   }
   return out;
}

}
