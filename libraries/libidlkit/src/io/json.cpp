// SPDX-License-Identifier: MIT
#include <idlkit/io/json.hpp>
#include <idlkit/variant_object.hpp>
#include <idlkit/exception/exception.hpp>

#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>

namespace idlkit {

namespace {

class json_parser {
public:
   explicit json_parser(std::string_view in)
      : _in(in) {}

   variant parse() {
      skip_ws();
      variant result = parse_value(0);
      skip_ws();
      IDLKIT_ASSERT(_pos == _in.size(), parse_error_exception, "Unexpected trailing content at offset {}", _pos);
      return result;
   }

private:
   std::string_view _in;
   size_t           _pos = 0;

   [[noreturn]] void fail(std::string_view what) const {
      IDLKIT_THROW_EXCEPTION(parse_error_exception, "JSON parse error at offset {}: {}", _pos, what);
   }

   char peek() const { return _pos < _in.size() ? _in[_pos] : '\0'; }
   bool at_end() const { return _pos >= _in.size(); }

   void skip_ws() {
      while (!at_end()) {
         char c = _in[_pos];
         if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
            ++_pos;
         else
            break;
      }
   }

   void expect(char c) {
      if (peek() != c)
         fail(fmt::format("expected '{}'", c));
      ++_pos;
   }

   void expect_literal(std::string_view lit) {
      if (_in.substr(_pos, lit.size()) != lit)
         fail(fmt::format("expected '{}'", lit));
      _pos += lit.size();
   }

   variant parse_value(uint32_t depth) {
      if (depth > json::max_depth)
         fail("nesting too deep");
      if (at_end())
         fail("unexpected end of input");
      switch (peek()) {
         case '{': return parse_object(depth + 1);
         case '[': return parse_array(depth + 1);
         case '"': return variant(parse_string());
         case 't': expect_literal("true"); return variant(true);
         case 'f': expect_literal("false"); return variant(false);
         case 'n': expect_literal("null"); return variant();
         default:
            return parse_number();
      }
   }

   variant parse_object(uint32_t depth) {
      expect('{');
      mutable_variant_object obj;
      skip_ws();
      if (peek() == '}') {
         ++_pos;
         return variant(std::move(obj));
      }
      while (true) {
         skip_ws();
         if (peek() != '"')
            fail("expected object key");
         std::string key = parse_string();
         skip_ws();
         expect(':');
         skip_ws();
         obj.set(std::move(key), parse_value(depth));
         skip_ws();
         if (peek() == ',') {
            ++_pos;
            continue;
         }
         expect('}');
         break;
      }
      return variant(std::move(obj));
   }

   variant parse_array(uint32_t depth) {
      expect('[');
      variants arr;
      skip_ws();
      if (peek() == ']') {
         ++_pos;
         return variant(std::move(arr));
      }
      while (true) {
         skip_ws();
         arr.push_back(parse_value(depth));
         skip_ws();
         if (peek() == ',') {
            ++_pos;
            continue;
         }
         expect(']');
         break;
      }
      return variant(std::move(arr));
   }

   uint32_t parse_hex4() {
      if (_pos + 4 > _in.size())
         fail("truncated \\u escape");
      uint32_t cp = 0;
      auto [ptr, ec] = std::from_chars(_in.data() + _pos, _in.data() + _pos + 4, cp, 16);
      if (ec != std::errc() || ptr != _in.data() + _pos + 4)
         fail("invalid \\u escape");
      _pos += 4;
      return cp;
   }

   static void append_utf8(std::string& out, uint32_t cp) {
      if (cp < 0x80) {
         out += static_cast<char>(cp);
      } else if (cp < 0x800) {
         out += static_cast<char>(0xC0 | (cp >> 6));
         out += static_cast<char>(0x80 | (cp & 0x3F));
      } else if (cp < 0x10000) {
         out += static_cast<char>(0xE0 | (cp >> 12));
         out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
         out += static_cast<char>(0x80 | (cp & 0x3F));
      } else {
         out += static_cast<char>(0xF0 | (cp >> 18));
         out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
         out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
         out += static_cast<char>(0x80 | (cp & 0x3F));
      }
   }

   std::string parse_string() {
      expect('"');
      std::string out;
      while (true) {
         if (at_end())
            fail("unterminated string");
         char c = _in[_pos++];
         if (c == '"')
            break;
         if (static_cast<unsigned char>(c) < 0x20)
            fail("control character in string");
         if (c != '\\') {
            out += c;
            continue;
         }
         if (at_end())
            fail("unterminated escape");
         char e = _in[_pos++];
         switch (e) {
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
               uint32_t cp = parse_hex4();
               if (cp >= 0xD800 && cp <= 0xDBFF) {
                  expect_literal("\\u");
                  uint32_t low = parse_hex4();
                  if (low < 0xDC00 || low > 0xDFFF)
                     fail("invalid surrogate pair");
                  cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
               } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                  fail("unpaired low surrogate");
               }
               append_utf8(out, cp);
               break;
            }
            default:
               fail(fmt::format("invalid escape '\\{}'", e));
         }
      }
      return out;
   }

   variant parse_number() {
      size_t start    = _pos;
      bool   negative = false;
      bool   integral = true;
      if (peek() == '-') {
         negative = true;
         ++_pos;
      }
      if (!std::isdigit(static_cast<unsigned char>(peek())))
         fail("invalid value");
      while (std::isdigit(static_cast<unsigned char>(peek())))
         ++_pos;
      if (peek() == '.') {
         integral = false;
         ++_pos;
         if (!std::isdigit(static_cast<unsigned char>(peek())))
            fail("invalid number");
         while (std::isdigit(static_cast<unsigned char>(peek())))
            ++_pos;
      }
      if (peek() == 'e' || peek() == 'E') {
         integral = false;
         ++_pos;
         if (peek() == '+' || peek() == '-')
            ++_pos;
         if (!std::isdigit(static_cast<unsigned char>(peek())))
            fail("invalid exponent");
         while (std::isdigit(static_cast<unsigned char>(peek())))
            ++_pos;
      }
      std::string_view text = _in.substr(start, _pos - start);
      const char*      first = text.data();
      const char*      last  = text.data() + text.size();
      if (integral) {
         if (negative) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last)
               return variant(v);
         } else {
            uint64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last)
               return variant(v);
         }
         // wider than 64 bits
         return variant(std::string(text));
      }
      double d = 0;
      auto [ptr, ec] = std::from_chars(first, last, d);
      if (ec != std::errc() || ptr != last)
         fail("invalid number");
      return variant(d);
   }
};

void escape_string(std::string& out, const std::string& s) {
   out += '"';
   for (char c : s) {
      switch (c) {
         case '"':  out += "\\\""; break;
         case '\\': out += "\\\\"; break;
         case '\b': out += "\\b"; break;
         case '\f': out += "\\f"; break;
         case '\n': out += "\\n"; break;
         case '\r': out += "\\r"; break;
         case '\t': out += "\\t"; break;
         default:
            if (static_cast<unsigned char>(c) < 0x20)
               out += fmt::format("\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
            else
               out += c;
      }
   }
   out += '"';
}

void write_value(std::string& out, const variant& v, bool pretty, uint32_t indent) {
   auto newline = [&](uint32_t level) {
      if (pretty) {
         out += '\n';
         out.append(level * 2, ' ');
      }
   };

   switch (v.get_type()) {
      case variant::null_type:
         out += "null";
         break;
      case variant::bool_type:
         out += v.as_bool() ? "true" : "false";
         break;
      case variant::int64_type:
         out += std::to_string(v.as_int64());
         break;
      case variant::uint64_type:
         out += std::to_string(v.as_uint64());
         break;
      case variant::double_type: {
         double d = v.as_double();
         if (std::isfinite(d))
            out += fmt::format("{}", d);
         else
            out += "null";
         break;
      }
      case variant::string_type:
         escape_string(out, v.get_string());
         break;
      case variant::array_type: {
         const auto& arr = v.get_array();
         out += '[';
         for (size_t i = 0; i < arr.size(); ++i) {
            if (i)
               out += ',';
            newline(indent + 1);
            write_value(out, arr[i], pretty, indent + 1);
         }
         if (!arr.empty())
            newline(indent);
         out += ']';
         break;
      }
      case variant::object_type: {
         const auto& obj   = v.get_object();
         bool        first = true;
         out += '{';
         for (const auto& e : obj) {
            if (!first)
               out += ',';
            first = false;
            newline(indent + 1);
            escape_string(out, e.key());
            out += pretty ? ": " : ":";
            write_value(out, e.value(), pretty, indent + 1);
         }
         if (!obj.empty())
            newline(indent);
         out += '}';
         break;
      }
   }
}

} // namespace

variant json::from_string(std::string_view utf8_str) {
   return json_parser(utf8_str).parse();
}

variant json::from_file(const std::filesystem::path& p) {
   IDLKIT_ASSERT(std::filesystem::exists(p), file_not_found_exception, "File '{}' does not exist", p.string());
   std::ifstream in(p, std::ios::binary);
   IDLKIT_ASSERT(in.good(), file_not_found_exception, "Unable to open '{}'", p.string());
   std::stringstream ss;
   ss << in.rdbuf();
   try {
      return from_string(ss.str());
   } IDLKIT_CAPTURE_AND_RETHROW("while parsing '{}'", p.string())
}

std::string json::to_string(const variant& v) {
   std::string out;
   write_value(out, v, false, 0);
   return out;
}

std::string json::to_pretty_string(const variant& v) {
   std::string out;
   write_value(out, v, true, 0);
   return out;
}

void json::save_to_file(const variant& v, const std::filesystem::path& fi, bool pretty) {
   std::ofstream o(fi, std::ios::binary | std::ios::trunc);
   IDLKIT_ASSERT(o.good(), invalid_arg_exception, "Unable to open '{}' for writing", fi.string());
   o << (pretty ? to_pretty_string(v) : to_string(v));
}

bool json::is_valid(std::string_view json_str) {
   try {
      from_string(json_str);
      return true;
   } catch (const parse_error_exception&) {
      return false;
   }
}

} // namespace idlkit
