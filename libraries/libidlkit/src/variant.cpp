// SPDX-License-Identifier: MIT
#include <idlkit/variant.hpp>
#include <idlkit/variant_object.hpp>
#include <idlkit/exception/exception.hpp>

#include <charconv>
#include <cmath>
#include <limits>

namespace idlkit {

namespace {

template <typename T>
T parse_number(const std::string& s, const char* type_name) {
   T value{};
   const char* first = s.data();
   const char* last  = s.data() + s.size();
   if (first != last && *first == '+')
      ++first;
   auto [ptr, ec] = std::from_chars(first, last, value);
   IDLKIT_ASSERT(ec == std::errc() && ptr == last && first != last, bad_cast_exception,
                 "Unable to convert string '{}' to {}", s, type_name);
   return value;
}

} // namespace

variant::variant() = default;

variant::variant(std::nullptr_t) {}

variant::variant(bool v)
   : _data(v) {}

variant::variant(float v)
   : _data(static_cast<double>(v)) {}

variant::variant(double v)
   : _data(v) {}

variant::variant(const char* v)
   : _data(std::string(v)) {}

variant::variant(std::string v)
   : _data(std::move(v)) {}

variant::variant(std::string_view v)
   : _data(std::string(v)) {}

variant::variant(variants v)
   : _data(std::make_unique<variants>(std::move(v))) {}

variant::variant(variant_object v)
   : _data(std::make_unique<variant_object>(std::move(v))) {}

variant::variant(const mutable_variant_object& v)
   : _data(std::make_unique<variant_object>(static_cast<const variant_object&>(v))) {}

variant::variant(int64_t v, std::true_type)
   : _data(v) {}

variant::variant(uint64_t v, std::false_type)
   : _data(v) {}

variant::variant(const variant& v) {
   *this = v;
}

variant::variant(variant&& v) noexcept
   : _data(std::move(v._data)) {
   v._data = std::monostate{};
}

variant::~variant() = default;

variant& variant::operator=(const variant& v) {
   if (this == &v)
      return *this;
   switch (v.get_type()) {
      case array_type:
         _data = std::make_unique<variants>(*std::get<std::unique_ptr<variants>>(v._data));
         break;
      case object_type:
         _data = std::make_unique<variant_object>(*std::get<std::unique_ptr<variant_object>>(v._data));
         break;
      case null_type:   _data = std::monostate{}; break;
      case int64_type:  _data = std::get<int64_t>(v._data); break;
      case uint64_type: _data = std::get<uint64_t>(v._data); break;
      case double_type: _data = std::get<double>(v._data); break;
      case bool_type:   _data = std::get<bool>(v._data); break;
      case string_type: _data = std::get<std::string>(v._data); break;
   }
   return *this;
}

variant& variant::operator=(variant&& v) noexcept {
   if (this != &v) {
      _data   = std::move(v._data);
      v._data = std::monostate{};
   }
   return *this;
}

variant::type_id variant::get_type() const {
   return static_cast<type_id>(_data.index());
}

const char* variant::get_type_name() const {
   switch (get_type()) {
      case null_type:   return "null";
      case int64_type:  return "int64";
      case uint64_type: return "uint64";
      case double_type: return "double";
      case bool_type:   return "bool";
      case string_type: return "string";
      case array_type:  return "array";
      case object_type: return "object";
   }
   return "unknown";
}

int64_t variant::as_int64() const {
   switch (get_type()) {
      case int64_type:
         return std::get<int64_t>(_data);
      case uint64_type: {
         auto v = std::get<uint64_t>(_data);
         IDLKIT_ASSERT(v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()), bad_cast_exception,
                       "Value {} does not fit in int64", v);
         return static_cast<int64_t>(v);
      }
      case double_type: {
         auto d = std::get<double>(_data);
         IDLKIT_ASSERT(std::isfinite(d) && std::trunc(d) == d && d >= -9223372036854775808.0 &&
                          d < 9223372036854775808.0,
                       bad_cast_exception, "Value {} is not an int64", d);
         return static_cast<int64_t>(d);
      }
      case bool_type:
         return std::get<bool>(_data) ? 1 : 0;
      case string_type:
         return parse_number<int64_t>(std::get<std::string>(_data), "int64");
      default:
         IDLKIT_THROW_EXCEPTION(bad_cast_exception, "Invalid cast from {} to int64", get_type_name());
   }
}

uint64_t variant::as_uint64() const {
   switch (get_type()) {
      case uint64_type:
         return std::get<uint64_t>(_data);
      case int64_type: {
         auto v = std::get<int64_t>(_data);
         IDLKIT_ASSERT(v >= 0, bad_cast_exception, "Value {} does not fit in uint64", v);
         return static_cast<uint64_t>(v);
      }
      case double_type: {
         auto d = std::get<double>(_data);
         IDLKIT_ASSERT(std::isfinite(d) && std::trunc(d) == d && d >= 0 && d < 18446744073709551616.0,
                       bad_cast_exception, "Value {} is not a uint64", d);
         return static_cast<uint64_t>(d);
      }
      case bool_type:
         return std::get<bool>(_data) ? 1 : 0;
      case string_type:
         return parse_number<uint64_t>(std::get<std::string>(_data), "uint64");
      default:
         IDLKIT_THROW_EXCEPTION(bad_cast_exception, "Invalid cast from {} to uint64", get_type_name());
   }
}

double variant::as_double() const {
   switch (get_type()) {
      case double_type: return std::get<double>(_data);
      case int64_type:  return static_cast<double>(std::get<int64_t>(_data));
      case uint64_type: return static_cast<double>(std::get<uint64_t>(_data));
      case bool_type:   return std::get<bool>(_data) ? 1.0 : 0.0;
      case string_type: return parse_number<double>(std::get<std::string>(_data), "double");
      default:
         IDLKIT_THROW_EXCEPTION(bad_cast_exception, "Invalid cast from {} to double", get_type_name());
   }
}

bool variant::as_bool() const {
   switch (get_type()) {
      case bool_type:   return std::get<bool>(_data);
      case int64_type:  return std::get<int64_t>(_data) != 0;
      case uint64_type: return std::get<uint64_t>(_data) != 0;
      case double_type: return std::get<double>(_data) != 0.0;
      case string_type: {
         const auto& s = std::get<std::string>(_data);
         if (s == "true")
            return true;
         if (s == "false")
            return false;
         IDLKIT_THROW_EXCEPTION(bad_cast_exception, "Cannot convert string '{}' to bool", s);
      }
      default:
         IDLKIT_THROW_EXCEPTION(bad_cast_exception, "Invalid cast from {} to bool", get_type_name());
   }
}

std::string variant::as_string() const {
   switch (get_type()) {
      case null_type:   return {};
      case string_type: return std::get<std::string>(_data);
      case int64_type:  return std::to_string(std::get<int64_t>(_data));
      case uint64_type: return std::to_string(std::get<uint64_t>(_data));
      case double_type: return fmt::format("{}", std::get<double>(_data));
      case bool_type:   return std::get<bool>(_data) ? "true" : "false";
      default:
         IDLKIT_THROW_EXCEPTION(bad_cast_exception, "Invalid cast from {} to string", get_type_name());
   }
}

const std::string& variant::get_string() const {
   IDLKIT_ASSERT(is_string(), bad_cast_exception, "Invalid cast from {} to string", get_type_name());
   return std::get<std::string>(_data);
}

const variants& variant::get_array() const {
   IDLKIT_ASSERT(is_array(), bad_cast_exception, "Invalid cast from {} to array", get_type_name());
   return *std::get<std::unique_ptr<variants>>(_data);
}

variants& variant::get_array() {
   IDLKIT_ASSERT(is_array(), bad_cast_exception, "Invalid cast from {} to array", get_type_name());
   return *std::get<std::unique_ptr<variants>>(_data);
}

const variant_object& variant::get_object() const {
   IDLKIT_ASSERT(is_object(), bad_cast_exception, "Invalid cast from {} to object", get_type_name());
   return *std::get<std::unique_ptr<variant_object>>(_data);
}

variant_object& variant::get_object() {
   IDLKIT_ASSERT(is_object(), bad_cast_exception, "Invalid cast from {} to object", get_type_name());
   return *std::get<std::unique_ptr<variant_object>>(_data);
}

const variant& variant::operator[](std::string_view key) const {
   return get_object()[key];
}

size_t variant::size() const {
   if (is_array())
      return get_array().size();
   if (is_object())
      return get_object().size();
   return 0;
}

bool operator==(const variant& a, const variant& b) {
   if (a.get_type() != b.get_type()) {
      if (a.is_numeric() && b.is_numeric() && !a.is_double() && !b.is_double() && !a.is_bool() && !b.is_bool()) {
         // int64 and uint64 holding the same non-negative value
         if (a.is_int64())
            return a.as_int64() >= 0 && static_cast<uint64_t>(a.as_int64()) == b.as_uint64();
         return b.as_int64() >= 0 && static_cast<uint64_t>(b.as_int64()) == a.as_uint64();
      }
      return false;
   }
   switch (a.get_type()) {
      case variant::null_type:   return true;
      case variant::int64_type:  return std::get<int64_t>(a._data) == std::get<int64_t>(b._data);
      case variant::uint64_type: return std::get<uint64_t>(a._data) == std::get<uint64_t>(b._data);
      case variant::double_type: return std::get<double>(a._data) == std::get<double>(b._data);
      case variant::bool_type:   return std::get<bool>(a._data) == std::get<bool>(b._data);
      case variant::string_type: return std::get<std::string>(a._data) == std::get<std::string>(b._data);
      case variant::array_type:  return a.get_array() == b.get_array();
      case variant::object_type: return a.get_object() == b.get_object();
   }
   return false;
}

void from_variant(const variant& v, std::string& s) { s = v.as_string(); }
void from_variant(const variant& v, bool& b) { b = v.as_bool(); }
void from_variant(const variant& v, int64_t& i) { i = v.as_int64(); }
void from_variant(const variant& v, uint64_t& i) { i = v.as_uint64(); }
void from_variant(const variant& v, double& d) { d = v.as_double(); }
void from_variant(const variant& v, variant& out) { out = v; }

void from_variant(const variant& v, uint32_t& i) {
   auto u = v.as_uint64();
   IDLKIT_ASSERT(u <= std::numeric_limits<uint32_t>::max(), bad_cast_exception, "Value {} does not fit in uint32", u);
   i = static_cast<uint32_t>(u);
}

void from_variant(const variant& v, int32_t& i) {
   auto s = v.as_int64();
   IDLKIT_ASSERT(s >= std::numeric_limits<int32_t>::min() && s <= std::numeric_limits<int32_t>::max(),
                 bad_cast_exception, "Value {} does not fit in int32", s);
   i = static_cast<int32_t>(s);
}

void from_variant(const variant& v, uint8_t& i) {
   auto u = v.as_uint64();
   IDLKIT_ASSERT(u <= std::numeric_limits<uint8_t>::max(), bad_cast_exception, "Value {} does not fit in uint8", u);
   i = static_cast<uint8_t>(u);
}

//=============================================================================
// variant_object
//=============================================================================

variant_object::iterator variant_object::find(std::string_view key) const {
   for (auto itr = _entries.begin(); itr != _entries.end(); ++itr) {
      if (itr->key() == key)
         return itr;
   }
   return _entries.end();
}

const variant& variant_object::operator[](std::string_view key) const {
   auto itr = find(key);
   if (itr == end())
      IDLKIT_THROW_EXCEPTION(key_not_found_exception, "Key not found: {}", key);
   return itr->value();
}

mutable_variant_object& mutable_variant_object::set(std::string key, variant value) {
   for (auto& e : _entries) {
      if (e.key() == key) {
         e.value() = std::move(value);
         return *this;
      }
   }
   _entries.emplace_back(std::move(key), std::move(value));
   return *this;
}

variant& mutable_variant_object::operator[](std::string_view key) {
   for (auto& e : _entries) {
      if (e.key() == key)
         return e.value();
   }
   _entries.emplace_back(std::string(key), variant());
   return _entries.back().value();
}

} // namespace idlkit
