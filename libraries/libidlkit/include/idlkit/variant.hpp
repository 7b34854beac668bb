// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace idlkit {

class variant;
class variant_object;
class mutable_variant_object;

using variants = std::vector<variant>;

/**
 *  @brief A dynamically typed value: null, integer, double, bool, string, array or object.
 *
 *  variant is the JSON-compatible tree used for IDL documents, configuration and the rendered
 *  form of decoded values. Objects keep their keys in insertion order. Copies are deep.
 */
class variant {
public:
   enum type_id {
      null_type   = 0,
      int64_type  = 1,
      uint64_type = 2,
      double_type = 3,
      bool_type   = 4,
      string_type = 5,
      array_type  = 6,
      object_type = 7
   };

   variant();
   variant(std::nullptr_t);
   variant(bool v);
   variant(float v);
   variant(double v);
   variant(const char* v);
   variant(std::string v);
   variant(std::string_view v);
   variant(variants v);
   variant(variant_object v);
   variant(const mutable_variant_object& v);

   template <typename T>
      requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
   variant(T v)
      : variant(static_cast<std::conditional_t<std::is_signed_v<T>, int64_t, uint64_t>>(v),
                std::bool_constant<std::is_signed_v<T>>{}) {}

   variant(const variant& v);
   variant(variant&& v) noexcept;
   ~variant();

   variant& operator=(const variant& v);
   variant& operator=(variant&& v) noexcept;

   type_id     get_type() const;
   const char* get_type_name() const;

   bool is_null() const { return get_type() == null_type; }
   bool is_bool() const { return get_type() == bool_type; }
   bool is_int64() const { return get_type() == int64_type; }
   bool is_uint64() const { return get_type() == uint64_type; }
   bool is_double() const { return get_type() == double_type; }
   bool is_string() const { return get_type() == string_type; }
   bool is_array() const { return get_type() == array_type; }
   bool is_object() const { return get_type() == object_type; }
   bool is_integer() const { return is_int64() || is_uint64() || is_bool(); }
   bool is_numeric() const { return is_integer() || is_double(); }

   /**
    *  Numeric conversions accept any numeric type and numeric strings; out of range values and
    *  non-numeric types throw bad_cast_exception.
    */
   int64_t  as_int64() const;
   uint64_t as_uint64() const;
   double   as_double() const;
   bool     as_bool() const;

   /** Any scalar as text: numbers in decimal, bool as true/false, null as empty. */
   std::string as_string() const;

   /** @throws bad_cast_exception unless this holds the requested type */
   const std::string&    get_string() const;
   const variants&       get_array() const;
   variants&             get_array();
   const variant_object& get_object() const;
   variant_object&       get_object();

   /** Object member access; throws key_not_found_exception. */
   const variant& operator[](std::string_view key) const;
   const variant& operator[](const char* key) const { return (*this)[std::string_view(key)]; }

   /** Elements of an array, members of an object, 0 otherwise. */
   size_t size() const;

   template <typename T>
   T as() const {
      T result;
      from_variant(*this, result);
      return result;
   }

   friend bool operator==(const variant& a, const variant& b);
   friend bool operator!=(const variant& a, const variant& b) { return !(a == b); }

private:
   variant(int64_t v, std::true_type);
   variant(uint64_t v, std::false_type);

   using storage = std::variant<std::monostate, int64_t, uint64_t, double, bool, std::string,
                                std::unique_ptr<variants>, std::unique_ptr<variant_object>>;
   storage _data;
};

void from_variant(const variant& v, std::string& s);
void from_variant(const variant& v, bool& b);
void from_variant(const variant& v, int64_t& i);
void from_variant(const variant& v, uint64_t& i);
void from_variant(const variant& v, uint32_t& i);
void from_variant(const variant& v, int32_t& i);
void from_variant(const variant& v, uint8_t& i);
void from_variant(const variant& v, double& d);
void from_variant(const variant& v, variant& out);

template <typename T>
void from_variant(const variant& v, std::optional<T>& o) {
   if (v.is_null()) {
      o.reset();
   } else {
      T value;
      from_variant(v, value);
      o = std::move(value);
   }
}

template <typename T>
void from_variant(const variant& v, std::vector<T>& vec) {
   const auto& arr = v.get_array();
   vec.clear();
   vec.reserve(arr.size());
   for (const auto& item : arr) {
      T value;
      from_variant(item, value);
      vec.push_back(std::move(value));
   }
}

} // namespace idlkit
