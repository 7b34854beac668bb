// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/variant.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace idlkit {

/**
 *  @brief An ordered map from string keys to variants.
 *
 *  Keys keep insertion order, which is the order they render in JSON. Lookups are linear; the
 *  objects handled here (IDL declarations, decoded structs) are small.
 */
class variant_object {
public:
   class entry {
   public:
      entry() = default;
      entry(std::string k, variant v)
         : _key(std::move(k))
         , _value(std::move(v)) {}

      const std::string& key() const { return _key; }
      const variant&     value() const { return _value; }
      variant&           value() { return _value; }

      friend bool operator==(const entry& a, const entry& b) { return a._key == b._key && a._value == b._value; }

   private:
      std::string _key;
      variant     _value;
   };

   using iterator = std::vector<entry>::const_iterator;

   variant_object() = default;

   iterator begin() const { return _entries.begin(); }
   iterator end() const { return _entries.end(); }
   iterator find(std::string_view key) const;

   bool   contains(std::string_view key) const { return find(key) != end(); }
   size_t size() const { return _entries.size(); }
   bool   empty() const { return _entries.empty(); }

   /** @throws key_not_found_exception */
   const variant& operator[](std::string_view key) const;
   const variant& operator[](const char* key) const { return (*this)[std::string_view(key)]; }

   friend bool operator==(const variant_object& a, const variant_object& b) { return a._entries == b._entries; }

protected:
   std::vector<entry> _entries;
};

/**
 *  @brief A variant_object that is built up in place.
 *
 *  @code
 *  mutable_variant_object("name", "counter")("count", 42)
 *  @endcode
 */
class mutable_variant_object : public variant_object {
public:
   mutable_variant_object() = default;

   template <typename T>
   mutable_variant_object(std::string key, T&& value) {
      set(std::move(key), variant(std::forward<T>(value)));
   }

   explicit mutable_variant_object(variant_object obj)
      : variant_object(std::move(obj)) {}

   /** Replaces the value of an existing key, otherwise appends. */
   mutable_variant_object& set(std::string key, variant value);

   template <typename T>
   mutable_variant_object& operator()(std::string key, T&& value) {
      return set(std::move(key), variant(std::forward<T>(value)));
   }

   /** Inserts a null value when the key is absent. */
   variant& operator[](std::string_view key);
   variant& operator[](const char* key) { return (*this)[std::string_view(key)]; }
   using variant_object::operator[];

   void reserve(size_t n) { _entries.reserve(n); }
};

} // namespace idlkit
