// SPDX-License-Identifier: MIT
#pragma once

#include <idlkit/solana/solana_types.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <idlkit/int128.hpp>
#include <idlkit/solana/idl_exceptions.hpp>

namespace idlkit::solana::borsh {

/**
 * @brief Borsh binary serialization encoder
 *
 * Borsh (Binary Object Representation Serializer for Hashing) is a deterministic
 * serialization format used extensively in Solana programs, particularly with Anchor.
 * It uses little-endian byte order for all numeric types.
 */
class encoder {
public:
   encoder() = default;
   explicit encoder(size_t reserve_size) { _buffer.reserve(reserve_size); }

   // Unsigned integers (little-endian)
   void write_u8(uint8_t v);
   void write_u16(uint16_t v);
   void write_u32(uint32_t v);
   void write_u64(uint64_t v);
   void write_u128(const idlkit::uint128& v);
   void write_u256(const idlkit::uint256& v);

   // Signed integers (little-endian, two's complement)
   void write_i8(int8_t v);
   void write_i16(int16_t v);
   void write_i32(int32_t v);
   void write_i64(int64_t v);
   void write_i128(const idlkit::int128& v);
   void write_i256(const idlkit::int256& v);

   // Floating point (IEEE 754, little-endian)
   void write_f32(float v);
   void write_f64(double v);

   // Boolean (single byte: 0 for false, 1 for true)
   void write_bool(bool v);

   // String (u32 length prefix + UTF-8 bytes, no null terminator)
   void write_string(std::string_view v);

   // Dynamic bytes (u32 length prefix + bytes)
   void write_bytes(const std::vector<uint8_t>& v);

   // Fixed-size bytes (no length prefix)
   void write_fixed_bytes(const uint8_t* data, size_t len);
   void write_fixed_bytes(const std::vector<uint8_t>& v) { write_fixed_bytes(v.data(), v.size()); }

   // Solana pubkey (32 bytes, no length prefix)
   void write_pubkey(const pubkey& pk);

   /**
    * @brief Write any supported value: primitives, strings, pubkeys and the containers below
    */
   template <typename T>
   void write_value(const T& v);

   /**
    * @brief Write Option<T> - 0 byte for None, 1 byte + value for Some
    */
   template <typename T>
   void write_option(const std::optional<T>& v);

   /**
    * @brief Write Vec<T> - u32 length prefix + elements
    */
   template <typename T>
   void write_vec(const std::vector<T>& v);

   /**
    * @brief Get the serialized buffer
    */
   std::vector<uint8_t> finish() { return std::move(_buffer); }

   /**
    * @brief Get a reference to the current buffer
    */
   const std::vector<uint8_t>& data() const { return _buffer; }

   /**
    * @brief Get current buffer size
    */
   size_t size() const { return _buffer.size(); }

private:
   std::vector<uint8_t> _buffer;

   // Helper to write primitive type
   template <typename T>
   void write_primitive(T value);
};

/**
 * @brief Borsh binary deserialization decoder
 *
 * A forward-only cursor over a borrowed buffer. Every read is bounds checked and fails with
 * truncated_buffer_exception carrying the absolute offset of the failed read. Offsets are
 * absolute positions in the buffer, whatever the start offset.
 */
class decoder {
public:
   explicit decoder(const std::vector<uint8_t>& data, size_t start = 0)
      : decoder(data.data(), data.size(), start) {}
   explicit decoder(std::span<const uint8_t> data, size_t start = 0)
      : decoder(data.data(), data.size(), start) {}
   decoder(const uint8_t* data, size_t len, size_t start = 0);

   // Unsigned integers
   uint8_t         read_u8();
   uint16_t        read_u16();
   uint32_t        read_u32();
   uint64_t        read_u64();
   idlkit::uint128 read_u128();
   idlkit::uint256 read_u256();

   // Signed integers
   int8_t         read_i8();
   int16_t        read_i16();
   int32_t        read_i32();
   int64_t        read_i64();
   idlkit::int128 read_i128();
   idlkit::int256 read_i256();

   // Floating point
   float  read_f32();
   double read_f64();

   // Boolean, invalid_bool_exception for anything but 0 or 1
   bool read_bool();

   // String, invalid_utf8_exception when the payload is not UTF-8
   std::string read_string();

   // Dynamic bytes
   std::vector<uint8_t> read_bytes();

   // Fixed-size bytes
   void                 read_fixed_bytes(uint8_t* out, size_t len);
   std::vector<uint8_t> read_fixed_bytes(size_t len);

   // Solana pubkey
   pubkey read_pubkey();

   /**
    * @brief Read any value write_value accepts
    */
   template <typename T>
   T read_value();

   /**
    * @brief Read Option<T>
    */
   template <typename T>
   std::optional<T> read_option();

   /**
    * @brief Read Vec<T>
    */
   template <typename T>
   std::vector<T> read_vec();

   /**
    * @brief Get number of remaining bytes
    */
   size_t remaining() const { return _size - _pos; }

   /**
    * @brief Check if there are more bytes to read
    */
   bool has_remaining() const { return _pos < _size; }

   /**
    * @brief Get current position
    */
   size_t position() const { return _pos; }

   /**
    * @brief Skip bytes
    */
   void skip(size_t n);

   /**
    * @brief Throws truncated_buffer_exception unless n more bytes are available
    */
   void ensure_remaining(size_t n) const {
      if (n > remaining()) [[unlikely]]
         throw idl::truncated_buffer_exception(_pos, n, remaining());
   }

private:
   const uint8_t* _data;
   size_t         _size;
   size_t         _pos;

   // Helper to read primitive type
   template <typename T>
   T read_primitive();
};

namespace detail {
template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_vector : std::false_type {};
template <typename T>
struct is_vector<std::vector<T>> : std::true_type {};
}  // namespace detail

//=============================================================================
// Encoder template implementations
//=============================================================================

template <typename T>
void encoder::write_primitive(T value) {
   static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
   const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&value);
   _buffer.insert(_buffer.end(), bytes, bytes + sizeof(T));
}

template <typename T>
void encoder::write_value(const T& v) {
   if constexpr (std::is_same_v<T, bool>) {
      write_bool(v);
   } else if constexpr (std::is_same_v<T, uint8_t>) {
      write_u8(v);
   } else if constexpr (std::is_same_v<T, uint16_t>) {
      write_u16(v);
   } else if constexpr (std::is_same_v<T, uint32_t>) {
      write_u32(v);
   } else if constexpr (std::is_same_v<T, uint64_t>) {
      write_u64(v);
   } else if constexpr (std::is_same_v<T, idlkit::uint128>) {
      write_u128(v);
   } else if constexpr (std::is_same_v<T, idlkit::uint256>) {
      write_u256(v);
   } else if constexpr (std::is_same_v<T, int8_t>) {
      write_i8(v);
   } else if constexpr (std::is_same_v<T, int16_t>) {
      write_i16(v);
   } else if constexpr (std::is_same_v<T, int32_t>) {
      write_i32(v);
   } else if constexpr (std::is_same_v<T, int64_t>) {
      write_i64(v);
   } else if constexpr (std::is_same_v<T, idlkit::int128>) {
      write_i128(v);
   } else if constexpr (std::is_same_v<T, idlkit::int256>) {
      write_i256(v);
   } else if constexpr (std::is_same_v<T, float>) {
      write_f32(v);
   } else if constexpr (std::is_same_v<T, double>) {
      write_f64(v);
   } else if constexpr (std::is_same_v<T, std::string>) {
      write_string(v);
   } else if constexpr (std::is_same_v<T, pubkey>) {
      write_pubkey(v);
   } else if constexpr (detail::is_optional<T>::value) {
      write_option(v);
   } else if constexpr (detail::is_vector<T>::value) {
      write_vec(v);
   } else {
      static_assert(sizeof(T) == 0, "Unsupported type for write_value");
   }
}

template <typename T>
void encoder::write_option(const std::optional<T>& v) {
   if (!v.has_value()) {
      write_u8(0);
   } else {
      write_u8(1);
      write_value(*v);
   }
}

template <typename T>
void encoder::write_vec(const std::vector<T>& v) {
   write_u32(static_cast<uint32_t>(v.size()));
   for (const auto& elem : v)
      write_value(elem);
}

//=============================================================================
// Decoder template implementations
//=============================================================================

template <typename T>
T decoder::read_primitive() {
   static_assert(std::is_trivially_copyable_v<T>, "Type must be trivially copyable");
   ensure_remaining(sizeof(T));
   T value;
   std::memcpy(&value, _data + _pos, sizeof(T));
   _pos += sizeof(T);
   return value;
}

template <typename T>
T decoder::read_value() {
   if constexpr (std::is_same_v<T, bool>) {
      return read_bool();
   } else if constexpr (std::is_same_v<T, uint8_t>) {
      return read_u8();
   } else if constexpr (std::is_same_v<T, uint16_t>) {
      return read_u16();
   } else if constexpr (std::is_same_v<T, uint32_t>) {
      return read_u32();
   } else if constexpr (std::is_same_v<T, uint64_t>) {
      return read_u64();
   } else if constexpr (std::is_same_v<T, idlkit::uint128>) {
      return read_u128();
   } else if constexpr (std::is_same_v<T, idlkit::uint256>) {
      return read_u256();
   } else if constexpr (std::is_same_v<T, int8_t>) {
      return read_i8();
   } else if constexpr (std::is_same_v<T, int16_t>) {
      return read_i16();
   } else if constexpr (std::is_same_v<T, int32_t>) {
      return read_i32();
   } else if constexpr (std::is_same_v<T, int64_t>) {
      return read_i64();
   } else if constexpr (std::is_same_v<T, idlkit::int128>) {
      return read_i128();
   } else if constexpr (std::is_same_v<T, idlkit::int256>) {
      return read_i256();
   } else if constexpr (std::is_same_v<T, float>) {
      return read_f32();
   } else if constexpr (std::is_same_v<T, double>) {
      return read_f64();
   } else if constexpr (std::is_same_v<T, std::string>) {
      return read_string();
   } else if constexpr (std::is_same_v<T, pubkey>) {
      return read_pubkey();
   } else if constexpr (detail::is_optional<T>::value) {
      return read_option<typename T::value_type>();
   } else if constexpr (detail::is_vector<T>::value) {
      return read_vec<typename T::value_type>();
   } else {
      static_assert(sizeof(T) == 0, "Unsupported type for read_value");
   }
}

template <typename T>
std::optional<T> decoder::read_option() {
   size_t  tag_offset = _pos;
   uint8_t has_value  = read_u8();
   if (has_value == 0) {
      return std::nullopt;
   }
   if (has_value != 1)
      throw idl::invalid_option_tag_exception(tag_offset, has_value);
   return read_value<T>();
}

template <typename T>
std::vector<T> decoder::read_vec() {
   uint32_t len = read_u32();
   std::vector<T> result;
   // every element costs at least one byte
   result.reserve(std::min<size_t>(len, remaining()));

   for (uint32_t i = 0; i < len; ++i)
      result.push_back(read_value<T>());

   return result;
}

//=============================================================================
// Helper functions for instruction data encoding/decoding
//=============================================================================

/**
 * @brief Compute Anchor discriminator
 *
 * The discriminator is the first 8 bytes of sha256("<namespace_prefix>:<name>"):
 * "global" for instructions, "account" for accounts.
 */
std::array<uint8_t, 8> compute_discriminator(std::string_view namespace_prefix, std::string_view name);

}  // namespace idlkit::solana::borsh
