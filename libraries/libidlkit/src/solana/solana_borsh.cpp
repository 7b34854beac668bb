// SPDX-License-Identifier: MIT
#include <idlkit/solana/solana_borsh.hpp>

#include <cstring>
#include <limits>

#include <idlkit/crypto/sha256.hpp>
#include <idlkit/utf8.hpp>

namespace idlkit::solana::borsh {

namespace {

constexpr uint64_t mask64 = std::numeric_limits<uint64_t>::max();

}  // namespace

//=============================================================================
// Encoder implementation
//=============================================================================

void encoder::write_u8(uint8_t v) { _buffer.push_back(v); }

void encoder::write_u16(uint16_t v) { write_primitive(v); }

void encoder::write_u32(uint32_t v) { write_primitive(v); }

void encoder::write_u64(uint64_t v) { write_primitive(v); }

void encoder::write_u128(const idlkit::uint128& v) {
   // Write as little-endian: low 64 bits first, then high 64 bits
   write_u64(static_cast<uint64_t>(v & idlkit::uint128(mask64)));
   write_u64(static_cast<uint64_t>(v >> 64));
}

void encoder::write_u256(const idlkit::uint256& v) {
   // Write as little-endian: 4 x 64-bit chunks, lowest first
   idlkit::uint256 m = mask64;
   write_u64(static_cast<uint64_t>(v & m));
   write_u64(static_cast<uint64_t>((v >> 64) & m));
   write_u64(static_cast<uint64_t>((v >> 128) & m));
   write_u64(static_cast<uint64_t>((v >> 192) & m));
}

void encoder::write_i8(int8_t v) { _buffer.push_back(static_cast<uint8_t>(v)); }

void encoder::write_i16(int16_t v) { write_primitive(v); }

void encoder::write_i32(int32_t v) { write_primitive(v); }

void encoder::write_i64(int64_t v) { write_primitive(v); }

void encoder::write_i128(const idlkit::int128& v) {
   // boost integers are sign-magnitude, build the two's complement bit pattern explicitly
   idlkit::uint128 bits = v >= 0 ? idlkit::uint128(v) : idlkit::uint128(~idlkit::uint128(-v) + 1);
   write_u128(bits);
}

void encoder::write_i256(const idlkit::int256& v) {
   idlkit::uint256 bits = v >= 0 ? idlkit::uint256(v) : idlkit::uint256(~idlkit::uint256(-v) + 1);
   write_u256(bits);
}

void encoder::write_f32(float v) { write_primitive(v); }

void encoder::write_f64(double v) { write_primitive(v); }

void encoder::write_bool(bool v) { _buffer.push_back(v ? 1 : 0); }

void encoder::write_string(std::string_view v) {
   write_u32(static_cast<uint32_t>(v.size()));
   _buffer.insert(_buffer.end(), v.begin(), v.end());
}

void encoder::write_bytes(const std::vector<uint8_t>& v) {
   write_u32(static_cast<uint32_t>(v.size()));
   _buffer.insert(_buffer.end(), v.begin(), v.end());
}

void encoder::write_fixed_bytes(const uint8_t* data, size_t len) {
   _buffer.insert(_buffer.end(), data, data + len);
}

void encoder::write_pubkey(const pubkey& pk) {
   _buffer.insert(_buffer.end(), pk.data.begin(), pk.data.end());
}

//=============================================================================
// Decoder implementation
//=============================================================================

decoder::decoder(const uint8_t* data, size_t len, size_t start)
   : _data(data)
   , _size(len)
   , _pos(start) {
   IDLKIT_ASSERT(start <= len, out_of_range_exception, "Borsh decoder: start offset {} is past the end of a {} byte buffer",
                 start, len);
}

uint8_t decoder::read_u8() {
   ensure_remaining(1);
   return _data[_pos++];
}

uint16_t decoder::read_u16() { return read_primitive<uint16_t>(); }

uint32_t decoder::read_u32() { return read_primitive<uint32_t>(); }

uint64_t decoder::read_u64() { return read_primitive<uint64_t>(); }

idlkit::uint128 decoder::read_u128() {
   ensure_remaining(16);
   uint64_t low  = read_u64();
   uint64_t high = read_u64();
   return (idlkit::uint128(high) << 64) | idlkit::uint128(low);
}

idlkit::uint256 decoder::read_u256() {
   // Read 4 x 64-bit chunks in little-endian order
   ensure_remaining(32);
   uint64_t chunk0 = read_u64();
   uint64_t chunk1 = read_u64();
   uint64_t chunk2 = read_u64();
   uint64_t chunk3 = read_u64();
   idlkit::uint256 result = idlkit::uint256(chunk3);
   result = (result << 64) | idlkit::uint256(chunk2);
   result = (result << 64) | idlkit::uint256(chunk1);
   result = (result << 64) | idlkit::uint256(chunk0);
   return result;
}

int8_t decoder::read_i8() {
   ensure_remaining(1);
   return static_cast<int8_t>(_data[_pos++]);
}

int16_t decoder::read_i16() { return read_primitive<int16_t>(); }

int32_t decoder::read_i32() { return read_primitive<int32_t>(); }

int64_t decoder::read_i64() { return read_primitive<int64_t>(); }

idlkit::int128 decoder::read_i128() {
   idlkit::uint128 bits = read_u128();
   if (!boost::multiprecision::bit_test(bits, 127))
      return idlkit::int128(bits);
   // two's complement: magnitude is the complement plus one
   idlkit::uint128 magnitude = ~bits + 1;
   return -idlkit::int128(magnitude);
}

idlkit::int256 decoder::read_i256() {
   idlkit::uint256 bits = read_u256();
   if (!boost::multiprecision::bit_test(bits, 255))
      return idlkit::int256(bits);
   idlkit::uint256 magnitude = ~bits + 1;
   return -idlkit::int256(magnitude);
}

float decoder::read_f32() { return read_primitive<float>(); }

double decoder::read_f64() { return read_primitive<double>(); }

bool decoder::read_bool() {
   size_t  offset = _pos;
   uint8_t v      = read_u8();
   if (v > 1)
      throw idl::invalid_bool_exception(offset, v);
   return v != 0;
}

std::string decoder::read_string() {
   uint32_t len = read_u32();
   ensure_remaining(len);
   std::string result(reinterpret_cast<const char*>(_data + _pos), len);
   if (auto bad = find_invalid_utf8(result))
      throw idl::invalid_utf8_exception(_pos + *bad);
   _pos += len;
   return result;
}

std::vector<uint8_t> decoder::read_bytes() {
   uint32_t len = read_u32();
   ensure_remaining(len);
   std::vector<uint8_t> result(_data + _pos, _data + _pos + len);
   _pos += len;
   return result;
}

void decoder::read_fixed_bytes(uint8_t* out, size_t len) {
   ensure_remaining(len);
   std::memcpy(out, _data + _pos, len);
   _pos += len;
}

std::vector<uint8_t> decoder::read_fixed_bytes(size_t len) {
   ensure_remaining(len);
   std::vector<uint8_t> result(_data + _pos, _data + _pos + len);
   _pos += len;
   return result;
}

pubkey decoder::read_pubkey() {
   pubkey pk;
   read_fixed_bytes(pk.data.data(), pubkey::SIZE);
   return pk;
}

void decoder::skip(size_t n) {
   ensure_remaining(n);
   _pos += n;
}

//=============================================================================
// Helper functions
//=============================================================================

std::array<uint8_t, 8> compute_discriminator(std::string_view namespace_prefix, std::string_view name) {
   // Anchor discriminator is sha256(namespace:name)[0..8]
   std::string preimage = fmt::format("{}:{}", namespace_prefix, name);
   idlkit::sha256 hash = idlkit::sha256::hash(preimage);

   std::array<uint8_t, 8> discriminator;
   std::memcpy(discriminator.data(), hash.data(), 8);
   return discriminator;
}

}  // namespace idlkit::solana::borsh
