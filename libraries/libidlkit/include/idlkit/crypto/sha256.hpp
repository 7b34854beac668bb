// SPDX-License-Identifier: MIT
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace idlkit
{

class sha256
{
  public:
    static constexpr size_t size = 32;

    sha256() = default;
    explicit sha256( const std::array<uint8_t, size>& h ) : _hash(h) {}

    std::string str()const;

    const uint8_t* data()const { return _hash.data(); }
    const std::array<uint8_t, size>& bytes()const { return _hash; }

    static sha256 hash( const char* d, size_t dlen );
    static sha256 hash( std::string_view s );

    friend bool operator==( const sha256& h1, const sha256& h2 ) { return h1._hash == h2._hash; }
    friend bool operator!=( const sha256& h1, const sha256& h2 ) { return !(h1 == h2); }

  private:
    std::array<uint8_t, size> _hash{};
};

} // idlkit
