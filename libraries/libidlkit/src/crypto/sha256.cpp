// SPDX-License-Identifier: MIT
#include <idlkit/crypto/sha256.hpp>
#include <idlkit/crypto/hex.hpp>
#include <idlkit/exception/exception.hpp>

#include <openssl/evp.h>

namespace idlkit {

std::string sha256::str()const {
   return to_hex(_hash);
}

sha256 sha256::hash( const char* d, size_t dlen ) {
   sha256 h;
   unsigned int out_len = 0;
   int ok = EVP_Digest( d, dlen, h._hash.data(), &out_len, EVP_sha256(), nullptr );
   IDLKIT_ASSERT( ok == 1 && out_len == size, assert_exception, "EVP_Digest(sha256) failed" );
   return h;
}

sha256 sha256::hash( std::string_view s ) {
   return hash( s.data(), s.size() );
}

} // idlkit
