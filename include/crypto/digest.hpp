#ifndef CHUNKSTORE_CRYPTO_DIGEST_HPP
#define CHUNKSTORE_CRYPTO_DIGEST_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace chunkstore::crypto {

// Lowercase hex MD5 of a byte range, computed with OpenSSL EVP
std::string md5_hex(const uint8_t* data, std::size_t size);
std::string md5_hex(const std::vector<uint8_t>& data);

// Cryptographically strong random bytes from OpenSSL RAND_bytes
std::vector<uint8_t> random_bytes(std::size_t count);

// Renders raw bytes as lowercase hex
std::string to_hex(const uint8_t* data, std::size_t size);
  
} // namespace chunkstore::crypto

#endif // CHUNKSTORE_CRYPTO_DIGEST_HPP
