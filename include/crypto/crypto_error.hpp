#ifndef CHUNKSTORE_CRYPTO_ERROR_HPP
#define CHUNKSTORE_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkstore::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message) 
        : CryptoError("Digest error: " + message) {}
};

class RandomError : public CryptoError {
public:
    explicit RandomError(const std::string& message) 
        : CryptoError("Random error: " + message) {}
};

} // namespace chunkstore::crypto

#endif // CHUNKSTORE_CRYPTO_ERROR_HPP
