#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <limits>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace chunkstore::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace


//==============================================
// DIGEST OPERATIONS
//==============================================

std::string md5_hex(const uint8_t* data, std::size_t size) {
  BOOST_LOG_TRIVIAL(debug) << "Digest: Computing MD5 over " << size << " bytes";

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to initialize MD5 context";
    throw DigestError("Failed to initialize MD5 context");
  }

  // An empty buffer still yields the MD5 of zero bytes
  if (size > 0 && !EVP_DigestUpdate(context.get(), data, size)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to update MD5 context";
    throw DigestError("Failed to update MD5 context");
  }

  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to finalize MD5";
    throw DigestError("Failed to finalize MD5");
  }

  return to_hex(hash, hash_len);
}

std::string md5_hex(const std::vector<uint8_t>& data) {
  return md5_hex(data.data(), data.size());
}

std::vector<uint8_t> random_bytes(std::size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count == 0) {
    return bytes;
  }
  if (count > static_cast<std::size_t>(std::numeric_limits<int>::max()) ||
      RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    BOOST_LOG_TRIVIAL(error) << "Digest: RAND_bytes failed for " << count << " bytes";
    throw RandomError("Failed to generate random bytes");
  }
  return bytes;
}

std::string to_hex(const uint8_t* data, std::size_t size) {
  std::stringstream ss;
  for (std::size_t i = 0; i < size; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace chunkstore::crypto
