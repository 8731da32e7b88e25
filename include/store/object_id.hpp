#ifndef CHUNKSTORE_STORE_OBJECT_ID_HPP
#define CHUNKSTORE_STORE_OBJECT_ID_HPP

#include <array>
#include <cstdint>
#include <string>
#include "store/store_error.hpp"

namespace chunkstore {
namespace store {

// 12-byte object identifier: 4-byte big-endian creation second,
// 5 bytes of per-process randomness and a 3-byte big-endian counter.
// Its external form is 24 lowercase hex characters.
class ObjectId {
public:
  static constexpr std::size_t SIZE = 12;
  static constexpr std::size_t HEX_SIZE = SIZE * 2;

  // ---- CONSTRUCTION ----
  ObjectId() = default;
  explicit ObjectId(const std::array<uint8_t, SIZE>& bytes) : bytes_(bytes) {}

  // Creates a new id unique within this process
  static ObjectId generate();
  // Parses 24 hex digits (either case); throws InvalidIdError otherwise
  static ObjectId from_hex(const std::string& hex);


  // ---- GETTERS ----
  std::string to_hex() const;
  // Creation time in seconds since the Unix epoch
  std::uint32_t timestamp() const;
  const std::array<uint8_t, SIZE>& bytes() const { return bytes_; }

  bool operator==(const ObjectId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const ObjectId& other) const { return bytes_ != other.bytes_; }
  bool operator<(const ObjectId& other) const { return bytes_ < other.bytes_; }

private:
  // ---- PARAMETERS ----
  std::array<uint8_t, SIZE> bytes_{};
};

} // namespace store
} // namespace chunkstore

#endif // CHUNKSTORE_STORE_OBJECT_ID_HPP
