#include "store/object_id.hpp"
#include "crypto/digest.hpp"
#include <atomic>
#include <chrono>
#include <cstring>
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace store {

namespace {

// Random bytes and counter seed chosen once per process
struct ProcessSeed {
  std::array<uint8_t, 5> random{};
  std::atomic<std::uint32_t> counter{0};

  ProcessSeed() {
    auto bytes = crypto::random_bytes(random.size() + 3);
    std::memcpy(random.data(), bytes.data(), random.size());
    counter = (static_cast<std::uint32_t>(bytes[5]) << 16) |
              (static_cast<std::uint32_t>(bytes[6]) << 8) |
              static_cast<std::uint32_t>(bytes[7]);
  }
};

ProcessSeed& process_seed() {
  static ProcessSeed seed;
  return seed;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace


//==============================================
// CONSTRUCTION
//==============================================

ObjectId ObjectId::generate() {
  auto& seed = process_seed();
  std::array<uint8_t, SIZE> bytes{};

  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  const std::uint32_t network_seconds = boost::endian::native_to_big(static_cast<std::uint32_t>(seconds));
  std::memcpy(bytes.data(), &network_seconds, sizeof(network_seconds));

  std::memcpy(bytes.data() + 4, seed.random.data(), seed.random.size());

  // Only the low 24 bits of the counter are used, wrapping is fine
  const std::uint32_t count = seed.counter.fetch_add(1) & 0xFFFFFF;
  bytes[9] = static_cast<uint8_t>(count >> 16);
  bytes[10] = static_cast<uint8_t>(count >> 8);
  bytes[11] = static_cast<uint8_t>(count);

  return ObjectId(bytes);
}

ObjectId ObjectId::from_hex(const std::string& hex) {
  if (hex.size() != HEX_SIZE) {
    BOOST_LOG_TRIVIAL(debug) << "Object id: Rejected id of length " << hex.size();
    throw InvalidIdError("'" + hex + "' is not a " + std::to_string(HEX_SIZE) + "-digit hex id");
  }

  std::array<uint8_t, SIZE> bytes{};
  for (std::size_t i = 0; i < SIZE; ++i) {
    const int high = hex_value(hex[2 * i]);
    const int low = hex_value(hex[2 * i + 1]);
    if (high < 0 || low < 0) {
      BOOST_LOG_TRIVIAL(debug) << "Object id: Rejected non-hex id: " << hex;
      throw InvalidIdError("'" + hex + "' contains non-hex characters");
    }
    bytes[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return ObjectId(bytes);
}


//==============================================
// GETTERS
//==============================================

std::string ObjectId::to_hex() const {
  return crypto::to_hex(bytes_.data(), bytes_.size());
}

std::uint32_t ObjectId::timestamp() const {
  std::uint32_t network_seconds = 0;
  std::memcpy(&network_seconds, bytes_.data(), sizeof(network_seconds));
  return boost::endian::big_to_native(network_seconds);
}

} // namespace store
} // namespace chunkstore
