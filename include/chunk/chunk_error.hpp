#ifndef CHUNKSTORE_CHUNK_ERROR_HPP
#define CHUNKSTORE_CHUNK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkstore {
namespace chunk {

class ChunkCodecError : public std::runtime_error {
public:
  explicit ChunkCodecError(const std::string& message)
    : std::runtime_error("Chunk codec error: " + message) {}
};

} // namespace chunk
} // namespace chunkstore

#endif // CHUNKSTORE_CHUNK_ERROR_HPP
