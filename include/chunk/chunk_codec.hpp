#ifndef CHUNKSTORE_CHUNK_CODEC_HPP
#define CHUNKSTORE_CHUNK_CODEC_HPP

#include <cstdint>
#include <cstddef>
#include <vector>
#include "chunk/chunk_error.hpp"

namespace chunkstore {
namespace chunk {

// One slice of an object's bytes, tagged with its zero-based position
struct Chunk {
  std::uint64_t index{0};
  std::vector<uint8_t> data;
};

class ChunkCodec {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChunkCodec(std::size_t chunk_size);


  // ---- PARTITION AND REASSEMBLY ----
  // Splits a buffer into ordered chunks of chunk_size bytes, the last one truncated
  std::vector<Chunk> split(const std::vector<uint8_t>& buffer) const;
  std::vector<Chunk> split(const uint8_t* data, std::size_t size) const;
  // Rebuilds a buffer of total_length bytes from a complete set of chunks in any order
  std::vector<uint8_t> reassemble(std::uint64_t total_length, const std::vector<Chunk>& chunks) const;
  // Copies one chunk into its region of a destination buffer of total_length bytes.
  // Regions of distinct indices never overlap, so concurrent callers need no lock.
  void write_chunk(uint8_t* destination, std::uint64_t total_length,
                   std::uint64_t index, const uint8_t* data, std::size_t size) const;


  // ---- OFFSET ARITHMETIC ----
  std::uint64_t chunk_count(std::uint64_t total_length) const;
  std::uint64_t chunk_offset(std::uint64_t index) const;
  // Length chunk `index` must have for an object of total_length bytes
  std::size_t expected_length(std::uint64_t total_length, std::uint64_t index) const;


  // ---- GETTERS ----
  std::size_t chunk_size() const { return chunk_size_; }

private:
  // ---- PARAMETERS ----
  std::size_t chunk_size_;
};

} // namespace chunk
} // namespace chunkstore

#endif // CHUNKSTORE_CHUNK_CODEC_HPP
