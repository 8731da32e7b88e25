#include "chunk/chunk_codec.hpp"
#include <algorithm>
#include <cstring>
#include <string>
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace chunk {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ChunkCodec::ChunkCodec(std::size_t chunk_size) : chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunk codec: Rejected chunk size of 0";
    throw ChunkCodecError("chunk size must be positive");
  }
}


//==============================================
// PARTITION AND REASSEMBLY
//==============================================

std::vector<Chunk> ChunkCodec::split(const std::vector<uint8_t>& buffer) const {
  return split(buffer.data(), buffer.size());
}

std::vector<Chunk> ChunkCodec::split(const uint8_t* data, std::size_t size) const {
  std::vector<Chunk> chunks;
  if (size == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Chunk codec: Empty buffer, no chunks produced";
    return chunks;
  }

  chunks.reserve(static_cast<std::size_t>(chunk_count(size)));

  // Walk the buffer in non-overlapping windows, truncating the last one
  std::uint64_t index = 0;
  for (std::size_t start = 0; start < size; start += chunk_size_) {
    const std::size_t length = std::min(chunk_size_, size - start);
    Chunk chunk;
    chunk.index = index++;
    chunk.data.assign(data + start, data + start + length);
    chunks.push_back(std::move(chunk));
  }

  BOOST_LOG_TRIVIAL(debug) << "Chunk codec: Split " << size << " bytes into "
                           << chunks.size() << " chunks of " << chunk_size_ << " bytes";
  return chunks;
}

std::vector<uint8_t> ChunkCodec::reassemble(std::uint64_t total_length,
                                            const std::vector<Chunk>& chunks) const {
  const std::uint64_t expected = chunk_count(total_length);
  if (chunks.size() != expected) {
    BOOST_LOG_TRIVIAL(error) << "Chunk codec: Expected " << expected << " chunks, got " << chunks.size();
    throw ChunkCodecError("expected " + std::to_string(expected) + " chunks, got " +
                          std::to_string(chunks.size()));
  }

  std::vector<uint8_t> buffer(static_cast<std::size_t>(total_length));
  std::vector<bool> seen(static_cast<std::size_t>(expected), false);

  for (const auto& chunk : chunks) {
    if (chunk.index >= expected) {
      throw ChunkCodecError("chunk index " + std::to_string(chunk.index) + " out of range");
    }
    if (seen[chunk.index]) {
      BOOST_LOG_TRIVIAL(error) << "Chunk codec: Duplicate chunk index " << chunk.index;
      throw ChunkCodecError("duplicate chunk index " + std::to_string(chunk.index));
    }
    seen[chunk.index] = true;
    write_chunk(buffer.data(), total_length, chunk.index, chunk.data.data(), chunk.data.size());
  }

  // Count matched and no index repeated, so every index was seen
  return buffer;
}

void ChunkCodec::write_chunk(uint8_t* destination, std::uint64_t total_length,
                             std::uint64_t index, const uint8_t* data, std::size_t size) const {
  if (index >= chunk_count(total_length)) {
    throw ChunkCodecError("chunk index " + std::to_string(index) + " out of range");
  }

  const std::size_t expected = expected_length(total_length, index);
  if (size != expected) {
    BOOST_LOG_TRIVIAL(error) << "Chunk codec: Chunk " << index << " has " << size
                             << " bytes, expected " << expected;
    throw ChunkCodecError("chunk " + std::to_string(index) + " has " + std::to_string(size) +
                          " bytes, expected " + std::to_string(expected));
  }

  std::memcpy(destination + chunk_offset(index), data, size);
}


//==============================================
// OFFSET ARITHMETIC
//==============================================

std::uint64_t ChunkCodec::chunk_count(std::uint64_t total_length) const {
  return (total_length + chunk_size_ - 1) / chunk_size_;
}

std::uint64_t ChunkCodec::chunk_offset(std::uint64_t index) const {
  return index * chunk_size_;
}

std::size_t ChunkCodec::expected_length(std::uint64_t total_length, std::uint64_t index) const {
  const std::uint64_t offset = chunk_offset(index);
  if (offset >= total_length) {
    return 0;
  }
  return static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, total_length - offset));
}

} // namespace chunk
} // namespace chunkstore
