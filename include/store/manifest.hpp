#ifndef CHUNKSTORE_STORE_MANIFEST_HPP
#define CHUNKSTORE_STORE_MANIFEST_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "document/document.hpp"
#include "store/object_id.hpp"

namespace chunkstore {
namespace store {

// ---- RECORD FIELD NAMES ----
namespace fields {
constexpr const char* ID = "_id";
constexpr const char* LENGTH = "length";
constexpr const char* CHUNK_SIZE = "chunk_size";
constexpr const char* UPLOAD_DATE = "upload_date";
constexpr const char* MD5 = "md5";
constexpr const char* METADATA = "metadata";

constexpr const char* FILES_ID = "files_id";
constexpr const char* SEQUENCE = "n";
constexpr const char* DATA = "data";
} // namespace fields

// One record per stored object describing how its chunks reassemble
struct Manifest {
  ObjectId id;
  std::uint64_t length{0};
  std::uint64_t chunk_size{0};
  std::chrono::system_clock::time_point created_at;
  std::string checksum;
  document::Document metadata = document::Document::object();
};

// ---- MANIFEST RECORDS ----
document::Document manifest_to_document(const Manifest& manifest);
// Throws IncompleteObjectError when a field is missing or malformed
Manifest manifest_from_document(const document::Document& record);
document::Document manifest_filter(const ObjectId& id);


// ---- CHUNK RECORDS ----
document::Document chunk_to_document(const ObjectId& id, std::uint64_t index, std::vector<uint8_t> data);
document::Document chunk_filter(const ObjectId& id, std::uint64_t index);
// Matches every chunk of an object
document::Document chunks_filter(const ObjectId& id);
// Returns the chunk's bytes after checking it belongs to (id, index)
const std::vector<uint8_t>& chunk_data(const document::Document& record, const ObjectId& id, std::uint64_t index);

} // namespace store
} // namespace chunkstore

#endif // CHUNKSTORE_STORE_MANIFEST_HPP
