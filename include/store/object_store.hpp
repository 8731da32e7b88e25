#ifndef CHUNKSTORE_STORE_OBJECT_STORE_HPP
#define CHUNKSTORE_STORE_OBJECT_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "chunk/chunk_codec.hpp"
#include "document/document_store.hpp"
#include "store/manifest.hpp"
#include "store/object_id.hpp"
#include "store/store_error.hpp"

namespace chunkstore {
namespace store {

constexpr std::size_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;
// One chunk must fit a single backend record
constexpr std::size_t MAX_CHUNK_SIZE = 1000 * 1000 * 1000;

struct StoreOptions {
  // Prepended to the "files" and "chunks" collection names
  std::string collection_prefix = "fs.";
  // Used for objects written from now on; stored objects keep their own
  std::size_t chunk_size = DEFAULT_CHUNK_SIZE;
};

// Payload and caller metadata returned by a read
struct StoredObject {
  std::vector<uint8_t> data;
  document::Document metadata = document::Document::object();
};

// Stores whole byte objects as one manifest document plus fixed-size chunk
// documents in a DocumentStore.
//
// Writes are not transactional: a failed put can leave chunks without a
// manifest, and a failed remove can leave either half behind. Nothing
// reclaims such orphans.
class ObjectStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Pings the backend and declares the (files_id, n) unique index
  explicit ObjectStore(std::shared_ptr<document::DocumentStore> backend, StoreOptions options = {});
  ~ObjectStore() = default;

  ObjectStore(const ObjectStore&) = delete;
  ObjectStore& operator=(const ObjectStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Stores a payload and returns its 24-digit hex id
  std::string put(const std::vector<uint8_t>& data,
                  const document::Document& metadata = document::Document::object());
  std::string put(const uint8_t* data, std::size_t size, const document::Document& metadata);
  // Reads chunks one at a time, in order
  StoredObject get(const std::string& id);
  // Reads all chunks concurrently, one thread per chunk
  StoredObject fast_get(const std::string& id);
  // Deletes the manifest, then every chunk of the object
  void remove(const std::string& id);
  // Releases the backend connection
  void close();


  // ---- QUERY OPERATIONS ----
  Manifest stat(const std::string& id);
  // Re-reads the object and compares its MD5 with the stored checksum
  bool verify(const std::string& id);


  // ---- GETTERS ----
  std::size_t chunk_size() const { return codec_.chunk_size(); }
  const StoreOptions& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<document::DocumentStore> backend_;
  StoreOptions options_;
  chunk::ChunkCodec codec_;
  std::shared_ptr<document::Collection> files_;
  std::shared_ptr<document::Collection> chunks_;


  // ---- RETRIEVAL SUPPORT ----
  // Fetches the manifest, NotFoundError if there is none
  Manifest load_manifest(const ObjectId& id, const std::string& operation);
  // Fetches chunk `index` and copies it into its region of `destination`
  void fetch_chunk_into(const chunk::ChunkCodec& codec, const Manifest& manifest,
                        std::uint64_t index, uint8_t* destination, const std::string& operation);
};

} // namespace store
} // namespace chunkstore

#endif // CHUNKSTORE_STORE_OBJECT_STORE_HPP
