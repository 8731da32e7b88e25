#include "store/object_store.hpp"
#include "crypto/digest.hpp"
#include "utils/completion_channel.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <system_error>
#include <thread>
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace store {

using document::Document;
using document::DocumentStoreError;

namespace {

std::size_t validated_chunk_size(const StoreOptions& options) {
  if (options.chunk_size == 0) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Chunk size must be positive";
    throw InvalidInputError("chunk size must be positive");
  }
  if (options.chunk_size > MAX_CHUNK_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Chunk size " << options.chunk_size << " exceeds " << MAX_CHUNK_SIZE;
    throw InvalidInputError("chunk size " + std::to_string(options.chunk_size) + " exceeds " +
                            std::to_string(MAX_CHUNK_SIZE));
  }
  return options.chunk_size;
}

// Result a fetch task posts back to the collector
struct ChunkOutcome {
  std::uint64_t index{0};
  std::exception_ptr error;
};

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ObjectStore::ObjectStore(std::shared_ptr<document::DocumentStore> backend, StoreOptions options)
  : backend_(std::move(backend))
  , options_(std::move(options))
  , codec_(validated_chunk_size(options_)) {
  if (!backend_) {
    throw InvalidInputError("object store needs a document store");
  }

  BOOST_LOG_TRIVIAL(info) << "Object store: Initializing with prefix '" << options_.collection_prefix
                          << "' and chunk size " << options_.chunk_size;

  try {
    backend_->ping();
  } catch (const DocumentStoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Backend ping failed: " << e.what();
    throw ConnectionError(std::string("ping failed: ") + e.what());
  }

  try {
    files_ = backend_->collection(options_.collection_prefix + "files");
    chunks_ = backend_->collection(options_.collection_prefix + "chunks");
    // One document per (object, sequence index)
    chunks_->create_unique_index("files_id_n", {fields::FILES_ID, fields::SEQUENCE});
  } catch (const DocumentStoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Failed to prepare collections: " << e.what();
    throw StoreUnavailableError(std::string("cannot prepare collections: ") + e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Object store: Initialization complete";
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::string ObjectStore::put(const std::vector<uint8_t>& data, const Document& metadata) {
  return put(data.data(), data.size(), metadata);
}

std::string ObjectStore::put(const uint8_t* data, std::size_t size, const Document& metadata) {
  if (data == nullptr && size > 0) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Null payload of " << size << " bytes";
    throw InvalidInputError("put: null payload with size " + std::to_string(size));
  }
  if (!metadata.is_null() && !metadata.is_object()) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Metadata must be a mapping, got " << metadata.type_name();
    throw InvalidInputError(std::string("put: metadata must be a mapping, got ") + metadata.type_name());
  }

  Manifest manifest;
  manifest.id = ObjectId::generate();
  manifest.length = size;
  manifest.chunk_size = codec_.chunk_size();
  manifest.created_at = std::chrono::system_clock::now();
  manifest.checksum = crypto::md5_hex(data, size);
  manifest.metadata = metadata.is_null() ? Document::object() : metadata;

  // Reject metadata the backend cannot store before any chunk is written
  try {
    document::validate_document(manifest.metadata);
  } catch (const DocumentStoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Metadata cannot be stored: " << e.what();
    throw InvalidInputError(std::string("put: metadata: ") + e.what());
  }

  const std::string hex = manifest.id.to_hex();
  BOOST_LOG_TRIVIAL(info) << "Object store: Storing object " << hex << " (" << size << " bytes)";

  auto chunks = codec_.split(data, size);
  for (auto& chunk : chunks) {
    try {
      chunks_->insert_one(chunk_to_document(manifest.id, chunk.index, std::move(chunk.data)));
    } catch (const DocumentStoreError& e) {
      // Chunks already written stay behind without a manifest
      BOOST_LOG_TRIVIAL(error) << "Object store: Failed to insert chunk " << chunk.index
                               << " of object " << hex << ": " << e.what();
      throw StoreUnavailableError("put " + hex + ": chunk " + std::to_string(chunk.index) + ": " + e.what());
    }
  }

  try {
    files_->insert_one(manifest_to_document(manifest));
  } catch (const DocumentStoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Failed to insert manifest of object " << hex << ": " << e.what();
    throw StoreUnavailableError("put " + hex + ": manifest: " + e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Object store: Stored object " << hex << " in " << chunks.size() << " chunks";
  return hex;
}

StoredObject ObjectStore::get(const std::string& id) {
  const ObjectId object_id = ObjectId::from_hex(id);
  BOOST_LOG_TRIVIAL(info) << "Object store: Retrieving object " << id;

  const Manifest manifest = load_manifest(object_id, "get");
  const chunk::ChunkCodec codec(static_cast<std::size_t>(manifest.chunk_size));

  StoredObject result;
  result.data.resize(static_cast<std::size_t>(manifest.length));
  result.metadata = manifest.metadata;

  const std::uint64_t count = codec.chunk_count(manifest.length);
  for (std::uint64_t index = 0; index < count; ++index) {
    fetch_chunk_into(codec, manifest, index, result.data.data(), "get");
  }

  BOOST_LOG_TRIVIAL(info) << "Object store: Retrieved object " << id << " (" << manifest.length
                          << " bytes, " << count << " chunks)";
  return result;
}

StoredObject ObjectStore::fast_get(const std::string& id) {
  const ObjectId object_id = ObjectId::from_hex(id);
  BOOST_LOG_TRIVIAL(info) << "Object store: Retrieving object " << id << " concurrently";

  const Manifest manifest = load_manifest(object_id, "fast_get");
  const chunk::ChunkCodec codec(static_cast<std::size_t>(manifest.chunk_size));

  StoredObject result;
  result.data.resize(static_cast<std::size_t>(manifest.length));
  result.metadata = manifest.metadata;

  const std::uint64_t count = codec.chunk_count(manifest.length);
  if (count == 0) {
    return result;
  }

  // Sized so that no task ever blocks reporting its outcome
  utils::CompletionChannel<ChunkOutcome> channel(static_cast<std::size_t>(count));
  std::atomic<bool> failed{false};
  uint8_t* destination = result.data.data();

  // Each task writes only the byte range of its own index
  auto fetch = [this, &codec, &manifest, &channel, &failed, destination](std::uint64_t index) {
    ChunkOutcome outcome;
    outcome.index = index;
    // Once a task has failed, tasks that have not started skip their fetch
    if (!failed.load()) {
      try {
        fetch_chunk_into(codec, manifest, index, destination, "fast_get");
      } catch (...) {
        outcome.error = std::current_exception();
        failed.store(true);
      }
    }
    channel.produce(std::move(outcome));
  };

  std::vector<std::thread> workers;
  workers.reserve(static_cast<std::size_t>(count));
  try {
    for (std::uint64_t index = 0; index < count; ++index) {
      workers.emplace_back(fetch, index);
    }
  } catch (const std::system_error& e) {
    failed.store(true);
    for (auto& worker : workers) {
      worker.join();
    }
    BOOST_LOG_TRIVIAL(error) << "Object store: Cannot start fetch thread for object " << id << ": " << e.what();
    throw StoreUnavailableError("fast_get " + id + ": cannot start fetch thread: " + e.what());
  }

  // Completion order does not matter, every outcome carries its own index
  std::exception_ptr first_error;
  for (std::uint64_t received = 0; received < count; ++received) {
    ChunkOutcome outcome = channel.consume();
    if (outcome.error && !first_error) {
      BOOST_LOG_TRIVIAL(debug) << "Object store: Chunk " << outcome.index << " of object " << id << " failed";
      first_error = outcome.error;
    }
  }

  // No task may outlive the destination buffer
  for (auto& worker : workers) {
    worker.join();
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }

  BOOST_LOG_TRIVIAL(info) << "Object store: Retrieved object " << id << " (" << manifest.length
                          << " bytes, " << count << " chunks) concurrently";
  return result;
}

void ObjectStore::remove(const std::string& id) {
  const ObjectId object_id = ObjectId::from_hex(id);
  BOOST_LOG_TRIVIAL(info) << "Object store: Removing object " << id;

  std::size_t removed = 0;
  try {
    removed = files_->delete_one(manifest_filter(object_id));
  } catch (const DocumentStoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Failed to delete manifest of object " << id << ": " << e.what();
    throw StoreUnavailableError("delete " + id + ": manifest: " + e.what());
  }

  if (removed == 0) {
    BOOST_LOG_TRIVIAL(warning) << "Object store: No manifest for object " << id << ", sweeping chunks only";
  }

  std::size_t chunk_count = 0;
  try {
    chunk_count = chunks_->delete_many(chunks_filter(object_id));
  } catch (const DocumentStoreError& e) {
    // The manifest is already gone, so the chunks are now orphans
    BOOST_LOG_TRIVIAL(error) << "Object store: Failed to delete chunks of object " << id << ": " << e.what();
    throw StoreUnavailableError("delete " + id + ": chunks: " + e.what());
  }

  BOOST_LOG_TRIVIAL(info) << "Object store: Removed object " << id << " and " << chunk_count << " chunks";
}

void ObjectStore::close() {
  BOOST_LOG_TRIVIAL(info) << "Object store: Closing backend connection";
  try {
    backend_->close();
  } catch (const DocumentStoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Failed to close backend: " << e.what();
    throw ConnectionError(std::string("close failed: ") + e.what());
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

Manifest ObjectStore::stat(const std::string& id) {
  return load_manifest(ObjectId::from_hex(id), "stat");
}

bool ObjectStore::verify(const std::string& id) {
  const Manifest manifest = stat(id);
  const StoredObject object = get(id);
  const std::string actual = crypto::md5_hex(object.data);

  if (actual != manifest.checksum) {
    BOOST_LOG_TRIVIAL(warning) << "Object store: Checksum mismatch for object " << id
                               << ": stored " << manifest.checksum << ", computed " << actual;
    return false;
  }
  return true;
}


//==============================================
// RETRIEVAL SUPPORT
//==============================================

Manifest ObjectStore::load_manifest(const ObjectId& id, const std::string& operation) {
  const std::string hex = id.to_hex();

  std::optional<Document> record;
  try {
    record = files_->find_one(manifest_filter(id));
  } catch (const DocumentStoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Failed to read manifest of object " << hex << ": " << e.what();
    throw StoreUnavailableError(operation + " " + hex + ": manifest: " + e.what());
  }

  if (!record) {
    BOOST_LOG_TRIVIAL(debug) << "Object store: No manifest for object " << hex;
    throw NotFoundError(operation + " " + hex);
  }

  return manifest_from_document(*record);
}

void ObjectStore::fetch_chunk_into(const chunk::ChunkCodec& codec, const Manifest& manifest,
                                   std::uint64_t index, uint8_t* destination, const std::string& operation) {
  const std::string hex = manifest.id.to_hex();
  const std::string where = operation + " " + hex + ": chunk " + std::to_string(index);

  std::optional<Document> record;
  try {
    record = chunks_->find_one(chunk_filter(manifest.id, index));
  } catch (const DocumentStoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Failed to read chunk " << index << " of object " << hex
                             << ": " << e.what();
    throw StoreUnavailableError(where + ": " + e.what());
  }

  if (!record) {
    BOOST_LOG_TRIVIAL(error) << "Object store: Chunk " << index << " of object " << hex << " is missing";
    throw IncompleteObjectError(where + " of " + std::to_string(codec.chunk_count(manifest.length)) + " is missing");
  }

  const auto& bytes = chunk_data(*record, manifest.id, index);
  try {
    codec.write_chunk(destination, manifest.length, index, bytes.data(), bytes.size());
  } catch (const chunk::ChunkCodecError& e) {
    throw IncompleteObjectError(where + ": " + e.what());
  }
}

} // namespace store
} // namespace chunkstore
