#ifndef CHUNKSTORE_DOCUMENT_STORE_HPP
#define CHUNKSTORE_DOCUMENT_STORE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "document/document.hpp"

namespace chunkstore {
namespace document {

// A named set of documents with per-document atomic operations.
// Filters are objects of top-level scalar equality terms; an empty
// object matches every document. Failures raise DocumentStoreError.
class Collection {
public:
  virtual ~Collection() = default;

  // ---- WRITE OPERATIONS ----
  // Inserts one object document; DUPLICATE_KEY if a unique index or "_id" clashes
  virtual void insert_one(const Document& document) = 0;
  // Removes the first matching document, returns the number removed (0 or 1)
  virtual std::size_t delete_one(const Document& filter) = 0;
  // Removes every matching document, returns the number removed
  virtual std::size_t delete_many(const Document& filter) = 0;


  // ---- QUERY OPERATIONS ----
  virtual std::optional<Document> find_one(const Document& filter) = 0;
  virtual std::size_t count(const Document& filter) = 0;


  // ---- SCHEMA ----
  // Declares a uniqueness constraint over the given top-level fields.
  // Declaring an index that already exists is a no-op.
  virtual void create_unique_index(const std::string& name, const std::vector<std::string>& fields) = 0;
};

// Connection to a document database holding named collections
class DocumentStore {
public:
  virtual ~DocumentStore() = default;

  // Returns the collection with the given name, creating it on first use
  virtual std::shared_ptr<Collection> collection(const std::string& name) = 0;
  // Verifies the connection is usable
  virtual void ping() = 0;
  // Releases the connection; later operations fail with CLOSED
  virtual void close() = 0;
  virtual bool is_closed() const = 0;
};

// Opens a backend from an endpoint string:
//   memory://            in-process store
//   sqlite://<path>      SQLite database file (":memory:" allowed)
//   <path>               same as sqlite://<path>
// `database` namespaces the collections inside the backend.
std::shared_ptr<DocumentStore> open_document_store(const std::string& endpoint,
                                                   const std::string& database);

} // namespace document
} // namespace chunkstore

#endif // CHUNKSTORE_DOCUMENT_STORE_HPP
