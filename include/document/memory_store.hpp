#ifndef CHUNKSTORE_DOCUMENT_MEMORY_STORE_HPP
#define CHUNKSTORE_DOCUMENT_MEMORY_STORE_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "document/document_store.hpp"

namespace chunkstore {
namespace document {

class MemoryCollection : public Collection {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  MemoryCollection(std::string name, std::shared_ptr<std::atomic<bool>> closed);


  // ---- WRITE OPERATIONS ----
  void insert_one(const Document& document) override;
  std::size_t delete_one(const Document& filter) override;
  std::size_t delete_many(const Document& filter) override;


  // ---- QUERY OPERATIONS ----
  std::optional<Document> find_one(const Document& filter) override;
  std::size_t count(const Document& filter) override;


  // ---- SCHEMA ----
  void create_unique_index(const std::string& name, const std::vector<std::string>& fields) override;

private:
  // ---- PARAMETERS ----
  std::string name_;
  std::shared_ptr<std::atomic<bool>> closed_;
  mutable std::mutex mutex_;
  std::vector<Document> documents_;
  // index name -> indexed fields; "_id" is always unique
  std::map<std::string, std::vector<std::string>> unique_indexes_;


  // ---- UTILITY METHODS ----
  // Throws CLOSED once the owning store has been closed
  void check_open() const;
  // True when both documents carry every field and all values are equal
  static bool same_key(const Document& a, const Document& b, const std::vector<std::string>& fields);
};

// Thread-safe in-process document store. Contents live as long as the store.
class MemoryDocumentStore : public DocumentStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MemoryDocumentStore(std::string database = "chunkstore");
  ~MemoryDocumentStore() override = default;


  // ---- DOCUMENT STORE INTERFACE ----
  std::shared_ptr<Collection> collection(const std::string& name) override;
  void ping() override;
  void close() override;
  bool is_closed() const override;

private:
  // ---- PARAMETERS ----
  std::string database_;
  std::shared_ptr<std::atomic<bool>> closed_;
  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<MemoryCollection>> collections_;
};

} // namespace document
} // namespace chunkstore

#endif // CHUNKSTORE_DOCUMENT_MEMORY_STORE_HPP
