#ifndef CHUNKSTORE_DOCUMENT_SQLITE_STORE_HPP
#define CHUNKSTORE_DOCUMENT_SQLITE_STORE_HPP

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "document/document_store.hpp"

namespace chunkstore {
namespace document {

// Forward declaration for the shared SQLite connection
struct SqliteConnection;

// Document store backed by one SQLite database file.
//
// Each collection is a table named "<database>.<collection>" with two
// columns per document: `fields`, a JSON projection of the top-level
// scalar fields used for filtering and unique expression indexes, and
// `body`, the whole document encoded as BSON.
class SqliteDocumentStore : public DocumentStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SqliteDocumentStore(const std::string& path, std::string database);
  ~SqliteDocumentStore() override;


  // ---- DOCUMENT STORE INTERFACE ----
  std::shared_ptr<Collection> collection(const std::string& name) override;
  void ping() override;
  void close() override;
  bool is_closed() const override;

private:
  // ---- PARAMETERS ----
  std::string path_;
  std::string database_;
  std::shared_ptr<SqliteConnection> connection_;
  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Collection>> collections_;
};

} // namespace document
} // namespace chunkstore

#endif // CHUNKSTORE_DOCUMENT_SQLITE_STORE_HPP
