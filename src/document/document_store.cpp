#include "document/document_store.hpp"
#include "document/memory_store.hpp"
#include "document/sqlite_store.hpp"
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace document {

std::shared_ptr<DocumentStore> open_document_store(const std::string& endpoint,
                                                   const std::string& database) {
  static const std::string memory_scheme = "memory://";
  static const std::string sqlite_scheme = "sqlite://";

  BOOST_LOG_TRIVIAL(info) << "Document store: Opening endpoint " << endpoint << " (database " << database << ")";

  if (endpoint.rfind(memory_scheme, 0) == 0) {
    return std::make_shared<MemoryDocumentStore>(database);
  }

  std::string path = endpoint;
  if (endpoint.rfind(sqlite_scheme, 0) == 0) {
    path = endpoint.substr(sqlite_scheme.size());
  } else if (endpoint.find("://") != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "Document store: Unsupported endpoint scheme: " << endpoint;
    throw DocumentStoreError(DocumentErrorCode::UNAVAILABLE, "unsupported endpoint " + endpoint);
  }

  if (path.empty()) {
    throw DocumentStoreError(DocumentErrorCode::UNAVAILABLE, "endpoint " + endpoint + " has no database path");
  }
  return std::make_shared<SqliteDocumentStore>(path, database);
}

} // namespace document
} // namespace chunkstore
