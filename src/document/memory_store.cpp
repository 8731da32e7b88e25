#include "document/memory_store.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace document {

//==============================================
// MEMORY COLLECTION
//==============================================

MemoryCollection::MemoryCollection(std::string name, std::shared_ptr<std::atomic<bool>> closed)
  : name_(std::move(name))
  , closed_(std::move(closed)) {
  unique_indexes_["_id"] = {"_id"};
}

void MemoryCollection::insert_one(const Document& document) {
  check_open();
  validate_document(document);

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [index_name, fields] : unique_indexes_) {
    for (const auto& existing : documents_) {
      if (same_key(existing, document, fields)) {
        BOOST_LOG_TRIVIAL(debug) << "Memory store: Duplicate key on index " << index_name
                                 << " in collection " << name_;
        throw DocumentStoreError(DocumentErrorCode::DUPLICATE_KEY,
                                 "index " + index_name + " in collection " + name_);
      }
    }
  }
  documents_.push_back(document);
}

std::size_t MemoryCollection::delete_one(const Document& filter) {
  check_open();
  validate_filter(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(documents_.begin(), documents_.end(),
                         [&filter](const Document& doc) { return matches(doc, filter); });
  if (it == documents_.end()) {
    return 0;
  }
  documents_.erase(it);
  return 1;
}

std::size_t MemoryCollection::delete_many(const Document& filter) {
  check_open();
  validate_filter(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  const auto before = documents_.size();
  documents_.erase(std::remove_if(documents_.begin(), documents_.end(),
                                  [&filter](const Document& doc) { return matches(doc, filter); }),
                   documents_.end());
  return before - documents_.size();
}

std::optional<Document> MemoryCollection::find_one(const Document& filter) {
  check_open();
  validate_filter(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& doc : documents_) {
    if (matches(doc, filter)) {
      return doc;
    }
  }
  return std::nullopt;
}

std::size_t MemoryCollection::count(const Document& filter) {
  check_open();
  validate_filter(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(documents_.begin(), documents_.end(),
                                                [&filter](const Document& doc) { return matches(doc, filter); }));
}

void MemoryCollection::create_unique_index(const std::string& name, const std::vector<std::string>& fields) {
  check_open();
  if (fields.empty()) {
    throw DocumentStoreError(DocumentErrorCode::INVALID_FILTER, "unique index " + name + " has no fields");
  }
  for (const auto& field : fields) {
    validate_field_name(field);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (unique_indexes_.count(name) > 0) {
    return;
  }

  // Existing documents must already satisfy the constraint
  for (std::size_t i = 0; i < documents_.size(); ++i) {
    for (std::size_t j = i + 1; j < documents_.size(); ++j) {
      if (same_key(documents_[i], documents_[j], fields)) {
        throw DocumentStoreError(DocumentErrorCode::DUPLICATE_KEY,
                                 "cannot build index " + name + " in collection " + name_);
      }
    }
  }

  unique_indexes_[name] = fields;
  BOOST_LOG_TRIVIAL(debug) << "Memory store: Created unique index " << name << " on collection " << name_;
}

void MemoryCollection::check_open() const {
  if (closed_->load()) {
    throw DocumentStoreError(DocumentErrorCode::CLOSED, "collection " + name_);
  }
}

bool MemoryCollection::same_key(const Document& a, const Document& b, const std::vector<std::string>& fields) {
  for (const auto& field : fields) {
    auto left = a.find(field);
    auto right = b.find(field);
    if (left == a.end() || right == b.end() || *left != *right) {
      return false;
    }
  }
  return true;
}


//==============================================
// MEMORY DOCUMENT STORE
//==============================================

MemoryDocumentStore::MemoryDocumentStore(std::string database)
  : database_(std::move(database))
  , closed_(std::make_shared<std::atomic<bool>>(false)) {
  BOOST_LOG_TRIVIAL(info) << "Memory store: Opened in-memory database " << database_;
}

std::shared_ptr<Collection> MemoryDocumentStore::collection(const std::string& name) {
  if (closed_->load()) {
    throw DocumentStoreError(DocumentErrorCode::CLOSED, "database " + database_);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = collections_[name];
  if (!entry) {
    entry = std::make_shared<MemoryCollection>(database_ + "." + name, closed_);
  }
  return entry;
}

void MemoryDocumentStore::ping() {
  if (closed_->load()) {
    throw DocumentStoreError(DocumentErrorCode::CLOSED, "database " + database_);
  }
}

void MemoryDocumentStore::close() {
  // Closing twice is a no-op
  if (!closed_->exchange(true)) {
    BOOST_LOG_TRIVIAL(info) << "Memory store: Closed in-memory database " << database_;
  }
}

bool MemoryDocumentStore::is_closed() const {
  return closed_->load();
}

} // namespace document
} // namespace chunkstore
