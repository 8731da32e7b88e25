#include "document/sqlite_store.hpp"
#include <sqlite3.h>
#include <limits>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace chunkstore {
namespace document {

//==============================================
// SHARED CONNECTION
//==============================================

struct SqliteConnection {
  sqlite3* db = nullptr;
  // Serializes statements so an error message is read by the call that caused it
  std::mutex mutex;
};

namespace {

[[noreturn]] void raise_sqlite_error(sqlite3* db, const std::string& context) {
  const int code = sqlite3_extended_errcode(db);
  const std::string message = sqlite3_errmsg(db);
  BOOST_LOG_TRIVIAL(error) << "SQLite store: " << context << " failed: " << message;

  if (code == SQLITE_CONSTRAINT_UNIQUE || code == SQLITE_CONSTRAINT_PRIMARYKEY) {
    throw DocumentStoreError(DocumentErrorCode::DUPLICATE_KEY, context + ": " + message);
  }
  throw DocumentStoreError(DocumentErrorCode::UNAVAILABLE, context + ": " + message);
}

void exec_sql(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    BOOST_LOG_TRIVIAL(error) << "SQLite store: exec failed: " << msg;
    if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE) {
      throw DocumentStoreError(DocumentErrorCode::DUPLICATE_KEY, msg);
    }
    throw DocumentStoreError(DocumentErrorCode::UNAVAILABLE, msg);
  }
}

// Quotes an identifier; names containing a double quote are rejected
std::string quote_identifier(const std::string& name) {
  if (name.empty() || name.find('"') != std::string::npos) {
    throw DocumentStoreError(DocumentErrorCode::INVALID_FILTER, "invalid identifier '" + name + "'");
  }
  return "\"" + name + "\"";
}

std::string field_expression(const std::string& field) {
  validate_field_name(field);
  return "json_extract(fields, '$.\"" + field + "\"')";
}

//==============================================
// RAII WRAPPER FOR PREPARED STATEMENTS
//==============================================

class Statement {
public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
      raise_sqlite_error(db, "prepare");
    }
  }

  ~Statement() {
    if (stmt_) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() { return stmt_; }

  // Binds filter values to parameters 1..N in order
  void bind_values(const std::vector<Document>& values) {
    int index = 1;
    for (const auto& value : values) {
      int rc = SQLITE_OK;
      if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        rc = sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
      } else if (value.is_boolean()) {
        // json_extract yields 1 and 0 for true and false
        rc = sqlite3_bind_int(stmt_, index, value.get<bool>() ? 1 : 0);
      } else if (value.is_number_unsigned()) {
        const auto unsigned_value = value.get<std::uint64_t>();
        if (unsigned_value > static_cast<std::uint64_t>(std::numeric_limits<sqlite3_int64>::max())) {
          throw DocumentStoreError(DocumentErrorCode::INVALID_FILTER, "integer filter term out of range");
        }
        rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(unsigned_value));
      } else if (value.is_number_integer()) {
        rc = sqlite3_bind_int64(stmt_, index, value.get<std::int64_t>());
      } else {
        rc = sqlite3_bind_double(stmt_, index, value.get<double>());
      }
      if (rc != SQLITE_OK) {
        raise_sqlite_error(db_, "bind");
      }
      ++index;
    }
  }

private:
  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;
};

// Builds "cond AND cond ..." for a validated filter, collecting the values to bind
std::string where_clause(const Document& filter, std::vector<Document>& values) {
  validate_filter(filter);
  if (filter.empty()) {
    return "1";
  }

  std::stringstream ss;
  bool first = true;
  for (const auto& [field, value] : filter.items()) {
    if (!first) {
      ss << " AND ";
    }
    ss << field_expression(field) << " = ?";
    values.push_back(value);
    first = false;
  }
  return ss.str();
}

//==============================================
// SQLITE COLLECTION
//==============================================

class SqliteCollection : public Collection {
public:
  SqliteCollection(std::shared_ptr<SqliteConnection> connection, std::string table)
    : connection_(std::move(connection))
    , table_(std::move(table))
    , quoted_table_(quote_identifier(table_)) {
    std::lock_guard<std::mutex> lock(connection_->mutex);
    sqlite3* db = open_db();
    exec_sql(db, "CREATE TABLE IF NOT EXISTS " + quoted_table_ +
                 " (id INTEGER PRIMARY KEY AUTOINCREMENT, fields TEXT NOT NULL, body BLOB NOT NULL);");
    exec_sql(db, "CREATE UNIQUE INDEX IF NOT EXISTS " + quote_identifier(table_ + "._id") +
                 " ON " + quoted_table_ + " (" + field_expression("_id") + ");");
    BOOST_LOG_TRIVIAL(debug) << "SQLite store: Collection table ready: " << table_;
  }

  void insert_one(const Document& document) override {
    validate_document(document);

    std::vector<uint8_t> body;
    try {
      body = Document::to_bson(document);
    } catch (const Document::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "SQLite store: Cannot encode document for " << table_ << ": " << e.what();
      throw DocumentStoreError(DocumentErrorCode::INVALID_DOCUMENT, e.what());
    }
    const std::string fields = scalar_fields(document).dump();
    // sqlite3_bind_* take int lengths
    if (body.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()) ||
        fields.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
      BOOST_LOG_TRIVIAL(error) << "SQLite store: Document of " << body.size() << " bytes is too large for " << table_;
      throw DocumentStoreError(DocumentErrorCode::INVALID_DOCUMENT,
                               "document of " + std::to_string(body.size()) + " bytes exceeds the row size limit");
    }

    std::lock_guard<std::mutex> lock(connection_->mutex);
    sqlite3* db = open_db();
    Statement st(db, "INSERT INTO " + quoted_table_ + " (fields, body) VALUES (?, ?);");
    if (sqlite3_bind_text(st.get(), 1, fields.data(), static_cast<int>(fields.size()), SQLITE_TRANSIENT) != SQLITE_OK ||
        sqlite3_bind_blob(st.get(), 2, body.data(), static_cast<int>(body.size()), SQLITE_STATIC) != SQLITE_OK) {
      raise_sqlite_error(db, "insert into " + table_);
    }
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
      raise_sqlite_error(db, "insert into " + table_);
    }
  }

  std::size_t delete_one(const Document& filter) override {
    std::vector<Document> values;
    const std::string where = where_clause(filter, values);

    std::lock_guard<std::mutex> lock(connection_->mutex);
    sqlite3* db = open_db();
    Statement st(db, "DELETE FROM " + quoted_table_ + " WHERE id = (SELECT id FROM " + quoted_table_ +
                     " WHERE " + where + " LIMIT 1);");
    st.bind_values(values);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
      raise_sqlite_error(db, "delete from " + table_);
    }
    return static_cast<std::size_t>(sqlite3_changes(db));
  }

  std::size_t delete_many(const Document& filter) override {
    std::vector<Document> values;
    const std::string where = where_clause(filter, values);

    std::lock_guard<std::mutex> lock(connection_->mutex);
    sqlite3* db = open_db();
    Statement st(db, "DELETE FROM " + quoted_table_ + " WHERE " + where + ";");
    st.bind_values(values);
    if (sqlite3_step(st.get()) != SQLITE_DONE) {
      raise_sqlite_error(db, "delete from " + table_);
    }
    return static_cast<std::size_t>(sqlite3_changes(db));
  }

  std::optional<Document> find_one(const Document& filter) override {
    std::vector<Document> values;
    const std::string where = where_clause(filter, values);

    std::vector<uint8_t> body;
    {
      std::lock_guard<std::mutex> lock(connection_->mutex);
      sqlite3* db = open_db();
      Statement st(db, "SELECT body FROM " + quoted_table_ + " WHERE " + where + " LIMIT 1;");
      st.bind_values(values);

      const int rc = sqlite3_step(st.get());
      if (rc == SQLITE_DONE) {
        return std::nullopt;
      }
      if (rc != SQLITE_ROW) {
        raise_sqlite_error(db, "find in " + table_);
      }

      const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(st.get(), 0));
      const int size = sqlite3_column_bytes(st.get(), 0);
      if (blob && size > 0) {
        body.assign(blob, blob + size);
      }
    }

    // Decode outside the lock so concurrent readers only serialize on I/O
    try {
      return Document::from_bson(body);
    } catch (const Document::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "SQLite store: Corrupt document in " << table_ << ": " << e.what();
      throw DocumentStoreError(DocumentErrorCode::UNAVAILABLE, "corrupt document in " + table_ + ": " + e.what());
    }
  }

  std::size_t count(const Document& filter) override {
    std::vector<Document> values;
    const std::string where = where_clause(filter, values);

    std::lock_guard<std::mutex> lock(connection_->mutex);
    sqlite3* db = open_db();
    Statement st(db, "SELECT COUNT(*) FROM " + quoted_table_ + " WHERE " + where + ";");
    st.bind_values(values);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
      raise_sqlite_error(db, "count in " + table_);
    }
    return static_cast<std::size_t>(sqlite3_column_int64(st.get(), 0));
  }

  void create_unique_index(const std::string& name, const std::vector<std::string>& fields) override {
    if (fields.empty()) {
      throw DocumentStoreError(DocumentErrorCode::INVALID_FILTER, "unique index " + name + " has no fields");
    }

    std::stringstream columns;
    for (std::size_t i = 0; i < fields.size(); ++i) {
      if (i > 0) {
        columns << ", ";
      }
      columns << field_expression(fields[i]);
    }

    std::lock_guard<std::mutex> lock(connection_->mutex);
    sqlite3* db = open_db();
    exec_sql(db, "CREATE UNIQUE INDEX IF NOT EXISTS " + quote_identifier(table_ + "." + name) +
                 " ON " + quoted_table_ + " (" + columns.str() + ");");
    BOOST_LOG_TRIVIAL(debug) << "SQLite store: Unique index " << name << " ready on " << table_;
  }

private:
  std::shared_ptr<SqliteConnection> connection_;
  std::string table_;
  std::string quoted_table_;

  // Caller must hold connection_->mutex
  sqlite3* open_db() {
    if (!connection_->db) {
      throw DocumentStoreError(DocumentErrorCode::CLOSED, "collection " + table_);
    }
    return connection_->db;
  }
};

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SqliteDocumentStore::SqliteDocumentStore(const std::string& path, std::string database)
  : path_(path)
  , database_(std::move(database))
  , connection_(std::make_shared<SqliteConnection>()) {
  BOOST_LOG_TRIVIAL(info) << "SQLite store: Opening database " << database_ << " at " << path_;

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path_.c_str(), &db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    BOOST_LOG_TRIVIAL(error) << "SQLite store: Failed to open " << path_ << ": " << message;
    throw DocumentStoreError(DocumentErrorCode::UNAVAILABLE, "failed to open " + path_ + ": " + message);
  }

  try {
    exec_sql(db, "PRAGMA journal_mode=WAL;");
    exec_sql(db, "PRAGMA synchronous=NORMAL;");
    exec_sql(db, "PRAGMA busy_timeout=5000;");
  } catch (...) {
    sqlite3_close(db);
    throw;
  }

  connection_->db = db;
}

SqliteDocumentStore::~SqliteDocumentStore() {
  std::lock_guard<std::mutex> lock(connection_->mutex);
  if (connection_->db) {
    sqlite3_close_v2(connection_->db);
    connection_->db = nullptr;
  }
}


//==============================================
// DOCUMENT STORE INTERFACE
//==============================================

std::shared_ptr<Collection> SqliteDocumentStore::collection(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& entry = collections_[name];
  if (!entry) {
    entry = std::make_shared<SqliteCollection>(connection_, database_ + "." + name);
  }
  return entry;
}

void SqliteDocumentStore::ping() {
  std::lock_guard<std::mutex> lock(connection_->mutex);
  if (!connection_->db) {
    throw DocumentStoreError(DocumentErrorCode::CLOSED, "database " + database_);
  }
  exec_sql(connection_->db, "SELECT 1;");
}

void SqliteDocumentStore::close() {
  std::lock_guard<std::mutex> lock(connection_->mutex);
  // Closing twice is a no-op
  if (!connection_->db) {
    return;
  }
  if (sqlite3_close_v2(connection_->db) != SQLITE_OK) {
    raise_sqlite_error(connection_->db, "close");
  }
  connection_->db = nullptr;
  BOOST_LOG_TRIVIAL(info) << "SQLite store: Closed database " << database_ << " at " << path_;
}

bool SqliteDocumentStore::is_closed() const {
  std::lock_guard<std::mutex> lock(connection_->mutex);
  return connection_->db == nullptr;
}

} // namespace document
} // namespace chunkstore
