#include <gtest/gtest.h>
#include <filesystem>
#include <functional>
#include <limits>
#include <thread>
#include <vector>
#include "document/sqlite_store.hpp"
#include "test_utils.hpp"

using namespace chunkstore::document;

class SqliteStoreTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path db_path;
  std::shared_ptr<SqliteDocumentStore> store;

  void SetUp() override {
    init_test_logging();
    test_dir = unique_temp_path("sqlite_store_test");
    std::filesystem::create_directories(test_dir);
    db_path = test_dir / "objects.db";
    store = std::make_shared<SqliteDocumentStore>(db_path.string(), "test");
  }

  void TearDown() override {
    if (store) {
      store->close();
      store.reset();
    }
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  static Document chunk_record(const std::string& owner, std::uint64_t n, std::vector<uint8_t> data = {1, 2, 3}) {
    return Document{{"files_id", owner}, {"n", n}, {"data", Document::binary(std::move(data))}};
  }

  static void expect_code(const std::function<void()>& action, DocumentErrorCode expected) {
    try {
      action();
      FAIL() << "Expected DocumentStoreError " << document_error_to_string(expected);
    } catch (const DocumentStoreError& e) {
      EXPECT_EQ(e.code(), expected) << e.what();
    }
  }
};

TEST_F(SqliteStoreTest, InsertAndFindBinary) {
  auto chunks = store->collection("fs.chunks");
  const auto payload = make_payload(4096);
  chunks->insert_one(chunk_record("a", 0, payload));
  chunks->insert_one(chunk_record("a", 1));

  auto found = chunks->find_one(Document{{"files_id", "a"}, {"n", 0}});
  ASSERT_TRUE(found.has_value());
  ASSERT_TRUE((*found)["data"].is_binary());
  EXPECT_EQ((*found)["data"].get_binary(), payload);
  EXPECT_EQ(as_uint64((*found)["n"]), 0u);

  EXPECT_FALSE(chunks->find_one(Document{{"files_id", "a"}, {"n", 2}}).has_value());
  EXPECT_EQ(chunks->count(Document{{"files_id", "a"}}), 2u);
}

TEST_F(SqliteStoreTest, NestedMetadataSurvives) {
  auto files = store->collection("fs.files");
  const Document metadata = {{"owner", "alice"}, {"tags", Document::array({"x", "y"})}, {"size", 12}};
  files->insert_one(Document{{"_id", "obj"}, {"length", 20971520}, {"metadata", metadata}});

  auto found = files->find_one(Document{{"_id", "obj"}});
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ((*found)["metadata"], metadata);
  EXPECT_EQ(as_uint64((*found)["length"]), 20971520u);
}

TEST_F(SqliteStoreTest, MatchesBooleanAndStringTerms) {
  auto files = store->collection("fs.files");
  files->insert_one(Document{{"_id", "a"}, {"flag", true}, {"label", "first"}});
  files->insert_one(Document{{"_id", "b"}, {"flag", false}, {"label", "second"}});

  EXPECT_EQ(files->count(Document{{"flag", true}}), 1u);
  EXPECT_EQ(files->count(Document{{"label", "second"}}), 1u);
  EXPECT_EQ(files->count(Document::object()), 2u);
}

TEST_F(SqliteStoreTest, UniqueIndexRejectsDuplicates) {
  auto chunks = store->collection("fs.chunks");
  chunks->create_unique_index("files_id_n", {"files_id", "n"});
  chunks->create_unique_index("files_id_n", {"files_id", "n"});

  chunks->insert_one(chunk_record("a", 0));
  chunks->insert_one(chunk_record("b", 0));
  expect_code([&]() { chunks->insert_one(chunk_record("a", 0)); }, DocumentErrorCode::DUPLICATE_KEY);
  EXPECT_EQ(chunks->count(Document::object()), 2u);

  auto files = store->collection("fs.files");
  files->insert_one(Document{{"_id", "x"}});
  expect_code([&]() { files->insert_one(Document{{"_id", "x"}}); }, DocumentErrorCode::DUPLICATE_KEY);
}

TEST_F(SqliteStoreTest, DeleteOneAndMany) {
  auto chunks = store->collection("fs.chunks");
  for (std::uint64_t n = 0; n < 5; ++n) {
    chunks->insert_one(chunk_record("a", n));
  }
  chunks->insert_one(chunk_record("b", 0));

  EXPECT_EQ(chunks->delete_one(Document{{"files_id", "a"}}), 1u);
  EXPECT_EQ(chunks->delete_one(Document{{"files_id", "none"}}), 0u);
  EXPECT_EQ(chunks->delete_many(Document{{"files_id", "a"}}), 4u);
  EXPECT_EQ(chunks->count(Document::object()), 1u);
}

TEST_F(SqliteStoreTest, CollectionsAreSeparateTables) {
  store->collection("fs.files")->insert_one(Document{{"_id", "a"}});
  store->collection("other.files")->insert_one(Document{{"_id", "a"}});
  EXPECT_EQ(store->collection("fs.files")->count(Document::object()), 1u);
  EXPECT_EQ(store->collection("other.files")->count(Document::object()), 1u);
}

TEST_F(SqliteStoreTest, DataPersistsAcrossReopen) {
  store->collection("fs.chunks")->insert_one(chunk_record("a", 0, {4, 5, 6}));
  store->close();

  store = std::make_shared<SqliteDocumentStore>(db_path.string(), "test");
  auto found = store->collection("fs.chunks")->find_one(Document{{"files_id", "a"}});
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ((*found)["data"].get_binary(), (std::vector<uint8_t>{4, 5, 6}));

  // Another database name sees none of it
  SqliteDocumentStore other(db_path.string(), "other");
  EXPECT_EQ(other.collection("fs.chunks")->count(Document::object()), 0u);
  other.close();
}

TEST_F(SqliteStoreTest, RejectsInvalidInput) {
  auto chunks = store->collection("fs.chunks");
  expect_code([&]() { chunks->insert_one(Document("text")); }, DocumentErrorCode::INVALID_DOCUMENT);
  expect_code([&]() { chunks->insert_one(Document{{"meta", {{"big", std::numeric_limits<std::uint64_t>::max()}}}}); },
              DocumentErrorCode::INVALID_DOCUMENT);
  EXPECT_EQ(chunks->count(Document::object()), 0u);
  expect_code([&]() { chunks->count(Document{{"a.b", 1}}); }, DocumentErrorCode::INVALID_FILTER);
  expect_code([&]() { chunks->create_unique_index("bad", {"x'y"}); }, DocumentErrorCode::INVALID_FILTER);
}

TEST_F(SqliteStoreTest, CloseFailsLaterOperations) {
  auto chunks = store->collection("fs.chunks");
  EXPECT_NO_THROW(store->ping());

  store->close();
  EXPECT_TRUE(store->is_closed());
  EXPECT_NO_THROW(store->close());

  expect_code([&]() { store->ping(); }, DocumentErrorCode::CLOSED);
  expect_code([&]() { chunks->insert_one(chunk_record("a", 0)); }, DocumentErrorCode::CLOSED);
  expect_code([&]() { chunks->find_one(Document::object()); }, DocumentErrorCode::CLOSED);
}

TEST_F(SqliteStoreTest, ConcurrentReaders) {
  auto chunks = store->collection("fs.chunks");
  for (std::uint64_t n = 0; n < 16; ++n) {
    chunks->insert_one(chunk_record("a", n, std::vector<uint8_t>(64, static_cast<uint8_t>(n))));
  }

  std::vector<std::thread> readers;
  std::vector<int> ok(16, 0);
  for (std::uint64_t n = 0; n < 16; ++n) {
    readers.emplace_back([&chunks, n, &ok]() {
      auto found = chunks->find_one(Document{{"files_id", "a"}, {"n", n}});
      ok[n] = found && (*found)["data"].get_binary()[0] == static_cast<uint8_t>(n);
    });
  }
  for (auto& reader : readers) {
    reader.join();
  }
  for (std::size_t n = 0; n < ok.size(); ++n) {
    EXPECT_TRUE(ok[n]) << "Reader " << n << " saw the wrong chunk";
  }
}

TEST(SqliteStoreOpenTest, UnopenablePathIsUnavailable) {
  try {
    SqliteDocumentStore store("/nonexistent-directory/for/sure/objects.db", "test");
    FAIL() << "Expected DocumentStoreError";
  } catch (const DocumentStoreError& e) {
    EXPECT_EQ(e.code(), DocumentErrorCode::UNAVAILABLE);
  }
}
