#include <gtest/gtest.h>
#include <functional>
#include <limits>
#include <thread>
#include <vector>
#include "document/document_store.hpp"
#include "document/memory_store.hpp"
#include "test_utils.hpp"

using namespace chunkstore::document;

class MemoryStoreTest : public ::testing::Test {
protected:
  std::shared_ptr<MemoryDocumentStore> store;
  std::shared_ptr<Collection> chunks;

  void SetUp() override {
    init_test_logging();
    store = std::make_shared<MemoryDocumentStore>("test");
    chunks = store->collection("fs.chunks");
  }

  static Document chunk_record(const std::string& owner, int n, std::vector<uint8_t> data = {1, 2, 3}) {
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

TEST_F(MemoryStoreTest, InsertAndFind) {
  chunks->insert_one(chunk_record("a", 0, {9, 8, 7}));
  chunks->insert_one(chunk_record("a", 1));

  auto found = chunks->find_one(Document{{"files_id", "a"}, {"n", 0}});
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ((*found)["data"].get_binary(), (std::vector<uint8_t>{9, 8, 7}));

  EXPECT_FALSE(chunks->find_one(Document{{"files_id", "b"}}).has_value());
  EXPECT_EQ(chunks->count(Document::object()), 2u);
  EXPECT_EQ(chunks->count(Document{{"files_id", "a"}}), 2u);
}

TEST_F(MemoryStoreTest, SameNameReturnsSameCollection) {
  chunks->insert_one(chunk_record("a", 0));
  EXPECT_EQ(store->collection("fs.chunks"), chunks);
  EXPECT_EQ(store->collection("fs.chunks")->count(Document::object()), 1u);
  EXPECT_EQ(store->collection("fs.files")->count(Document::object()), 0u);
}

TEST_F(MemoryStoreTest, IdIsAlwaysUnique) {
  auto files = store->collection("fs.files");
  files->insert_one(Document{{"_id", "x"}, {"length", 1}});
  expect_code([&]() { files->insert_one(Document{{"_id", "x"}, {"length", 2}}); },
              DocumentErrorCode::DUPLICATE_KEY);
  EXPECT_EQ(files->count(Document::object()), 1u);
}

TEST_F(MemoryStoreTest, UniqueIndexRejectsDuplicates) {
  chunks->create_unique_index("files_id_n", {"files_id", "n"});
  // Declaring it again is a no-op
  chunks->create_unique_index("files_id_n", {"files_id", "n"});

  chunks->insert_one(chunk_record("a", 0));
  chunks->insert_one(chunk_record("a", 1));
  chunks->insert_one(chunk_record("b", 0));
  expect_code([&]() { chunks->insert_one(chunk_record("a", 1)); }, DocumentErrorCode::DUPLICATE_KEY);
  EXPECT_EQ(chunks->count(Document::object()), 3u);
}

TEST_F(MemoryStoreTest, UniqueIndexOverExistingDuplicatesFails) {
  chunks->insert_one(chunk_record("a", 0));
  chunks->insert_one(chunk_record("a", 0));
  expect_code([&]() { chunks->create_unique_index("files_id_n", {"files_id", "n"}); },
              DocumentErrorCode::DUPLICATE_KEY);
}

TEST_F(MemoryStoreTest, DeleteOneAndMany) {
  for (int n = 0; n < 5; ++n) {
    chunks->insert_one(chunk_record("a", n));
  }
  chunks->insert_one(chunk_record("b", 0));

  EXPECT_EQ(chunks->delete_one(Document{{"files_id", "a"}}), 1u);
  EXPECT_EQ(chunks->count(Document{{"files_id", "a"}}), 4u);
  EXPECT_EQ(chunks->delete_one(Document{{"files_id", "zzz"}}), 0u);

  EXPECT_EQ(chunks->delete_many(Document{{"files_id", "a"}}), 4u);
  EXPECT_EQ(chunks->delete_many(Document{{"files_id", "a"}}), 0u);
  EXPECT_EQ(chunks->count(Document::object()), 1u);
}

TEST_F(MemoryStoreTest, RejectsInvalidInput) {
  expect_code([&]() { chunks->insert_one(Document::array()); }, DocumentErrorCode::INVALID_DOCUMENT);
  // Same rule as the SQLite backend: unsigned values must fit int64
  expect_code([&]() { chunks->insert_one(Document{{"big", std::numeric_limits<std::uint64_t>::max()}}); },
              DocumentErrorCode::INVALID_DOCUMENT);
  EXPECT_EQ(chunks->count(Document::object()), 0u);
  expect_code([&]() { chunks->find_one(Document{{"n", Document::array()}}); }, DocumentErrorCode::INVALID_FILTER);
  expect_code([&]() { chunks->create_unique_index("empty", {}); }, DocumentErrorCode::INVALID_FILTER);
}

TEST_F(MemoryStoreTest, CloseFailsLaterOperations) {
  EXPECT_NO_THROW(store->ping());
  EXPECT_FALSE(store->is_closed());

  store->close();
  EXPECT_TRUE(store->is_closed());
  EXPECT_NO_THROW(store->close());

  expect_code([&]() { store->ping(); }, DocumentErrorCode::CLOSED);
  expect_code([&]() { chunks->insert_one(chunk_record("a", 0)); }, DocumentErrorCode::CLOSED);
  expect_code([&]() { chunks->find_one(Document::object()); }, DocumentErrorCode::CLOSED);
  expect_code([&]() { store->collection("other"); }, DocumentErrorCode::CLOSED);
}

TEST_F(MemoryStoreTest, ConcurrentReaders) {
  for (int n = 0; n < 32; ++n) {
    chunks->insert_one(chunk_record("a", n, std::vector<uint8_t>(16, static_cast<uint8_t>(n))));
  }

  std::vector<std::thread> readers;
  std::vector<int> ok(32, 0);
  for (int n = 0; n < 32; ++n) {
    readers.emplace_back([this, n, &ok]() {
      auto found = chunks->find_one(Document{{"files_id", "a"}, {"n", n}});
      ok[n] = found && (*found)["data"].get_binary()[0] == static_cast<uint8_t>(n);
    });
  }
  for (auto& reader : readers) {
    reader.join();
  }
  for (int n = 0; n < 32; ++n) {
    EXPECT_TRUE(ok[n]) << "Reader " << n << " saw the wrong chunk";
  }
}

TEST(OpenDocumentStoreTest, EndpointSchemes) {
  auto memory = open_document_store("memory://", "test");
  ASSERT_NE(memory, nullptr);
  EXPECT_NE(std::dynamic_pointer_cast<MemoryDocumentStore>(memory), nullptr);

  auto sqlite = open_document_store("sqlite://:memory:", "test");
  ASSERT_NE(sqlite, nullptr);
  EXPECT_NO_THROW(sqlite->ping());
  sqlite->close();

  EXPECT_THROW(open_document_store("redis://localhost:6379", "test"), DocumentStoreError);
  EXPECT_THROW(open_document_store("sqlite://", "test"), DocumentStoreError);
  EXPECT_THROW(open_document_store("", "test"), DocumentStoreError);
}
