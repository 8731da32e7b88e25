#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include "store/object_id.hpp"

using namespace chunkstore::store;

TEST(ObjectIdTest, GeneratedIdIsTwentyFourLowercaseHex) {
  const std::string hex = ObjectId::generate().to_hex();
  ASSERT_EQ(hex.size(), ObjectId::HEX_SIZE);
  EXPECT_TRUE(std::all_of(hex.begin(), hex.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  })) << hex;
}

TEST(ObjectIdTest, HexRoundTrip) {
  const ObjectId id = ObjectId::generate();
  EXPECT_EQ(ObjectId::from_hex(id.to_hex()), id);
}

TEST(ObjectIdTest, AcceptsUppercaseHex) {
  const ObjectId lower = ObjectId::from_hex("0123456789abcdef01234567");
  const ObjectId upper = ObjectId::from_hex("0123456789ABCDEF01234567");
  EXPECT_EQ(lower, upper);
  EXPECT_EQ(upper.to_hex(), "0123456789abcdef01234567");
}

TEST(ObjectIdTest, RejectsMalformedIds) {
  EXPECT_THROW(ObjectId::from_hex(""), InvalidIdError);
  EXPECT_THROW(ObjectId::from_hex("abc"), InvalidIdError);
  EXPECT_THROW(ObjectId::from_hex("0123456789abcdef0123456"), InvalidIdError);
  EXPECT_THROW(ObjectId::from_hex("0123456789abcdef012345678"), InvalidIdError);
  EXPECT_THROW(ObjectId::from_hex("0123456789abcdef0123456g"), InvalidIdError);
  EXPECT_THROW(ObjectId::from_hex("not-a-valid-object-id!!!"), InvalidIdError);

  try {
    ObjectId::from_hex("xyz");
    FAIL() << "Expected InvalidIdError";
  } catch (const StoreError& e) {
    EXPECT_EQ(e.code(), ErrorCode::INVALID_ID);
  }
}

TEST(ObjectIdTest, TimestampIsCreationSecond) {
  const auto before = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  const ObjectId id = ObjectId::generate();
  const auto after = std::chrono::duration_cast<std::chrono::seconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();

  EXPECT_GE(static_cast<long long>(id.timestamp()), static_cast<long long>(before));
  EXPECT_LE(static_cast<long long>(id.timestamp()), static_cast<long long>(after));
}

TEST(ObjectIdTest, UniqueAcrossThreads) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 1000;

  std::set<std::string> ids;
  std::mutex mutex;
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      std::vector<std::string> local;
      for (int i = 0; i < kPerThread; ++i) {
        local.push_back(ObjectId::generate().to_hex());
      }
      std::lock_guard<std::mutex> lock(mutex);
      ids.insert(local.begin(), local.end());
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(ids.size(), static_cast<std::size_t>(kThreads * kPerThread));
}
