/**
 * @file page_buffer_test.cpp
 * @brief Unit tests for PageBuffer
 */

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "pagewise/page_buffer.hpp"
#include "test_utils.hpp"

namespace pagewise {
namespace {

using test::make_rows;

TEST(PageBufferTest, InitiallyEmpty) {
  PageBuffer buffer;
  EXPECT_EQ(buffer.size(), 0u);
  EXPECT_EQ(buffer.remaining(), 0u);
  EXPECT_TRUE(buffer.exhausted());
  EXPECT_FALSE(buffer.next().has_value());
}

TEST(PageBufferTest, DrainInOrder) {
  PageBuffer buffer;
  buffer.replace(make_rows({"A", "B", "C"}));

  EXPECT_EQ(buffer.size(), 3u);
  EXPECT_EQ((*buffer.next())["name"].as_string(), "A");
  EXPECT_EQ((*buffer.next())["name"].as_string(), "B");
  EXPECT_EQ(buffer.position(), 2u);
  EXPECT_EQ(buffer.remaining(), 1u);
  EXPECT_EQ((*buffer.next())["name"].as_string(), "C");
  EXPECT_TRUE(buffer.exhausted());
  EXPECT_FALSE(buffer.next().has_value());
}

TEST(PageBufferTest, ReplaceDiscardsPreviousPage) {
  PageBuffer buffer;
  buffer.replace(make_rows({"A", "B"}));
  ASSERT_TRUE(buffer.next().has_value());

  buffer.replace(make_rows({"C"}));
  EXPECT_EQ(buffer.size(), 1u);
  EXPECT_EQ(buffer.position(), 0u);
  EXPECT_EQ((*buffer.next())["name"].as_string(), "C");
  EXPECT_FALSE(buffer.next().has_value());
}

TEST(PageBufferTest, Clear) {
  PageBuffer buffer;
  buffer.replace(make_rows({"A", "B"}));
  buffer.clear();

  EXPECT_EQ(buffer.size(), 0u);
  EXPECT_EQ(buffer.position(), 0u);
  EXPECT_TRUE(buffer.snapshot().empty());
}

TEST(PageBufferTest, SnapshotKeepsReadRows) {
  PageBuffer buffer;
  buffer.replace(make_rows({"A", "B"}));
  ASSERT_TRUE(buffer.next().has_value());

  auto snapshot = buffer.snapshot();
  ASSERT_EQ(snapshot.size(), 2u);
  EXPECT_EQ(snapshot[0]["name"].as_string(), "A");
}

TEST(PageBufferTest, ConcurrentObserver) {
  PageBuffer buffer;
  std::atomic<bool> done{false};

  // Every page holds rows of one letter, so a consistent snapshot never mixes
  std::thread observer([&] {
    while (!done.load()) {
      auto snapshot = buffer.snapshot();
      if (snapshot.empty()) {
        continue;
      }
      const std::string first = snapshot.front()["name"].as_string();
      for (const auto& row : snapshot) {
        ASSERT_EQ(row["name"].as_string(), first);
      }
      ASSERT_LE(buffer.position(), 4u);
    }
  });

  size_t read = 0;
  for (int page = 0; page < 500; ++page) {
    const std::string name(1, static_cast<char>('a' + page % 26));
    buffer.replace(make_rows({name, name, name, name}));
    while (buffer.next().has_value()) {
      ++read;
    }
  }
  done.store(true);
  observer.join();

  EXPECT_EQ(read, 2000u);
}

}  // namespace
}  // namespace pagewise
