/**
 * @file restart_test.cpp
 * @brief Tests for checkpointing and restarting a PagingItemReader
 */

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "pagewise/execution_context.hpp"
#include "pagewise/paging_item_reader.hpp"
#include "test_utils.hpp"

namespace pagewise {
namespace {

using test::FakeQueryExecutor;
using test::make_rows;

std::vector<std::vector<Row>> five_items() {
  return {make_rows({"A", "B"}), make_rows({"C", "D"}), make_rows({"E"})};
}

class RestartTest : public ::testing::Test {
protected:
  std::unique_ptr<PagingItemReader>
  make_reader(std::shared_ptr<FakeQueryExecutor> executor,
              bool save_state = true) {
    auto reader = std::make_unique<PagingItemReader>();
    EXPECT_TRUE(reader->set_name("users").ok());
    EXPECT_TRUE(reader->set_query_id("select_users").ok());
    EXPECT_TRUE(reader->set_query_executor(std::move(executor)).ok());
    EXPECT_TRUE(reader->set_page_size(2).ok());
    EXPECT_TRUE(reader->set_save_state(save_state).ok());
    EXPECT_TRUE(reader->initialize().ok());
    return reader;
  }

  static std::string read_name(PagingItemReader &reader) {
    std::optional<Row> row;
    Status status = reader.read_next(&row);
    EXPECT_TRUE(status.ok()) << status.to_string();
    return row.has_value() ? (*row)["name"].as_string() : "<end>";
  }
};

TEST_F(RestartTest, OpenRequiresInitialize) {
  PagingItemReader reader;
  ExecutionContext context;

  EXPECT_TRUE(reader.open(context).is_illegal_state());
}

TEST_F(RestartTest, OpenTwiceFails) {
  auto reader = make_reader(std::make_shared<FakeQueryExecutor>(five_items()));
  ExecutionContext context;

  ASSERT_TRUE(reader->open(context).ok());
  EXPECT_TRUE(reader->is_open());
  EXPECT_TRUE(reader->open(context).is_illegal_state());

  reader->close();
  EXPECT_TRUE(reader->open(context).ok());
}

TEST_F(RestartTest, OpenAfterReadingWithoutOpen) {
  auto executor = std::make_shared<FakeQueryExecutor>(
      std::vector<std::vector<Row>>{make_rows({"A", "B"}), make_rows({"A", "B"}),
                                    make_rows({"C"})});
  auto reader = make_reader(executor);

  EXPECT_EQ(read_name(*reader), "A");
  EXPECT_FALSE(reader->is_open());

  ExecutionContext context;
  context.put_int64("users.read.count", 1);
  ASSERT_TRUE(reader->open(context).ok());
  EXPECT_TRUE(reader->is_open());

  // Open starts over from page 0 and skips the checkpointed item
  EXPECT_EQ(reader->current_item_count(), 1u);
  EXPECT_EQ(read_name(*reader), "B");
  EXPECT_EQ(executor->calls().back().parameters.at("_page").as_int64(), 0);
}

TEST_F(RestartTest, UpdateWritesReadCount) {
  auto reader = make_reader(std::make_shared<FakeQueryExecutor>(five_items()));
  ExecutionContext context;
  ASSERT_TRUE(reader->open(context).ok());

  EXPECT_EQ(read_name(*reader), "A");
  EXPECT_EQ(read_name(*reader), "B");
  EXPECT_EQ(read_name(*reader), "C");

  ASSERT_TRUE(reader->update(&context).ok());
  EXPECT_EQ(context.get_int64("users.read.count"), 3);
  EXPECT_FALSE(context.contains("users.read.count.max"));
  EXPECT_TRUE(context.is_dirty());
}

TEST_F(RestartTest, UpdateRejectsNullContext) {
  auto reader = make_reader(std::make_shared<FakeQueryExecutor>());

  EXPECT_EQ(reader->update(nullptr).code(), StatusCode::kInvalidArgument);
}

TEST_F(RestartTest, RestartSkipsConsumedItemsFromFirstPage) {
  ExecutionContext context;
  context.put_int64("users.read.count", 3);

  auto executor = std::make_shared<FakeQueryExecutor>(five_items());
  auto reader = make_reader(executor);
  ASSERT_TRUE(reader->open(context).ok());

  EXPECT_EQ(reader->current_item_count(), 3u);
  EXPECT_EQ(read_name(*reader), "D");
  EXPECT_EQ(read_name(*reader), "E");
  EXPECT_EQ(read_name(*reader), "<end>");

  // Restart re-reads from page 0 since seeking is unsupported
  ASSERT_GE(executor->calls().size(), 2u);
  EXPECT_EQ(executor->calls()[0].parameters.at("_page").as_int64(), 0);
  EXPECT_EQ(executor->calls()[1].parameters.at("_page").as_int64(), 1);
}

TEST_F(RestartTest, RestartIgnoredWithoutSaveState) {
  ExecutionContext context;
  context.put_int64("users.read.count", 3);

  auto reader = make_reader(std::make_shared<FakeQueryExecutor>(five_items()),
                            /*save_state=*/false);
  ASSERT_TRUE(reader->open(context).ok());

  EXPECT_EQ(reader->current_item_count(), 0u);
  EXPECT_EQ(read_name(*reader), "A");

  ExecutionContext out;
  ASSERT_TRUE(reader->update(&out).ok());
  EXPECT_TRUE(out.empty());
}

TEST_F(RestartTest, RestartPastEndOfData) {
  ExecutionContext context;
  context.put_int64("users.read.count", 9);

  auto reader = make_reader(std::make_shared<FakeQueryExecutor>(five_items()));
  ASSERT_TRUE(reader->open(context).ok());

  EXPECT_EQ(reader->current_item_count(), 5u);
  EXPECT_TRUE(reader->is_exhausted());
  EXPECT_EQ(read_name(*reader), "<end>");
}

TEST_F(RestartTest, RestartFailurePropagates) {
  ExecutionContext context;
  context.put_int64("users.read.count", 3);

  auto executor = std::make_shared<FakeQueryExecutor>(five_items());
  executor->fail_next(Status::Execution("database unavailable"));
  auto reader = make_reader(executor);

  Status status = reader->open(context);
  EXPECT_TRUE(status.is_execution_error());
  EXPECT_EQ(status.message(), "database unavailable");
  EXPECT_FALSE(reader->is_open());
  EXPECT_EQ(reader->page(), 0u);

  // Opening again retries from the start
  ASSERT_TRUE(reader->open(context).ok());
  EXPECT_EQ(read_name(*reader), "D");
}

TEST_F(RestartTest, RestoredCountAboveMaxFails) {
  ExecutionContext context;
  context.put_int64("users.read.count", 4);
  context.put_int64("users.read.count.max", 2);

  auto reader = make_reader(std::make_shared<FakeQueryExecutor>(five_items()));
  EXPECT_TRUE(reader->open(context).is_illegal_state());
  EXPECT_FALSE(reader->is_open());
}

TEST_F(RestartTest, NegativeReadCountRejected) {
  ExecutionContext context;
  context.put_int64("users.read.count", -1);

  auto reader = make_reader(std::make_shared<FakeQueryExecutor>(five_items()));
  EXPECT_EQ(reader->open(context).code(), StatusCode::kInvalidArgument);
}

TEST_F(RestartTest, MaxItemCountRoundTripsThroughContext) {
  auto executor = std::make_shared<FakeQueryExecutor>(five_items());
  auto reader = std::make_unique<PagingItemReader>();
  ASSERT_TRUE(reader->set_name("users").ok());
  ASSERT_TRUE(reader->set_query_id("q").ok());
  ASSERT_TRUE(reader->set_query_executor(executor).ok());
  ASSERT_TRUE(reader->set_page_size(2).ok());
  ASSERT_TRUE(reader->set_max_item_count(4).ok());
  ASSERT_TRUE(reader->initialize().ok());

  ExecutionContext context;
  ASSERT_TRUE(reader->open(context).ok());
  EXPECT_EQ(read_name(*reader), "A");
  ASSERT_TRUE(reader->update(&context).ok());

  EXPECT_EQ(context.get_int64("users.read.count"), 1);
  EXPECT_EQ(context.get_int64("users.read.count.max"), 4);
}

TEST_F(RestartTest, CheckpointAfterEveryItemResumesExactly) {
  std::vector<std::string> all;
  ExecutionContext context;

  // Read one item per run, checkpointing in between
  for (int run = 0; run < 7; ++run) {
    auto reader = make_reader(std::make_shared<FakeQueryExecutor>(five_items()));
    ASSERT_TRUE(reader->open(context).ok());
    const std::string name = read_name(*reader);
    if (name != "<end>") {
      all.push_back(name);
    }
    ASSERT_TRUE(reader->update(&context).ok());
    reader->close();
  }

  EXPECT_EQ(all, (std::vector<std::string>{"A", "B", "C", "D", "E"}));
  EXPECT_EQ(context.get_int64("users.read.count"), 5);
}

}  // namespace
}  // namespace pagewise
