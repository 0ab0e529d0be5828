/**
 * @file page_request_test.cpp
 * @brief Unit tests for PageRequest parameter construction
 */

#include <gtest/gtest.h>

#include "pagewise/page_request.hpp"

namespace pagewise {
namespace {

TEST(PageRequestTest, SkipCount) {
  PageRequest first("q", nullptr, 0, 25);
  EXPECT_EQ(first.skip_count(), 0u);

  PageRequest fourth("q", nullptr, 3, 25);
  EXPECT_EQ(fourth.skip_count(), 75u);
  EXPECT_EQ(fourth.page_index(), 3u);
  EXPECT_EQ(fourth.page_size(), 25u);
  EXPECT_EQ(fourth.query_id(), "q");
}

TEST(PageRequestTest, ParametersWithoutBase) {
  PageRequest request("q", nullptr, 2, 10);
  ParameterMap params = request.parameters();

  ASSERT_EQ(params.size(), 3u);
  EXPECT_EQ(params.at("_page"), Value(int64_t{2}));
  EXPECT_EQ(params.at("_pagesize"), Value(int64_t{10}));
  EXPECT_EQ(params.at("_skiprows"), Value(int64_t{20}));
}

TEST(PageRequestTest, BaseParametersCopied) {
  ParameterMap base{{"status", Value("active")}, {"limit_age", Value(30)}};
  PageRequest request("q", &base, 1, 2);

  ParameterMap params = request.parameters();
  ParameterMap expected{{"status", Value("active")},
                        {"limit_age", Value(30)},
                        {"_page", Value(int64_t{1})},
                        {"_pagesize", Value(int64_t{2})},
                        {"_skiprows", Value(int64_t{2})}};
  EXPECT_EQ(params, expected);

  // The base mapping is never touched
  EXPECT_EQ(base.size(), 2u);
  EXPECT_EQ(base.count("_page"), 0u);
}

TEST(PageRequestTest, ReservedKeysWin) {
  ParameterMap base{{"_page", Value("first")},
                    {"_pagesize", Value(int64_t{1000})},
                    {"_skiprows", Value(true)}};
  PageRequest request("q", &base, 4, 5);

  ParameterMap params = request.parameters();
  ASSERT_EQ(params.size(), 3u);
  EXPECT_EQ(params.at("_page"), Value(int64_t{4}));
  EXPECT_EQ(params.at("_pagesize"), Value(int64_t{5}));
  EXPECT_EQ(params.at("_skiprows"), Value(int64_t{20}));

  EXPECT_EQ(base.at("_page"), Value("first"));
}

TEST(PageRequestTest, ParametersAreIndependentCopies) {
  ParameterMap base{{"status", Value("active")}};
  PageRequest request("q", &base, 0, 2);

  ParameterMap first = request.parameters();
  first["status"] = Value("changed");

  ParameterMap second = request.parameters();
  EXPECT_EQ(second.at("status"), Value("active"));
}

TEST(PageRequestTest, ReservedNames) {
  EXPECT_EQ(kPageParameter, "_page");
  EXPECT_EQ(kPageSizeParameter, "_pagesize");
  EXPECT_EQ(kSkipRowsParameter, "_skiprows");

  EXPECT_TRUE(PageRequest::is_reserved("_page"));
  EXPECT_TRUE(PageRequest::is_reserved("_pagesize"));
  EXPECT_TRUE(PageRequest::is_reserved("_skiprows"));
  EXPECT_FALSE(PageRequest::is_reserved("page"));
  EXPECT_FALSE(PageRequest::is_reserved("status"));
}

}  // namespace
}  // namespace pagewise
