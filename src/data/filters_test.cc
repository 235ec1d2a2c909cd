// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/data/filters.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/lib/util/testing/test_with_files.h"
#include "src/metrics/testing/dataset_builder.h"

namespace ibmetrics::data {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using metrics::testing::DatasetBuilder;
using metrics::testing::Date;

namespace {

std::vector<UserInfo> Users() {
  return {
      {"Red Hat Internal", "5001", "1001"},
      {"Acme Corp", "5002", "1002"},
      {std::nullopt, "5003", "1003"},
      {"Internal Testing", "5004", "1004"},
  };
}

metrics::Dataset Builds() {
  return DatasetBuilder()
      .AddBuild("1001", Date(2022, 1, 1))
      .WithAccount("5001")
      .AddBuild("1002", Date(2022, 1, 2))
      .WithAccount("5002")
      .AddBuild("1003", Date(2022, 1, 3))
      .WithAccount("5003")
      .AddBuild("1004", Date(2022, 1, 4))
      .WithAccount("5004")
      .AddUndatedBuild("1002")
      .WithAccount("5002")
      .Build();
}

std::vector<std::string> OrgIds(const metrics::Dataset& dataset) {
  std::vector<std::string> ids;
  for (const auto& record : dataset) {
    ids.push_back(record.org_id);
  }
  return ids;
}

}  // namespace

TEST(FiltersTest, GetFilterIds) {
  std::set<std::string> ids;
  ASSERT_TRUE(GetFilterIds(Users(), {"red hat"}, &ids).ok());
  EXPECT_THAT(ids, ElementsAre("1001"));
}

// Patterns are anchored at the start of the name.
TEST(FiltersTest, GetFilterIdsMatchesPrefix) {
  std::set<std::string> ids;
  ASSERT_TRUE(GetFilterIds(Users(), {"internal"}, &ids).ok());
  EXPECT_THAT(ids, ElementsAre("1004"));

  ids.clear();
  ASSERT_TRUE(GetFilterIds(Users(), {".*internal"}, &ids).ok());
  EXPECT_THAT(ids, ElementsAre("1001", "1004"));
}

TEST(FiltersTest, GetFilterIdsMatchesMissingNames) {
  std::set<std::string> ids;
  ASSERT_TRUE(GetFilterIds(Users(), {"---"}, &ids).ok());
  EXPECT_THAT(ids, ElementsAre("1003"));
}

TEST(FiltersTest, GetFilterIdsSkipsEmptyPatterns) {
  std::set<std::string> ids;
  ASSERT_TRUE(GetFilterIds(Users(), {"", ""}, &ids).ok());
  EXPECT_THAT(ids, IsEmpty());
}

TEST(FiltersTest, GetFilterIdsRejectsInvalidPattern) {
  std::set<std::string> ids;
  EXPECT_EQ(util::INVALID_ARGUMENT, GetFilterIds(Users(), {"acme("}, &ids).error_code());
}

TEST(FiltersTest, FilterOrgs) {
  EXPECT_THAT(OrgIds(FilterOrgs(Builds(), {"1002", "1003"})), ElementsAre("1001", "1004"));
  EXPECT_THAT(OrgIds(FilterOrgs(Builds(), {})), ElementsAre("1001", "1002", "1003", "1004", "1002"));
}

TEST(FiltersTest, FilterUsers) {
  metrics::Dataset filtered;
  ASSERT_TRUE(FilterUsers(Builds(), Users(), {"acme", "internal"}, &filtered).ok());
  EXPECT_THAT(OrgIds(filtered), ElementsAre("1001", "1003"));

  ASSERT_TRUE(FilterUsers(Builds(), {}, {"acme"}, &filtered).ok());
  EXPECT_EQ(5u, filtered.size());
  ASSERT_TRUE(FilterUsers(Builds(), Users(), {}, &filtered).ok());
  EXPECT_EQ(5u, filtered.size());
}

TEST(FiltersTest, SliceTimeIsClosed) {
  metrics::Dataset sliced = SliceTime(Builds(), Date(2022, 1, 2), Date(2022, 1, 3));
  EXPECT_THAT(OrgIds(sliced), ElementsAre("1002", "1003"));
  EXPECT_THAT(SliceTime(Builds(), Date(2022, 2, 1), Date(2022, 3, 1)), IsEmpty());
}

class UserFilterFileTest : public util::testing::TestWithFiles {};

TEST_F(UserFilterFileTest, ReadUserFilter) {
  std::string path = WriteTestFile("filter.txt", "# test accounts\nRed Hat\n\n  Internal  \n");
  std::vector<std::string> patterns;
  ASSERT_TRUE(ReadUserFilter(path, &patterns).ok());
  EXPECT_THAT(patterns, ElementsAre("Red Hat", "Internal"));
}

}  // namespace ibmetrics::data
