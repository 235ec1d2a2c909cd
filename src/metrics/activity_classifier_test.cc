// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/metrics/activity_classifier.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/lib/util/datetime_util.h"
#include "src/metrics/testing/dataset_builder.h"

namespace ibmetrics::metrics {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using testing::DatasetBuilder;
using testing::Date;
using util::Days;

namespace {

RepeatOrgPolicy Repeat(int min_builds, int period_days) {
  RepeatOrgPolicy policy;
  policy.min_builds = min_builds;
  policy.period = Days(period_days);
  return policy;
}

ActiveOrgPolicy Active(int min_days, int recent_limit_days) {
  ActiveOrgPolicy policy;
  policy.min_days = min_days;
  policy.recent_limit_days = recent_limit_days;
  return policy;
}

}  // namespace

TEST(ActivityClassifierTest, GetOrgTimelinesAreSorted) {
  Dataset dataset = DatasetBuilder()
                        .AddBuild("a", Date(2022, 1, 3))
                        .AddBuild("a", Date(2022, 1, 1))
                        .AddUndatedBuild("a")
                        .AddBuild("b", Date(2022, 1, 2))
                        .Build();
  OrgTimelines timelines;
  ASSERT_EQ(kOK, GetOrgTimelines(dataset, &timelines));
  ASSERT_EQ(2u, timelines.size());
  EXPECT_THAT(timelines["a"], ElementsAre(Date(2022, 1, 1), Date(2022, 1, 3)));
  EXPECT_THAT(timelines["b"], ElementsAre(Date(2022, 1, 2)));
}

TEST(ActivityClassifierTest, HasBuildBurst) {
  std::vector<Timestamp> timeline = {Date(2022, 1, 1), Date(2022, 1, 10), Date(2022, 1, 12),
                                     Date(2022, 1, 13)};
  EXPECT_TRUE(HasBuildBurst(timeline, 2, Days(3)));
  EXPECT_FALSE(HasBuildBurst(timeline, 2, Days(1)));
  EXPECT_TRUE(HasBuildBurst(timeline, 3, Days(4)));
  EXPECT_FALSE(HasBuildBurst(timeline, 3, Days(3)));
  EXPECT_TRUE(HasBuildBurst(timeline, 4, Days(13)));
  EXPECT_FALSE(HasBuildBurst(timeline, 5, Days(365)));
}

TEST(ActivityClassifierTest, RepeatOrgs) {
  Dataset dataset = DatasetBuilder()
                        .AddBuild("daily", Date(2022, 1, 1))
                        .AddBuild("daily", Date(2022, 1, 2))
                        .AddBuild("daily", Date(2022, 1, 3))
                        .AddBuild("sparse", Date(2022, 1, 1))
                        .AddBuild("sparse", Date(2022, 1, 20))
                        .AddBuild("once", Date(2022, 1, 5))
                        .Build();
  std::set<std::string> orgs;
  ASSERT_EQ(kOK, RepeatOrgs(dataset, Repeat(2, 2), &orgs));
  EXPECT_THAT(orgs, ElementsAre("daily"));
}

// The builds must span strictly less than the period.
TEST(ActivityClassifierTest, RepeatOrgsPeriodIsExclusive) {
  Dataset dataset = DatasetBuilder()
                        .AddBuild("a", Date(2022, 1, 1))
                        .AddBuild("a", Date(2022, 1, 2))
                        .AddBuild("a", Date(2022, 1, 3))
                        .Build();
  std::set<std::string> orgs;
  ASSERT_EQ(kOK, RepeatOrgs(dataset, Repeat(3, 2), &orgs));
  EXPECT_THAT(orgs, IsEmpty());
  ASSERT_EQ(kOK, RepeatOrgs(dataset, Repeat(3, 3), &orgs));
  EXPECT_THAT(orgs, ElementsAre("a"));
}

// An org with fewer than min_builds builds is never a repeat org, however close the builds are.
TEST(ActivityClassifierTest, RepeatOrgsNeedsMinBuilds) {
  Dataset dataset = DatasetBuilder().AddBuilds("a", Date(2022, 1, 1), 2).Build();
  std::set<std::string> orgs;
  ASSERT_EQ(kOK, RepeatOrgs(dataset, Repeat(3, 30), &orgs));
  EXPECT_THAT(orgs, IsEmpty());
  ASSERT_EQ(kOK, RepeatOrgs(dataset, Repeat(2, 30), &orgs));
  EXPECT_THAT(orgs, ElementsAre("a"));
}

TEST(ActivityClassifierTest, RepeatOrgsRejectsInvalidPolicy) {
  Dataset dataset = DatasetBuilder().AddBuilds("a", Date(2022, 1, 1), 2).Build();
  std::set<std::string> orgs;
  EXPECT_EQ(kInvalidWindowSpec, RepeatOrgs(dataset, Repeat(1, 7), &orgs));
  EXPECT_EQ(kInvalidWindowSpec, RepeatOrgs(dataset, Repeat(0, 7), &orgs));
  EXPECT_EQ(kInvalidWindowSpec, RepeatOrgs(dataset, Repeat(2, 0), &orgs));
  EXPECT_EQ(kEmptyDataset, RepeatOrgs(Dataset(), Repeat(2, 7), &orgs));
}

TEST(ActivityClassifierTest, OrgBuildDays) {
  Dataset dataset = DatasetBuilder()
                        .AddBuild("a", Date(2022, 1, 1, 8))
                        .AddBuild("a", Date(2022, 1, 1, 20))
                        .AddBuild("a", Date(2022, 1, 4, 3))
                        .Build();
  OrgTimelines days;
  ASSERT_EQ(kOK, OrgBuildDays(dataset, &days));
  EXPECT_THAT(days["a"], ElementsAre(Date(2022, 1, 1), Date(2022, 1, 4)));
}

TEST(ActivityClassifierTest, ActiveOrgs) {
  const Timestamp kNow = Date(2022, 3, 31);
  Dataset dataset = DatasetBuilder()
                        .AddBuild("recent", Date(2022, 3, 1))
                        .AddBuild("recent", Date(2022, 3, 20))
                        .AddBuild("one-day", Date(2022, 3, 25, 1))
                        .AddBuild("one-day", Date(2022, 3, 25, 22))
                        .AddBuild("stale", Date(2022, 1, 1))
                        .AddBuild("stale", Date(2022, 1, 5))
                        .AddBuild("just-in", Date(2022, 2, 27))
                        .AddBuild("just-in", Date(2022, 3, 2, 10))
                        .AddBuild("on-cutoff", Date(2022, 2, 20))
                        .AddBuild("on-cutoff", Date(2022, 3, 1, 15))
                        .Build();
  std::set<std::string> orgs;
  ASSERT_EQ(kOK, ActiveOrgs(dataset, Active(2, 30), kNow, &orgs));
  EXPECT_THAT(orgs, ElementsAre("just-in", "recent"));

  ASSERT_EQ(kOK, ActiveOrgs(dataset, Active(1, 30), kNow, &orgs));
  EXPECT_THAT(orgs, ElementsAre("just-in", "one-day", "recent"));
}

// The result depends only on the reference time passed in.
TEST(ActivityClassifierTest, ActiveOrgsDependsOnReferenceTime) {
  Dataset dataset = DatasetBuilder()
                        .AddBuild("a", Date(2022, 1, 1))
                        .AddBuild("a", Date(2022, 1, 5))
                        .Build();
  std::set<std::string> orgs;
  ASSERT_EQ(kOK, ActiveOrgs(dataset, Active(2, 30), Date(2022, 1, 20), &orgs));
  EXPECT_THAT(orgs, ElementsAre("a"));
  ASSERT_EQ(kOK, ActiveOrgs(dataset, Active(2, 30), Date(2022, 6, 1), &orgs));
  EXPECT_THAT(orgs, IsEmpty());
}

TEST(ActivityClassifierTest, ActiveOrgsRejectsInvalidPolicy) {
  Dataset dataset = DatasetBuilder().AddBuilds("a", Date(2022, 1, 1), 2).Build();
  std::set<std::string> orgs;
  EXPECT_EQ(kInvalidWindowSpec, ActiveOrgs(dataset, Active(0, 30), Date(2022, 1, 2), &orgs));
  EXPECT_EQ(kInvalidWindowSpec, ActiveOrgs(dataset, Active(2, -1), Date(2022, 1, 2), &orgs));
  EXPECT_EQ(kEmptyDataset, ActiveOrgs(Dataset(), Active(2, 30), Date(2022, 1, 2), &orgs));
}

}  // namespace ibmetrics::metrics
