// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/config/metrics_config.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/lib/util/datetime_util.h"
#include "src/lib/util/testing/test_with_files.h"

namespace ibmetrics::config {

using ::testing::ElementsAre;

namespace {

constexpr char kCustomConfig[] = R"(
footprints {
  groups {
    footprint: "edge"
    image_types: "rhel-edge-commit"
    image_types: "rhel-edge-installer"
  }
  groups {
    footprint: "public"
    image_types: "aws"
    image_types: "gcp"
  }
  cloud_footprints: "public"
  cloud_footprint: "hyperscaler"
}
repeat_orgs {
  min_builds: 3
  period_days: 14
}
active_orgs {
  recent_limit_days: 60
}
monthly_window_days: 28
top_packages: 10
)";

}  // namespace

TEST(MetricsConfigTest, DefaultMetricsConfig) {
  MetricsConfig config = DefaultMetricsConfig();
  EXPECT_TRUE(ValidateMetricsConfig(config).ok());
  EXPECT_EQ(1, config.daily_window_days());
  EXPECT_EQ(30, config.monthly_window_days());
  EXPECT_EQ(7, config.period_days());
  EXPECT_EQ(20, config.top_packages());
  EXPECT_EQ(20, config.top_orgs());
  EXPECT_EQ(2, config.repeat_orgs().min_builds());
  EXPECT_EQ(7, config.repeat_orgs().period_days());
  EXPECT_EQ(2, config.active_orgs().min_days());
  EXPECT_EQ(30, config.active_orgs().recent_limit_days());
  EXPECT_EQ(0, config.footprints().groups_size());
  EXPECT_THAT(config.footprints().cloud_footprints(), ElementsAre("aws", "azure", "gcp"));
  EXPECT_EQ("cloud", config.footprints().cloud_footprint());
}

TEST(MetricsConfigTest, ParseMetricsConfig) {
  MetricsConfig config;
  ASSERT_TRUE(ParseMetricsConfig(kCustomConfig, &config).ok());
  EXPECT_EQ(28, config.monthly_window_days());
  EXPECT_EQ(10, config.top_packages());
  EXPECT_EQ(20, config.top_orgs());
  EXPECT_EQ(3, config.repeat_orgs().min_builds());
  EXPECT_EQ(2, config.active_orgs().min_days());
  EXPECT_EQ(60, config.active_orgs().recent_limit_days());
  EXPECT_EQ(2, config.footprints().groups_size());
  EXPECT_THAT(config.footprints().cloud_footprints(), ElementsAre("public"));
}

TEST(MetricsConfigTest, ParseEmptyConfigUsesDefaults) {
  MetricsConfig config;
  ASSERT_TRUE(ParseMetricsConfig("", &config).ok());
  EXPECT_EQ(DefaultMetricsConfig().SerializeAsString(), config.SerializeAsString());
}

TEST(MetricsConfigTest, ParseMetricsConfigErrors) {
  MetricsConfig config;
  EXPECT_EQ(util::INVALID_ARGUMENT, ParseMetricsConfig("unknown_field: 3", &config).error_code());
  EXPECT_EQ(util::INVALID_ARGUMENT, ParseMetricsConfig("period_days: 0", &config).error_code());
  EXPECT_EQ(util::INVALID_ARGUMENT,
            ParseMetricsConfig("repeat_orgs { min_builds: 1 }", &config).error_code());
  EXPECT_EQ(util::INVALID_ARGUMENT,
            ParseMetricsConfig("active_orgs { recent_limit_days: -1 }", &config).error_code());
  EXPECT_EQ(util::INVALID_ARGUMENT,
            ParseMetricsConfig("daily_window_days: 40", &config).error_code());
  EXPECT_EQ(util::INVALID_ARGUMENT,
            ParseMetricsConfig("footprints { groups { image_types: \"aws\" } }", &config)
                .error_code());
}

TEST(MetricsConfigTest, BuildDefaultFootprintMap) {
  MetricsConfig config = DefaultMetricsConfig();
  metrics::FootprintMap split;
  ASSERT_TRUE(BuildFootprintMap(config.footprints(), true, &split).ok());
  EXPECT_EQ("azure", split.Map("vhd"));
  EXPECT_EQ("aws", split.Map("aws"));
  EXPECT_EQ("edge", split.Map("rhel-edge-commit"));

  metrics::FootprintMap collapsed;
  ASSERT_TRUE(BuildFootprintMap(config.footprints(), false, &collapsed).ok());
  EXPECT_EQ("cloud", collapsed.Map("vhd"));
  EXPECT_EQ("cloud", collapsed.Map("aws"));
  EXPECT_EQ("private-cloud", collapsed.Map("vsphere"));
}

TEST(MetricsConfigTest, BuildCustomFootprintMap) {
  MetricsConfig config;
  ASSERT_TRUE(ParseMetricsConfig(kCustomConfig, &config).ok());
  metrics::FootprintMap footprint_map;
  ASSERT_TRUE(BuildFootprintMap(config.footprints(), false, &footprint_map).ok());
  EXPECT_EQ("hyperscaler", footprint_map.Map("aws"));
  EXPECT_EQ("edge", footprint_map.Map("rhel-edge-installer"));
  EXPECT_EQ("vsphere", footprint_map.Map("vsphere"));
}

TEST(MetricsConfigTest, BuildFootprintMapRejectsConflicts) {
  MetricsConfig config;
  ASSERT_TRUE(ParseMetricsConfig(R"(
    footprints {
      groups { footprint: "a" image_types: "x" }
      groups { footprint: "b" image_types: "x" }
    })",
                                 &config)
                  .ok());
  metrics::FootprintMap footprint_map;
  EXPECT_EQ(util::INVALID_ARGUMENT,
            BuildFootprintMap(config.footprints(), true, &footprint_map).error_code());

  ASSERT_TRUE(ParseMetricsConfig(R"(
    footprints {
      groups { footprint: "a" image_types: "x" }
      groups { footprint: "b" image_types: "a" }
    })",
                                 &config)
                  .ok());
  EXPECT_EQ(util::INVALID_ARGUMENT,
            BuildFootprintMap(config.footprints(), true, &footprint_map).error_code());
}

TEST(MetricsConfigTest, Policies) {
  MetricsConfig config;
  ASSERT_TRUE(ParseMetricsConfig(kCustomConfig, &config).ok());
  metrics::RepeatOrgPolicy repeat = ToRepeatOrgPolicy(config.repeat_orgs());
  EXPECT_EQ(3, repeat.min_builds);
  EXPECT_EQ(util::Days(14), repeat.period);
  metrics::ActiveOrgPolicy active = ToActiveOrgPolicy(config.active_orgs());
  EXPECT_EQ(2, active.min_days);
  EXPECT_EQ(60, active.recent_limit_days);
}

class MetricsConfigFileTest : public util::testing::TestWithFiles {};

TEST_F(MetricsConfigFileTest, LoadMetricsConfig) {
  MetricsConfig config;
  ASSERT_TRUE(LoadMetricsConfig(WriteTestFile("config.txt", kCustomConfig), &config).ok());
  EXPECT_EQ(28, config.monthly_window_days());

  EXPECT_EQ(util::NOT_FOUND, LoadMetricsConfig(TestFile("missing.txt"), &config).error_code());
  EXPECT_EQ(util::INVALID_ARGUMENT,
            LoadMetricsConfig(WriteTestFile("bad.txt", "top_orgs: -2"), &config).error_code());
}

}  // namespace ibmetrics::config
