// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/bin/report/report_app.h"

#include <google/protobuf/text_format.h>

#include <sstream>

#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "src/config/metrics_config.h"
#include "src/lib/util/datetime_util.h"
#include "src/lib/util/file_util.h"
#include "src/lib/util/testing/test_with_files.h"
#include "src/metrics/testing/dataset_builder.h"

namespace ibmetrics {

using ::testing::ElementsAre;
using ::testing::Each;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;
using metrics::testing::DatasetBuilder;
using metrics::testing::Date;

namespace {

const char* const kImageTypes[] = {"aws", "vhd", "vsphere", "rhel-edge-commit"};

constexpr int kNumDays = 60;

// One build per day from Monday 2022-01-03 to 2022-03-03, rotating over four orgs that each use a
// single image type.
metrics::Dataset DailyDataset() {
  DatasetBuilder builder;
  for (int day = 0; day < kNumDays; day++) {
    builder.AddBuild(absl::StrCat("org-", day % 4), Date(2022, 1, 3) + util::Days(day),
                     kImageTypes[day % 4]);
    if (day % 2 == 0) {
      builder.WithPackages({"vim"});
    }
  }
  return builder.Build();
}

std::string DailyDump() {
  std::string dump =
      " org_id |     created_at      | job_id | image_type | packages | account_number\n"
      "--------+---------------------+--------+------------+----------+---------------\n";
  for (int day = 0; day < kNumDays; day++) {
    absl::StrAppend(&dump, " org-", day % 4, " | ",
                    util::FormatDate(Date(2022, 1, 3) + util::Days(day)), " 12:00:00 | job-", day,
                    " | ", kImageTypes[day % 4], " | [\"vim\"] | acct-", day % 4, "\n");
  }
  absl::StrAppend(&dump, "(", kNumDays, " rows)\n");
  return dump;
}

const TimeSeries* FindSeries(const MetricsReport& report, const std::string& name) {
  for (const auto& series : report.series()) {
    if (series.name() == name) {
      return &series;
    }
  }
  return nullptr;
}

std::vector<std::string> TableNames(const google::protobuf::RepeatedPtrField<RankedCount>& table) {
  std::vector<std::string> names;
  for (const auto& entry : table) {
    names.push_back(entry.name());
  }
  return names;
}

}  // namespace

class ReportAppTest : public util::testing::TestWithFiles {
 protected:
  void SetUp() override {
    TestWithFiles::SetUp();
    auto clock = std::make_unique<util::FakeSystemClock>(Date(2022, 3, 10));
    app_ = std::make_unique<ReportApp>(config::DefaultMetricsConfig(), std::move(clock), &out_);
  }

  std::ostringstream out_;
  std::unique_ptr<ReportApp> app_;
};

TEST_F(ReportAppTest, BuildReportSummary) {
  metrics::Dataset dataset = DailyDataset();
  MetricsReport report;
  ASSERT_TRUE(app_->BuildReport(dataset, {}, Date(2022, 1, 3), Date(2022, 3, 3),
                                Date(2022, 3, 10), false, &report)
                  .ok());

  EXPECT_EQ(kNumDays, report.summary().num_builds());
  EXPECT_EQ(4, report.summary().num_users());
  EXPECT_EQ(kNumDays / 2, report.summary().num_builds_with_packages());
  EXPECT_EQ(0, report.summary().num_builds_with_fs_customizations());

  EXPECT_THAT(TableNames(report.image_types()),
              UnorderedElementsAre("aws", "vhd", "vsphere", "rhel-edge-commit"));
  ASSERT_EQ(1, report.top_packages_size());
  EXPECT_EQ("vim", report.top_packages(0).name());
  EXPECT_EQ(kNumDays / 2, report.top_packages(0).count());

  // Without user info, the biggest orgs are named by their account numbers.
  EXPECT_THAT(TableNames(report.top_orgs()),
              UnorderedElementsAre("acct-org-0", "acct-org-1", "acct-org-2", "acct-org-3"));
}

TEST_F(ReportAppTest, BuildReportSeries) {
  MetricsReport report;
  ASSERT_TRUE(app_->BuildReport(DailyDataset(), {}, Date(2022, 1, 3), Date(2022, 3, 3),
                                Date(2022, 3, 10), false, &report)
                  .ok());

  for (const char* name :
       {"monthly_builds", "monthly_users", "monthly_new_users", "monthly_returning_users",
        "monthly_users_cumulative_average", "period_builds", "period_builds_trendline",
        "period_users", "period_new_users", "period_returning_users", "users_sliding_window",
        "dau_over_mau", "footprint_monthly_users/cloud", "footprint_monthly_builds/edge"}) {
    EXPECT_NE(nullptr, FindSeries(report, name)) << name;
  }
  EXPECT_EQ(nullptr, FindSeries(report, "footprint_monthly_users/aws"));

  const TimeSeries* monthly_builds = FindSeries(report, "monthly_builds");
  ASSERT_NE(nullptr, monthly_builds);
  EXPECT_THAT(monthly_builds->values(), ElementsAre(29.0, 28.0, 3.0));
  EXPECT_EQ(monthly_builds->timestamps_size(), monthly_builds->values_size());

  // Every full week holds seven builds.
  const TimeSeries* period_builds = FindSeries(report, "period_builds");
  ASSERT_NE(nullptr, period_builds);
  EXPECT_THAT(period_builds->values(), Not(IsEmpty()));
  EXPECT_THAT(period_builds->values(), Each(7.0));
}

TEST_F(ReportAppTest, BuildReportFootprintsAndOrgs) {
  MetricsReport report;
  ASSERT_TRUE(app_->BuildReport(DailyDataset(), {}, Date(2022, 1, 3), Date(2022, 3, 3),
                                Date(2022, 3, 10), false, &report)
                  .ok());

  EXPECT_THAT(TableNames(report.footprints()), ElementsAre("cloud", "edge", "private-cloud"));
  EXPECT_EQ(kNumDays / 2, report.footprints(0).count());
  EXPECT_THAT(report.single_footprint_orgs(),
              UnorderedElementsAre(Pair("org-0", "cloud"), Pair("org-1", "cloud"),
                                   Pair("org-2", "private-cloud"), Pair("org-3", "edge")));

  EXPECT_THAT(report.repeat_orgs(), ElementsAre("org-0", "org-1", "org-2", "org-3"));
  EXPECT_THAT(report.active_orgs(), ElementsAre("org-0", "org-1", "org-2", "org-3"));

  // A year later nobody is active.
  ASSERT_TRUE(app_->BuildReport(DailyDataset(), {}, Date(2022, 1, 3), Date(2022, 3, 3),
                                Date(2023, 3, 10), false, &report)
                  .ok());
  EXPECT_THAT(report.active_orgs(), IsEmpty());
}

TEST_F(ReportAppTest, BuildReportSplitCloud) {
  MetricsReport report;
  ASSERT_TRUE(app_->BuildReport(DailyDataset(), {}, Date(2022, 1, 3), Date(2022, 3, 3),
                                Date(2022, 3, 10), true, &report)
                  .ok());
  EXPECT_THAT(TableNames(report.footprints()),
              UnorderedElementsAre("aws", "azure", "edge", "private-cloud"));
  EXPECT_NE(nullptr, FindSeries(report, "footprint_monthly_users/aws"));
  EXPECT_EQ(nullptr, FindSeries(report, "footprint_monthly_users/cloud"));
}

TEST_F(ReportAppTest, BuildReportOmitsDauOverMauAcrossGaps) {
  metrics::Dataset dataset = DatasetBuilder()
                                 .AddBuild("org-0", Date(2022, 1, 3))
                                 .AddBuild("org-0", Date(2022, 1, 4))
                                 .AddBuild("org-1", Date(2022, 6, 1))
                                 .Build();
  MetricsReport report;
  ASSERT_TRUE(app_->BuildReport(dataset, {}, Date(2022, 1, 3), Date(2022, 6, 1),
                                Date(2022, 6, 2), false, &report)
                  .ok());
  EXPECT_EQ(nullptr, FindSeries(report, "dau_over_mau"));
  EXPECT_NE(nullptr, FindSeries(report, "monthly_users"));
}

TEST_F(ReportAppTest, BuildReportOfEmptyDataset) {
  MetricsReport report;
  auto result = app_->BuildReport({}, {}, Date(2022, 1, 3), Date(2022, 3, 3), Date(2022, 3, 10),
                                  false, &report);
  EXPECT_EQ(util::FAILED_PRECONDITION, result.error_code());
}

TEST_F(ReportAppTest, PrintReport) {
  MetricsReport report;
  ASSERT_TRUE(app_->BuildReport(DailyDataset(), {}, Date(2022, 1, 3), Date(2022, 3, 3),
                                Date(2022, 3, 10), false, &report)
                  .ok());
  app_->PrintReport(report);

  std::string printed = out_.str();
  EXPECT_THAT(printed, HasSubstr("- Total builds: 60"));
  EXPECT_THAT(printed, HasSubstr("## Image types\n"));
  EXPECT_THAT(printed, HasSubstr("## Repeat orgs: 4\n"));
  EXPECT_THAT(printed, HasSubstr("## monthly_builds\n2022-01-01      29.0000\n"));
}

TEST_F(ReportAppTest, Run) {
  ReportOptions options;
  options.dump_path = WriteTestFile("dump.txt", DailyDump());
  options.userinfo_path = WriteTestFile(
      "userinfo.json",
      R"([{"name": "Acme QA", "accountNumber": "acct-0", "org_id": "org-0"},
          {"name": "Initech", "accountNumber": "acct-1", "org_id": "org-1"},
          {"name": null, "accountNumber": "acct-2", "org_id": "org-2"}])");
  options.userfilter_path = WriteTestFile("userfilter.txt", "# Internal accounts\n\nacme\n");
  options.output_path = TestFile("report.textproto");

  ASSERT_TRUE(app_->Run(options).ok());

  std::string printed = out_.str();
  EXPECT_THAT(printed, HasSubstr("Imported 60 records\n"));
  EXPECT_THAT(printed, HasSubstr("45 records after user filtering\n"));

  std::string text;
  ASSERT_TRUE(util::ReadTextFile(options.output_path, &text).ok());
  MetricsReport report;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(text, &report));
  EXPECT_EQ(45, report.summary().num_builds());
  EXPECT_EQ(3, report.summary().num_users());
  EXPECT_THAT(TableNames(report.top_orgs()), UnorderedElementsAre("Initech", "acct-2", "acct-3"));
  // Active orgs are judged against the fake clock.
  EXPECT_THAT(report.active_orgs(), ElementsAre("org-1", "org-2", "org-3"));
}

TEST_F(ReportAppTest, RunWithOrgFilter) {
  ReportOptions options;
  options.dump_path = WriteTestFile("dump.txt", DailyDump());
  options.userinfo_path = WriteTestFile(
      "userinfo.json",
      R"([{"name": "Acme QA", "accountNumber": "acct-0", "org_id": "org-0"},
          {"name": "Initech", "accountNumber": "acct-1", "org_id": "org-1"}])");
  options.orgfilter_path = WriteTestFile("orgfilter.txt", "initech\n");
  options.output_path = TestFile("report.textproto");

  ASSERT_TRUE(app_->Run(options).ok());
  EXPECT_THAT(out_.str(), HasSubstr("45 records after org filtering\n"));

  std::string text;
  ASSERT_TRUE(util::ReadTextFile(options.output_path, &text).ok());
  MetricsReport report;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(text, &report));
  EXPECT_EQ(45, report.summary().num_builds());
  EXPECT_THAT(report.repeat_orgs(), ElementsAre("org-0", "org-2", "org-3"));
}

TEST_F(ReportAppTest, RunWithTimeRange) {
  ReportOptions options;
  options.dump_path = WriteTestFile("dump.txt", DailyDump());
  options.start = Date(2022, 2, 1);
  options.end = Date(2022, 2, 28, 23);
  options.output_path = TestFile("report.textproto");

  ASSERT_TRUE(app_->Run(options).ok());

  std::string text;
  ASSERT_TRUE(util::ReadTextFile(options.output_path, &text).ok());
  MetricsReport report;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(text, &report));
  EXPECT_EQ(28, report.summary().num_builds());
}

TEST_F(ReportAppTest, RunWithInvertedTimeRange) {
  ReportOptions options;
  options.dump_path = WriteTestFile("dump.txt", DailyDump());
  options.start = Date(2022, 3, 1);
  options.end = Date(2022, 2, 1);
  EXPECT_EQ(util::INVALID_ARGUMENT, app_->Run(options).error_code());
}

TEST_F(ReportAppTest, RunWithMissingDump) {
  ReportOptions options;
  options.dump_path = TestFile("missing.txt");
  auto result = app_->Run(options);
  EXPECT_FALSE(result.ok());
  EXPECT_THAT(result.error_message(), ::testing::StartsWith("Reading the build dump: "));
}

}  // namespace ibmetrics
