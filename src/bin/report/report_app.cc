// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/bin/report/report_app.h"

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/time_util.h>

#include <algorithm>
#include <map>
#include <set>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "gflags/gflags.h"
#include "src/config/metrics_config.h"
#include "src/data/dump_reader.h"
#include "src/data/filters.h"
#include "src/lib/util/datetime_util.h"
#include "src/lib/util/file_util.h"
#include "src/logging.h"
#include "src/metrics/activity_classifier.h"
#include "src/metrics/cohort_tracker.h"
#include "src/metrics/derived_metrics.h"
#include "src/metrics/footprint_mapper.h"
#include "src/metrics/summary.h"
#include "src/metrics/time_bucketer.h"
#include "src/metrics/window_aggregator.h"
#include "src/report/frequency_tables.h"

DEFINE_string(dump, "", "Path to a pipe-delimited database dump of builds. (Required)");
DEFINE_string(start, "", "Builds before this date are ignored. Defaults to the first build.");
DEFINE_string(end, "", "Builds after this date are ignored. Defaults to the last build.");
DEFINE_string(userinfo, "",
              "Path to a JSON array of user info objects with the keys 'name', "
              "'accountNumber' and 'org_id'. (Optional)");
DEFINE_string(userfilter, "",
              "Path to a file of user name patterns, one per line. The builds of matching "
              "users are removed. (Optional)");
DEFINE_string(filter_orgs, "",
              "Path to a file of user name patterns, one per line. All builds of the "
              "organizations of matching users are removed. Requires -userinfo. (Optional)");
DEFINE_string(config, "", "Path to a text-format MetricsConfig. (Optional)");
DEFINE_string(now, "",
              "Reference time of the active-org test. Defaults to the current time.");
DEFINE_int32(period_days, 0,
             "Width in days of the periods of the periodic series. Overrides period_days of "
             "the config if positive.");
DEFINE_bool(split_cloud, false, "Report the public clouds as separate footprints.");
DEFINE_string(output, "", "Write the report to this file as a text-format MetricsReport.");

namespace ibmetrics {

using google::protobuf::util::TimeUtil;
using metrics::CountSeries;
using metrics::Dataset;
using metrics::Timestamp;
using util::Status;

namespace {

constexpr char kUsersSlidingWindowSeries[] = "users_sliding_window";

Status ToStatus(metrics::Status status, const std::string& operation) {
  std::string message = absl::StrCat(operation, " failed: ", metrics::StatusName(status));
  switch (status) {
    case metrics::kOK:
      return Status::OK;
    case metrics::kEmptyDataset:
      return Status(util::FAILED_PRECONDITION, message);
    case metrics::kInvalidWindowSpec:
    case metrics::kInvalidArguments:
    case metrics::kAmbiguousLookup:
      return Status(util::INVALID_ARGUMENT, message);
    case metrics::kInternalError:
      return Status(util::INTERNAL, message);
  }
  return Status(util::UNKNOWN, message);
}

google::protobuf::Timestamp ToProtoTimestamp(Timestamp time) {
  return TimeUtil::NanosecondsToTimestamp(
      std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count());
}

Timestamp FromProtoTimestamp(const google::protobuf::Timestamp& timestamp) {
  return Timestamp(std::chrono::duration_cast<metrics::Duration>(
      std::chrono::nanoseconds(TimeUtil::TimestampToNanoseconds(timestamp))));
}

void AddSeries(const std::string& name, const std::vector<Timestamp>& timestamps,
               const std::vector<double>& values, MetricsReport* report) {
  TimeSeries* series = report->add_series();
  series->set_name(name);
  for (const auto& timestamp : timestamps) {
    *series->add_timestamps() = ToProtoTimestamp(timestamp);
  }
  for (double value : values) {
    series->add_values(value);
  }
}

void AddSeries(const std::string& name, const std::vector<Timestamp>& timestamps,
               const std::vector<int64_t>& counts, MetricsReport* report) {
  AddSeries(name, timestamps, std::vector<double>(counts.begin(), counts.end()), report);
}

void AddTable(const report::FrequencyTable& table,
              google::protobuf::RepeatedPtrField<RankedCount>* ranked) {
  for (const auto& entry : table) {
    RankedCount* count = ranked->Add();
    count->set_name(entry.name);
    count->set_count(entry.count);
  }
}

report::FrequencyTable FromProtoTable(const google::protobuf::RepeatedPtrField<RankedCount>& ranked) {
  report::FrequencyTable table;
  for (const auto& count : ranked) {
    table.push_back({count.name(), count.count()});
  }
  return table;
}

bool ParseTimeFlag(const std::string& flag_name, const std::string& value,
                   std::optional<Timestamp>* time) {
  if (value.empty()) {
    return true;
  }
  Timestamp parsed;
  if (!util::ParseTimestamp(value, &parsed)) {
    LOG(ERROR) << "Unable to parse -" << flag_name << "=" << value << " as a date.";
    return false;
  }
  *time = parsed;
  return true;
}

}  // namespace

std::unique_ptr<ReportApp> ReportApp::CreateFromFlagsOrDie(ReportOptions* options) {
  if (FLAGS_dump.empty()) {
    LOG(FATAL) << "The -dump flag is required.";
  }
  options->dump_path = FLAGS_dump;
  options->userinfo_path = FLAGS_userinfo;
  options->userfilter_path = FLAGS_userfilter;
  options->orgfilter_path = FLAGS_filter_orgs;
  options->output_path = FLAGS_output;
  options->split_cloud = FLAGS_split_cloud;
  CHECK(ParseTimeFlag("start", FLAGS_start, &options->start));
  CHECK(ParseTimeFlag("end", FLAGS_end, &options->end));
  CHECK(ParseTimeFlag("now", FLAGS_now, &options->now));

  MetricsConfig config = config::DefaultMetricsConfig();
  if (!FLAGS_config.empty()) {
    auto status = config::LoadMetricsConfig(FLAGS_config, &config);
    if (!status.ok()) {
      LOG(FATAL) << "Unable to load the metrics config " << FLAGS_config << ": "
                 << status.ToString();
    }
  }
  if (FLAGS_period_days > 0) {
    config.set_period_days(FLAGS_period_days);
  } else if (FLAGS_period_days < 0) {
    LOG(FATAL) << "-period_days must not be negative.";
  }

  return std::make_unique<ReportApp>(std::move(config), std::make_unique<util::SystemClock>(),
                                     &std::cout);
}

ReportApp::ReportApp(MetricsConfig config, std::unique_ptr<util::ClockInterface> clock,
                     std::ostream* ostream)
    : config_(std::move(config)), clock_(std::move(clock)), ostream_(ostream) {
  CHECK(clock_);
  CHECK(ostream_);
}

Status ReportApp::LoadData(const ReportOptions& options, Dataset* dataset,
                           std::vector<data::UserInfo>* users) {
  Dataset builds;
  RETURN_IF_ERROR(data::ReadDump(options.dump_path, &builds).Annotate("Reading the build dump"));
  *ostream_ << "Imported " << builds.size() << " records" << std::endl;

  if (!options.userinfo_path.empty()) {
    RETURN_IF_ERROR(
        data::ReadUserInfo(options.userinfo_path, users).Annotate("Reading the user info"));
  }

  if (!options.userfilter_path.empty()) {
    std::vector<std::string> patterns;
    RETURN_IF_ERROR(
        data::ReadUserFilter(options.userfilter_path, &patterns).Annotate("Reading the user filter"));
    Dataset filtered;
    RETURN_IF_ERROR(data::FilterUsers(builds, *users, patterns, &filtered));
    builds = std::move(filtered);
    *ostream_ << builds.size() << " records after user filtering" << std::endl;
  }

  if (!options.orgfilter_path.empty()) {
    std::vector<std::string> patterns;
    RETURN_IF_ERROR(
        data::ReadUserFilter(options.orgfilter_path, &patterns).Annotate("Reading the org filter"));
    std::set<std::string> org_ids;
    RETURN_IF_ERROR(data::GetFilterIds(*users, patterns, &org_ids));
    builds = data::FilterOrgs(builds, org_ids);
    *ostream_ << builds.size() << " records after org filtering" << std::endl;
  }

  *dataset = std::move(builds);
  return Status::OK;
}

Status ReportApp::Run(const ReportOptions& options) {
  Dataset builds;
  std::vector<data::UserInfo> users;
  RETURN_IF_ERROR(LoadData(options, &builds, &users));

  metrics::TimeRange range;
  RETURN_IF_ERROR(ToStatus(metrics::GetTimeRange(builds, &range), "GetTimeRange"));
  Timestamp start = options.start.value_or(range.min);
  Timestamp end = options.end.value_or(range.max);
  if (end < start) {
    return Status(util::INVALID_ARGUMENT, "The end of the time range precedes its start.");
  }
  Dataset sliced = data::SliceTime(builds, start, end);
  Timestamp now = options.now.value_or(clock_->now());

  MetricsReport report;
  RETURN_IF_ERROR(BuildReport(sliced, users, start, end, now, options.split_cloud, &report));
  PrintReport(report);

  if (!options.output_path.empty()) {
    std::string text;
    if (!google::protobuf::TextFormat::PrintToString(report, &text)) {
      return Status(util::INTERNAL, "Unable to serialize the report.");
    }
    RETURN_IF_ERROR(util::WriteTextFile(options.output_path, text));
    LOG(INFO) << "Wrote the report to " << options.output_path;
  }
  return Status::OK;
}

Status ReportApp::BuildReport(const Dataset& dataset, const std::vector<data::UserInfo>& users,
                              Timestamp start, Timestamp end, Timestamp now, bool split_cloud,
                              MetricsReport* report) {
  report->Clear();

  metrics::Summary summary;
  RETURN_IF_ERROR(ToStatus(metrics::MakeSummary(dataset, &summary), "MakeSummary"));
  ReportSummary* report_summary = report->mutable_summary();
  *report_summary->mutable_start() = ToProtoTimestamp(summary.start);
  *report_summary->mutable_end() = ToProtoTimestamp(summary.end);
  report_summary->set_num_builds(summary.num_builds);
  report_summary->set_num_users(summary.num_users);
  report_summary->set_num_builds_with_packages(summary.num_builds_with_packages);
  report_summary->set_num_builds_with_fs_customizations(
      summary.num_builds_with_fs_customizations);
  report_summary->set_num_builds_with_custom_repos(summary.num_builds_with_custom_repos);

  // Frequency tables.
  AddTable(report::TopPackages(dataset, config_.top_packages()), report->mutable_top_packages());
  AddTable(report::ImageTypeCounts(dataset), report->mutable_image_types());
  data::UserDirectory directory(users);
  report::FrequencyTable biggest_orgs;
  RETURN_IF_ERROR(
      ToStatus(report::BiggestOrgs(dataset, directory, config_.top_orgs(), &biggest_orgs),
               "BiggestOrgs"));
  AddTable(biggest_orgs, report->mutable_top_orgs());

  // Calendar-month series.
  CountSeries monthly_builds;
  RETURN_IF_ERROR(ToStatus(metrics::MonthlyBuilds(dataset, &monthly_builds), "MonthlyBuilds"));
  AddSeries("monthly_builds", monthly_builds.timestamps, monthly_builds.counts, report);

  metrics::UserSplitSeries monthly_users;
  RETURN_IF_ERROR(
      ToStatus(metrics::MonthlyUsersStacked(dataset, &monthly_users), "MonthlyUsersStacked"));
  AddSeries("monthly_users", monthly_users.bucket_starts, monthly_users.total, report);
  AddSeries("monthly_new_users", monthly_users.bucket_starts, monthly_users.new_users, report);
  AddSeries("monthly_returning_users", monthly_users.bucket_starts, monthly_users.returning,
            report);
  AddSeries("monthly_users_cumulative_average", monthly_users.bucket_starts,
            metrics::CumulativeAverage(monthly_users.total), report);

  // Fixed-period series, starting on the Monday on or before |start|.
  Timestamp first_monday = util::StartOfWeek(start);
  metrics::Duration period = util::Days(config_.period_days());
  CountSeries period_builds;
  RETURN_IF_ERROR(ToStatus(metrics::BuildsOverTime(dataset, first_monday, end, period,
                                                   &period_builds),
                           "BuildsOverTime"));
  AddSeries("period_builds", period_builds.timestamps, period_builds.counts, report);
  std::vector<double> build_counts(period_builds.counts.begin(), period_builds.counts.end());
  AddSeries("period_builds_trendline", period_builds.timestamps,
            metrics::GaussianTrendline(build_counts), report);

  CountSeries period_users;
  RETURN_IF_ERROR(ToStatus(
      metrics::PeriodDistinct(dataset, first_monday, end, period, metrics::OrgId, &period_users),
      "PeriodDistinct"));
  AddSeries("period_users", period_users.timestamps, period_users.counts, report);

  metrics::UserSplitSeries periodic_users;
  RETURN_IF_ERROR(ToStatus(metrics::PeriodicUsers(dataset, first_monday, period, &periodic_users),
                           "PeriodicUsers"));
  AddSeries("period_new_users", periodic_users.bucket_starts, periodic_users.new_users, report);
  AddSeries("period_returning_users", periodic_users.bucket_starts, periodic_users.returning,
            report);

  // Sliding-window series.
  CountSeries window_users;
  RETURN_IF_ERROR(ToStatus(metrics::SlidingWindowDistinct(dataset, metrics::OrgId,
                                                          config_.monthly_window_days(),
                                                          &window_users),
                           "SlidingWindowDistinct"));
  AddSeries(kUsersSlidingWindowSeries, window_users.timestamps, window_users.counts, report);

  metrics::RatioSeries dau_over_mau;
  metrics::Status dau_status = metrics::DauOverMau(
      dataset, &dau_over_mau, config_.daily_window_days(), config_.monthly_window_days());
  if (dau_status == metrics::kInvalidArguments) {
    LOG(WARNING) << "Omitting dau_over_mau: a monthly window has no active organization.";
  } else {
    RETURN_IF_ERROR(ToStatus(dau_status, "DauOverMau"));
    AddSeries("dau_over_mau", dau_over_mau.timestamps, dau_over_mau.values, report);
  }

  // Footprints.
  metrics::FootprintMap footprint_map;
  RETURN_IF_ERROR(config::BuildFootprintMap(config_.footprints(), split_cloud, &footprint_map));
  AddTable(report::FootprintCounts(metrics::ApplyFootprints(dataset, footprint_map)),
           report->mutable_footprints());

  std::map<std::string, std::string> org_footprints;
  RETURN_IF_ERROR(ToStatus(metrics::SingleFootprintOrgs(dataset, footprint_map, &org_footprints),
                           "SingleFootprintOrgs"));
  report->mutable_single_footprint_orgs()->insert(org_footprints.begin(), org_footprints.end());

  std::map<std::string, CountSeries> footprint_users;
  RETURN_IF_ERROR(ToStatus(metrics::FootprintMonthlyUsers(dataset, footprint_map, &footprint_users),
                           "FootprintMonthlyUsers"));
  for (const auto& [footprint, series] : footprint_users) {
    AddSeries(absl::StrCat("footprint_monthly_users/", footprint), series.timestamps,
              series.counts, report);
  }
  std::map<std::string, CountSeries> footprint_builds;
  RETURN_IF_ERROR(ToStatus(
      metrics::FootprintMonthlyBuilds(dataset, footprint_map, &footprint_builds),
      "FootprintMonthlyBuilds"));
  for (const auto& [footprint, series] : footprint_builds) {
    AddSeries(absl::StrCat("footprint_monthly_builds/", footprint), series.timestamps,
              series.counts, report);
  }

  // Organization classes.
  std::set<std::string> repeat_orgs;
  RETURN_IF_ERROR(ToStatus(
      metrics::RepeatOrgs(dataset, config::ToRepeatOrgPolicy(config_.repeat_orgs()), &repeat_orgs),
      "RepeatOrgs"));
  for (const auto& org : repeat_orgs) {
    report->add_repeat_orgs(org);
  }
  std::set<std::string> active_orgs;
  RETURN_IF_ERROR(ToStatus(metrics::ActiveOrgs(dataset,
                                               config::ToActiveOrgPolicy(config_.active_orgs()),
                                               now, &active_orgs),
                           "ActiveOrgs"));
  for (const auto& org : active_orgs) {
    report->add_active_orgs(org);
  }

  VLOG(1) << "Built a report of " << report->series_size() << " series from " << dataset.size()
          << " builds.";
  return Status::OK;
}

void ReportApp::PrintReport(const MetricsReport& report) {
  metrics::Summary summary;
  summary.start = FromProtoTimestamp(report.summary().start());
  summary.end = FromProtoTimestamp(report.summary().end());
  summary.num_builds = report.summary().num_builds();
  summary.num_users = report.summary().num_users();
  summary.num_builds_with_packages = report.summary().num_builds_with_packages();
  summary.num_builds_with_fs_customizations =
      report.summary().num_builds_with_fs_customizations();
  summary.num_builds_with_custom_repos = report.summary().num_builds_with_custom_repos();
  *ostream_ << metrics::Summarize(summary) << "\n";

  *ostream_ << report::FormatTable("Most frequently selected packages",
                                   FromProtoTable(report.top_packages()));
  *ostream_ << report::FormatTable("Image types", FromProtoTable(report.image_types()));
  *ostream_ << report::FormatTable("Footprints", FromProtoTable(report.footprints()));
  *ostream_ << report::FormatTable("Biggest orgs", FromProtoTable(report.top_orgs()));

  *ostream_ << "## Repeat orgs: " << report.repeat_orgs_size() << "\n";
  *ostream_ << "## Active orgs: " << report.active_orgs_size() << "\n";
  *ostream_ << "## Single-footprint orgs: " << report.single_footprint_orgs_size() << "\n";

  for (const auto& series : report.series()) {
    *ostream_ << "\n## " << series.name() << "\n";
    int n = std::min(series.timestamps_size(), series.values_size());
    for (int i = 0; i < n; i++) {
      *ostream_ << absl::StrFormat("%s %12.4f\n",
                                   util::FormatDate(FromProtoTimestamp(series.timestamps(i))),
                                   series.values(i));
    }
  }
  ostream_->flush();
}

}  // namespace ibmetrics
