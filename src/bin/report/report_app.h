// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_BIN_REPORT_REPORT_APP_H_
#define IBMETRICS_SRC_BIN_REPORT_REPORT_APP_H_

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/data/user_info.h"
#include "src/lib/util/clock.h"
#include "src/lib/util/status.h"
#include "src/metrics/build_record.h"
#include "src/pb/metrics_config.pb.h"
#include "src/pb/metrics_report.pb.h"

namespace ibmetrics {

// Inputs of a single run of the report application.
struct ReportOptions {
  std::string dump_path;
  std::string userinfo_path;
  std::string userfilter_path;
  // Patterns of user names whose organizations are removed, by org_id.
  std::string orgfilter_path;
  std::string output_path;

  // Builds outside of [start, end] are ignored. Unset bounds default to the time range of the
  // data.
  std::optional<metrics::Timestamp> start;
  std::optional<metrics::Timestamp> end;

  // Reference time of the active-org test. Defaults to the clock's time.
  std::optional<metrics::Timestamp> now;

  // Report the public clouds as separate footprints.
  bool split_cloud = false;
};

// The image-builder usage report application.
//
// A run reads a database dump of builds, removes filtered users and builds outside of the time
// range, computes a MetricsReport, prints it and optionally writes it to a file in text format.
class ReportApp {
 public:
  // Creates a ReportApp from the command-line flags. Exits if the flags or the config file are
  // invalid. |options| is set from the flags.
  static std::unique_ptr<ReportApp> CreateFromFlagsOrDie(ReportOptions* options);

  // The |ostream| is used for printing the report.
  ReportApp(MetricsConfig config, std::unique_ptr<util::ClockInterface> clock,
            std::ostream* ostream);

  ReportApp(const ReportApp& other) = delete;
  ReportApp& operator=(const ReportApp& other) = delete;

  // Performs a run. Returns the first error encountered.
  util::Status Run(const ReportOptions& options);

  // Computes the report of |dataset|. |users| names the accounts of the biggest-orgs table and
  // |now| is the reference time of the active-org test. |start| is the start of the periodic
  // series; periods begin on the Monday on or before it.
  //
  // The dau_over_mau series is omitted if a monthly window of |dataset| has no builds.
  //
  // Returns FAILED_PRECONDITION if |dataset| has no dated builds.
  util::Status BuildReport(const metrics::Dataset& dataset,
                           const std::vector<data::UserInfo>& users, metrics::Timestamp start,
                           metrics::Timestamp end, metrics::Timestamp now, bool split_cloud,
                           MetricsReport* report);

  // Prints the summary, the tables and the series of |report|.
  void PrintReport(const MetricsReport& report);

  const MetricsConfig& config() const { return config_; }

 private:
  util::Status LoadData(const ReportOptions& options, metrics::Dataset* dataset,
                        std::vector<data::UserInfo>* users);

  MetricsConfig config_;
  std::unique_ptr<util::ClockInterface> clock_;
  std::ostream* ostream_;
};

}  // namespace ibmetrics

#endif  // IBMETRICS_SRC_BIN_REPORT_REPORT_APP_H_
