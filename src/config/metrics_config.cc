// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/config/metrics_config.h"

#include <google/protobuf/text_format.h>

#include <map>
#include <vector>

#include "absl/strings/str_cat.h"
#include "src/lib/util/datetime_util.h"
#include "src/lib/util/file_util.h"
#include "src/logging.h"
#include "src/metrics/status.h"

namespace ibmetrics::config {

using util::INVALID_ARGUMENT;
using util::Status;

namespace {

Status CheckPositive(int32_t value, const char* field_name) {
  if (value <= 0) {
    return Status(INVALID_ARGUMENT, absl::StrCat(field_name, " must be positive, got ", value));
  }
  return Status::OK;
}

}  // namespace

MetricsConfig DefaultMetricsConfig() {
  MetricsConfig config;
  for (const auto& footprint : metrics::DefaultCloudFootprints()) {
    config.mutable_footprints()->add_cloud_footprints(footprint);
  }
  return config;
}

Status ParseMetricsConfig(const std::string& text, MetricsConfig* config) {
  MetricsConfig parsed;
  if (!google::protobuf::TextFormat::ParseFromString(text, &parsed)) {
    return Status(INVALID_ARGUMENT, "Unable to parse the metrics config as text-format proto.");
  }
  if (parsed.footprints().groups_size() == 0 &&
      parsed.footprints().cloud_footprints_size() == 0) {
    for (const auto& footprint : metrics::DefaultCloudFootprints()) {
      parsed.mutable_footprints()->add_cloud_footprints(footprint);
    }
  }
  RETURN_IF_ERROR(ValidateMetricsConfig(parsed));
  config->Swap(&parsed);
  return Status::OK;
}

Status LoadMetricsConfig(const std::string& path, MetricsConfig* config) {
  std::string text;
  RETURN_IF_ERROR(util::ReadTextFile(path, &text));
  auto status = ParseMetricsConfig(text, config);
  if (!status.ok()) {
    LOG(ERROR) << "Invalid metrics config " << path << ": " << status.error_message();
  }
  return status;
}

Status ValidateMetricsConfig(const MetricsConfig& config) {
  RETURN_IF_ERROR(CheckPositive(config.daily_window_days(), "daily_window_days"));
  RETURN_IF_ERROR(CheckPositive(config.monthly_window_days(), "monthly_window_days"));
  RETURN_IF_ERROR(CheckPositive(config.period_days(), "period_days"));
  RETURN_IF_ERROR(CheckPositive(config.top_packages(), "top_packages"));
  RETURN_IF_ERROR(CheckPositive(config.top_orgs(), "top_orgs"));
  RETURN_IF_ERROR(CheckPositive(config.repeat_orgs().period_days(), "repeat_orgs.period_days"));
  RETURN_IF_ERROR(CheckPositive(config.active_orgs().min_days(), "active_orgs.min_days"));
  if (config.daily_window_days() > config.monthly_window_days()) {
    return Status(INVALID_ARGUMENT, "daily_window_days exceeds monthly_window_days");
  }
  if (config.repeat_orgs().min_builds() < metrics::kMinRepeatBuilds) {
    return Status(INVALID_ARGUMENT, absl::StrCat("repeat_orgs.min_builds must be at least ",
                                                 metrics::kMinRepeatBuilds));
  }
  if (config.active_orgs().recent_limit_days() < 0) {
    return Status(INVALID_ARGUMENT, "active_orgs.recent_limit_days must not be negative");
  }
  for (const auto& group : config.footprints().groups()) {
    if (group.footprint().empty()) {
      return Status(INVALID_ARGUMENT, "A footprint group has no footprint name.");
    }
  }
  if (config.footprints().cloud_footprint().empty()) {
    return Status(INVALID_ARGUMENT, "footprints.cloud_footprint must not be empty");
  }
  return Status::OK;
}

Status BuildFootprintMap(const FootprintConfig& footprints, bool split_cloud,
                         metrics::FootprintMap* footprint_map) {
  std::map<std::string, std::string> table;
  if (footprints.groups_size() == 0) {
    table = metrics::DefaultFootprintTable();
  } else {
    for (const auto& group : footprints.groups()) {
      for (const auto& image_type : group.image_types()) {
        auto inserted = table.emplace(image_type, group.footprint());
        if (!inserted.second && inserted.first->second != group.footprint()) {
          return Status(INVALID_ARGUMENT,
                        absl::StrCat("Image type ", image_type, " is in footprints ",
                                     inserted.first->second, " and ", group.footprint()));
        }
      }
    }
  }

  if (!split_cloud) {
    std::vector<std::string> clouds(footprints.cloud_footprints().begin(),
                                    footprints.cloud_footprints().end());
    table = metrics::CollapseFootprints(table, clouds, footprints.cloud_footprint());
  }

  auto status = metrics::FootprintMap::Create(std::move(table), footprint_map);
  if (status != metrics::kOK) {
    return Status(INVALID_ARGUMENT, "Inconsistent footprint grouping.",
                  metrics::StatusName(status));
  }
  return Status::OK;
}

metrics::RepeatOrgPolicy ToRepeatOrgPolicy(const RepeatOrgConfig& config) {
  metrics::RepeatOrgPolicy policy;
  policy.min_builds = config.min_builds();
  policy.period = util::Days(config.period_days());
  return policy;
}

metrics::ActiveOrgPolicy ToActiveOrgPolicy(const ActiveOrgConfig& config) {
  metrics::ActiveOrgPolicy policy;
  policy.min_days = config.min_days();
  policy.recent_limit_days = config.recent_limit_days();
  return policy;
}

}  // namespace ibmetrics::config
