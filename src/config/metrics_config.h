// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_CONFIG_METRICS_CONFIG_H_
#define IBMETRICS_SRC_CONFIG_METRICS_CONFIG_H_

#include <string>

#include "src/lib/util/status.h"
#include "src/metrics/activity_classifier.h"
#include "src/metrics/footprint_mapper.h"
#include "src/pb/metrics_config.pb.h"

namespace ibmetrics::config {

// A MetricsConfig with every field at its default value and the built-in cloud footprints.
MetricsConfig DefaultMetricsConfig();

// Reads a text-format MetricsConfig from the file at |path| and validates it. Fields that are
// not set in the file keep their default values.
//
// Returns INVALID_ARGUMENT if the file cannot be parsed or fails ValidateMetricsConfig().
util::Status LoadMetricsConfig(const std::string& path, MetricsConfig* config);

// Same as LoadMetricsConfig(), for a config held in memory.
util::Status ParseMetricsConfig(const std::string& text, MetricsConfig* config);

// Checks that window widths, periods and table lengths are positive and that the classifier
// thresholds are within range.
util::Status ValidateMetricsConfig(const MetricsConfig& config);

// Builds the FootprintMap of |footprints|. If |footprints| has no groups the built-in grouping
// is used. Unless |split_cloud| is set, the cloud footprints are collapsed into a single one.
util::Status BuildFootprintMap(const FootprintConfig& footprints, bool split_cloud,
                               metrics::FootprintMap* footprint_map);

metrics::RepeatOrgPolicy ToRepeatOrgPolicy(const RepeatOrgConfig& config);
metrics::ActiveOrgPolicy ToActiveOrgPolicy(const ActiveOrgConfig& config);

}  // namespace ibmetrics::config

#endif  // IBMETRICS_SRC_CONFIG_METRICS_CONFIG_H_
