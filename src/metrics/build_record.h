// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_METRICS_BUILD_RECORD_H_
#define IBMETRICS_SRC_METRICS_BUILD_RECORD_H_

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ibmetrics::metrics {

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;

// One row of a build dataset.
struct BuildRecord {
  // Opaque organization identifier. Many builds share an org.
  std::string org_id;

  // Unset when the ingested value could not be interpreted as a timestamp. Undated records are
  // never counted in any window, bucket or classification.
  std::optional<Timestamp> created_at;

  // Unique build identifier.
  std::string job_id;

  // Fine-grained image type, e.g. "aws" or "vsphere".
  std::string image_type;

  // Customizations. Only emptiness is significant to the metrics.
  std::vector<std::string> packages;
  std::vector<std::string> filesystem;
  std::vector<std::string> payload_repositories;

  // Alternate identifier, used only for filtering and naming.
  std::string account_number;
};

// A static snapshot of build records, in no particular order.
using Dataset = std::vector<BuildRecord>;

// Selects the attribute of a record whose distinct values are counted by the aggregators.
using AttributeSelector = std::function<const std::string&(const BuildRecord&)>;

inline const std::string& OrgId(const BuildRecord& record) { return record.org_id; }
inline const std::string& JobId(const BuildRecord& record) { return record.job_id; }
inline const std::string& ImageType(const BuildRecord& record) { return record.image_type; }
inline const std::string& AccountNumber(const BuildRecord& record) {
  return record.account_number;
}

// A series of per-window counts. |timestamps[i]| identifies the window of |counts[i]|: its start
// for bucketed series and its end for sliding-window series.
struct CountSeries {
  std::vector<int64_t> counts;
  std::vector<Timestamp> timestamps;
};

// A series of per-window ratios, timestamped like CountSeries.
struct RatioSeries {
  std::vector<double> values;
  std::vector<Timestamp> timestamps;
};

}  // namespace ibmetrics::metrics

#endif  // IBMETRICS_SRC_METRICS_BUILD_RECORD_H_
