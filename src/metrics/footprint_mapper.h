// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_METRICS_FOOTPRINT_MAPPER_H_
#define IBMETRICS_SRC_METRICS_FOOTPRINT_MAPPER_H_

#include <map>
#include <string>
#include <vector>

#include "src/metrics/build_record.h"
#include "src/metrics/status.h"

namespace ibmetrics::metrics {

// A many-to-one grouping of image types into deployment footprints.
//
// The mapping is open: image types without an entry map to themselves. A FootprintMap is always
// idempotent, i.e. mapping an already mapped value returns it unchanged.
class FootprintMap {
 public:
  // An empty map, under which every image type is its own footprint.
  FootprintMap() = default;

  // Creates a FootprintMap from |table|, a map from image type to footprint.
  //
  // Returns kInvalidArguments if a footprint of |table| is itself an image type of |table| that
  // maps to a different footprint, or if a key or footprint is empty.
  static Status Create(std::map<std::string, std::string> table, FootprintMap* footprint_map);

  // Returns the footprint of |image_type|, or |image_type| itself if it has no entry.
  [[nodiscard]] std::string Map(const std::string& image_type) const;

 private:
  explicit FootprintMap(std::map<std::string, std::string> table) : table_(std::move(table)) {}

  std::map<std::string, std::string> table_;
};

// The built-in grouping:
//   edge:          rhel-edge-commit, rhel-edge-installer
//   private-cloud: vsphere, guest-image
//   bare-metal:    image-installer
//   gcp:           gcp
//   aws:           aws
//   azure:         azure, vhd
std::map<std::string, std::string> DefaultFootprintTable();

// The footprints of the public clouds in the built-in grouping.
std::vector<std::string> DefaultCloudFootprints();

// Returns a copy of |table| in which every entry whose footprint is one of |cloud_footprints|
// maps to |cloud_footprint| instead. Entries are added so that the cloud footprints themselves
// also map to |cloud_footprint|.
std::map<std::string, std::string> CollapseFootprints(
    const std::map<std::string, std::string>& table,
    const std::vector<std::string>& cloud_footprints, const std::string& cloud_footprint);

// Returns a copy of |dataset| with every image_type replaced by its footprint.
Dataset ApplyFootprints(const Dataset& dataset, const FootprintMap& footprint_map);

// Maps every element of |image_types|.
std::vector<std::string> MapImageTypes(const std::vector<std::string>& image_types,
                                       const FootprintMap& footprint_map);

// Finds the organizations all of whose dated builds map to a single footprint, and that
// footprint. Undated records are skipped.
//
// Returns kEmptyDataset if |dataset| has no dated record.
Status SingleFootprintOrgs(const Dataset& dataset, const FootprintMap& footprint_map,
                           std::map<std::string, std::string>* org_footprints);

// Distinct organizations per calendar month, separately for the builds of each footprint. Each
// series spans the months of its own footprint's builds.
//
// Returns kEmptyDataset if |dataset| has no dated record.
Status FootprintMonthlyUsers(const Dataset& dataset, const FootprintMap& footprint_map,
                             std::map<std::string, CountSeries>* series);

// Builds per calendar month, separately for each footprint.
Status FootprintMonthlyBuilds(const Dataset& dataset, const FootprintMap& footprint_map,
                              std::map<std::string, CountSeries>* series);

}  // namespace ibmetrics::metrics

#endif  // IBMETRICS_SRC_METRICS_FOOTPRINT_MAPPER_H_
