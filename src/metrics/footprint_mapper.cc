// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/metrics/footprint_mapper.h"

#include <algorithm>
#include <set>

#include "src/logging.h"
#include "src/metrics/window_aggregator.h"

namespace ibmetrics::metrics {

namespace {

// Splits the dated records of |dataset| by footprint.
Status GroupByFootprint(const Dataset& dataset, const FootprintMap& footprint_map,
                        std::map<std::string, Dataset>* groups) {
  std::map<std::string, Dataset> result;
  for (const auto& record : dataset) {
    if (!record.created_at) {
      continue;
    }
    BuildRecord mapped = record;
    mapped.image_type = footprint_map.Map(record.image_type);
    result[mapped.image_type].push_back(std::move(mapped));
  }
  if (result.empty()) {
    LOG(ERROR) << "Cannot split a dataset with no dated record by footprint.";
    return kEmptyDataset;
  }
  *groups = std::move(result);
  return kOK;
}

Status MonthlyPerFootprint(const Dataset& dataset, const FootprintMap& footprint_map,
                           const AttributeSelector& attribute,
                           std::map<std::string, CountSeries>* series) {
  std::map<std::string, Dataset> groups;
  if (Status status = GroupByFootprint(dataset, footprint_map, &groups); status != kOK) {
    return status;
  }
  std::map<std::string, CountSeries> result;
  for (const auto& [footprint, records] : groups) {
    if (Status status = MonthlyDistinct(records, attribute, &result[footprint]); status != kOK) {
      return status;
    }
  }
  *series = std::move(result);
  return kOK;
}

}  // namespace

Status FootprintMap::Create(std::map<std::string, std::string> table,
                            FootprintMap* footprint_map) {
  for (const auto& [image_type, footprint] : table) {
    if (image_type.empty() || footprint.empty()) {
      LOG(ERROR) << "Footprint table has an empty entry: '" << image_type << "' -> '" << footprint
                 << "'";
      return kInvalidArguments;
    }
    auto it = table.find(footprint);
    if (it != table.end() && it->second != footprint) {
      LOG(ERROR) << "Footprint '" << footprint << "' of image type '" << image_type
                 << "' is itself mapped to '" << it->second << "'";
      return kInvalidArguments;
    }
  }
  *footprint_map = FootprintMap(std::move(table));
  return kOK;
}

std::string FootprintMap::Map(const std::string& image_type) const {
  auto it = table_.find(image_type);
  if (it == table_.end()) {
    return image_type;
  }
  return it->second;
}

std::map<std::string, std::string> DefaultFootprintTable() {
  return {
      {"rhel-edge-commit", "edge"},
      {"rhel-edge-installer", "edge"},
      {"vsphere", "private-cloud"},
      {"guest-image", "private-cloud"},
      {"image-installer", "bare-metal"},
      {"gcp", "gcp"},
      {"aws", "aws"},
      {"azure", "azure"},
      {"vhd", "azure"},
  };
}

std::vector<std::string> DefaultCloudFootprints() { return {"aws", "azure", "gcp"}; }

std::map<std::string, std::string> CollapseFootprints(
    const std::map<std::string, std::string>& table,
    const std::vector<std::string>& cloud_footprints, const std::string& cloud_footprint) {
  auto is_cloud = [&cloud_footprints](const std::string& footprint) {
    return std::find(cloud_footprints.begin(), cloud_footprints.end(), footprint) !=
           cloud_footprints.end();
  };
  std::map<std::string, std::string> collapsed;
  for (const auto& [image_type, footprint] : table) {
    collapsed[image_type] = is_cloud(footprint) ? cloud_footprint : footprint;
  }
  for (const auto& footprint : cloud_footprints) {
    collapsed[footprint] = cloud_footprint;
  }
  return collapsed;
}

Dataset ApplyFootprints(const Dataset& dataset, const FootprintMap& footprint_map) {
  Dataset mapped;
  mapped.reserve(dataset.size());
  for (const auto& record : dataset) {
    BuildRecord copy = record;
    copy.image_type = footprint_map.Map(record.image_type);
    mapped.push_back(std::move(copy));
  }
  return mapped;
}

std::vector<std::string> MapImageTypes(const std::vector<std::string>& image_types,
                                       const FootprintMap& footprint_map) {
  std::vector<std::string> footprints;
  footprints.reserve(image_types.size());
  for (const auto& image_type : image_types) {
    footprints.push_back(footprint_map.Map(image_type));
  }
  return footprints;
}

Status SingleFootprintOrgs(const Dataset& dataset, const FootprintMap& footprint_map,
                           std::map<std::string, std::string>* org_footprints) {
  // The footprint of each org so far. Orgs that built a second footprint move to |mixed|.
  std::map<std::string, std::string> single;
  std::set<std::string> mixed;
  bool has_dated = false;
  for (const auto& record : dataset) {
    if (!record.created_at) {
      continue;
    }
    has_dated = true;
    if (mixed.count(record.org_id) > 0) {
      continue;
    }
    std::string footprint = footprint_map.Map(record.image_type);
    auto [it, inserted] = single.emplace(record.org_id, footprint);
    if (!inserted && it->second != footprint) {
      single.erase(it);
      mixed.insert(record.org_id);
    }
  }
  if (!has_dated) {
    LOG(ERROR) << "Cannot find single-footprint organizations of a dataset with no dated record.";
    return kEmptyDataset;
  }
  *org_footprints = std::move(single);
  return kOK;
}

Status FootprintMonthlyUsers(const Dataset& dataset, const FootprintMap& footprint_map,
                             std::map<std::string, CountSeries>* series) {
  return MonthlyPerFootprint(dataset, footprint_map, OrgId, series);
}

Status FootprintMonthlyBuilds(const Dataset& dataset, const FootprintMap& footprint_map,
                              std::map<std::string, CountSeries>* series) {
  return MonthlyPerFootprint(dataset, footprint_map, JobId, series);
}

}  // namespace ibmetrics::metrics
