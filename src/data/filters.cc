// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/data/filters.h"

#include <regex>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "src/lib/util/file_util.h"
#include "src/logging.h"

namespace ibmetrics::data {

using metrics::BuildRecord;
using metrics::Dataset;
using metrics::Timestamp;
using util::INVALID_ARGUMENT;
using util::Status;

namespace {

// Collects the users whose name matches any of |patterns|.
Status MatchingUsers(const std::vector<UserInfo>& users, const std::vector<std::string>& patterns,
                     std::vector<const UserInfo*>* matches) {
  std::vector<std::regex> expressions;
  for (const auto& pattern : patterns) {
    if (pattern.empty()) {
      continue;
    }
    try {
      expressions.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
      return Status(INVALID_ARGUMENT, absl::StrCat("Invalid user filter pattern: ", pattern),
                    e.what());
    }
  }

  for (const auto& user : users) {
    const std::string name = user.name.value_or(kMissingUserName);
    for (const auto& expression : expressions) {
      if (std::regex_search(name, expression, std::regex_constants::match_continuous)) {
        matches->push_back(&user);
        break;
      }
    }
  }
  return Status::OK;
}

}  // namespace

Status GetFilterIds(const std::vector<UserInfo>& users, const std::vector<std::string>& patterns,
                    std::set<std::string>* ids) {
  std::vector<const UserInfo*> matches;
  RETURN_IF_ERROR(MatchingUsers(users, patterns, &matches));
  for (const UserInfo* user : matches) {
    ids->insert(user->org_id);
  }
  return Status::OK;
}

Dataset FilterOrgs(const Dataset& dataset, const std::set<std::string>& org_ids) {
  Dataset filtered;
  for (const BuildRecord& record : dataset) {
    if (org_ids.count(record.org_id) == 0) {
      filtered.push_back(record);
    }
  }
  return filtered;
}

Status FilterUsers(const Dataset& dataset, const std::vector<UserInfo>& users,
                   const std::vector<std::string>& patterns, Dataset* filtered) {
  std::vector<const UserInfo*> matches;
  RETURN_IF_ERROR(MatchingUsers(users, patterns, &matches));
  std::set<std::string> ids;
  for (const UserInfo* user : matches) {
    ids.insert(user->account_number);
  }

  Dataset result;
  for (const BuildRecord& record : dataset) {
    if (ids.count(record.account_number) == 0) {
      result.push_back(record);
    }
  }
  VLOG(1) << "Filtered " << dataset.size() - result.size() << " builds of " << ids.size()
          << " accounts.";
  *filtered = std::move(result);
  return Status::OK;
}

Dataset SliceTime(const Dataset& dataset, Timestamp start, Timestamp end) {
  Dataset sliced;
  for (const BuildRecord& record : dataset) {
    if (record.created_at && *record.created_at >= start && *record.created_at <= end) {
      sliced.push_back(record);
    }
  }
  return sliced;
}

Status ReadUserFilter(const std::string& path, std::vector<std::string>* patterns) {
  std::vector<std::string> lines;
  RETURN_IF_ERROR(util::ReadLines(path, &lines));
  patterns->clear();
  for (const auto& line : lines) {
    std::string pattern(absl::StripAsciiWhitespace(line));
    if (pattern.empty() || pattern[0] == '#') {
      continue;
    }
    patterns->push_back(std::move(pattern));
  }
  return Status::OK;
}

}  // namespace ibmetrics::data
