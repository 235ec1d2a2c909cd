// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/data/user_info.h"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>

#include "absl/strings/str_cat.h"
#include "src/lib/util/file_util.h"
#include "src/logging.h"

namespace ibmetrics::data {

using google::protobuf::Struct;
using google::protobuf::Value;
using util::INVALID_ARGUMENT;
using util::Status;

namespace {

// Converts a JSON string or number to text. Returns false for any other kind.
bool IdentifierText(const Value& value, std::string* text) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      *text = value.string_value();
      return true;
    case Value::kNumberValue: {
      double number = value.number_value();
      if (std::floor(number) == number && std::fabs(number) < 9.0e15) {
        *text = absl::StrCat(static_cast<int64_t>(number));
      } else {
        *text = absl::StrCat(number);
      }
      return true;
    }
    default:
      return false;
  }
}

}  // namespace

Status ParseUserInfo(const std::string& json, std::vector<UserInfo>* users) {
  google::protobuf::ListValue list;
  auto parse_status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!parse_status.ok()) {
    return Status(INVALID_ARGUMENT, "User info is not a JSON array.", parse_status.ToString());
  }

  std::vector<UserInfo> result;
  result.reserve(list.values_size());
  for (int i = 0; i < list.values_size(); i++) {
    const Value& entry = list.values(i);
    if (entry.kind_case() != Value::kStructValue) {
      return Status(INVALID_ARGUMENT, absl::StrCat("User info entry ", i, " is not an object."));
    }
    const auto& fields = entry.struct_value().fields();
    UserInfo user;
    if (auto it = fields.find("name"); it != fields.end()) {
      std::string name;
      if (IdentifierText(it->second, &name)) {
        user.name = std::move(name);
      }
    }
    if (auto it = fields.find("accountNumber"); it != fields.end()) {
      IdentifierText(it->second, &user.account_number);
    }
    if (auto it = fields.find("org_id"); it != fields.end()) {
      IdentifierText(it->second, &user.org_id);
    }
    result.push_back(std::move(user));
  }
  VLOG(2) << "Parsed " << result.size() << " user info entries.";
  *users = std::move(result);
  return Status::OK;
}

Status ReadUserInfo(const std::string& path, std::vector<UserInfo>* users) {
  std::string contents;
  RETURN_IF_ERROR(util::ReadNonEmptyTextFile(path, &contents));
  return ParseUserInfo(contents, users);
}

UserDirectory::UserDirectory(const std::vector<UserInfo>& users) : users_(users) {
  for (const auto& user : users_) {
    users_by_account_[user.account_number].push_back(&user);
  }
}

metrics::Status UserDirectory::NameForAccount(const std::string& account_number,
                                              std::string* name) const {
  auto it = users_by_account_.find(account_number);
  if (it == users_by_account_.end()) {
    *name = account_number;
    return metrics::kOK;
  }
  if (it->second.size() > 1) {
    LOG(ERROR) << "Multiple (" << it->second.size() << ") entries with same account_number ("
               << account_number << ") in user data";
    return metrics::kAmbiguousLookup;
  }
  const UserInfo* user = it->second.front();
  *name = user->name.value_or(account_number);
  return metrics::kOK;
}

}  // namespace ibmetrics::data
