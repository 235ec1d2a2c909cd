// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_DATA_USER_INFO_H_
#define IBMETRICS_SRC_DATA_USER_INFO_H_

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "src/lib/util/status.h"
#include "src/metrics/status.h"

namespace ibmetrics::data {

// External naming information about one customer account.
struct UserInfo {
  // Unset if the source has no name for the account.
  std::optional<std::string> name;
  std::string account_number;
  std::string org_id;
};

// Parses a JSON array of objects with the keys "name", "accountNumber" and "org_id". Numeric
// identifiers are converted to their decimal text. Keys other than these are ignored.
//
// Returns INVALID_ARGUMENT if |json| is not an array of objects.
util::Status ParseUserInfo(const std::string& json, std::vector<UserInfo>* users);

// Reads the file at |path| and parses it with ParseUserInfo().
util::Status ReadUserInfo(const std::string& path, std::vector<UserInfo>* users);

// Resolves account numbers to user names.
class UserDirectory {
 public:
  explicit UserDirectory(const std::vector<UserInfo>& users);

  UserDirectory(const UserDirectory& other) = delete;
  UserDirectory& operator=(const UserDirectory& other) = delete;

  // Sets |name| to the name of the user with |account_number|. If there is no such user, or the
  // user has no name, |name| is set to |account_number|.
  //
  // Returns kAmbiguousLookup if more than one user has |account_number|; |name| is not set.
  metrics::Status NameForAccount(const std::string& account_number, std::string* name) const;

  [[nodiscard]] bool empty() const { return users_by_account_.empty(); }

 private:
  std::unordered_map<std::string, std::vector<const UserInfo*>> users_by_account_;
  std::vector<UserInfo> users_;
};

}  // namespace ibmetrics::data

#endif  // IBMETRICS_SRC_DATA_USER_INFO_H_
