// Copyright 2019 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
#ifndef IBMETRICS_SRC_LIB_UTIL_FILE_UTIL_H_
#define IBMETRICS_SRC_LIB_UTIL_FILE_UTIL_H_

#include <string>
#include <vector>

#include "src/lib/util/status.h"

namespace ibmetrics {
namespace util {

// Reads the whole file at |file_path| into |contents|.
Status ReadTextFile(const std::string& file_path, std::string* contents);

// Like ReadTextFile() but fails with FAILED_PRECONDITION if the file is empty.
Status ReadNonEmptyTextFile(const std::string& file_path, std::string* contents);

// Reads the file at |file_path| and splits it into lines. Line terminators are removed and a
// trailing empty line is not reported.
Status ReadLines(const std::string& file_path, std::vector<std::string>* lines);

// Writes |contents| to |file_path|, replacing any existing file.
Status WriteTextFile(const std::string& file_path, const std::string& contents);

}  // namespace util
}  // namespace ibmetrics
#endif  // IBMETRICS_SRC_LIB_UTIL_FILE_UTIL_H_
