// Copyright 2019 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.
#include "src/lib/util/file_util.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <streambuf>
#include <string>

#include "absl/strings/str_split.h"
#include "src/lib/util/status_codes.h"
#include "src/logging.h"

namespace ibmetrics::util {

namespace {
// Dumps of a few million records fit comfortably; anything bigger is most likely the wrong file.
constexpr int64_t kMaxFileSize = int64_t{4} * 1024 * 1024 * 1024;

Status ErrnoStatus(const std::string& message) {
  int error_number = errno;
  StatusCode code = ErrnoToStatusCode(error_number).value_or(INTERNAL);
  return Status(code, message, std::strerror(error_number));
}
}  // namespace

Status ReadTextFile(const std::string& file_path, std::string* contents) {
  if (file_path.empty()) {
    return Status(INVALID_ARGUMENT, "ReadTextFile: file_path is empty.");
  }
  errno = 0;
  std::ifstream stream(file_path, std::ifstream::in | std::ifstream::binary);
  if (!stream.good()) {
    return ErrnoStatus("Unable to open file at " + file_path);
  }
  stream.seekg(0, std::ios::end);
  if (!stream.good()) {
    return Status(INTERNAL, "Error reading file at " + file_path);
  }
  auto file_size = static_cast<int64_t>(stream.tellg());
  if (file_size < 0 || file_size > kMaxFileSize) {
    return Status(FAILED_PRECONDITION, "Invalid file length for " + file_path);
  }
  contents->clear();
  if (file_size == 0) {
    return Status::OK;
  }
  contents->reserve(file_size);

  stream.seekg(0, std::ios::beg);
  if (!stream.good()) {
    return Status(INTERNAL, "Error reading file at " + file_path);
  }
  contents->assign((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  if (stream.bad()) {
    return Status(DATA_LOSS, "Error reading file at " + file_path);
  }
  VLOG(3) << "Successfully read " << contents->size() << " bytes from " << file_path;
  return Status::OK;
}

Status ReadNonEmptyTextFile(const std::string& file_path, std::string* contents) {
  RETURN_IF_ERROR(ReadTextFile(file_path, contents));
  if (contents->empty()) {
    return Status(FAILED_PRECONDITION, "File was empty: " + file_path);
  }
  return Status::OK;
}

Status ReadLines(const std::string& file_path, std::vector<std::string>* lines) {
  std::string contents;
  RETURN_IF_ERROR(ReadTextFile(file_path, &contents));
  lines->clear();
  if (contents.empty()) {
    return Status::OK;
  }
  for (absl::string_view line : absl::StrSplit(contents, '\n')) {
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines->emplace_back(std::string(line));
  }
  if (contents.back() == '\n') {
    lines->pop_back();
  }
  return Status::OK;
}

Status WriteTextFile(const std::string& file_path, const std::string& contents) {
  errno = 0;
  std::ofstream stream(file_path, std::ofstream::out | std::ofstream::trunc);
  if (!stream.good()) {
    return ErrnoStatus("Unable to open file for writing at " + file_path);
  }
  stream << contents;
  stream.close();
  if (stream.fail()) {
    return Status(DATA_LOSS, "Error writing file at " + file_path);
  }
  return Status::OK;
}

}  // namespace ibmetrics::util
