// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_LIB_UTIL_STATUS_H_
#define IBMETRICS_SRC_LIB_UTIL_STATUS_H_

#include <string>

#include "src/lib/util/status_codes.h"

namespace ibmetrics {
namespace util {

// The result of reading, parsing or validating an input of the report.
//
// A Status carries a StatusCode, a message for the user and optional details, such as the error
// reported by the protobuf parser.
class Status {
 public:
  Status() = default;

  Status(StatusCode code, std::string error_message)
      : code_(code), error_message_(std::move(error_message)) {}

  Status(StatusCode code, std::string error_message, std::string error_details)
      : code_(code),
        error_message_(std::move(error_message)),
        error_details_(std::move(error_details)) {}

  static const Status &OK;

  [[nodiscard]] StatusCode error_code() const { return code_; }
  [[nodiscard]] const std::string &error_message() const { return error_message_; }
  [[nodiscard]] const std::string &error_details() const { return error_details_; }

  [[nodiscard]] bool ok() const { return code_ == StatusCode::OK; }

  // Returns a copy of this status whose message is prefixed with "|context|: ". OK is returned
  // unchanged.
  [[nodiscard]] Status Annotate(const std::string &context) const;

  // Returns "<CODE>: <message>", or "OK". Details follow in parentheses.
  [[nodiscard]] std::string ToString() const;

 private:
  StatusCode code_ = StatusCode::OK;
  std::string error_message_;
  std::string error_details_;
};

// Returns from the calling function with the status of |expr| if it is an error.
//
// |expr| is evaluated only once.
#define RETURN_IF_ERROR(expr)                                  \
  do {                                                         \
    ::ibmetrics::util::Status return_if_error_status = (expr); \
    if (!return_if_error_status.ok()) {                        \
      return return_if_error_status;                           \
    }                                                          \
  } while (false)

}  // namespace util
}  // namespace ibmetrics

#endif  // IBMETRICS_SRC_LIB_UTIL_STATUS_H_
