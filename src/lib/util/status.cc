// Copyright 2018 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/lib/util/status.h"

namespace ibmetrics::util {

namespace {
const Status kOkStatus;
}  // namespace

const Status &Status::OK = kOkStatus;

Status Status::Annotate(const std::string &context) const {
  if (ok()) {
    return *this;
  }
  return Status(code_, context + ": " + error_message_, error_details_);
}

std::string Status::ToString() const {
  if (ok()) {
    return "OK";
  }
  std::string out = std::string(StatusCodeName(code_)) + ": " + error_message_;
  if (!error_details_.empty()) {
    out += " (" + error_details_ + ")";
  }
  return out;
}

}  // namespace ibmetrics::util
