// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/metrics/status.h"

namespace ibmetrics::metrics {

const char* StatusName(Status status) {
  switch (status) {
    case kOK:
      return "kOK";
    case kEmptyDataset:
      return "kEmptyDataset";
    case kInvalidWindowSpec:
      return "kInvalidWindowSpec";
    case kAmbiguousLookup:
      return "kAmbiguousLookup";
    case kInvalidArguments:
      return "kInvalidArguments";
    case kInternalError:
      return "kInternalError";
  }
  return "kUnknown";
}

}  // namespace ibmetrics::metrics
