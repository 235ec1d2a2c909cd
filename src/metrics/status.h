// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_METRICS_STATUS_H_
#define IBMETRICS_SRC_METRICS_STATUS_H_

namespace ibmetrics::metrics {

enum Status {
  kOK = 0,

  // The dataset contains no record with a valid created_at timestamp.
  kEmptyDataset,

  // A period or window width is not positive, or a classifier threshold is below its minimum.
  kInvalidWindowSpec,

  // More than one external name record maps to the same identifier.
  kAmbiguousLookup,

  kInvalidArguments,

  // A computed value violates an invariant of the engine.
  kInternalError,
};

// Returns a printable name for |status|, e.g. "kEmptyDataset".
const char* StatusName(Status status);

}  // namespace ibmetrics::metrics

#endif  // IBMETRICS_SRC_METRICS_STATUS_H_
