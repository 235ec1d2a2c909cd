// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/lib/util/status_codes.h"

namespace ibmetrics::util {

std::optional<StatusCode> ErrnoToStatusCode(int error_number) {
  switch (error_number) {
    case 0:
      return OK;

    case EINVAL:
    case EISDIR:
    case ENAMETOOLONG:
      return INVALID_ARGUMENT;

    case ENODEV:
    case ENOENT:
    case ENOTDIR:
    case ENXIO:
      return NOT_FOUND;

    case EEXIST:
      return ALREADY_EXISTS;

    case EPERM:
    case EACCES:
    case EROFS:
      return PERMISSION_DENIED;

    case EMFILE:
    case ENFILE:
    case ENOMEM:
      return RESOURCE_EXHAUSTED;

    case EFBIG:
    case EOVERFLOW:
    case ERANGE:
      return OUT_OF_RANGE;

    case ENOSYS:
    case ENOTSUP:
      return UNIMPLEMENTED;

    case EIO:
      return DATA_LOSS;

    case ECANCELED:
      return CANCELLED;

    default:
      return std::nullopt;
  }
}

const char* StatusCodeName(StatusCode code) {
  switch (code) {
    case OK:
      return "OK";
    case CANCELLED:
      return "CANCELLED";
    case UNKNOWN:
      return "UNKNOWN";
    case INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case NOT_FOUND:
      return "NOT_FOUND";
    case ALREADY_EXISTS:
      return "ALREADY_EXISTS";
    case PERMISSION_DENIED:
      return "PERMISSION_DENIED";
    case RESOURCE_EXHAUSTED:
      return "RESOURCE_EXHAUSTED";
    case FAILED_PRECONDITION:
      return "FAILED_PRECONDITION";
    case OUT_OF_RANGE:
      return "OUT_OF_RANGE";
    case UNIMPLEMENTED:
      return "UNIMPLEMENTED";
    case INTERNAL:
      return "INTERNAL";
    case DATA_LOSS:
      return "DATA_LOSS";
  }
  return "UNKNOWN";
}

}  // namespace ibmetrics::util
