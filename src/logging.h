// Copyright 2017 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_LOGGING_H_
#define IBMETRICS_SRC_LOGGING_H_

#ifdef HAVE_GLOG
#include <glog/logging.h>

#define INIT_LOGGING(val)                  \
  {                                        \
    google::InitGoogleLogging(val);        \
    google::InstallFailureSignalHandler(); \
  }

#else
#error "HAVE_GLOG must be defined"
#endif

#endif  // IBMETRICS_SRC_LOGGING_H_
