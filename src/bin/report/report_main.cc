// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "gflags/gflags.h"
#include "src/bin/report/report_app.h"
#include "src/logging.h"

int main(int argc, char* argv[]) {
  google::SetUsageMessage(
      "Image-builder usage report.\n"
      "Reads a database dump of builds given by the -dump flag and prints a summary, "
      "frequency tables and the usage series of the builds.");
  google::ParseCommandLineFlags(&argc, &argv, true);
  INIT_LOGGING(argv[0]);

  ibmetrics::ReportOptions options;
  auto app = ibmetrics::ReportApp::CreateFromFlagsOrDie(&options);
  auto status = app->Run(options);
  if (!status.ok()) {
    LOG(ERROR) << "Report failed: " << status.ToString();
    return 1;
  }
  return 0;
}
