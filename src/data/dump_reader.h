// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef IBMETRICS_SRC_DATA_DUMP_READER_H_
#define IBMETRICS_SRC_DATA_DUMP_READER_H_

#include <string>
#include <vector>

#include "src/lib/util/status.h"
#include "src/metrics/build_record.h"

namespace ibmetrics::data {

// Reads a pipe-delimited database dump of build records.
//
// The expected layout is the one printed by psql:
//
//    org_id | created_at          | job_id | image_type | packages     | ...
//   --------+---------------------+--------+------------+--------------+----
//    1234   | 2022-05-04 12:00:00 | 5b1e.. | aws        | ["vim", "gcc"] | ...
//   (1 row)
//
// The first line names the columns and the second line is ignored. Rows follow until a footer of
// the form "(N rows)". Columns other than those of metrics::BuildRecord are ignored and missing
// columns are left empty. A missing footer, or a footer that disagrees with the number of rows
// read, is logged as a warning.
//
// created_at values that are not timestamps produce undated records. The packages, filesystem
// and payload_repositories cells hold JSON arrays; an empty cell is an empty list.
//
// Returns INVALID_ARGUMENT if the header is missing, a row has the wrong number of cells, or a
// list cell is not a JSON array.
util::Status ParseDump(const std::string& contents, metrics::Dataset* dataset);

// Reads the file at |path| and parses it with ParseDump().
util::Status ReadDump(const std::string& path, metrics::Dataset* dataset);

// Parses a JSON array into a list of strings. Non-string elements are kept as their JSON text and
// nulls are dropped. An empty or all-whitespace |json| is an empty list.
util::Status ParseJsonList(const std::string& json, std::vector<std::string>* values);

}  // namespace ibmetrics::data

#endif  // IBMETRICS_SRC_DATA_DUMP_READER_H_
