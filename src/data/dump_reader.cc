// Copyright 2020 The Fuchsia Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "src/data/dump_reader.h"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <functional>
#include <map>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "src/lib/util/datetime_util.h"
#include "src/lib/util/file_util.h"
#include "src/logging.h"

namespace ibmetrics::data {

using metrics::BuildRecord;
using util::INVALID_ARGUMENT;
using util::Status;

namespace {

std::vector<std::string> SplitRow(absl::string_view line) {
  std::vector<std::string> cells;
  for (absl::string_view cell : absl::StrSplit(line, '|')) {
    cells.emplace_back(std::string(absl::StripAsciiWhitespace(cell)));
  }
  return cells;
}

// Returns true if |line| is a footer such as "(12 rows)" and sets |row_count|.
bool ParseFooter(absl::string_view line, int64_t* row_count) {
  line = absl::StripAsciiWhitespace(line);
  if (!absl::ConsumePrefix(&line, "(")) {
    return false;
  }
  if (!absl::ConsumeSuffix(&line, " rows)") && !absl::ConsumeSuffix(&line, " row)")) {
    return false;
  }
  return absl::SimpleAtoi(line, row_count);
}

using CellParser = std::function<Status(const std::string& cell, BuildRecord* record)>;

Status ParseListCell(const std::string& cell, std::vector<std::string>* values) {
  return ParseJsonList(cell, values);
}

// Parsers of the known columns, keyed by column name.
const std::map<std::string, CellParser>& ColumnParsers() {
  static const auto* parsers = new std::map<std::string, CellParser>{
      {"org_id",
       [](const std::string& cell, BuildRecord* record) {
         record->org_id = cell;
         return Status::OK;
       }},
      {"created_at",
       [](const std::string& cell, BuildRecord* record) {
         metrics::Timestamp t;
         if (util::ParseTimestamp(cell, &t)) {
           record->created_at = t;
         }
         return Status::OK;
       }},
      {"job_id",
       [](const std::string& cell, BuildRecord* record) {
         record->job_id = cell;
         return Status::OK;
       }},
      {"image_type",
       [](const std::string& cell, BuildRecord* record) {
         record->image_type = cell;
         return Status::OK;
       }},
      {"packages",
       [](const std::string& cell, BuildRecord* record) {
         return ParseListCell(cell, &record->packages);
       }},
      {"filesystem",
       [](const std::string& cell, BuildRecord* record) {
         return ParseListCell(cell, &record->filesystem);
       }},
      {"payload_repositories",
       [](const std::string& cell, BuildRecord* record) {
         return ParseListCell(cell, &record->payload_repositories);
       }},
      {"account_number",
       [](const std::string& cell, BuildRecord* record) {
         record->account_number = cell;
         return Status::OK;
       }},
  };
  return *parsers;
}

}  // namespace

Status ParseJsonList(const std::string& json, std::vector<std::string>* values) {
  values->clear();
  if (absl::StripAsciiWhitespace(json).empty()) {
    return Status::OK;
  }
  google::protobuf::ListValue list;
  auto parse_status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!parse_status.ok()) {
    return Status(INVALID_ARGUMENT, "Not a JSON array: " + json, parse_status.ToString());
  }
  for (const auto& value : list.values()) {
    switch (value.kind_case()) {
      case google::protobuf::Value::kStringValue:
        values->push_back(value.string_value());
        break;
      case google::protobuf::Value::kNullValue:
        break;
      default: {
        std::string text;
        auto print_status = google::protobuf::util::MessageToJsonString(value, &text);
        if (!print_status.ok()) {
          return Status(INVALID_ARGUMENT, "Unprintable JSON list element in " + json,
                        print_status.ToString());
        }
        values->push_back(std::move(text));
      }
    }
  }
  return Status::OK;
}

Status ParseDump(const std::string& contents, metrics::Dataset* dataset) {
  std::vector<absl::string_view> lines = absl::StrSplit(contents, '\n');
  if (lines.size() < 2 || absl::StripAsciiWhitespace(lines[0]).empty()) {
    return Status(INVALID_ARGUMENT, "Dump has no header.");
  }

  const std::vector<std::string> names = SplitRow(lines[0]);
  std::vector<const CellParser*> parsers;
  parsers.reserve(names.size());
  for (const auto& name : names) {
    auto it = ColumnParsers().find(name);
    if (it == ColumnParsers().end()) {
      VLOG(1) << "Ignoring column '" << name << "'";
      parsers.push_back(nullptr);
    } else {
      parsers.push_back(&it->second);
    }
  }

  metrics::Dataset result;
  int64_t row_count = -1;
  int64_t undated = 0;
  // Line 1 is the separator below the header.
  for (size_t i = 2; i < lines.size(); i++) {
    absl::string_view line = lines[i];
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (ParseFooter(line, &row_count)) {
      break;
    }
    if (absl::StripAsciiWhitespace(line).empty()) {
      continue;
    }
    std::vector<std::string> cells = SplitRow(line);
    if (cells.size() != names.size()) {
      return Status(INVALID_ARGUMENT, absl::StrCat("Line ", i + 1, " has ", cells.size(),
                                                   " cells but the header names ", names.size(),
                                                   " columns."));
    }
    BuildRecord record;
    for (size_t c = 0; c < cells.size(); c++) {
      if (parsers[c] == nullptr) {
        continue;
      }
      Status status = (*parsers[c])(cells[c], &record);
      if (!status.ok()) {
        return Status(status.error_code(),
                      absl::StrCat("Line ", i + 1, ", column ", names[c], ": ",
                                   status.error_message()),
                      status.error_details());
      }
    }
    if (!record.created_at) {
      undated++;
    }
    result.push_back(std::move(record));
  }

  if (row_count == -1) {
    LOG(WARNING) << "Failed to parse row count";
  } else if (row_count != static_cast<int64_t>(result.size())) {
    LOG(WARNING) << "Read " << result.size() << " records but row count in dump footer states "
                 << row_count << " rows";
  }
  if (undated > 0) {
    LOG(WARNING) << undated << " records have no valid created_at and will not be counted.";
  }
  *dataset = std::move(result);
  return Status::OK;
}

Status ReadDump(const std::string& path, metrics::Dataset* dataset) {
  std::string contents;
  RETURN_IF_ERROR(util::ReadNonEmptyTextFile(path, &contents));
  return ParseDump(contents, dataset);
}

}  // namespace ibmetrics::data
