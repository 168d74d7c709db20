/**
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 **/

#include "utility/TableWriter.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include "utility/StringUtil.hpp"

#include "glog/logging.h"

namespace tabsql {

bool ParseTableTheme(const std::string &name, TableTheme *theme) {
  if (name == "ASCIICompact") {
    *theme = TableTheme::kASCIICompact;
    return true;
  }
  if (name == "UtfCompact") {
    *theme = TableTheme::kUtfCompact;
    return true;
  }
  return false;
}

TableWriter::TableWriter(FILE *out,
                         const TableTheme theme,
                         const std::string &column_separator,
                         const bool print_header)
    : out_(out),
      theme_(theme),
      column_separator_(column_separator),
      print_header_(print_header) {
  DCHECK(out_ != nullptr);
}

void TableWriter::render() {
  std::size_t num_columns = header_.size();
  for (const std::vector<std::string> &row : rows_) {
    num_columns = std::max(num_columns, row.size());
  }

  std::vector<std::size_t> widths(num_columns, 0);
  if (print_header_) {
    for (std::size_t i = 0; i < header_.size(); ++i) {
      widths[i] = Utf8Length(header_[i]);
    }
  }
  for (const std::vector<std::string> &row : rows_) {
    for (std::size_t i = 0; i < row.size(); ++i) {
      widths[i] = std::max(widths[i], Utf8Length(row[i]));
    }
  }

  if (print_header_ && !header_.empty()) {
    writeLine(header_, widths);
    writeRule(widths);
  }
  for (const std::vector<std::string> &row : rows_) {
    writeLine(row, widths);
  }
  rows_.clear();
}

void TableWriter::writeLine(const std::vector<std::string> &cells,
                            const std::vector<std::size_t> &widths) const {
  std::string line;
  for (std::size_t i = 0; i < widths.size(); ++i) {
    const std::string cell = i < cells.size() ? cells[i] : std::string();
    if (i != 0) {
      line.append(column_separator_);
    }
    line.append(cell);
    // The last column is left ragged.
    if (i + 1 < widths.size()) {
      line.append(widths[i] - Utf8Length(cell), ' ');
    }
  }
  std::fprintf(out_, "%s\n", line.c_str());
}

void TableWriter::writeRule(const std::vector<std::size_t> &widths) const {
  const char *rule_char = (theme_ == TableTheme::kUtfCompact) ? "─" : "-";
  std::string line;
  for (std::size_t i = 0; i < widths.size(); ++i) {
    if (i != 0) {
      line.append(column_separator_);
    }
    for (std::size_t w = 0; w < widths[i]; ++w) {
      line.append(rule_char);
    }
  }
  std::fprintf(out_, "%s\n", line.c_str());
}

}  // namespace tabsql
