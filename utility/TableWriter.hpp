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

#ifndef TABSQL_UTILITY_TABLE_WRITER_HPP_
#define TABSQL_UTILITY_TABLE_WRITER_HPP_

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include "utility/Macros.hpp"

namespace tabsql {

/** \addtogroup Utility
 *  @{
 */

/**
 * @brief Visual styles understood by TableWriter.
 **/
enum class TableTheme {
  kASCIICompact = 0,
  kUtfCompact
};

/**
 * @brief Parse a theme name ("ASCIICompact" or "UtfCompact").
 *
 * @param name The theme name.
 * @param theme Set to the parsed theme on success.
 * @return false if the name is not a known theme.
 **/
bool ParseTableTheme(const std::string &name, TableTheme *theme);

/**
 * @brief Accumulates rows of strings and writes them as an aligned text
 *        table.
 *
 * A compact table has no borders: a header line, a rule under each column,
 * then one line per row. Each render() call is independent, so columns are
 * aligned within the rows of a single render only.
 **/
class TableWriter {
 public:
  /**
   * @brief Constructor.
   *
   * @param out Where rendered tables are written. Not owned.
   * @param theme The rule style.
   * @param column_separator Written between two adjacent columns.
   * @param print_header If false, the header line and rule are omitted.
   **/
  TableWriter(FILE *out,
              const TableTheme theme,
              const std::string &column_separator,
              const bool print_header);

  void setHeader(const std::vector<std::string> &header) {
    header_ = header;
  }

  const std::vector<std::string>& header() const {
    return header_;
  }

  void append(const std::vector<std::string> &row) {
    rows_.push_back(row);
  }

  std::size_t numPendingRows() const {
    return rows_.size();
  }

  /**
   * @brief Write the header and all appended rows, then forget the rows. The
   *        header is kept for the next page.
   **/
  void render();

 private:
  void writeLine(const std::vector<std::string> &cells,
                 const std::vector<std::size_t> &widths) const;

  void writeRule(const std::vector<std::size_t> &widths) const;

  FILE *out_;
  const TableTheme theme_;
  const std::string column_separator_;
  const bool print_header_;

  std::vector<std::string> header_;
  std::vector<std::vector<std::string>> rows_;

  DISALLOW_COPY_AND_ASSIGN(TableWriter);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_UTILITY_TABLE_WRITER_HPP_
