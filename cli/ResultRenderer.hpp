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

#ifndef TABSQL_CLI_RESULT_RENDERER_HPP_
#define TABSQL_CLI_RESULT_RENDERER_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

#include "utility/Macros.hpp"

namespace tabsql {

struct CliConfiguration;
class ResultSet;

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief Prints a result set as pages of table rows followed by its summary
 *        line.
 **/
class ResultRenderer {
 public:
  /**
   * @param config Page size and table style. Must outlive the renderer.
   * @param out Where tables and summaries go. Not owned.
   * @param err Where row fetch failures are reported. Not owned.
   **/
  ResultRenderer(const CliConfiguration &config, FILE *out, FILE *err);

  /**
   * @brief Consume the current result set of results: render its rows a page
   *        at a time, then its summary line, then flush the output. A failed
   *        row fetch ends the rows but not the summary.
   *
   * @return The number of rows fetched.
   **/
  std::size_t renderCurrent(ResultSet *results);

  /**
   * @brief Format the summary of a result set, e.g. "(1 row affected)" or
   *        "(3 rows affected, return status = 0)".
   *
   * @return An empty string if the engine reported neither count.
   **/
  static std::string FormatSummary(const bool has_rows_affected,
                                   const std::int64_t rows_affected,
                                   const bool has_return_status,
                                   const std::int32_t return_status);

 private:
  const CliConfiguration &config_;
  FILE *out_;
  FILE *err_;

  DISALLOW_COPY_AND_ASSIGN(ResultRenderer);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_RESULT_RENDERER_HPP_
