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

#include "cli/ResultRenderer.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "cli/CliConfiguration.hpp"
#include "session/CellValue.hpp"
#include "session/Session.hpp"
#include "session/SessionError.hpp"
#include "utility/TableWriter.hpp"

#include "glog/logging.h"

namespace tabsql {

ResultRenderer::ResultRenderer(const CliConfiguration &config, FILE *out, FILE *err)
    : config_(config),
      out_(out),
      err_(err) {
  CHECK_GT(config_.page_size, 0u);
}

std::size_t ResultRenderer::renderCurrent(ResultSet *results) {
  const std::vector<std::string> &columns = results->columns();
  TableWriter table(out_, config_.theme, config_.column_separator, config_.print_header);
  table.setHeader(columns);

  std::size_t num_rows = 0;
  std::vector<CellValue> values;
  std::vector<std::string> row;
  try {
    while (results->nextRow(&values)) {
      ++num_rows;
      if (columns.empty()) {
        continue;
      }
      row.clear();
      for (const CellValue &value : values) {
        row.push_back(value.toDisplayString());
      }
      table.append(row);
      if (table.numPendingRows() == config_.page_size) {
        table.render();
      }
    }
  } catch (const EngineError &error) {
    VLOG(1) << "Row fetch stopped by an engine error: " << error.what();
  } catch (const SessionError &error) {
    std::fprintf(err_, "%s\n", error.what());
    std::fflush(err_);
  }

  if (!columns.empty() && table.numPendingRows() > 0) {
    table.render();
  }
  VLOG(2) << "Rendered " << num_rows << " row(s) in " << columns.size() << " column(s)";

  std::int64_t rows_affected = 0;
  std::int32_t return_status = 0;
  const bool has_rows_affected = results->rowsAffected(&rows_affected);
  const bool has_return_status = results->returnStatus(&return_status);
  const std::string summary = FormatSummary(has_rows_affected, rows_affected,
                                            has_return_status, return_status);
  if (!summary.empty()) {
    std::fprintf(out_, "%s\n", summary.c_str());
  }

  std::fflush(out_);
  return num_rows;
}

std::string ResultRenderer::FormatSummary(const bool has_rows_affected,
                                          const std::int64_t rows_affected,
                                          const bool has_return_status,
                                          const std::int32_t return_status) {
  if (!has_rows_affected && !has_return_status) {
    return std::string();
  }

  std::string display;
  if (has_rows_affected) {
    display = std::to_string(rows_affected)
              + (rows_affected == 1 ? " row affected" : " rows affected");
  }
  if (has_return_status) {
    if (has_rows_affected) {
      display += ", ";
    }
    display += "return status = " + std::to_string(return_status);
  }
  return "(" + display + ")";
}

}  // namespace tabsql
