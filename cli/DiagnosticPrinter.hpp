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

#ifndef TABSQL_CLI_DIAGNOSTIC_PRINTER_HPP_
#define TABSQL_CLI_DIAGNOSTIC_PRINTER_HPP_

#include <cstdio>

#include "session/Session.hpp"

namespace tabsql {

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief The session error handler used by the CLI: prints engine
 *        diagnostics of informational severity and above, and flags those
 *        above the informational severity as failures. Lower severities are
 *        dropped.
 *
 * Query plan and statistics notices are preformatted by the engine and are
 * printed verbatim. Other informational messages get their trailing
 * whitespace replaced by a single newline.
 **/
class DiagnosticPrinter {
 public:
  /**
   * @param out Where diagnostics are written. Not owned.
   **/
  explicit DiagnosticPrinter(FILE *out)
      : out_(out) {}

  /**
   * @return true if the diagnostic reports a failure.
   **/
  bool operator()(const Diagnostic &diagnostic) const;

  /**
   * @return true for the informational codes the engine uses for query
   *         plans and statistics.
   **/
  static bool IsPreformattedNotice(const int code);

 private:
  FILE *out_;
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_DIAGNOSTIC_PRINTER_HPP_
