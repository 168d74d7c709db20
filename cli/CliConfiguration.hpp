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

#ifndef TABSQL_CLI_CLI_CONFIGURATION_HPP_
#define TABSQL_CLI_CLI_CONFIGURATION_HPP_

#include <cstddef>
#include <string>

#include "session/GrpcSession.hpp"
#include "utility/TableWriter.hpp"

namespace tabsql {

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief Every setting of the CLI, built once at startup and handed by const
 *        reference to the components that need it.
 **/
struct CliConfiguration {
  CliConfiguration()
      : page_size(3000),
        column_separator(" "),
        echo_input(false),
        echo_line_numbers(true),
        print_header(true),
        theme(TableTheme::kUtfCompact) {}

  /**
   * @brief Build the configuration from the command line flags. Must be
   *        called after gflags::ParseCommandLineFlags().
   **/
  static CliConfiguration FromFlags();

  // Batch terminator regex, anchored at end of line.
  std::string terminator;
  std::size_t page_size;
  std::string column_separator;
  bool echo_input;
  bool echo_line_numbers;
  bool print_header;
  TableTheme theme;

  // Empty for interactive input.
  std::string input_file;
  // Empty for standard output.
  std::string output_file;
  std::string history_file;

  GrpcSessionOptions session;
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_CLI_CONFIGURATION_HPP_
