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

#include "cli/Flags.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

#include "utility/TableWriter.hpp"

#include "gflags/gflags.h"

namespace tabsql {

DEFINE_string(terminator, ";|^go",
              "Regular expression marking the end of a command batch. It is "
              "matched against the end of each input line and the matched "
              "text is removed from the batch.");

static bool ValidatePageSize(const char *flagname, std::int32_t value) {
  if (value > 0) {
    return true;
  }
  std::fprintf(stderr, "--%s must be positive (got %d)\n", flagname, value);
  return false;
}
DEFINE_int32(page_size, 3000, "Number of rows rendered per table page.");
DEFINE_validator(page_size, &ValidatePageSize);

DEFINE_string(column_separator, " ", "String printed between table columns.");

DEFINE_bool(echo_input, false,
            "Print each line read from --input_file before its batch runs.");

DEFINE_bool(no_prompt_in_echo, false,
            "Echo input lines without their \"<line number>> \" prompt.");

DEFINE_bool(no_header, false, "Render result tables without column headers.");

static bool ValidateTheme(const char *flagname, const std::string &value) {
  TableTheme theme;
  if (ParseTableTheme(value, &theme)) {
    return true;
  }
  std::fprintf(stderr, "--%s must be ASCIICompact or UtfCompact (got %s)\n",
               flagname, value.c_str());
  return false;
}
DEFINE_string(theme, "UtfCompact", "Display theme: ASCIICompact or UtfCompact.");
DEFINE_validator(theme, &ValidateTheme);

DEFINE_string(input_file, "",
              "File to read command batches from. If empty, batches are read "
              "interactively.");

DEFINE_string(output_file, "",
              "File to write results to; truncated if it exists. If empty, "
              "results go to standard output.");

DEFINE_string(history_file, "",
              "Where interactive history is kept. Defaults to "
              "$HOME/.tabsql_history.");

DEFINE_string(server, "localhost:5000", "host:port of the tabular session service.");

DEFINE_string(database, "master", "Database to use after login.");

DEFINE_string(user_name, "", "Login name. Defaults to $USER.");

DEFINE_string(client_hostname, "",
              "Client host name sent at login. Defaults to the system host name.");

DEFINE_bool(chained, false,
            "Use chained transaction mode. Can break lots of stored procedures.");

DEFINE_int32(login_timeout, 0, "Seconds to wait for the login; 0 waits 60 seconds.");

DEFINE_int32(command_timeout, 0, "Seconds a batch may run; 0 for no limit.");

}  // namespace tabsql
