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

#include "cli/CliConfiguration.hpp"

#include <unistd.h>

#include <climits>
#include <cstddef>
#include <cstdlib>
#include <string>

#include "cli/Flags.hpp"
#include "utility/TableWriter.hpp"

#include "gflags/gflags.h"
#include "glog/logging.h"

namespace tabsql {

namespace {

std::string EnvironmentOr(const char *name, const std::string &fallback) {
  const char *value = std::getenv(name);
  return value == nullptr ? fallback : std::string(value);
}

std::string SystemHostName() {
  char name[HOST_NAME_MAX + 1];
  if (gethostname(name, sizeof(name)) != 0) {
    PLOG(WARNING) << "gethostname failed";
    return std::string();
  }
  name[HOST_NAME_MAX] = '\0';
  return name;
}

}  // namespace

CliConfiguration CliConfiguration::FromFlags() {
  CliConfiguration config;

  config.terminator = FLAGS_terminator;
  config.page_size = static_cast<std::size_t>(FLAGS_page_size);
  config.column_separator = FLAGS_column_separator;
  config.echo_input = FLAGS_echo_input;
  config.echo_line_numbers = !FLAGS_no_prompt_in_echo;
  config.print_header = !FLAGS_no_header;
  CHECK(ParseTableTheme(FLAGS_theme, &config.theme))
      << "Unvalidated theme " << FLAGS_theme;

  config.input_file = FLAGS_input_file;
  config.output_file = FLAGS_output_file;
  config.history_file = FLAGS_history_file.empty()
                            ? EnvironmentOr("HOME", ".") + "/.tabsql_history"
                            : FLAGS_history_file;

  config.session.server = FLAGS_server;
  config.session.database = FLAGS_database;
  config.session.user_name = FLAGS_user_name.empty()
                                 ? EnvironmentOr("USER", "")
                                 : FLAGS_user_name;
  config.session.client_hostname = FLAGS_client_hostname.empty()
                                       ? SystemHostName()
                                       : FLAGS_client_hostname;
  config.session.chained = FLAGS_chained;
  config.session.login_timeout_seconds = FLAGS_login_timeout;
  config.session.command_timeout_seconds = FLAGS_command_timeout;

  return config;
}

}  // namespace tabsql
