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

#ifndef TABSQL_CLI_FLAGS_HPP_
#define TABSQL_CLI_FLAGS_HPP_

#include "gflags/gflags_declare.h"

namespace tabsql {

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief A collection of common flags shared by the tabsql CLI binaries.
 **/

DECLARE_string(terminator);
DECLARE_int32(page_size);
DECLARE_string(column_separator);
DECLARE_bool(echo_input);
DECLARE_bool(no_prompt_in_echo);
DECLARE_bool(no_header);
DECLARE_string(theme);
DECLARE_string(input_file);
DECLARE_string(output_file);
DECLARE_string(history_file);

DECLARE_string(server);
DECLARE_string(database);
DECLARE_string(user_name);
DECLARE_string(client_hostname);
DECLARE_bool(chained);
DECLARE_int32(login_timeout);
DECLARE_int32(command_timeout);

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_FLAGS_HPP_
