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

#ifndef TABSQL_CLI_CONTROL_COMMAND_DISPATCHER_HPP_
#define TABSQL_CLI_CONTROL_COMMAND_DISPATCHER_HPP_

#include <cstdio>
#include <string>

#include "utility/Macros.hpp"

namespace tabsql {

class Session;

/** \addtogroup CLI
 *  @{
 */

extern const char kBeginTransactionCommand[];
extern const char kCommitTransactionCommand[];
extern const char kRollbackTransactionCommand[];

/**
 * @brief Intercepts the transaction shortcuts \b, \c and \r. They run the
 *        session's transaction primitives and are never sent as query text.
 **/
class ControlCommandDispatcher {
 public:
  /**
   * @param session Not owned.
   * @param err Where non-engine failures are printed. Not owned.
   **/
  ControlCommandDispatcher(Session *session, FILE *err)
      : session_(session),
        err_(err) {}

  /**
   * @brief Run batch if it is one of the control commands. The match is exact
   *        and case-sensitive.
   *
   * @return true if batch was a control command and has been handled.
   **/
  bool dispatch(const std::string &batch);

 private:
  Session *session_;
  FILE *err_;

  DISALLOW_COPY_AND_ASSIGN(ControlCommandDispatcher);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_CONTROL_COMMAND_DISPATCHER_HPP_
