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

#include "cli/ControlCommandDispatcher.hpp"

#include <cstdio>
#include <string>

#include "session/Session.hpp"
#include "session/SessionError.hpp"

#include "glog/logging.h"

namespace tabsql {

const char kBeginTransactionCommand[] = "\\b";
const char kCommitTransactionCommand[] = "\\c";
const char kRollbackTransactionCommand[] = "\\r";

bool ControlCommandDispatcher::dispatch(const std::string &batch) {
  void (Session::*primitive)() = nullptr;
  if (batch == kBeginTransactionCommand) {
    primitive = &Session::begin;
  } else if (batch == kCommitTransactionCommand) {
    primitive = &Session::commit;
  } else if (batch == kRollbackTransactionCommand) {
    primitive = &Session::rollback;
  } else {
    return false;
  }

  VLOG(1) << "Control command " << batch;
  try {
    (session_->*primitive)();
  } catch (const EngineError &error) {
    // Printed by the session's error handler.
    VLOG(1) << "Control command " << batch << " failed: " << error.what();
  } catch (const SessionError &error) {
    std::fprintf(err_, "%s\n", error.what());
    std::fflush(err_);
  }
  return true;
}

}  // namespace tabsql
