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

#include "cli/ExecutionLoop.hpp"

#include <signal.h>

#include <cstdio>
#include <memory>
#include <string>

#include "cli/BatchSource.hpp"
#include "cli/CliConfiguration.hpp"
#include "session/Session.hpp"
#include "session/SessionError.hpp"
#include "threading/CancellationBridge.hpp"
#include "threading/CancellationToken.hpp"
#include "threading/InterruptChannel.hpp"
#include "utility/StringUtil.hpp"

#include "glog/logging.h"

namespace tabsql {

ExecutionLoop::ExecutionLoop(const CliConfiguration &config,
                             BatchSource *source,
                             Session *session,
                             InterruptChannel *interrupts,
                             FILE *out,
                             FILE *err)
    : source_(DCHECK_NOTNULL(source)),
      session_(DCHECK_NOTNULL(session)),
      interrupts_(DCHECK_NOTNULL(interrupts)),
      out_(out),
      err_(err),
      dispatcher_(session, err),
      renderer_(config, out, err) {}

ExitStatus ExecutionLoop::run() {
  std::string batch;
  for (;;) {
    if (interrupts_->drain() == SIGTERM) {
      LOG(INFO) << "Terminated between batches";
      return ExitStatus::kSuccess;
    }

    ReadStatus status;
    try {
      status = source_->readBatch(&batch);
    } catch (const InputError &error) {
      std::fprintf(err_, "%s\n", error.what());
      std::fflush(err_);
      LOG(ERROR) << "Stopping after a read failure: " << error.what();
      return ExitStatus::kReadFailure;
    }

    if (status == ReadStatus::kEndOfInput) {
      VLOG(1) << "End of input";
      return ExitStatus::kSuccess;
    }
    // Interrupts seen while reading do not carry over to the submission.
    if (interrupts_->drain() == SIGTERM) {
      LOG(INFO) << "Terminated while reading; batch not submitted";
      return ExitStatus::kSuccess;
    }

    if (dispatcher_.dispatch(batch) || IsBlank(batch)) {
      continue;
    }

    if (!executeBatch(batch)) {
      return ExitStatus::kResultSetAdvanceFailure;
    }
  }
}

bool ExecutionLoop::executeBatch(const std::string &batch) {
  VLOG(1) << "Submitting batch: " << batch;

  std::unique_ptr<ResultSet> results;
  CancellationToken token;
  CancellationBridge bridge(interrupts_, &token);
  try {
    results = session_->submit(batch, &token);
  } catch (const EngineError &error) {
    bridge.retire();
    VLOG(1) << "Batch failed in the engine: " << error.what();
    return true;
  } catch (const SessionError &error) {
    bridge.retire();
    std::fprintf(err_, "%s\n", error.what());
    std::fflush(err_);
    return true;
  }
  bridge.retire();

  if (results == nullptr) {
    return true;
  }

  for (;;) {
    renderer_.renderCurrent(results.get());

    if (!results->hasNextResultSet()) {
      return true;
    }
    try {
      results->advanceToNextResultSet();
    } catch (const EngineError &error) {
      LOG(ERROR) << "Unable to advance to the next result set: " << error.what();
      return false;
    } catch (const SessionError &error) {
      std::fprintf(err_, "%s\n", error.what());
      std::fflush(err_);
      LOG(ERROR) << "Unable to advance to the next result set: " << error.what();
      return false;
    }
    std::fprintf(out_, "\n");
  }
}

}  // namespace tabsql
