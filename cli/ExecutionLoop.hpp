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

#ifndef TABSQL_CLI_EXECUTION_LOOP_HPP_
#define TABSQL_CLI_EXECUTION_LOOP_HPP_

#include <cstdio>
#include <string>

#include "cli/ControlCommandDispatcher.hpp"
#include "cli/ResultRenderer.hpp"
#include "utility/Macros.hpp"

namespace tabsql {

class BatchSource;
class InterruptChannel;
class Session;
struct CliConfiguration;

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief How ExecutionLoop::run() ended.
 **/
enum class ExitStatus {
  kSuccess = 0,
  kReadFailure,
  kResultSetAdvanceFailure
};

/**
 * @brief The read-execute-render loop: pulls batches from a source, handles
 *        control commands, submits everything else to the session and renders
 *        every result set produced. Batches run strictly one after another.
 **/
class ExecutionLoop {
 public:
  /**
   * @brief Constructor. None of the pointers are owned.
   *
   * @param config Must outlive the loop.
   * @param source Where batches come from.
   * @param session Where batches are submitted.
   * @param interrupts Interrupts arriving during a submission cancel it.
   * @param out Result tables and summaries.
   * @param err Errors not already reported by the session's error handler.
   **/
  ExecutionLoop(const CliConfiguration &config,
                BatchSource *source,
                Session *session,
                InterruptChannel *interrupts,
                FILE *out,
                FILE *err);

  /**
   * @brief Run until the source is exhausted, reading fails, a SIGTERM is
   *        received between batches, or a result set cannot be advanced to.
   **/
  ExitStatus run();

  /**
   * @brief Submit one batch and render all of its result sets. Submission
   *        errors are reported and swallowed.
   *
   * @return false if advancing to a further result set failed, which ends the
   *         loop.
   **/
  bool executeBatch(const std::string &batch);

 private:
  BatchSource *source_;
  Session *session_;
  InterruptChannel *interrupts_;
  FILE *out_;
  FILE *err_;

  ControlCommandDispatcher dispatcher_;
  ResultRenderer renderer_;

  DISALLOW_COPY_AND_ASSIGN(ExecutionLoop);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_EXECUTION_LOOP_HPP_
