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

#ifndef TABSQL_CLI_INTERACTIVE_SOURCE_HPP_
#define TABSQL_CLI_INTERACTIVE_SOURCE_HPP_

#include <cstddef>
#include <string>

#include "cli/BatchAccumulator.hpp"
#include "cli/BatchSource.hpp"
#include "cli/LineReader.hpp"
#include "cli/TerminatorMatcher.hpp"
#include "utility/Macros.hpp"

namespace tabsql {

class Session;

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief Reads batches typed at a line editor.
 *
 * The prompt shows where the session is connected and the number of the line
 * being typed, e.g. "PROD.master 2 $ ". An interrupt throws away the batch
 * being typed and starts over at line 1.
 **/
class InteractiveSource : public BatchSource {
 public:
  /**
   * @param line_reader The line editor. Not owned.
   * @param session Queried for the prompt. Not owned.
   * @param terminator Must outlive the source.
   **/
  InteractiveSource(LineReader *line_reader,
                    Session *session,
                    const TerminatorMatcher &terminator);

  ReadStatus readBatch(std::string *batch) override;

 private:
  std::string buildPrompt(const std::size_t line_number);

  /**
   * @return The server name reported by the engine, resolved on first use.
   **/
  const std::string& homeServer();

  LineReader *line_reader_;
  Session *session_;
  BatchAccumulator accumulator_;
  std::string home_server_;

  DISALLOW_COPY_AND_ASSIGN(InteractiveSource);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_INTERACTIVE_SOURCE_HPP_
