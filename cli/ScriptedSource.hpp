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

#ifndef TABSQL_CLI_SCRIPTED_SOURCE_HPP_
#define TABSQL_CLI_SCRIPTED_SOURCE_HPP_

#include <cstddef>
#include <cstdio>
#include <memory>
#include <string>

#include "cli/BatchAccumulator.hpp"
#include "cli/BatchSource.hpp"
#include "cli/TerminatorMatcher.hpp"
#include "utility/Macros.hpp"

namespace tabsql {

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief Echo settings of a ScriptedSource.
 **/
struct EchoOptions {
  EchoOptions()
      : enabled(false),
        with_line_numbers(true),
        out(nullptr) {}

  bool enabled;
  // Prefix echoed lines with "<n>> ".
  bool with_line_numbers;
  FILE *out;
};

/**
 * @brief Reads batches sequentially from a finite stream.
 *
 * A final line without a trailing newline is still delivered, and so is a
 * final batch without a terminator: it is returned as the last batch and the
 * next call reports end of input.
 **/
class ScriptedSource : public BatchSource {
 public:
  /**
   * @brief Open a script file.
   *
   * @exception InputError The file cannot be opened.
   **/
  static std::unique_ptr<ScriptedSource> Open(const std::string &path,
                                              const TerminatorMatcher &terminator,
                                              const EchoOptions &echo);

  /**
   * @param in The stream to read.
   * @param owns_stream If true, close() closes in.
   * @param terminator Must outlive the source.
   * @param echo Where consumed lines are echoed.
   **/
  ScriptedSource(FILE *in,
                 const bool owns_stream,
                 const TerminatorMatcher &terminator,
                 const EchoOptions &echo);

  ~ScriptedSource() override;

  ReadStatus readBatch(std::string *batch) override;

  void close() override;

 private:
  /**
   * @return false at end of input.
   * @exception InputError The stream reported an error.
   **/
  bool readLine(std::string *line);

  void echo(const std::string &line, const std::size_t line_number) const;

  FILE *in_;
  const bool owns_stream_;
  const EchoOptions echo_;
  BatchAccumulator accumulator_;

  // Reused by getline().
  char *line_buffer_;
  std::size_t line_capacity_;

  DISALLOW_COPY_AND_ASSIGN(ScriptedSource);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_SCRIPTED_SOURCE_HPP_
