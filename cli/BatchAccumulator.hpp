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

#ifndef TABSQL_CLI_BATCH_ACCUMULATOR_HPP_
#define TABSQL_CLI_BATCH_ACCUMULATOR_HPP_

#include <cstddef>
#include <string>

#include "cli/TerminatorMatcher.hpp"
#include "utility/Macros.hpp"

namespace tabsql {

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief Folds lines into a batch until one of them matches the terminator.
 **/
class BatchAccumulator {
 public:
  /**
   * @param terminator Must outlive the accumulator.
   **/
  explicit BatchAccumulator(const TerminatorMatcher &terminator)
      : terminator_(terminator),
        num_lines_(0),
        done_(false) {}

  /**
   * @brief Add one line (without its line ending).
   *
   * @return true if the line matched the terminator and the batch is final.
   *         Take it with takeBatch() before feeding more lines.
   **/
  bool feed(const std::string &line);

  /**
   * @brief Hand out the finalized batch and start a new one.
   **/
  std::string takeBatch();

  /**
   * @brief Report end of input.
   *
   * @param partial Set to the text accumulated so far if no terminator ended
   *        it.
   * @return true if an unterminated partial batch was pending. The
   *         accumulator is reset either way.
   **/
  bool finishInput(std::string *partial);

  /**
   * @brief Discard everything accumulated.
   **/
  void reset();

  /**
   * @return true if at least one line has been fed since the last reset.
   **/
  bool pending() const {
    return num_lines_ > 0;
  }

  /**
   * @return The 1-based number of the line about to be fed.
   **/
  std::size_t lineNumber() const {
    return num_lines_ + 1;
  }

 private:
  const TerminatorMatcher &terminator_;
  std::string buffer_;
  std::size_t num_lines_;
  bool done_;

  DISALLOW_COPY_AND_ASSIGN(BatchAccumulator);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_BATCH_ACCUMULATOR_HPP_
