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

#ifndef TABSQL_CLI_BATCH_SOURCE_HPP_
#define TABSQL_CLI_BATCH_SOURCE_HPP_

#include <stdexcept>
#include <string>

namespace tabsql {

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief Outcome of BatchSource::readBatch().
 **/
enum class ReadStatus {
  kBatch = 0,
  kEndOfInput
};

/**
 * @brief Reading the input failed for a reason other than end of input.
 **/
class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * Virtual base for the places command batches come from.
 */
class BatchSource {
 public:
  BatchSource() {}

  virtual ~BatchSource() {}

  /**
   * @brief Requests a complete command batch, with its terminator removed.
   * This call may block until user input is given.
   *
   * @param batch Set to the batch text when kBatch is returned.
   * @return kBatch, or kEndOfInput once the input is exhausted.
   * @exception InputError Reading failed.
   */
  virtual ReadStatus readBatch(std::string *batch) = 0;

  /**
   * @brief Release the input. No batch may be read afterwards.
   */
  virtual void close() {}
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_BATCH_SOURCE_HPP_
