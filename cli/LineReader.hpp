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

#ifndef TABSQL_CLI_LINE_READER_HPP_
#define TABSQL_CLI_LINE_READER_HPP_

#include <string>

namespace tabsql {

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief Outcome of LineReader::readLine().
 **/
enum class LineStatus {
  kLine = 0,
  kInterrupted,
  kEndOfInput
};

/**
 * @brief An interactive line editor: shows a prompt, reads one line, and keeps
 *        a recallable history.
 **/
class LineReader {
 public:
  LineReader() {}

  virtual ~LineReader() {}

  virtual void setPrompt(const std::string &prompt) = 0;

  /**
   * @brief Read one line. Blocks until the user finishes a line, interrupts,
   *        or closes the input.
   *
   * @param line Set to the line, without its line ending, on kLine.
   * @exception InputError The terminal could not be read.
   **/
  virtual LineStatus readLine(std::string *line) = 0;

  virtual void saveToHistory(const std::string &entry) = 0;
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_LINE_READER_HPP_
