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

#ifndef TABSQL_CLI_LINE_READER_READLINE_HPP_
#define TABSQL_CLI_LINE_READER_READLINE_HPP_

#include <string>

#include "cli/LineReader.hpp"
#include "utility/Macros.hpp"

namespace tabsql {

class InterruptChannel;

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief A LineReader backed by GNU readline's callback interface.
 *
 * The terminal and the interrupt channel are polled together, so an interrupt
 * aborts the line being edited instead of killing the process. Only one
 * instance may exist at a time since readline keeps global state.
 **/
class LineReaderReadline : public LineReader {
 public:
  /**
   * @param interrupts Signals forwarded by InstallSignalHandlers(). Not owned.
   * @param history_file Loaded now and written back on destruction. May be
   *        empty to keep history in memory only.
   **/
  LineReaderReadline(InterruptChannel *interrupts,
                     const std::string &history_file);

  ~LineReaderReadline() override;

  void setPrompt(const std::string &prompt) override {
    prompt_ = prompt;
  }

  LineStatus readLine(std::string *line) override;

  void saveToHistory(const std::string &entry) override;

 private:
  InterruptChannel *interrupts_;
  const std::string history_file_;
  std::string prompt_;

  DISALLOW_COPY_AND_ASSIGN(LineReaderReadline);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_LINE_READER_READLINE_HPP_
