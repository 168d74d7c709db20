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

#ifndef TABSQL_CLI_TERMINATOR_MATCHER_HPP_
#define TABSQL_CLI_TERMINATOR_MATCHER_HPP_

#include <regex>
#include <string>

namespace tabsql {

/** \addtogroup CLI
 *  @{
 */

/**
 * @brief Decides whether a line ends a batch.
 *
 * The pattern is opaque to the matcher and may contain alternation, e.g.
 * ";|^go". It is always anchored to the end of the line.
 **/
class TerminatorMatcher {
 public:
  /**
   * @param pattern An ECMAScript regular expression.
   * @exception std::regex_error The pattern does not compile.
   **/
  explicit TerminatorMatcher(const std::string &pattern);

  const std::string& pattern() const {
    return pattern_;
  }

  /**
   * @brief Test line against the terminator.
   *
   * @param line The line, without its line ending.
   * @param stripped Set to line minus the matched suffix when it matches,
   *        otherwise to line.
   * @return true if the line ends a batch. Empty matches never count.
   **/
  bool match(const std::string &line, std::string *stripped) const;

 private:
  const std::string pattern_;
  const std::regex regex_;
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_CLI_TERMINATOR_MATCHER_HPP_
