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

#include "cli/TerminatorMatcher.hpp"

#include <regex>
#include <string>

namespace tabsql {

TerminatorMatcher::TerminatorMatcher(const std::string &pattern)
    : pattern_(pattern),
      regex_("(?:" + pattern + ")$", std::regex::ECMAScript) {}

bool TerminatorMatcher::match(const std::string &line, std::string *stripped) const {
  std::smatch match_result;
  if (!std::regex_search(line, match_result, regex_,
                         std::regex_constants::match_not_null)) {
    *stripped = line;
    return false;
  }
  *stripped = line.substr(0, match_result.position(0));
  return true;
}

}  // namespace tabsql
