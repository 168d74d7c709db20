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

#include "cli/DiagnosticPrinter.hpp"

#include <cstdio>
#include <string>

#include "session/Session.hpp"
#include "utility/StringUtil.hpp"

namespace tabsql {

bool DiagnosticPrinter::IsPreformattedNotice(const int code) {
  return (code >= 3612 && code <= 3615)
         || (code >= 6201 && code <= 6299)
         || (code >= 10201 && code <= 10299);
}

bool DiagnosticPrinter::operator()(const Diagnostic &diagnostic) const {
  if (diagnostic.severity > kInformationalSeverity) {
    std::fprintf(out_, "Msg %d, Level %d:\n%s\n",
                 diagnostic.code,
                 diagnostic.severity,
                 TrimRightWhitespace(diagnostic.text).c_str());
    std::fflush(out_);
    return true;
  }

  // Below informational severity nothing is shown.
  if (diagnostic.severity < kInformationalSeverity) {
    return false;
  }

  if (IsPreformattedNotice(diagnostic.code)) {
    std::fputs(diagnostic.text.c_str(), out_);
  } else {
    std::fprintf(out_, "%s\n", TrimRightWhitespace(diagnostic.text).c_str());
  }
  std::fflush(out_);
  return false;
}

}  // namespace tabsql
