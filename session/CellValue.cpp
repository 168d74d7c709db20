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

#include "session/CellValue.hpp"

#include <cstdio>
#include <ctime>
#include <string>

#include "utility/StringUtil.hpp"

#include "glog/logging.h"

namespace tabsql {

namespace {

std::string FormatTimestamp(const std::int64_t seconds_since_epoch) {
  const std::time_t seconds = static_cast<std::time_t>(seconds_since_epoch);
  std::tm calendar;
  if (gmtime_r(&seconds, &calendar) == nullptr) {
    // Out of the range gmtime can represent; show the raw count.
    return std::to_string(seconds_since_epoch);
  }
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &calendar);
  return buffer;
}

}  // namespace

std::string CellValue::toDisplayString() const {
  switch (kind_) {
    case Kind::kNull:
      return "NULL";
    case Kind::kText:
      return TrimWhitespace(bytes_);
    case Kind::kInteger:
      return std::to_string(integer_);
    case Kind::kReal:
      return DoubleToShortestString(real_);
    case Kind::kTimestamp:
      return FormatTimestamp(integer_);
    case Kind::kBinary:
      return "0x" + ToHexString(bytes_);
  }
  LOG(FATAL) << "Unhandled CellValue kind " << static_cast<int>(kind_);
  return std::string();
}

}  // namespace tabsql
