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

#include "utility/StringUtil.hpp"

#include <cctype>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace tabsql {

namespace {

inline bool IsSpace(const char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string TrimWhitespace(const std::string &str) {
  std::size_t begin = 0;
  while (begin < str.size() && IsSpace(str[begin])) {
    ++begin;
  }
  std::size_t end = str.size();
  while (end > begin && IsSpace(str[end - 1])) {
    --end;
  }
  return str.substr(begin, end - begin);
}

std::string TrimRightWhitespace(const std::string &str) {
  std::size_t end = str.size();
  while (end > 0 && IsSpace(str[end - 1])) {
    --end;
  }
  return str.substr(0, end);
}

bool IsBlank(const std::string &str) {
  for (const char c : str) {
    if (!IsSpace(c)) {
      return false;
    }
  }
  return true;
}

std::string ToHexString(const std::string &bytes) {
  static const char kHexDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (const char c : bytes) {
    const unsigned char byte = static_cast<unsigned char>(c);
    hex.push_back(kHexDigits[byte >> 4]);
    hex.push_back(kHexDigits[byte & 0x0F]);
  }
  return hex;
}

std::string DoubleToShortestString(const double value) {
  char buffer[32];
  // 17 significant digits always round-trip; try the shorter forms first.
  for (int precision = 1; precision < 17; ++precision) {
    std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
    if (std::strtod(buffer, nullptr) == value) {
      return buffer;
    }
  }
  std::snprintf(buffer, sizeof(buffer), "%.17g", value);
  return buffer;
}

std::size_t Utf8Length(const std::string &str) {
  std::size_t length = 0;
  for (const char c : str) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++length;
    }
  }
  return length;
}

}  // namespace tabsql
