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

#ifndef TABSQL_SESSION_CELL_VALUE_HPP_
#define TABSQL_SESSION_CELL_VALUE_HPP_

#include <cstdint>
#include <string>

namespace tabsql {

/** \addtogroup Session
 *  @{
 */

/**
 * @brief One column value of a fetched row. A closed set of kinds: every value
 *        the session layer produces is exactly one of them.
 **/
class CellValue {
 public:
  enum class Kind {
    kNull = 0,
    kText,
    kInteger,
    kReal,
    kTimestamp,  // Seconds since the Unix epoch, UTC.
    kBinary
  };

  CellValue()
      : kind_(Kind::kNull),
        integer_(0),
        real_(0.0) {}

  static CellValue Null() {
    return CellValue();
  }

  static CellValue Text(const std::string &text) {
    CellValue value(Kind::kText);
    value.bytes_ = text;
    return value;
  }

  static CellValue Integer(const std::int64_t integer) {
    CellValue value(Kind::kInteger);
    value.integer_ = integer;
    return value;
  }

  static CellValue Real(const double real) {
    CellValue value(Kind::kReal);
    value.real_ = real;
    return value;
  }

  static CellValue Timestamp(const std::int64_t seconds_since_epoch) {
    CellValue value(Kind::kTimestamp);
    value.integer_ = seconds_since_epoch;
    return value;
  }

  static CellValue Binary(const std::string &bytes) {
    CellValue value(Kind::kBinary);
    value.bytes_ = bytes;
    return value;
  }

  Kind kind() const {
    return kind_;
  }

  bool isNull() const {
    return kind_ == Kind::kNull;
  }

  /**
   * @brief Render the value for display: "NULL", "YYYY-MM-DD HH:MM:SS" for
   *        timestamps, "0x"-prefixed hex for binary, and whitespace-trimmed
   *        text for everything else.
   **/
  std::string toDisplayString() const;

 private:
  explicit CellValue(const Kind kind)
      : kind_(kind),
        integer_(0),
        real_(0.0) {}

  Kind kind_;
  std::string bytes_;
  std::int64_t integer_;
  double real_;
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_SESSION_CELL_VALUE_HPP_
