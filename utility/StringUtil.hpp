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

#ifndef TABSQL_UTILITY_STRING_UTIL_HPP_
#define TABSQL_UTILITY_STRING_UTIL_HPP_

#include <cstddef>
#include <string>

namespace tabsql {

/** \addtogroup Utility
 *  @{
 */

/**
 * @brief Remove leading and trailing whitespace.
 **/
std::string TrimWhitespace(const std::string &str);

/**
 * @brief Remove trailing whitespace (including newlines) only.
 **/
std::string TrimRightWhitespace(const std::string &str);

/**
 * @return true if str contains nothing but whitespace.
 **/
bool IsBlank(const std::string &str);

/**
 * @brief Encode bytes as lowercase hexadecimal, two digits per byte, without
 *        any prefix.
 **/
std::string ToHexString(const std::string &bytes);

/**
 * @brief The shortest decimal representation of a double that reads back to
 *        the same value.
 **/
std::string DoubleToShortestString(const double value);

/**
 * @brief Number of UTF-8 code points in str. Continuation bytes are not
 *        counted, so malformed input degrades to a byte count.
 **/
std::size_t Utf8Length(const std::string &str);

/** @} */

}  // namespace tabsql

#endif  // TABSQL_UTILITY_STRING_UTIL_HPP_
