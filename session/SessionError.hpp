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

#ifndef TABSQL_SESSION_SESSION_ERROR_HPP_
#define TABSQL_SESSION_SESSION_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace tabsql {

/** \addtogroup Session
 *  @{
 */

/**
 * @brief A failure reported by a Session that did not reach the user through
 *        the session's error handler (transport errors, deadlines, protocol
 *        violations). Callers print it.
 **/
class SessionError : public std::runtime_error {
 public:
  explicit SessionError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief A failure the engine itself reported as a diagnostic. The diagnostic
 *        has already gone through the session's error handler, so callers must
 *        not print it again.
 **/
class EngineError : public SessionError {
 public:
  EngineError(const int severity, const int code, const std::string &message)
      : SessionError(message),
        severity_(severity),
        code_(code) {}

  int severity() const {
    return severity_;
  }

  int code() const {
    return code_;
  }

 private:
  int severity_;
  int code_;
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_SESSION_SESSION_ERROR_HPP_
