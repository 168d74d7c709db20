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

#ifndef TABSQL_SESSION_SESSION_HPP_
#define TABSQL_SESSION_SESSION_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "session/CellValue.hpp"

namespace tabsql {

class CancellationToken;

/** \addtogroup Session
 *  @{
 */

/**
 * @brief Keys of the environment a session reports after login.
 **/
extern const char kEnvServerType[];
extern const char kEnvServer[];
extern const char kEnvDatabase[];

/**
 * @brief Diagnostics at or below this severity are informational.
 **/
constexpr int kInformationalSeverity = 10;

/**
 * @brief A server-side message: informational notices as well as errors.
 **/
struct Diagnostic {
  int severity;
  int code;
  std::string text;
};

/**
 * @brief Invoked for every diagnostic the engine sends. Returns true if the
 *        operation that produced the diagnostic should be treated as failed.
 **/
typedef std::function<bool(const Diagnostic&)> ErrorHandler;

/**
 * @brief A cursor over the result sets of one submitted batch. Result sets are
 *        consumed strictly in order, each one exhausted before the next is
 *        requested.
 **/
class ResultSet {
 public:
  ResultSet() {}

  virtual ~ResultSet() {}

  /**
   * @return The column names of the current result set. May be empty.
   **/
  virtual const std::vector<std::string>& columns() const = 0;

  /**
   * @brief Fetch the next row of the current result set.
   *
   * @param values Replaced with one value per column.
   * @return false once the current result set is exhausted.
   * @exception SessionError The fetch failed.
   **/
  virtual bool nextRow(std::vector<CellValue> *values) = 0;

  /**
   * @return true and set count if the engine reported a rows-affected count
   *         for the current result set.
   **/
  virtual bool rowsAffected(std::int64_t *count) const = 0;

  /**
   * @return true and set status if the engine reported a return status for
   *         the current result set.
   **/
  virtual bool returnStatus(std::int32_t *status) const = 0;

  virtual bool hasNextResultSet() = 0;

  /**
   * @exception SessionError Moving to the next result set failed.
   **/
  virtual void advanceToNextResultSet() = 0;
};

/**
 * @brief A connected database session.
 **/
class Session {
 public:
  Session() {}

  virtual ~Session() {}

  /**
   * @brief Submit a batch for execution. Blocks until the engine describes the
   *        first result set, finishes, or the submission is cancelled.
   *
   * @param batch The command text.
   * @param token Cancelling it aborts the submission.
   * @return The result sets, or nullptr if the batch produced none. Must not
   *         outlive the session.
   * @exception EngineError The engine reported the batch as failed.
   * @exception SessionError Any other failure.
   **/
  virtual std::unique_ptr<ResultSet> submit(const std::string &batch,
                                            CancellationToken *token) = 0;

  virtual void begin() = 0;

  virtual void commit() = 0;

  virtual void rollback() = 0;

  /**
   * @brief Run a query whose result is a single scalar.
   **/
  virtual CellValue selectValue(const std::string &query) = 0;

  /**
   * @return The login environment entry for key, or an empty string.
   **/
  virtual std::string getEnvironment(const std::string &key) const = 0;

  virtual void setErrorHandler(const ErrorHandler &handler) = 0;
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_SESSION_SESSION_HPP_
