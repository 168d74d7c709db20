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

#ifndef TABSQL_THREADING_CANCELLATION_TOKEN_HPP_
#define TABSQL_THREADING_CANCELLATION_TOKEN_HPP_

#include <functional>
#include <mutex>

#include "utility/Macros.hpp"

namespace tabsql {

/** \addtogroup Threading
 *  @{
 */

/**
 * @brief Cancellation state of exactly one submission. Signaled at most once;
 *        safe to cancel from another thread.
 **/
class CancellationToken {
 public:
  CancellationToken()
      : cancelled_(false) {}

  /**
   * @brief Mark the token cancelled and run the cancel handler, if one is
   *        set. Later calls have no effect.
   **/
  void cancel();

  bool isCancelled() const;

  /**
   * @brief Install the action that aborts the submission. If the token is
   *        already cancelled the handler runs immediately.
   **/
  void setCancelHandler(const std::function<void()> &handler);

  /**
   * @brief Remove the cancel handler. Once this returns the handler is not
   *        running and will not run again.
   **/
  void clearCancelHandler();

 private:
  mutable std::mutex mutex_;
  bool cancelled_;
  std::function<void()> handler_;

  DISALLOW_COPY_AND_ASSIGN(CancellationToken);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_THREADING_CANCELLATION_TOKEN_HPP_
