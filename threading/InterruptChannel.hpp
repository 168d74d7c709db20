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

#ifndef TABSQL_THREADING_INTERRUPT_CHANNEL_HPP_
#define TABSQL_THREADING_INTERRUPT_CHANNEL_HPP_

#include "utility/Macros.hpp"

namespace tabsql {

/** \addtogroup Threading
 *  @{
 */

/**
 * @brief A self-pipe carrying interrupt notifications (SIGINT, SIGTERM) from
 *        a signal handler to whoever polls fd().
 **/
class InterruptChannel {
 public:
  InterruptChannel();

  ~InterruptChannel();

  /**
   * @brief Record a notification. Async-signal-safe.
   *
   * @param signo The signal number being forwarded.
   **/
  void notify(const int signo);

  /**
   * @return A descriptor that polls readable while notifications are pending.
   **/
  int fd() const {
    return read_fd_;
  }

  /**
   * @brief Consume every pending notification.
   *
   * @return SIGTERM if any pending notification was a SIGTERM, otherwise the
   *         last signal number seen, or 0 if nothing was pending.
   **/
  int drain();

 private:
  int read_fd_;
  int write_fd_;

  DISALLOW_COPY_AND_ASSIGN(InterruptChannel);
};

/**
 * @brief Route SIGINT and SIGTERM into channel for the rest of the process
 *        lifetime, and ignore SIGPIPE. The handlers do not restart
 *        interrupted system calls.
 *
 * @param channel Must outlive every signal delivery. Not owned.
 **/
void InstallSignalHandlers(InterruptChannel *channel);

/** @} */

}  // namespace tabsql

#endif  // TABSQL_THREADING_INTERRUPT_CHANNEL_HPP_
