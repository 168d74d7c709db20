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

#ifndef TABSQL_THREADING_CANCELLATION_BRIDGE_HPP_
#define TABSQL_THREADING_CANCELLATION_BRIDGE_HPP_

#include <atomic>
#include <thread>

#include "utility/Macros.hpp"

namespace tabsql {

class CancellationToken;
class InterruptChannel;

/** \addtogroup Threading
 *  @{
 */

/**
 * @brief Turns an interrupt notification into cancellation of one in-flight
 *        submission.
 *
 * Constructing a bridge arms it: notifications left over from before the
 * submission are discarded and a listener thread starts waiting on the
 * interrupt channel. retire() is the rendezvous with the submission: it tells
 * the listener the submission has returned and joins it. If an interrupt
 * arrives first, the listener cancels the token and then still waits for
 * retire(), so the listener never outlives the submission.
 *
 * Usage:
 * @code
 *   CancellationToken token;
 *   CancellationBridge bridge(&interrupts, &token);
 *   result = session->submit(batch, &token);
 *   bridge.retire();
 * @endcode
 **/
class CancellationBridge {
 public:
  /**
   * @brief Arm the bridge.
   *
   * @param interrupts The source of interrupt notifications. Not owned.
   * @param token Cancelled at most once if an interrupt arrives. Not owned.
   **/
  CancellationBridge(InterruptChannel *interrupts, CancellationToken *token);

  /**
   * @brief Retires the bridge if retire() was not called.
   **/
  ~CancellationBridge();

  /**
   * @brief Signal that the submission returned and wait for the listener to
   *        exit. Idempotent.
   **/
  void retire();

  /**
   * @return true if an interrupt cancelled the submission.
   **/
  bool interrupted() const {
    return interrupted_.load();
  }

 private:
  void listen();

  InterruptChannel *interrupts_;
  CancellationToken *token_;

  int done_read_fd_;
  int done_write_fd_;

  std::atomic<bool> interrupted_;
  bool retired_;
  std::thread listener_;

  DISALLOW_COPY_AND_ASSIGN(CancellationBridge);
};

/** @} */

}  // namespace tabsql

#endif  // TABSQL_THREADING_CANCELLATION_BRIDGE_HPP_
