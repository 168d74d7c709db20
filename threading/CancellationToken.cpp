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

#include "threading/CancellationToken.hpp"

#include <functional>
#include <mutex>

namespace tabsql {

void CancellationToken::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    return;
  }
  cancelled_ = true;
  if (handler_) {
    handler_();
  }
}

bool CancellationToken::isCancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

void CancellationToken::setCancelHandler(const std::function<void()> &handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = handler;
  if (cancelled_ && handler_) {
    handler_();
  }
}

void CancellationToken::clearCancelHandler() {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = nullptr;
}

}  // namespace tabsql
