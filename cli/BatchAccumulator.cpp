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

#include "cli/BatchAccumulator.hpp"

#include <string>
#include <utility>

#include "glog/logging.h"

namespace tabsql {

bool BatchAccumulator::feed(const std::string &line) {
  DCHECK(!done_) << "feed() called on a finalized batch";

  std::string stripped;
  done_ = terminator_.match(line, &stripped);
  // A terminator that leaves nothing behind adds no line of its own, so the
  // batch never ends in a newline.
  if (!done_ || !stripped.empty()) {
    if (num_lines_ > 0) {
      buffer_.push_back('\n');
    }
    buffer_.append(stripped);
  }
  ++num_lines_;
  return done_;
}

std::string BatchAccumulator::takeBatch() {
  DCHECK(done_) << "takeBatch() called before the terminator matched";
  std::string batch(std::move(buffer_));
  reset();
  return batch;
}

bool BatchAccumulator::finishInput(std::string *partial) {
  const bool had_partial = pending() && !done_;
  if (had_partial) {
    *partial = buffer_;
  }
  reset();
  return had_partial;
}

void BatchAccumulator::reset() {
  buffer_.clear();
  num_lines_ = 0;
  done_ = false;
}

}  // namespace tabsql
