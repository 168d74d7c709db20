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

#include "cli/ScriptedSource.hpp"

#include <sys/types.h>

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include "cli/BatchSource.hpp"
#include "cli/TerminatorMatcher.hpp"

#include "glog/logging.h"

namespace tabsql {

std::unique_ptr<ScriptedSource> ScriptedSource::Open(const std::string &path,
                                                     const TerminatorMatcher &terminator,
                                                     const EchoOptions &echo) {
  FILE *in = std::fopen(path.c_str(), "r");
  if (in == nullptr) {
    throw InputError("Unable to open " + path + ": " + std::strerror(errno));
  }
  LOG(INFO) << "Reading batches from " << path;
  return std::make_unique<ScriptedSource>(in, true, terminator, echo);
}

ScriptedSource::ScriptedSource(FILE *in,
                               const bool owns_stream,
                               const TerminatorMatcher &terminator,
                               const EchoOptions &echo)
    : in_(DCHECK_NOTNULL(in)),
      owns_stream_(owns_stream),
      echo_(echo),
      accumulator_(terminator),
      line_buffer_(nullptr),
      line_capacity_(0) {}

ScriptedSource::~ScriptedSource() {
  close();
  std::free(line_buffer_);
}

ReadStatus ScriptedSource::readBatch(std::string *batch) {
  CHECK(in_ != nullptr) << "readBatch() called on a closed source";

  std::string line;
  for (;;) {
    const std::size_t line_number = accumulator_.lineNumber();
    if (!readLine(&line)) {
      if (accumulator_.finishInput(batch)) {
        VLOG(1) << "Script ended inside a batch; running it as the last one";
        return ReadStatus::kBatch;
      }
      return ReadStatus::kEndOfInput;
    }

    echo(line, line_number);
    if (accumulator_.feed(line)) {
      *batch = accumulator_.takeBatch();
      return ReadStatus::kBatch;
    }
  }
}

void ScriptedSource::close() {
  if (in_ != nullptr && owns_stream_) {
    std::fclose(in_);
  }
  in_ = nullptr;
}

bool ScriptedSource::readLine(std::string *line) {
  line->clear();
  errno = 0;
  const ssize_t length = getline(&line_buffer_, &line_capacity_, in_);
  if (length == -1) {
    if (std::ferror(in_)) {
      throw InputError(std::string("Error reading input: ") + std::strerror(errno));
    }
    return false;
  }
  // Lengths are tracked explicitly so embedded NUL bytes are kept.
  line->assign(line_buffer_, static_cast<std::size_t>(length));

  if (!line->empty() && line->back() == '\n') {
    line->pop_back();
    if (!line->empty() && line->back() == '\r') {
      line->pop_back();
    }
  }
  return true;
}

void ScriptedSource::echo(const std::string &line, const std::size_t line_number) const {
  if (!echo_.enabled || echo_.out == nullptr) {
    return;
  }
  if (echo_.with_line_numbers) {
    std::fprintf(echo_.out, "%zu> ", line_number);
  }
  std::fwrite(line.data(), 1, line.size(), echo_.out);
  std::fputc('\n', echo_.out);
}

}  // namespace tabsql
