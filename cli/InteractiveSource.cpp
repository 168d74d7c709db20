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

#include "cli/InteractiveSource.hpp"

#include <cstddef>
#include <string>

#include "cli/BatchSource.hpp"
#include "cli/LineReader.hpp"
#include "session/CellValue.hpp"
#include "session/Session.hpp"
#include "session/SessionError.hpp"

#include "glog/logging.h"

namespace tabsql {

namespace {

const char kServerNameQuery[] = "select @@servername";

}  // namespace

InteractiveSource::InteractiveSource(LineReader *line_reader,
                                     Session *session,
                                     const TerminatorMatcher &terminator)
    : line_reader_(DCHECK_NOTNULL(line_reader)),
      session_(DCHECK_NOTNULL(session)),
      accumulator_(terminator) {}

ReadStatus InteractiveSource::readBatch(std::string *batch) {
  std::string line;
  for (;;) {
    line_reader_->setPrompt(buildPrompt(accumulator_.lineNumber()));

    LineStatus status;
    try {
      status = line_reader_->readLine(&line);
    } catch (const InputError&) {
      accumulator_.reset();
      throw;
    }

    switch (status) {
      case LineStatus::kInterrupted:
        VLOG(1) << "Interrupted; discarding the batch being typed";
        accumulator_.reset();
        break;
      case LineStatus::kEndOfInput:
        accumulator_.reset();
        return ReadStatus::kEndOfInput;
      case LineStatus::kLine:
        if (accumulator_.feed(line)) {
          *batch = accumulator_.takeBatch();
          line_reader_->saveToHistory(*batch);
          return ReadStatus::kBatch;
        }
        break;
    }
  }
}

std::string InteractiveSource::buildPrompt(const std::size_t line_number) {
  const std::string server_type = session_->getEnvironment(kEnvServerType);
  const std::string suffix = " " + std::to_string(line_number) + " $ ";

  if (server_type == "ASE" || server_type == "sql server") {
    return homeServer() + "." + session_->getEnvironment(kEnvDatabase) + suffix;
  }
  if (server_type == "SQL Anywhere") {
    return homeServer() + suffix;
  }
  return session_->getEnvironment(kEnvServer) + suffix;
}

const std::string& InteractiveSource::homeServer() {
  if (!home_server_.empty()) {
    return home_server_;
  }
  try {
    const CellValue name = session_->selectValue(kServerNameQuery);
    if (!name.isNull()) {
      home_server_ = name.toDisplayString();
    }
  } catch (const SessionError &error) {
    // Retried on the next prompt.
    LOG(WARNING) << "Unable to resolve the server name: " << error.what();
  }
  return home_server_;
}

}  // namespace tabsql
