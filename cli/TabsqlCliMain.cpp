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

/* Interactive and scripted command-batch front end for a tabular session. */

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <regex>
#include <string>

#include "cli/BatchSource.hpp"
#include "cli/CliConfig.h"  // For TABSQL_VERSION.
#include "cli/CliConfiguration.hpp"
#include "cli/DiagnosticPrinter.hpp"
#include "cli/ExecutionLoop.hpp"
#include "cli/Flags.hpp"
#include "cli/InteractiveSource.hpp"
#include "cli/OutputFile.hpp"
#include "cli/LineReaderReadline.hpp"
#include "cli/ScriptedSource.hpp"
#include "cli/TerminatorMatcher.hpp"
#include "session/GrpcSession.hpp"
#include "session/SessionError.hpp"
#include "threading/InterruptChannel.hpp"

#include "gflags/gflags.h"
#include "glog/logging.h"

using tabsql::BatchSource;
using tabsql::CliConfiguration;
using tabsql::CloseOutputFile;
using tabsql::DiagnosticPrinter;
using tabsql::EchoOptions;
using tabsql::ExecutionLoop;
using tabsql::ExitStatus;
using tabsql::FilePtr;
using tabsql::GrpcSession;
using tabsql::InputError;
using tabsql::InteractiveSource;
using tabsql::InterruptChannel;
using tabsql::LineReaderReadline;
using tabsql::OpenOutputFile;
using tabsql::ScriptedSource;
using tabsql::SessionError;
using tabsql::TerminatorMatcher;

int main(int argc, char **argv) {
  google::InitGoogleLogging(argv[0]);
  gflags::SetVersionString(TABSQL_VERSION);
  gflags::SetUsageMessage("Runs command batches against a tabular session service.");
  // Also handles --version with the string above.
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  const CliConfiguration config = CliConfiguration::FromFlags();

  std::unique_ptr<TerminatorMatcher> terminator;
  try {
    terminator = std::make_unique<TerminatorMatcher>(config.terminator);
  } catch (const std::regex_error &error) {
    std::fprintf(stderr, "Invalid terminator '%s': %s\n",
                 config.terminator.c_str(), error.what());
    return 1;
  }

  InterruptChannel interrupts;
  tabsql::InstallSignalHandlers(&interrupts);

  std::unique_ptr<GrpcSession> session = GrpcSession::Create(config.session);
  session->setErrorHandler(DiagnosticPrinter(stdout));
  try {
    session->connect();
  } catch (const SessionError &error) {
    std::fprintf(stderr, "failed to connect: %s\n", error.what());
    return 1;
  }

  // Opened only once logged in, so a failed login leaves an existing file
  // untouched.
  FilePtr output_file(nullptr, &std::fclose);
  FILE *out = stdout;
  if (!config.output_file.empty()) {
    output_file = OpenOutputFile(config.output_file);
    if (output_file == nullptr) {
      std::fprintf(stderr, "Unable to open %s: %s\n",
                   config.output_file.c_str(), std::strerror(errno));
      return 1;
    }
    out = output_file.get();
  }

  std::unique_ptr<LineReaderReadline> line_reader;
  std::unique_ptr<BatchSource> source;
  try {
    if (config.input_file.empty()) {
      line_reader = std::make_unique<LineReaderReadline>(&interrupts, config.history_file);
      source = std::make_unique<InteractiveSource>(line_reader.get(), session.get(), *terminator);
    } else {
      EchoOptions echo;
      echo.enabled = config.echo_input;
      echo.with_line_numbers = config.echo_line_numbers;
      echo.out = out;
      source = ScriptedSource::Open(config.input_file, *terminator, echo);
    }
  } catch (const InputError &error) {
    std::fprintf(stderr, "%s\n", error.what());
    return 1;
  }

  ExecutionLoop loop(config, source.get(), session.get(), &interrupts, out, stderr);
  const ExitStatus status = loop.run();

  source->close();
  if (CloseOutputFile(&output_file) != 0) {
    PLOG(ERROR) << "Error closing " << config.output_file;
    return 1;
  }
  return status == ExitStatus::kSuccess ? 0 : 1;
}
