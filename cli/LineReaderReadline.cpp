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

#include "cli/LineReaderReadline.hpp"

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <readline/history.h>
#include <readline/readline.h>

#include "cli/BatchSource.hpp"
#include "threading/InterruptChannel.hpp"

#include "glog/logging.h"

namespace tabsql {

namespace {

constexpr int kMaxHistoryEntries = 500;

// readline's line callback carries no user pointer.
bool g_line_ready = false;
char *g_line = nullptr;

extern "C" void OnLineComplete(char *line) {
  g_line_ready = true;
  g_line = line;
  rl_callback_handler_remove();
}

}  // namespace

LineReaderReadline::LineReaderReadline(InterruptChannel *interrupts,
                                       const std::string &history_file)
    : interrupts_(DCHECK_NOTNULL(interrupts)),
      history_file_(history_file) {
  // Signals are forwarded to the interrupt channel; readline must not
  // install handlers of its own.
  rl_catch_signals = 0;
  using_history();
  if (!history_file_.empty() && read_history(history_file_.c_str()) != 0) {
    VLOG(1) << "No history loaded from " << history_file_;
  }
}

LineReaderReadline::~LineReaderReadline() {
  if (history_file_.empty()) {
    return;
  }
  stifle_history(kMaxHistoryEntries);
  const int error = write_history(history_file_.c_str());
  if (error != 0) {
    LOG(WARNING) << "Unable to write history to " << history_file_ << ": "
                 << std::strerror(error);
  }
}

LineStatus LineReaderReadline::readLine(std::string *line) {
  g_line_ready = false;
  g_line = nullptr;
  rl_callback_handler_install(prompt_.c_str(), OnLineComplete);

  struct pollfd fds[2];
  fds[0].fd = fileno(stdin);
  fds[0].events = POLLIN;
  fds[1].fd = interrupts_->fd();
  fds[1].events = POLLIN;

  while (!g_line_ready) {
    fds[0].revents = 0;
    fds[1].revents = 0;
    if (poll(fds, 2, -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      const int error = errno;
      rl_callback_handler_remove();
      throw InputError(std::string("Unable to read the terminal: ") + std::strerror(error));
    }

    if (fds[1].revents & POLLIN) {
      const int signo = interrupts_->drain();
      if (signo != 0) {
        // Abandon the line being edited.
        rl_free_line_state();
        rl_callback_sigcleanup();
        rl_crlf();
        rl_callback_handler_remove();
        return signo == SIGTERM ? LineStatus::kEndOfInput : LineStatus::kInterrupted;
      }
    }

    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      rl_callback_read_char();
    }
  }

  if (g_line == nullptr) {
    return LineStatus::kEndOfInput;
  }
  line->assign(g_line);
  std::free(g_line);
  g_line = nullptr;
  return LineStatus::kLine;
}

void LineReaderReadline::saveToHistory(const std::string &entry) {
  add_history(entry.c_str());
}

}  // namespace tabsql
