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

#include "threading/InterruptChannel.hpp"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>

#include "glog/logging.h"

namespace tabsql {

namespace {

InterruptChannel *g_signal_channel = nullptr;

extern "C" void ForwardSignal(int signo) {
  if (g_signal_channel != nullptr) {
    g_signal_channel->notify(signo);
  }
}

void SetNonBlocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL);
  PCHECK(flags != -1) << "fcntl(F_GETFL) failed";
  PCHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1)
      << "fcntl(F_SETFL) failed";
}

}  // namespace

InterruptChannel::InterruptChannel() {
  int fds[2];
  PCHECK(pipe(fds) == 0) << "Unable to create interrupt pipe";
  read_fd_ = fds[0];
  write_fd_ = fds[1];
  SetNonBlocking(read_fd_);
  SetNonBlocking(write_fd_);
}

InterruptChannel::~InterruptChannel() {
  if (g_signal_channel == this) {
    g_signal_channel = nullptr;
  }
  close(read_fd_);
  close(write_fd_);
}

void InterruptChannel::notify(const int signo) {
  const int saved_errno = errno;
  const unsigned char byte = static_cast<unsigned char>(signo);
  // A full pipe already holds plenty of pending notifications.
  ssize_t written;
  do {
    written = write(write_fd_, &byte, 1);
  } while (written == -1 && errno == EINTR);
  errno = saved_errno;
}

int InterruptChannel::drain() {
  int result = 0;
  unsigned char buffer[64];
  for (;;) {
    const ssize_t bytes_read = read(read_fd_, buffer, sizeof(buffer));
    if (bytes_read > 0) {
      for (ssize_t i = 0; i < bytes_read; ++i) {
        if (result != SIGTERM) {
          result = buffer[i];
        }
      }
      continue;
    }
    if (bytes_read == -1 && errno == EINTR) {
      continue;
    }
    break;
  }
  return result;
}

void InstallSignalHandlers(InterruptChannel *channel) {
  CHECK(channel != nullptr);
  g_signal_channel = channel;

  struct sigaction action = {};
  action.sa_handler = ForwardSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  PCHECK(sigaction(SIGINT, &action, nullptr) == 0) << "sigaction(SIGINT)";
  PCHECK(sigaction(SIGTERM, &action, nullptr) == 0) << "sigaction(SIGTERM)";

  signal(SIGPIPE, SIG_IGN);
}

}  // namespace tabsql
