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

#include "threading/CancellationBridge.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <thread>

#include "threading/CancellationToken.hpp"
#include "threading/InterruptChannel.hpp"

#include "glog/logging.h"

namespace tabsql {

namespace {

// Blocks until one of fds is readable. Returns its index.
int WaitReadable(struct pollfd *fds, const nfds_t num_fds) {
  for (;;) {
    for (nfds_t i = 0; i < num_fds; ++i) {
      fds[i].revents = 0;
    }
    const int ready = poll(fds, num_fds, -1);
    if (ready == -1) {
      PCHECK(errno == EINTR) << "poll failed in cancellation listener";
      continue;
    }
    for (nfds_t i = 0; i < num_fds; ++i) {
      if (fds[i].revents != 0) {
        return static_cast<int>(i);
      }
    }
  }
}

}  // namespace

CancellationBridge::CancellationBridge(InterruptChannel *interrupts,
                                       CancellationToken *token)
    : interrupts_(DCHECK_NOTNULL(interrupts)),
      token_(DCHECK_NOTNULL(token)),
      interrupted_(false),
      retired_(false) {
  int fds[2];
  PCHECK(pipe(fds) == 0) << "Unable to create rendezvous pipe";
  done_read_fd_ = fds[0];
  done_write_fd_ = fds[1];

  // Interrupts that arrived before this submission do not cancel it.
  interrupts_->drain();
  listener_ = std::thread(&CancellationBridge::listen, this);
}

CancellationBridge::~CancellationBridge() {
  retire();
  close(done_read_fd_);
  close(done_write_fd_);
}

void CancellationBridge::retire() {
  if (retired_) {
    return;
  }
  retired_ = true;

  const char done = 1;
  ssize_t written;
  do {
    written = write(done_write_fd_, &done, 1);
  } while (written == -1 && errno == EINTR);
  PCHECK(written == 1) << "Unable to signal submission completion";

  listener_.join();
  VLOG(2) << "Cancellation listener retired"
          << (interrupted_.load() ? " after an interrupt" : "");
}

void CancellationBridge::listen() {
  struct pollfd fds[2];
  fds[0].fd = done_read_fd_;
  fds[0].events = POLLIN;
  fds[1].fd = interrupts_->fd();
  fds[1].events = POLLIN;

  if (WaitReadable(fds, 2) == 0) {
    return;
  }

  interrupts_->drain();
  interrupted_.store(true);
  VLOG(1) << "Interrupt received, cancelling the running batch";
  token_->cancel();

  // Wait for the submission to actually return.
  WaitReadable(fds, 1);
}

}  // namespace tabsql
