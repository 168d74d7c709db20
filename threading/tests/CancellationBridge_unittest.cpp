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

#include <signal.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "threading/CancellationBridge.hpp"
#include "threading/CancellationToken.hpp"
#include "threading/InterruptChannel.hpp"

#include "glog/logging.h"
#include "gtest/gtest.h"

namespace tabsql {

TEST(CancellationTokenTest, CancelRunsHandlerOnce) {
  CancellationToken token;
  int calls = 0;
  token.setCancelHandler([&calls]() { ++calls; });
  EXPECT_FALSE(token.isCancelled());

  token.cancel();
  token.cancel();
  EXPECT_TRUE(token.isCancelled());
  EXPECT_EQ(1, calls);
}

TEST(CancellationTokenTest, HandlerSetAfterCancelRunsImmediately) {
  CancellationToken token;
  token.cancel();

  int calls = 0;
  token.setCancelHandler([&calls]() { ++calls; });
  EXPECT_EQ(1, calls);
}

TEST(CancellationTokenTest, ClearedHandlerDoesNotRun) {
  CancellationToken token;
  int calls = 0;
  token.setCancelHandler([&calls]() { ++calls; });
  token.clearCancelHandler();
  token.cancel();
  EXPECT_TRUE(token.isCancelled());
  EXPECT_EQ(0, calls);
}

TEST(InterruptChannelTest, DrainReportsPendingSignals) {
  InterruptChannel channel;
  EXPECT_EQ(0, channel.drain());

  channel.notify(SIGINT);
  EXPECT_EQ(SIGINT, channel.drain());
  EXPECT_EQ(0, channel.drain());

  // SIGTERM wins over a later SIGINT.
  channel.notify(SIGTERM);
  channel.notify(SIGINT);
  EXPECT_EQ(SIGTERM, channel.drain());
}

TEST(CancellationBridgeTest, RetireWithoutInterrupt) {
  InterruptChannel channel;
  CancellationToken token;
  CancellationBridge bridge(&channel, &token);
  bridge.retire();

  EXPECT_FALSE(bridge.interrupted());
  EXPECT_FALSE(token.isCancelled());

  // A notification after retirement is left for the next owner.
  channel.notify(SIGINT);
  EXPECT_FALSE(token.isCancelled());
  EXPECT_EQ(SIGINT, channel.drain());
}

TEST(CancellationBridgeTest, StaleInterruptIsDiscardedWhenArmed) {
  InterruptChannel channel;
  channel.notify(SIGINT);

  CancellationToken token;
  CancellationBridge bridge(&channel, &token);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  bridge.retire();

  EXPECT_FALSE(bridge.interrupted());
  EXPECT_FALSE(token.isCancelled());
}

TEST(CancellationBridgeTest, InterruptCancelsTheSubmissionOnce) {
  InterruptChannel channel;
  CancellationToken token;

  std::atomic<int> cancels(0);
  std::atomic<bool> submission_done(false);
  token.setCancelHandler([&cancels]() { ++cancels; });

  CancellationBridge bridge(&channel, &token);

  // Stands in for a blocking submit(): returns once it has been cancelled.
  std::thread submission([&token, &submission_done]() {
    while (!token.isCancelled()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    submission_done = true;
  });

  channel.notify(SIGINT);
  channel.notify(SIGINT);
  submission.join();
  bridge.retire();

  EXPECT_TRUE(submission_done.load());
  EXPECT_TRUE(bridge.interrupted());
  EXPECT_TRUE(token.isCancelled());
  EXPECT_EQ(1, cancels.load());
}

TEST(CancellationBridgeTest, DestructorRetires) {
  InterruptChannel channel;
  CancellationToken token;
  {
    CancellationBridge bridge(&channel, &token);
  }
  EXPECT_FALSE(token.isCancelled());
}

}  // namespace tabsql

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
