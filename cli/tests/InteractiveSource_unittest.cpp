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

#include <deque>
#include <string>
#include <utility>
#include <vector>

#include "cli/BatchSource.hpp"
#include "cli/InteractiveSource.hpp"
#include "cli/LineReader.hpp"
#include "cli/TerminatorMatcher.hpp"
#include "cli/tests/FakeSession.hpp"
#include "session/CellValue.hpp"
#include "session/Session.hpp"

#include "glog/logging.h"
#include "gtest/gtest.h"

namespace tabsql {

namespace {

/**
 * Replays a scripted sequence of lines and interrupts, then reports end of
 * input. Records every prompt and history entry.
 */
class ScriptedLineReader : public LineReader {
 public:
  void setPrompt(const std::string &prompt) override {
    current_prompt_ = prompt;
  }

  LineStatus readLine(std::string *line) override {
    prompts_.push_back(current_prompt_);
    if (script_.empty()) {
      return LineStatus::kEndOfInput;
    }
    const std::pair<LineStatus, std::string> next = script_.front();
    script_.pop_front();
    *line = next.second;
    return next.first;
  }

  void saveToHistory(const std::string &entry) override {
    history_.push_back(entry);
  }

  void addLine(const std::string &line) {
    script_.emplace_back(LineStatus::kLine, line);
  }

  void addInterrupt() {
    script_.emplace_back(LineStatus::kInterrupted, std::string());
  }

  std::vector<std::string> prompts_;
  std::vector<std::string> history_;

 private:
  std::deque<std::pair<LineStatus, std::string>> script_;
  std::string current_prompt_;
};

}  // namespace

class InteractiveSourceTest : public ::testing::Test {
 protected:
  InteractiveSourceTest()
      : terminator_(";|^go"),
        source_(&reader_, &session_, terminator_) {
    session_.setEnvironment(kEnvServer, "db01:5000");
  }

  const TerminatorMatcher terminator_;
  ScriptedLineReader reader_;
  FakeSession session_;
  InteractiveSource source_;
};

TEST_F(InteractiveSourceTest, MultiLineBatch) {
  reader_.addLine("select *");
  reader_.addLine("from t");
  reader_.addLine("go");

  std::string batch;
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));
  EXPECT_EQ("select *\nfrom t", batch);

  const std::vector<std::string> expected_prompts = {
      "db01:5000 1 $ ", "db01:5000 2 $ ", "db01:5000 3 $ "};
  EXPECT_EQ(expected_prompts, reader_.prompts_);

  ASSERT_EQ(1u, reader_.history_.size());
  EXPECT_EQ("select *\nfrom t", reader_.history_[0]);
}

TEST_F(InteractiveSourceTest, InterruptDiscardsThePartialBatch) {
  reader_.addLine("select 1");
  reader_.addInterrupt();
  reader_.addLine("select 2;");

  std::string batch;
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));
  EXPECT_EQ("select 2", batch);

  // The line counter restarts at 1 after the interrupt.
  const std::vector<std::string> expected_prompts = {
      "db01:5000 1 $ ", "db01:5000 2 $ ", "db01:5000 1 $ "};
  EXPECT_EQ(expected_prompts, reader_.prompts_);
  EXPECT_EQ(std::vector<std::string>({"select 2"}), reader_.history_);
}

TEST_F(InteractiveSourceTest, EndOfInputDiscardsThePartialBatch) {
  reader_.addLine("select 1");

  std::string batch;
  EXPECT_EQ(ReadStatus::kEndOfInput, source_.readBatch(&batch));
  EXPECT_TRUE(reader_.history_.empty());
  EXPECT_TRUE(session_.submitted_.empty());
}

TEST_F(InteractiveSourceTest, AsePromptUsesServerNameAndDatabase) {
  session_.setEnvironment(kEnvServerType, "ASE");
  session_.setEnvironment(kEnvDatabase, "pubs2");
  session_.select_value_ = CellValue::Text("PROD");
  reader_.addLine("select 1");
  reader_.addLine("go");
  reader_.addLine("select 2;");

  std::string batch;
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));

  const std::vector<std::string> expected_prompts = {
      "PROD.pubs2 1 $ ", "PROD.pubs2 2 $ ", "PROD.pubs2 1 $ "};
  EXPECT_EQ(expected_prompts, reader_.prompts_);

  // The server name is looked up once.
  EXPECT_EQ(1, session_.num_select_value_);
  EXPECT_EQ("select @@servername", session_.last_select_query_);
}

TEST_F(InteractiveSourceTest, SqlServerPrompt) {
  session_.setEnvironment(kEnvServerType, "sql server");
  session_.setEnvironment(kEnvDatabase, "master");
  session_.select_value_ = CellValue::Text("WIN01");
  reader_.addLine("select 1;");

  std::string batch;
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));
  EXPECT_EQ("WIN01.master 1 $ ", reader_.prompts_[0]);
}

TEST_F(InteractiveSourceTest, SqlAnywherePromptOmitsDatabase) {
  session_.setEnvironment(kEnvServerType, "SQL Anywhere");
  session_.setEnvironment(kEnvDatabase, "demo");
  session_.select_value_ = CellValue::Text("anywhere");
  reader_.addLine("select 1;");

  std::string batch;
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));
  EXPECT_EQ("anywhere 1 $ ", reader_.prompts_[0]);
}

TEST_F(InteractiveSourceTest, ServerNameLookupIsRetriedAfterFailure) {
  session_.setEnvironment(kEnvServerType, "ASE");
  session_.setEnvironment(kEnvDatabase, "master");
  session_.fail_select_value_ = true;
  reader_.addLine("select 1");

  std::string batch;
  reader_.addLine("go");
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));
  EXPECT_EQ(".master 1 $ ", reader_.prompts_[0]);
  EXPECT_EQ(2, session_.num_select_value_);

  session_.fail_select_value_ = false;
  session_.select_value_ = CellValue::Text("PROD");
  reader_.addLine("select 2;");
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));
  EXPECT_EQ("PROD.master 1 $ ", reader_.prompts_[2]);
  EXPECT_EQ(3, session_.num_select_value_);
}

TEST_F(InteractiveSourceTest, PromptFollowsDatabaseChanges) {
  session_.setEnvironment(kEnvServerType, "ASE");
  session_.select_value_ = CellValue::Text("PROD");
  session_.environment_.emplace_back(kEnvDatabase, "master");
  reader_.addLine("use pubs2;");
  reader_.addLine("select 1;");

  std::string batch;
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));
  session_.environment_.back().second = "pubs2";
  ASSERT_EQ(ReadStatus::kBatch, source_.readBatch(&batch));

  EXPECT_EQ("PROD.master 1 $ ", reader_.prompts_[0]);
  EXPECT_EQ("PROD.pubs2 1 $ ", reader_.prompts_[1]);
}

}  // namespace tabsql

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
