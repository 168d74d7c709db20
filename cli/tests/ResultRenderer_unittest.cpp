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

#include <cstdint>
#include <string>
#include <vector>

#include "cli/CliConfiguration.hpp"
#include "cli/ResultRenderer.hpp"
#include "cli/tests/FakeSession.hpp"
#include "session/CellValue.hpp"
#include "utility/MemStream.hpp"
#include "utility/TableWriter.hpp"

#include "glog/logging.h"
#include "gtest/gtest.h"

namespace tabsql {

namespace {

FakeResult NumberedRows(const int num_rows) {
  FakeResult result;
  result.columns = {"n"};
  for (int i = 1; i <= num_rows; ++i) {
    result.rows.push_back({CellValue::Integer(i)});
  }
  return result;
}

}  // namespace

class ResultRendererTest : public ::testing::Test {
 protected:
  ResultRendererTest() {
    config_.theme = TableTheme::kASCIICompact;
  }

  std::size_t render(const FakeResult &result) {
    FakeResultSet results({result});
    ResultRenderer renderer(config_, out_.file(), err_.file());
    return renderer.renderCurrent(&results);
  }

  CliConfiguration config_;
  MemStream out_;
  MemStream err_;
};

TEST_F(ResultRendererTest, FormatsValues) {
  FakeResult result;
  result.columns = {"id", "name", "created", "raw"};
  result.rows.push_back({CellValue::Integer(1),
                         CellValue::Text("  ann "),
                         CellValue::Timestamp(1614834367),
                         CellValue::Binary(std::string("\xde\xad", 2))});
  result.rows.push_back({CellValue::Integer(22),
                         CellValue::Null(),
                         CellValue::Null(),
                         CellValue::Null()});

  EXPECT_EQ(2u, render(result));
  EXPECT_EQ("id name created             raw\n"
            "-- ---- ------------------- ------\n"
            "1  ann  2021-03-04 05:06:07 0xdead\n"
            "22 NULL NULL                NULL\n",
            out_.str());
  EXPECT_EQ("", err_.str());
}

TEST_F(ResultRendererTest, PagesRepeatTheHeader) {
  config_.page_size = 2;
  EXPECT_EQ(5u, render(NumberedRows(5)));
  EXPECT_EQ("n\n-\n1\n2\n"
            "n\n-\n3\n4\n"
            "n\n-\n5\n",
            out_.str());
}

TEST_F(ResultRendererTest, NoEmptyTrailingPage) {
  config_.page_size = 2;
  EXPECT_EQ(4u, render(NumberedRows(4)));
  EXPECT_EQ("n\n-\n1\n2\n"
            "n\n-\n3\n4\n",
            out_.str());
}

TEST_F(ResultRendererTest, NoRowsNoTable) {
  EXPECT_EQ(0u, render(NumberedRows(0)));
  EXPECT_EQ("", out_.str());
}

TEST_F(ResultRendererTest, HeaderCanBeSuppressed) {
  config_.print_header = false;
  render(NumberedRows(2));
  EXPECT_EQ("1\n2\n", out_.str());
}

TEST_F(ResultRendererTest, RowsAffectedSummary) {
  FakeResult result;
  result.has_rows_affected = true;
  result.rows_affected = 3;
  EXPECT_EQ(0u, render(result));
  EXPECT_EQ("(3 rows affected)\n", out_.str());
}

TEST_F(ResultRendererTest, SummaryFollowsTheTable) {
  FakeResult result = NumberedRows(1);
  result.has_rows_affected = true;
  result.rows_affected = 1;
  result.has_return_status = true;
  result.return_status = 0;
  render(result);
  EXPECT_EQ("n\n-\n1\n(1 row affected, return status = 0)\n", out_.str());
}

TEST_F(ResultRendererTest, FetchErrorFallsThroughToSummary) {
  FakeResult result = NumberedRows(2);
  result.fail_after_rows = true;
  result.has_return_status = true;
  result.return_status = -6;

  EXPECT_EQ(2u, render(result));
  EXPECT_EQ("n\n-\n1\n2\n(return status = -6)\n", out_.str());
  EXPECT_EQ("connection reset while fetching\n", err_.str());
}

TEST(ResultRendererSummaryTest, Wording) {
  EXPECT_EQ("", ResultRenderer::FormatSummary(false, 0, false, 0));
  EXPECT_EQ("(1 row affected)", ResultRenderer::FormatSummary(true, 1, false, 0));
  EXPECT_EQ("(0 rows affected)", ResultRenderer::FormatSummary(true, 0, false, 0));
  EXPECT_EQ("(12 rows affected)", ResultRenderer::FormatSummary(true, 12, false, 7));
  EXPECT_EQ("(return status = 7)", ResultRenderer::FormatSummary(false, 12, true, 7));
  EXPECT_EQ("(2 rows affected, return status = 1)",
            ResultRenderer::FormatSummary(true, 2, true, 1));
}

}  // namespace tabsql

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
