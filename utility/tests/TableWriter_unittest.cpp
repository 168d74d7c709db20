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

#include <string>
#include <vector>

#include "utility/MemStream.hpp"
#include "utility/TableWriter.hpp"

#include "glog/logging.h"
#include "gtest/gtest.h"

namespace tabsql {

TEST(TableWriterTest, ParseTableTheme) {
  TableTheme theme = TableTheme::kUtfCompact;
  EXPECT_TRUE(ParseTableTheme("ASCIICompact", &theme));
  EXPECT_EQ(TableTheme::kASCIICompact, theme);
  EXPECT_TRUE(ParseTableTheme("UtfCompact", &theme));
  EXPECT_EQ(TableTheme::kUtfCompact, theme);
  EXPECT_FALSE(ParseTableTheme("utfcompact", &theme));
  EXPECT_FALSE(ParseTableTheme("", &theme));
}

TEST(TableWriterTest, AlignsColumnsToWidestCell) {
  MemStream out;
  TableWriter table(out.file(), TableTheme::kASCIICompact, " ", true);
  table.setHeader({"id", "name"});
  table.append({"1", "alice"});
  table.append({"22", "bo"});
  table.render();

  EXPECT_EQ("id name\n"
            "-- -----\n"
            "1  alice\n"
            "22 bo\n",
            out.str());
}

TEST(TableWriterTest, UnicodeThemeRule) {
  MemStream out;
  TableWriter table(out.file(), TableTheme::kUtfCompact, " ", true);
  table.setHeader({"x"});
  table.append({"100"});
  table.render();

  EXPECT_EQ("x\n"
            "───\n"
            "100\n",
            out.str());
}

TEST(TableWriterTest, CustomSeparator) {
  MemStream out;
  TableWriter table(out.file(), TableTheme::kASCIICompact, " | ", true);
  table.setHeader({"a", "b"});
  table.append({"1", "2"});
  table.render();

  EXPECT_EQ("a | b\n"
            "- | -\n"
            "1 | 2\n",
            out.str());
}

TEST(TableWriterTest, MultiByteCellsAlignByCodePoint) {
  MemStream out;
  TableWriter table(out.file(), TableTheme::kASCIICompact, " ", true);
  table.setHeader({"n", "v"});
  table.append({"\xc3\xa9", "x"});
  table.append({"ab", "y"});
  table.render();

  EXPECT_EQ("n  v\n"
            "-- -\n"
            "\xc3\xa9  x\n"
            "ab y\n",
            out.str());
}

TEST(TableWriterTest, NoHeader) {
  MemStream out;
  TableWriter table(out.file(), TableTheme::kASCIICompact, " ", false);
  table.setHeader({"a_long_header", "b"});
  table.append({"1", "2"});
  table.render();

  // The header does not count towards the column width either.
  EXPECT_EQ("1 2\n", out.str());
}

TEST(TableWriterTest, RenderStartsAFreshPageWithTheSameHeader) {
  MemStream out;
  TableWriter table(out.file(), TableTheme::kASCIICompact, " ", true);
  table.setHeader({"x"});
  table.append({"1"});
  EXPECT_EQ(1u, table.numPendingRows());
  table.render();
  EXPECT_EQ(0u, table.numPendingRows());

  table.append({"2"});
  table.render();

  EXPECT_EQ("x\n-\n1\n"
            "x\n-\n2\n",
            out.str());
  ASSERT_EQ(1u, table.header().size());
  EXPECT_EQ("x", table.header()[0]);
}

}  // namespace tabsql

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
