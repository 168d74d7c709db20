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

#include "session/CellValue.hpp"

#include "glog/logging.h"
#include "gtest/gtest.h"

namespace tabsql {

TEST(CellValueTest, NullDisplaysAsNullToken) {
  EXPECT_TRUE(CellValue().isNull());
  EXPECT_EQ("NULL", CellValue::Null().toDisplayString());
}

TEST(CellValueTest, TextIsTrimmed) {
  EXPECT_EQ("padded", CellValue::Text("  padded   ").toDisplayString());
  EXPECT_EQ("a  b", CellValue::Text("a  b\n").toDisplayString());
}

TEST(CellValueTest, Numbers) {
  EXPECT_EQ("42", CellValue::Integer(42).toDisplayString());
  EXPECT_EQ("-7", CellValue::Integer(-7).toDisplayString());
  EXPECT_EQ("1.5", CellValue::Real(1.5).toDisplayString());
}

TEST(CellValueTest, TimestampUsesDateTimeLayout) {
  EXPECT_EQ("1970-01-01 00:00:00", CellValue::Timestamp(0).toDisplayString());
  // 2021-03-04 05:06:07 UTC.
  EXPECT_EQ("2021-03-04 05:06:07", CellValue::Timestamp(1614834367).toDisplayString());
}

TEST(CellValueTest, BinaryIsHexPrefixed) {
  EXPECT_EQ("0xdeadbeef",
            CellValue::Binary(std::string("\xde\xad\xbe\xef", 4)).toDisplayString());
  EXPECT_EQ("0x", CellValue::Binary("").toDisplayString());
  // Binary payloads are not trimmed.
  EXPECT_EQ("0x20", CellValue::Binary(" ").toDisplayString());
}

TEST(CellValueTest, Kinds) {
  EXPECT_EQ(CellValue::Kind::kText, CellValue::Text("x").kind());
  EXPECT_EQ(CellValue::Kind::kInteger, CellValue::Integer(1).kind());
  EXPECT_EQ(CellValue::Kind::kReal, CellValue::Real(1.0).kind());
  EXPECT_EQ(CellValue::Kind::kTimestamp, CellValue::Timestamp(1).kind());
  EXPECT_EQ(CellValue::Kind::kBinary, CellValue::Binary("x").kind());
}

}  // namespace tabsql

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
