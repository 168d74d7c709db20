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

#include "utility/StringUtil.hpp"

#include "glog/logging.h"
#include "gtest/gtest.h"

namespace tabsql {

TEST(StringUtilTest, TrimWhitespace) {
  EXPECT_EQ("abc", TrimWhitespace("  abc \t\n"));
  EXPECT_EQ("a b", TrimWhitespace("a b"));
  EXPECT_EQ("", TrimWhitespace(" \n "));
  EXPECT_EQ("", TrimWhitespace(""));
}

TEST(StringUtilTest, TrimRightWhitespace) {
  EXPECT_EQ("  abc", TrimRightWhitespace("  abc \n\n"));
  EXPECT_EQ("", TrimRightWhitespace("\n"));
}

TEST(StringUtilTest, IsBlank) {
  EXPECT_TRUE(IsBlank(""));
  EXPECT_TRUE(IsBlank(" \n\t"));
  EXPECT_FALSE(IsBlank(" x "));
}

TEST(StringUtilTest, ToHexString) {
  EXPECT_EQ("", ToHexString(""));
  EXPECT_EQ("00ff10ab", ToHexString(std::string("\x00\xff\x10\xab", 4)));
}

TEST(StringUtilTest, DoubleToShortestString) {
  EXPECT_EQ("0.1", DoubleToShortestString(0.1));
  EXPECT_EQ("2.5", DoubleToShortestString(2.5));
  EXPECT_EQ("-3", DoubleToShortestString(-3.0));
  EXPECT_EQ("0.30000000000000004", DoubleToShortestString(0.1 + 0.2));
}

TEST(StringUtilTest, Utf8Length) {
  EXPECT_EQ(0u, Utf8Length(""));
  EXPECT_EQ(3u, Utf8Length("abc"));
  EXPECT_EQ(1u, Utf8Length("\xe2\x94\x80"));
  EXPECT_EQ(4u, Utf8Length("caf\xc3\xa9"));
}

}  // namespace tabsql

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
