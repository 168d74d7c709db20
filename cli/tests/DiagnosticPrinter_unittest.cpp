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

#include "cli/DiagnosticPrinter.hpp"
#include "session/Session.hpp"
#include "utility/MemStream.hpp"

#include "glog/logging.h"
#include "gtest/gtest.h"

namespace tabsql {

namespace {

Diagnostic MakeDiagnostic(const int severity, const int code, const std::string &text) {
  Diagnostic diagnostic;
  diagnostic.severity = severity;
  diagnostic.code = code;
  diagnostic.text = text;
  return diagnostic;
}

}  // namespace

TEST(DiagnosticPrinterTest, ErrorsAreFailures) {
  MemStream out;
  const DiagnosticPrinter printer(out.file());

  EXPECT_TRUE(printer(MakeDiagnostic(16, 208, "t not found.\n")));
  EXPECT_EQ("Msg 208, Level 16:\nt not found.\n", out.str());
}

TEST(DiagnosticPrinterTest, InformationalMessagesAreTrimmed) {
  MemStream out;
  const DiagnosticPrinter printer(out.file());

  EXPECT_FALSE(printer(MakeDiagnostic(10, 0, "hello   \n")));
  EXPECT_FALSE(printer(MakeDiagnostic(10, 5701, "Changed database context to 'master'.")));
  EXPECT_EQ("hello\nChanged database context to 'master'.\n", out.str());
}

TEST(DiagnosticPrinterTest, LowSeverityMessagesAreDropped) {
  MemStream out;
  const DiagnosticPrinter printer(out.file());

  EXPECT_FALSE(printer(MakeDiagnostic(0, 5701, "Changed database context to 'master'.")));
  EXPECT_FALSE(printer(MakeDiagnostic(9, 6201, "QUERY PLAN FOR STATEMENT 1 (at line 1).\n")));
  EXPECT_EQ("", out.str());
}

TEST(DiagnosticPrinterTest, PreformattedNoticesAreVerbatim) {
  EXPECT_TRUE(DiagnosticPrinter::IsPreformattedNotice(3612));
  EXPECT_TRUE(DiagnosticPrinter::IsPreformattedNotice(3615));
  EXPECT_TRUE(DiagnosticPrinter::IsPreformattedNotice(6250));
  EXPECT_TRUE(DiagnosticPrinter::IsPreformattedNotice(10299));
  EXPECT_FALSE(DiagnosticPrinter::IsPreformattedNotice(3616));
  EXPECT_FALSE(DiagnosticPrinter::IsPreformattedNotice(10300));

  MemStream out;
  const DiagnosticPrinter printer(out.file());
  const std::string plan = "QUERY PLAN FOR STATEMENT 1 (at line 1).\n\n  ";
  EXPECT_FALSE(printer(MakeDiagnostic(10, 6201, plan)));
  EXPECT_EQ(plan, out.str());
}

TEST(DiagnosticPrinterTest, PreformattedCodeAboveInformationalIsAnError) {
  MemStream out;
  const DiagnosticPrinter printer(out.file());
  EXPECT_TRUE(printer(MakeDiagnostic(11, 6201, "bad plan  ")));
  EXPECT_EQ("Msg 6201, Level 11:\nbad plan\n", out.str());
}

}  // namespace tabsql

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
