//===- unittests/Basic/ShellUtilityTest.cpp -------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2015 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#include "rulekit/Basic/ShellUtility.h"

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace rulekit;
using namespace rulekit::basic;

namespace {

TEST(ShellUtilityTest, escaping) {
  // No escapable char.
  EXPECT_EQ("input01", shellEscaped("input01"));
  EXPECT_EQ("/usr/bin/cc", shellEscaped("/usr/bin/cc"));
  EXPECT_EQ("-DNAME=1", shellEscaped("-DNAME=1"));

  // Spaces.
  EXPECT_EQ("'input A'", shellEscaped("input A"));
  EXPECT_EQ("'input A B'", shellEscaped("input A B"));

  // Double Quote.
  EXPECT_EQ("'input\"A'", shellEscaped("input\"A"));

  // Single Quote.
  EXPECT_EQ("'input'\\''A'", shellEscaped("input'A"));

  // Shell metacharacters.
  EXPECT_EQ("'a$b'", shellEscaped("a$b"));
  EXPECT_EQ("'input\nA'", shellEscaped("input\nA"));
  EXPECT_EQ("'x>D*[;()^<'", shellEscaped("x>D*[;()^<"));

  // The empty string must still be a word.
  EXPECT_EQ("''", shellEscaped(""));
}

TEST(ShellUtilityTest, formatCommandLine) {
  EXPECT_EQ("", formatCommandLine(std::vector<std::string>()));
  std::vector<std::string> args{"echo", "hello world", "it"};
  EXPECT_EQ("echo 'hello world' it", formatCommandLine(args));
  args = {"printf", "", "x"};
  EXPECT_EQ("printf '' x", formatCommandLine(args));
}

}
