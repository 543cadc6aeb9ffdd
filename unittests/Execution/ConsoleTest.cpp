//===- unittests/Execution/ConsoleTest.cpp --------------------------------===//
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

#include "rulekit/Execution/Console.h"
#include "rulekit/Execution/Platform.h"
#include "rulekit/Execution/Verbosity.h"

#include "llvm/ADT/Triple.h"
#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

#include <string>

using namespace rulekit;
using namespace rulekit::execution;

namespace {

TEST(VerbosityTest, levels) {
  EXPECT_TRUE(isSilent(Verbosity::Silent));
  EXPECT_FALSE(shouldPrintStandardInformation(Verbosity::Silent));
  EXPECT_TRUE(shouldPrintStandardInformation(Verbosity::StandardInformation));
  EXPECT_FALSE(shouldPrintCommand(Verbosity::BinaryOutputs));
  EXPECT_TRUE(shouldPrintBinaryRunInformation(Verbosity::BinaryOutputs));
  EXPECT_TRUE(shouldPrintCommand(Verbosity::Commands));
  EXPECT_FALSE(shouldPrintOutput(Verbosity::Commands));
  EXPECT_TRUE(shouldPrintOutput(Verbosity::CommandsAndOutput));
  EXPECT_TRUE(shouldPrintOutput(Verbosity::All));
}

TEST(VerbosityTest, parse) {
  EXPECT_EQ(Verbosity::Commands, *parseVerbosity("commands"));
  EXPECT_EQ(Verbosity::Commands, *parseVerbosity("3"));
  EXPECT_EQ(Verbosity::Silent, *parseVerbosity("0"));
  EXPECT_EQ(Verbosity::All, *parseVerbosity("all"));
  EXPECT_FALSE(parseVerbosity("").hasValue());
  EXPECT_FALSE(parseVerbosity("6").hasValue());
  EXPECT_FALSE(parseVerbosity("Commands").hasValue());

  for (Verbosity verbosity: { Verbosity::Silent,
        Verbosity::StandardInformation, Verbosity::BinaryOutputs,
        Verbosity::Commands, Verbosity::CommandsAndOutput, Verbosity::All }) {
    auto parsed = parseVerbosity(getVerbosityName(verbosity));
    ASSERT_TRUE(parsed.hasValue()) << getVerbosityName(verbosity).str();
    EXPECT_EQ(verbosity, *parsed);
  }
}

TEST(ConsoleTest, printInfo) {
  std::string out, err;
  llvm::raw_string_ostream outStream(out), errStream(err);

  Console console(Verbosity::StandardInformation, outStream, errStream);
  console.printInfo("Using cached rule keys");
  EXPECT_EQ("Using cached rule keys\n", errStream.str());

  Console silent = console.withVerbosity(Verbosity::Silent);
  EXPECT_EQ(Verbosity::Silent, silent.getVerbosity());
  silent.printInfo("not shown");
  EXPECT_EQ("Using cached rule keys\n", errStream.str());
  EXPECT_EQ("", outStream.str());
}

TEST(ConsoleTest, printBuildFailure) {
  std::string out, err, other;
  llvm::raw_string_ostream outStream(out), errStream(err);
  llvm::raw_string_ostream otherStream(other);

  Console console(Verbosity::Silent, outStream, errStream);
  EXPECT_FALSE(console.useColors());
  console.printBuildFailure("//app:main failed");
  EXPECT_EQ("BUILD FAILED: //app:main failed\n", errStream.str());

  Console redirected = console.withStreams(otherStream, otherStream);
  redirected.printErrorText("plain");
  EXPECT_EQ("plain\n", otherStream.str());
  EXPECT_EQ(&otherStream, &redirected.getStdOut());
}

TEST(PlatformTest, triples) {
  EXPECT_EQ(Platform::Linux,
            getPlatformForTriple(llvm::Triple("x86_64-unknown-linux-gnu")));
  EXPECT_EQ(Platform::MacOS,
            getPlatformForTriple(llvm::Triple("arm64-apple-macosx13.0")));
  EXPECT_EQ(Platform::Windows,
            getPlatformForTriple(llvm::Triple("x86_64-pc-windows-msvc")));
  EXPECT_EQ(Platform::FreeBSD,
            getPlatformForTriple(llvm::Triple("x86_64-unknown-freebsd13")));
  EXPECT_EQ(Platform::Unknown,
            getPlatformForTriple(llvm::Triple("wasm32-unknown-unknown")));

  EXPECT_EQ("linux", getPlatformName(Platform::Linux));
  EXPECT_EQ("macos", getPlatformName(Platform::MacOS));
  EXPECT_EQ("unknown", getPlatformName(Platform::Unknown));
  EXPECT_NE(Platform::Unknown, detectPlatform());
}

}
