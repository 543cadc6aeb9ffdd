//===- unittests/RuleKey/BuildTargetTest.cpp ------------------------------===//
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

#include "rulekit/RuleKey/BuildTarget.h"
#include "rulekit/RuleKey/SourcePath.h"

#include "llvm/Support/Error.h"

#include "gtest/gtest.h"

#include <map>
#include <string>

using namespace rulekit;
using namespace rulekit::rulekey;

namespace {

static std::string parseError(StringRef name) {
  auto target = BuildTarget::parse(name);
  if (target) {
    ADD_FAILURE() << "unexpected target: " << target->getFullyQualifiedName();
    return "";
  }
  return llvm::toString(target.takeError());
}

TEST(BuildTargetTest, parse) {
  auto target = BuildTarget::parse("cell//foo/bar:baz#shared,arm64");
  ASSERT_TRUE(bool(target)) << llvm::toString(target.takeError());
  EXPECT_EQ("cell", target->getCellName());
  EXPECT_EQ("foo/bar", target->getBasePath());
  EXPECT_EQ("baz", target->getShortName());
  ASSERT_EQ(2u, target->getFlavors().size());
  EXPECT_EQ("arm64", target->getFlavors()[0]);
  EXPECT_EQ("shared", target->getFlavors()[1]);
  EXPECT_TRUE(target->isFlavored());
  EXPECT_EQ("cell//foo/bar:baz", target->getUnflavoredName());
  EXPECT_EQ("cell//foo/bar:baz#arm64,shared",
            target->getFullyQualifiedName());

  auto root = BuildTarget::parse("//:all");
  ASSERT_TRUE(bool(root)) << llvm::toString(root.takeError());
  EXPECT_EQ("", root->getCellName());
  EXPECT_EQ("", root->getBasePath());
  EXPECT_FALSE(root->isFlavored());
  EXPECT_EQ("//:all", root->getFullyQualifiedName());
}

TEST(BuildTargetTest, parseErrors) {
  EXPECT_NE(std::string::npos, parseError("foo:bar").find("expected '//'"));
  EXPECT_NE(std::string::npos, parseError("//foo").find("expected ':'"));
  EXPECT_NE(std::string::npos,
            parseError("//foo:").find("missing rule name"));
  EXPECT_NE(std::string::npos,
            parseError("//foo/:bar").find("must not begin or end"));
  EXPECT_NE(std::string::npos,
            parseError("//foo/../x:bar").find("invalid base path"));
  EXPECT_NE(std::string::npos,
            parseError("//foo:bar#a,,b").find("empty flavor"));
  EXPECT_NE(std::string::npos,
            parseError("//foo:bar#").find("empty flavor"));
  EXPECT_NE(std::string::npos,
            parseError("//foo:bar:baz").find("invalid rule name"));
}

TEST(BuildTargetTest, flavors) {
  BuildTarget target("", "lib", "util", { "b", "a", "b" });
  EXPECT_EQ("//lib:util#a,b", target.getFullyQualifiedName());

  BuildTarget flavored = target.withFlavors({ "c", "a" });
  EXPECT_EQ("//lib:util#a,b,c", flavored.getFullyQualifiedName());
  EXPECT_NE(target, flavored);
  EXPECT_TRUE(target < flavored);

  EXPECT_EQ(target, BuildTarget("", "lib", "util", { "a", "b" }));
}

TEST(BuildTargetTest, createFromAttributes) {
  std::map<std::string, std::string> attributes{ { "name", "util" } };
  auto target = BuildTargetFactory::createFromAttributes(
      "/repo", "cell", attributes, "/repo/lib/core/BUCK");
  ASSERT_TRUE(bool(target)) << llvm::toString(target.takeError());
  EXPECT_EQ("cell//lib/core:util", target->getFullyQualifiedName());

  // Build files at the cell root have an empty base path.
  target = BuildTargetFactory::createFromAttributes(
      "/repo/", "", attributes, "/repo/BUCK");
  ASSERT_TRUE(bool(target)) << llvm::toString(target.takeError());
  EXPECT_EQ("//:util", target->getFullyQualifiedName());

  // A matching base path is accepted.
  attributes["base_path"] = "lib";
  target = BuildTargetFactory::createFromAttributes(
      "/repo", "", attributes, "/repo/lib/BUCK");
  ASSERT_TRUE(bool(target)) << llvm::toString(target.takeError());
  EXPECT_EQ("//lib:util", target->getFullyQualifiedName());
}

TEST(BuildTargetTest, createFromAttributesErrors) {
  auto expectError = [](const std::map<std::string, std::string>& attributes,
                        StringRef buildFile, StringRef message) {
    auto target = BuildTargetFactory::createFromAttributes(
        "/repo", "", attributes, buildFile);
    ASSERT_FALSE(bool(target));
    std::string error = llvm::toString(target.takeError());
    EXPECT_NE(std::string::npos, error.find(message.str())) << error;
  };

  expectError({}, "/repo/lib/BUCK",
              "/repo/lib/BUCK: malformed raw data, missing required "
              "attribute 'name': {}");
  expectError({ { "srcs", "a.c" }, { "base_path", "lib" } },
              "/repo/lib/BUCK",
              "malformed raw data, missing required attribute 'name': "
              "{base_path->lib,srcs->a.c}");
  expectError({ { "name", "" } }, "/repo/lib/BUCK",
              "rule attribute 'name' must not be empty");
  expectError({ { "name", "util" }, { "base_path", "other" } },
              "/repo/lib/BUCK",
              "declares base_path 'other' but is defined in 'lib'");
  expectError({ { "name", "util" } }, "/elsewhere/BUCK",
              "not inside cell root");
  expectError({ { "name", "util" } }, "/repository/BUCK",
              "not inside cell root");
  expectError({ { "name", "a:b" } }, "/repo/BUCK", "invalid rule name");
}

TEST(SourcePathTest, describe) {
  auto file = SourcePath::makePath("/repo", "src/a.c");
  EXPECT_TRUE(file.isPath());
  EXPECT_EQ("/repo/src/a.c", file.getAbsolutePath());
  EXPECT_EQ("src/a.c", file.describe());

  auto absolute = SourcePath::makePath("/repo", "/usr/include/stdio.h");
  EXPECT_EQ("/usr/include/stdio.h", absolute.getAbsolutePath());

  auto member = SourcePath::makeArchiveMember("/repo", "lib/x.a", "m.o");
  EXPECT_TRUE(member.isArchiveMember());
  EXPECT_EQ("/repo/lib/x.a", member.getAbsolutePath());
  EXPECT_EQ("m.o", member.getMemberPath());
  EXPECT_EQ("lib/x.a(m.o)", member.describe());

  BuildTarget target("", "gen", "tool");
  auto output = SourcePath::makeBuildTarget(target, "out.h");
  EXPECT_TRUE(output.isBuildTarget());
  EXPECT_EQ(target, output.getBuildTarget());
  EXPECT_EQ("//gen:tool[out.h]", output.describe());
  EXPECT_EQ("//gen:tool", SourcePath::makeBuildTarget(target).describe());

  // Descriptions do not depend on the root.
  EXPECT_EQ(file.describe(),
            SourcePath::makePath("/elsewhere", "src/a.c").describe());
  EXPECT_NE(file, SourcePath::makePath("/elsewhere", "src/a.c"));
}

}
