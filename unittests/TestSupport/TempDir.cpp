//===- unittests/TestSupport/TempDir.cpp ----------------------------------===//
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

#include "TempDir.h"

#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include "gtest/gtest.h"

rulekit::TmpDir::TmpDir(llvm::StringRef namePrefix) {
  llvm::SmallString<256> tempDirPrefix;
  llvm::sys::path::system_temp_directory(true, tempDirPrefix);
  llvm::sys::path::append(tempDirPrefix, namePrefix);

  std::error_code ec = llvm::sys::fs::createUniqueDirectory(
      tempDirPrefix.str(), tempDir);
  EXPECT_FALSE(ec) << ec.message();
}

rulekit::TmpDir::~TmpDir() {
  std::error_code ec = llvm::sys::fs::remove_directories(tempDir.str());
  EXPECT_FALSE(ec) << ec.message();
}

const char *rulekit::TmpDir::c_str() { return tempDir.c_str(); }
std::string rulekit::TmpDir::str() const { return tempDir.str().str(); }

std::string rulekit::TmpDir::path(llvm::StringRef name) const {
  llvm::SmallString<256> result(tempDir);
  llvm::sys::path::append(result, name);
  return result.str().str();
}

std::string rulekit::TmpDir::writeFile(llvm::StringRef name,
                                       llvm::StringRef contents) {
  std::string filePath = path(name);
  std::error_code ec;
  llvm::raw_fd_ostream os(filePath, ec, llvm::sys::fs::OF_None);
  EXPECT_FALSE(ec) << ec.message();
  os << contents;
  os.close();
  EXPECT_FALSE(os.has_error());
  os.clear_error();
  return filePath;
}
