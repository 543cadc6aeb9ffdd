//===-- SourcePath.cpp ----------------------------------------------------===//
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

#include "rulekit/RuleKey/SourcePath.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

using namespace rulekit;
using namespace rulekit::rulekey;

std::string SourcePath::getAbsolutePath() const {
  assert(!isBuildTarget() && "build target outputs have no fixed location");
  if (llvm::sys::path::is_absolute(relativePath))
    return relativePath;

  SmallString<256> result(root);
  llvm::sys::path::append(result, relativePath);
  return result.str().str();
}

std::string SourcePath::describe() const {
  switch (kind) {
  case Kind::Path:
    return relativePath;
  case Kind::ArchiveMember:
    return relativePath + "(" + memberPath + ")";
  case Kind::BuildTarget:
    if (relativePath.empty())
      return target->getFullyQualifiedName();
    return target->getFullyQualifiedName() + "[" + relativePath + "]";
  }
  llvm_unreachable("invalid source path kind");
}

raw_ostream& rulekit::rulekey::operator<<(raw_ostream& os,
                                          const SourcePath& path) {
  return os << path.describe();
}
