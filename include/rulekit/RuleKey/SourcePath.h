//===- SourcePath.h ---------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_SOURCEPATH_H
#define RULEKIT_RULEKEY_SOURCEPATH_H

#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/BuildTarget.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <cassert>
#include <string>

namespace rulekit {
namespace rulekey {

/// A reference to an input of a rule.
///
/// A source path is either a file under a project root, a member of an
/// archive file, or an output of another rule.
class SourcePath {
public:
  enum class Kind {
    /// A file on disk, relative to a root.
    Path = 0,

    /// A named member of an archive file on disk.
    ArchiveMember,

    /// An output of the rule producing a build target.
    BuildTarget,
  };

private:
  Kind kind;

  /// The filesystem root, for the Path and ArchiveMember kinds.
  std::string root;

  /// The path relative to the root, or the archive path for archive members,
  /// or the output path for build target outputs.
  std::string relativePath;

  /// The member name, for archive members.
  std::string memberPath;

  /// The producing target, for build target outputs.
  Optional<rulekey::BuildTarget> target;

  SourcePath(Kind kind, StringRef root, StringRef relativePath,
             StringRef memberPath, Optional<rulekey::BuildTarget> target)
    : kind(kind), root(root), relativePath(relativePath),
      memberPath(memberPath), target(std::move(target)) {}

public:
  static SourcePath makePath(StringRef root, StringRef relativePath) {
    return SourcePath(Kind::Path, root, relativePath, "", None);
  }

  static SourcePath makeArchiveMember(StringRef root, StringRef archivePath,
                                      StringRef memberPath) {
    return SourcePath(Kind::ArchiveMember, root, archivePath, memberPath,
                      None);
  }

  static SourcePath makeBuildTarget(const rulekey::BuildTarget& target,
                                    StringRef outputPath = "") {
    return SourcePath(Kind::BuildTarget, "", outputPath, "", target);
  }

  Kind getKind() const { return kind; }
  bool isPath() const { return kind == Kind::Path; }
  bool isArchiveMember() const { return kind == Kind::ArchiveMember; }
  bool isBuildTarget() const { return kind == Kind::BuildTarget; }

  StringRef getRoot() const { return root; }

  /// Get the root relative path of a file, or of the archive containing a
  /// member.
  StringRef getRelativePath() const { return relativePath; }

  StringRef getMemberPath() const {
    assert(isArchiveMember());
    return memberPath;
  }

  const rulekey::BuildTarget& getBuildTarget() const {
    assert(isBuildTarget());
    return *target;
  }

  StringRef getOutputPath() const {
    assert(isBuildTarget());
    return relativePath;
  }

  /// Get the absolute path of the file, or of the archive file for members.
  std::string getAbsolutePath() const;

  /// Get a root independent description, e.g. "lib/a.a(member.o)".
  std::string describe() const;

  bool operator==(const SourcePath& rhs) const {
    return kind == rhs.kind && root == rhs.root &&
      relativePath == rhs.relativePath && memberPath == rhs.memberPath &&
      target == rhs.target;
  }
  bool operator!=(const SourcePath& rhs) const { return !(*this == rhs); }
};

raw_ostream& operator<<(raw_ostream& os, const SourcePath& path);

}
}

#endif
