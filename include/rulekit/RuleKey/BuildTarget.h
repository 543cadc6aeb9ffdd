//===- BuildTarget.h --------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_BUILDTARGET_H
#define RULEKIT_RULEKEY_BUILDTARGET_H

#include "rulekit/Basic/LLVM.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <map>
#include <string>
#include <vector>

namespace rulekit {
namespace rulekey {

/// The name of a buildable unit.
///
/// A target is written as "cell//base/path:name#flavor1,flavor2", where the
/// cell and flavors are optional. Flavors are kept sorted and unique, so the
/// fully qualified name is canonical.
class BuildTarget {
  std::string cellName;
  std::string basePath;
  std::string shortName;
  std::vector<std::string> flavors;

public:
  BuildTarget(StringRef cellName, StringRef basePath, StringRef shortName,
              ArrayRef<std::string> flavors = {});

  /// Parse a fully qualified target name.
  static Expected<BuildTarget> parse(StringRef name);

  StringRef getCellName() const { return cellName; }

  /// Get the base path, without the leading "//".
  StringRef getBasePath() const { return basePath; }

  StringRef getShortName() const { return shortName; }

  ArrayRef<std::string> getFlavors() const { return flavors; }
  bool isFlavored() const { return !flavors.empty(); }

  /// Get a copy of this target with \arg newFlavors added.
  BuildTarget withFlavors(ArrayRef<std::string> newFlavors) const;

  /// Get the name without flavors, e.g. "cell//base:name".
  std::string getUnflavoredName() const;

  /// Get the canonical name, e.g. "cell//base:name#a,b".
  std::string getFullyQualifiedName() const;

  /// Check that the components are well formed.
  Error validate() const;

  bool operator==(const BuildTarget& rhs) const {
    return cellName == rhs.cellName && basePath == rhs.basePath &&
      shortName == rhs.shortName && flavors == rhs.flavors;
  }
  bool operator!=(const BuildTarget& rhs) const { return !(*this == rhs); }
  bool operator<(const BuildTarget& rhs) const {
    return getFullyQualifiedName() < rhs.getFullyQualifiedName();
  }
};

raw_ostream& operator<<(raw_ostream& os, const BuildTarget& target);

/// Creates targets from the attributes of a rule declared in a build file.
class BuildTargetFactory {
public:
  /// Create the target for a declared rule.
  ///
  /// \param cellRoot The absolute path of the cell's root directory.
  /// \param cellName The name of the cell, which may be empty.
  /// \param attributes The rule attributes; "name" is required and
  /// "base_path", if present, must match the build file location.
  /// \param buildFilePath The absolute path of the build file declaring the
  /// rule, which must be inside \arg cellRoot.
  static Expected<BuildTarget>
  createFromAttributes(StringRef cellRoot, StringRef cellName,
                       const std::map<std::string, std::string>& attributes,
                       StringRef buildFilePath);
};

}
}

#endif
