//===- SourceWithFlags.h ----------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_SOURCEWITHFLAGS_H
#define RULEKIT_RULEKEY_SOURCEWITHFLAGS_H

#include "rulekit/RuleKey/RuleKeyAppendable.h"
#include "rulekit/RuleKey/SourcePath.h"

#include <memory>
#include <string>
#include <vector>

namespace rulekit {
namespace rulekey {

/// A source file together with the compiler flags specific to it.
class SourceWithFlags : public RuleKeyAppendable {
  SourcePath sourcePath;
  std::vector<std::string> flags;

public:
  SourceWithFlags(SourcePath sourcePath, std::vector<std::string> flags = {})
    : sourcePath(std::move(sourcePath)), flags(std::move(flags)) {}

  static std::shared_ptr<const SourceWithFlags>
  create(SourcePath sourcePath, std::vector<std::string> flags = {}) {
    return std::make_shared<SourceWithFlags>(std::move(sourcePath),
                                             std::move(flags));
  }

  const SourcePath& getSourcePath() const { return sourcePath; }
  const std::vector<std::string>& getFlags() const { return flags; }

  void appendToRuleKey(RuleKeyObjectSink& sink) const override;
};

}
}

#endif
