//===- BuildRule.h ----------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_BUILDRULE_H
#define RULEKIT_RULEKEY_BUILDRULE_H

#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/BuildTarget.h"
#include "rulekit/RuleKey/RuleKeyAppendable.h"

#include "llvm/ADT/StringRef.h"

#include <string>
#include <vector>

namespace rulekit {
namespace rulekey {

/// A unit of build work whose identity is fingerprinted by a rule key.
///
/// Rules are owned by the client; rule key computation only reads them and
/// may do so concurrently from several threads.
class BuildRule {
public:
  virtual ~BuildRule();

  virtual const BuildTarget& getBuildTarget() const = 0;

  /// Get the rule type name, e.g. "cxx_library".
  virtual StringRef getType() const = 0;

  /// Get the rules this rule depends on to build.
  virtual std::vector<const BuildRule*> getBuildDeps() const = 0;

  /// Add the identity affecting fields of the rule to \arg sink.
  virtual void appendToRuleKey(RuleKeyObjectSink& sink) const = 0;

  std::string getFullyQualifiedName() const {
    return getBuildTarget().getFullyQualifiedName();
  }
};

/// Maps build targets to the rules producing them.
class BuildRuleResolver {
public:
  virtual ~BuildRuleResolver();

  /// Get the rule for \arg target, or null if there is none.
  virtual const BuildRule* lookupRule(const BuildTarget& target) = 0;
};

}
}

#endif
