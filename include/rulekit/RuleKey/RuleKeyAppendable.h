//===- RuleKeyAppendable.h --------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_RULEKEYAPPENDABLE_H
#define RULEKIT_RULEKEY_RULEKEYAPPENDABLE_H

#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/RuleKeyValue.h"

#include "llvm/ADT/StringRef.h"

namespace rulekit {
namespace rulekey {

/// A receiver of named rule key fields.
class RuleKeyObjectSink {
public:
  virtual ~RuleKeyObjectSink();

  /// Add the field \arg key with the given \arg value.
  ///
  /// Field order is significant. An empty sequence value adds nothing.
  virtual RuleKeyObjectSink& setReflectively(StringRef key,
                                             const RuleKeyValue& value) = 0;
};

/// A structured value which contributes its own named fields to a rule key.
///
/// The fields are namespaced under the name of the field holding the value,
/// i.e. a field "flags" set by an appendable held in field "src" is recorded
/// as "src.flags".
class RuleKeyAppendable {
public:
  virtual ~RuleKeyAppendable();

  virtual void appendToRuleKey(RuleKeyObjectSink& sink) const = 0;
};

}
}

#endif
