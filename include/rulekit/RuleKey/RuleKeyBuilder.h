//===- RuleKeyBuilder.h -----------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_RULEKEYBUILDER_H
#define RULEKIT_RULEKEY_RULEKEYBUILDER_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/BuildRule.h"
#include "rulekit/RuleKey/FileHashCache.h"
#include "rulekit/RuleKey/HashFunction.h"
#include "rulekit/RuleKey/RuleKeyAppendable.h"
#include "rulekit/RuleKey/RuleKeyHasher.h"
#include "rulekit/RuleKey/RuleKeyLogger.h"
#include "rulekit/RuleKey/RuleKeyValue.h"

#include "llvm/ADT/Optional.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>

namespace rulekit {
namespace rulekey {

/// Resolves the rules referenced while building a rule key.
class RuleKeyResolver : public BuildRuleResolver {
public:
  virtual ~RuleKeyResolver();

  /// Get the finalized rule key of \arg rule.
  virtual Expected<RuleKey> getRuleKey(const BuildRule& rule) = 0;
};

/// Accumulates the fields of one rule and produces its rule key.
///
/// Each field is encoded as its tagged name followed by its value, and the
/// encoding is fed into a fresh hash function. Referenced rules contribute
/// only their own finalized keys, and paths contribute their content hashes.
///
/// Errors (e.g. an unreadable file) are latched: later fields are ignored and
/// \see build() reports the first failure.
class RuleKeyBuilder : public RuleKeyObjectSink {
  class NestedSink;

  RuleKeyResolver& resolver;
  FileHashCache& hashCache;
  RuleKeyHasher hasher;
  RuleKeyLogger* logger;

  /// The rule being keyed, for diagnostics.
  std::string ruleName;

  /// The first error encountered, if any.
  Optional<std::string> error;

  /// The finished key, once built.
  Optional<RuleKey> result;

  /// The encoded bytes of the current field, when logging.
  SmallVector<uint8_t, 256> fieldBytes;

  void fail(StringRef field, const Twine& message);

  /// Emit the field \arg name with \arg value, unless the value is an empty
  /// sequence.
  void appendField(RuleKeyHasher& out, StringRef name,
                   const RuleKeyValue& value);

  /// Emit \arg value alone; \arg name is used to derive sub-field names.
  void appendValue(RuleKeyHasher& out, StringRef name,
                   const RuleKeyValue& value);

  void appendSourcePath(RuleKeyHasher& out, StringRef name,
                        const SourcePath& path);
  void appendMapping(RuleKeyHasher& out, StringRef name,
                     const RuleKeyValue& value);

  // Copying is disabled.
  RuleKeyBuilder(const RuleKeyBuilder&) RULEKIT_DELETED_FUNCTION;
  void operator=(const RuleKeyBuilder&) RULEKIT_DELETED_FUNCTION;

public:
  RuleKeyBuilder(RuleKeyResolver& resolver, FileHashCache& hashCache,
                 std::unique_ptr<HashFunction> hashFunction,
                 RuleKeyLogger* logger = nullptr);
  ~RuleKeyBuilder() override;

  /// Set the name of the rule being keyed, used in error messages.
  void setRuleName(StringRef name) { ruleName = name.str(); }

  RuleKeyBuilder& setReflectively(StringRef key,
                                  const RuleKeyValue& value) override;

  /// Finish the key.
  ///
  /// \returns The rule key, or the first error encountered while adding
  /// fields. Subsequent calls return the same result.
  Expected<RuleKey> build();
};

}
}

#endif
