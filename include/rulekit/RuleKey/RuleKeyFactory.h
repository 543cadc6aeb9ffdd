//===- RuleKeyFactory.h -----------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_RULEKEYFACTORY_H
#define RULEKIT_RULEKEY_RULEKEYFACTORY_H

#include "rulekit/Basic/Compiler.h"
#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/BuildRule.h"
#include "rulekit/RuleKey/FileHashCache.h"
#include "rulekit/RuleKey/HashCode.h"
#include "rulekit/RuleKey/HashFunction.h"
#include "rulekit/RuleKey/RuleKeyConfiguration.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace rulekit {
namespace rulekey {

/// A thread-safe memo of finalized rule keys, keyed by rule identity.
class RuleKeyCache {
  std::mutex mutex;
  std::unordered_map<const BuildRule*, RuleKey> keys;

public:
  Optional<RuleKey> get(const BuildRule& rule);

  /// Record the key of \arg rule; an existing entry is kept.
  void put(const BuildRule& rule, const RuleKey& key);

  void invalidate(const BuildRule& rule);
  void invalidateAll();

  size_t size();
};

/// Computes the rule keys of whole rule graphs.
///
/// The key of a rule covers, in order, the cache key seed, the encoding
/// version, the rule type, the build target, the rule's dependencies (sorted
/// by target name) and finally the rule's own fields. Dependency keys are
/// computed on demand and memoized, so each rule is keyed once.
class RuleKeyFactory {
  class Resolution;

  int64_t seed;
  HashFunctionFactory hashFunctionFactory;
  FileHashCache& hashCache;
  BuildRuleResolver& ruleResolver;
  RuleKeyCache cache;

  /// The stream receiving field diagnostics, if enabled.
  raw_ostream* diagnostics = nullptr;
  std::mutex diagnosticsMutex;

  Expected<RuleKey> buildImpl(const BuildRule& rule,
                              SmallVectorImpl<const BuildRule*>& stack);

  // Copying is disabled.
  RuleKeyFactory(const RuleKeyFactory&) RULEKIT_DELETED_FUNCTION;
  void operator=(const RuleKeyFactory&) RULEKIT_DELETED_FUNCTION;

public:
  RuleKeyFactory(int64_t seed, HashFunctionFactory hashFunctionFactory,
                 FileHashCache& hashCache, BuildRuleResolver& ruleResolver);

  /// Create a factory from a loaded configuration.
  ///
  /// \param diagnostics The stream for field diagnostics, used when the
  /// configuration enables them.
  static std::unique_ptr<RuleKeyFactory>
  create(const RuleKeyConfiguration& config, FileHashCache& hashCache,
         BuildRuleResolver& ruleResolver, raw_ostream* diagnostics = nullptr);

  /// Print the encoded fields of every key computed to \arg os, or stop if
  /// null.
  void setDiagnosticsStream(raw_ostream* os) { diagnostics = os; }

  RuleKeyCache& getCache() { return cache; }

  /// Get the rule key of \arg rule.
  ///
  /// \returns The key, or an error if the rule or one of its transitive
  /// dependencies is malformed, unresolvable, or part of a cycle.
  Expected<RuleKey> build(const BuildRule& rule);

  /// Get the rule keys of \arg rules, computing them concurrently.
  ///
  /// \param threads The number of threads to use, or zero for the hardware
  /// concurrency.
  std::vector<Expected<RuleKey>> buildAll(ArrayRef<const BuildRule*> rules,
                                          unsigned threads = 0);
};

}
}

#endif
