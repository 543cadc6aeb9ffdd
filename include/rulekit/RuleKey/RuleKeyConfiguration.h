//===- RuleKeyConfiguration.h -----------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_RULEKEYCONFIGURATION_H
#define RULEKIT_RULEKEY_RULEKEYCONFIGURATION_H

#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/HashFunction.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>

namespace rulekit {
namespace rulekey {

/// Settings which affect how rule keys are computed.
///
/// The configuration is usually loaded from a YAML file of the form:
///
///   rulekey:
///     seed: 1
///     hash-function: sha256
///     log-field-diagnostics: false
///     threads: 4
struct RuleKeyConfiguration {
  /// A value mixed into every key, so bumping it invalidates all caches.
  int64_t seed = 0;

  HashFunctionKind hashFunction = HashFunctionKind::SHA1;

  /// Whether to print the encoded fields of every key computed.
  bool logFieldDiagnostics = false;

  /// The number of threads for batch computation, or zero to use the
  /// hardware concurrency.
  unsigned threads = 0;

  /// Parse a configuration file's contents.
  ///
  /// \param filename The name used in diagnostics.
  static Expected<RuleKeyConfiguration> parse(StringRef data,
                                              StringRef filename);

  /// Load the configuration file at \arg path.
  static Expected<RuleKeyConfiguration> load(StringRef path);

  /// Write the configuration as YAML accepted by \see parse().
  void print(raw_ostream& os) const;
};

}
}

#endif
