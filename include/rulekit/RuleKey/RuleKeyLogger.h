//===- RuleKeyLogger.h ------------------------------------------*- C++ -*-===//
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

#ifndef RULEKIT_RULEKEY_RULEKEYLOGGER_H
#define RULEKIT_RULEKEY_RULEKEYLOGGER_H

#include "rulekit/Basic/LLVM.h"
#include "rulekit/RuleKey/HashCode.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace rulekit {
namespace rulekey {

/// Observer of the fields of a rule key under construction.
///
/// Logging never changes the resulting key.
class RuleKeyLogger {
public:
  virtual ~RuleKeyLogger();

  /// Check whether field bytes should be collected at all.
  virtual bool isEnabled() const = 0;

  /// Called with the exact encoded bytes of each top-level field.
  virtual void addField(StringRef name, ArrayRef<uint8_t> bytes) = 0;

  /// Called once with the finished key.
  virtual void registerRuleKey(const RuleKey& key) = 0;
};

class NullRuleKeyLogger : public RuleKeyLogger {
public:
  bool isEnabled() const override { return false; }
  void addField(StringRef, ArrayRef<uint8_t>) override {}
  void registerRuleKey(const RuleKey&) override {}
};

/// A logger which keeps every field, for explaining cache misses.
class RecordingRuleKeyLogger : public RuleKeyLogger {
public:
  struct Entry {
    std::string name;
    std::vector<uint8_t> bytes;
  };

private:
  std::vector<Entry> entries;
  Optional<RuleKey> ruleKey;

public:
  bool isEnabled() const override { return true; }
  void addField(StringRef name, ArrayRef<uint8_t> bytes) override;
  void registerRuleKey(const RuleKey& key) override;

  ArrayRef<Entry> getEntries() const { return entries; }
  const Optional<RuleKey>& getRuleKey() const { return ruleKey; }

  /// Find the first field whose name or bytes differ from \arg other.
  ///
  /// \returns The name of the field, or None if both logs are identical.
  Optional<std::string>
  findFirstDifference(const RecordingRuleKeyLogger& other) const;

  /// Print the key and one line per field to \arg os.
  void print(raw_ostream& os, StringRef ruleName) const;
};

}
}

#endif
