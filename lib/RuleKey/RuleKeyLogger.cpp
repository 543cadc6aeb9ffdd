//===-- RuleKeyLogger.cpp -------------------------------------------------===//
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

#include "rulekit/RuleKey/RuleKeyLogger.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace rulekit;
using namespace rulekit::rulekey;

RuleKeyLogger::~RuleKeyLogger() {}

void RecordingRuleKeyLogger::addField(StringRef name,
                                      ArrayRef<uint8_t> bytes) {
  entries.push_back(Entry{ name.str(),
                           std::vector<uint8_t>(bytes.begin(), bytes.end()) });
}

void RecordingRuleKeyLogger::registerRuleKey(const RuleKey& key) {
  ruleKey = key;
}

Optional<std::string> RecordingRuleKeyLogger::findFirstDifference(
    const RecordingRuleKeyLogger& other) const {
  size_t count = std::min(entries.size(), other.entries.size());
  for (size_t i = 0; i != count; ++i) {
    const Entry& lhs = entries[i];
    const Entry& rhs = other.entries[i];
    if (lhs.name != rhs.name || lhs.bytes != rhs.bytes)
      return lhs.name;
  }
  if (entries.size() > count)
    return entries[count].name;
  if (other.entries.size() > count)
    return other.entries[count].name;
  return None;
}

void RecordingRuleKeyLogger::print(raw_ostream& os, StringRef ruleName) const {
  os << ruleName << ": ";
  if (ruleKey.hasValue())
    os << *ruleKey;
  else
    os << "<unfinished>";
  os << "\n";
  for (const auto& entry: entries) {
    os << "  " << entry.name << " = " << llvm::toHex(entry.bytes, true)
       << "\n";
  }
}
