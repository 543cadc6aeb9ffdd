//===- unittests/RuleKey/TestRules.h --------------------------------------===//
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

#ifndef RULEKIT_UNITTESTS_RULEKEY_TESTRULES_H
#define RULEKIT_UNITTESTS_RULEKEY_TESTRULES_H

#include "rulekit/RuleKey/BuildRule.h"
#include "rulekit/RuleKey/BuildTarget.h"
#include "rulekit/RuleKey/RuleKeyBuilder.h"
#include "rulekit/RuleKey/RuleKeyValue.h"

#include "llvm/Support/Error.h"

#include "gtest/gtest.h"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace rulekit {
namespace unittests {

inline rulekey::BuildTarget makeTarget(llvm::StringRef name) {
  auto target = rulekey::BuildTarget::parse(name);
  if (!target) {
    ADD_FAILURE() << llvm::toString(target.takeError());
    return rulekey::BuildTarget("", "", "invalid");
  }
  return *target;
}

/// A rule whose fields and dependencies are set directly by the test.
class TestRule : public rulekey::BuildRule {
  rulekey::BuildTarget target;
  std::string type;

public:
  std::vector<const rulekey::BuildRule*> deps;
  std::vector<std::pair<std::string, rulekey::RuleKeyValue>> fields;

  explicit TestRule(llvm::StringRef name, llvm::StringRef type = "test_rule")
    : target(makeTarget(name)), type(type) {}
  TestRule(const rulekey::BuildTarget& target, llvm::StringRef type)
    : target(target), type(type) {}

  const rulekey::BuildTarget& getBuildTarget() const override {
    return target;
  }
  llvm::StringRef getType() const override { return type; }
  std::vector<const rulekey::BuildRule*> getBuildDeps() const override {
    return deps;
  }

  void appendToRuleKey(rulekey::RuleKeyObjectSink& sink) const override {
    for (const auto& field: fields)
      sink.setReflectively(field.first, field.second);
  }

  TestRule& addField(llvm::StringRef name,
                     const rulekey::RuleKeyValue& value) {
    fields.emplace_back(name.str(), value);
    return *this;
  }
};

/// A resolver over a fixed set of rules and precomputed keys.
class TestRuleResolver : public rulekey::RuleKeyResolver {
  std::map<std::string, const rulekey::BuildRule*> rules;
  std::map<const rulekey::BuildRule*, rulekey::RuleKey> keys;

public:
  void addRule(const rulekey::BuildRule& rule) {
    rules[rule.getFullyQualifiedName()] = &rule;
  }

  void setRuleKey(const rulekey::BuildRule& rule,
                  const rulekey::RuleKey& key) {
    keys.erase(&rule);
    keys.insert({ &rule, key });
  }

  const rulekey::BuildRule*
  lookupRule(const rulekey::BuildTarget& target) override {
    auto it = rules.find(target.getFullyQualifiedName());
    if (it == rules.end())
      return nullptr;
    return it->second;
  }

  llvm::Expected<rulekey::RuleKey>
  getRuleKey(const rulekey::BuildRule& rule) override {
    auto it = keys.find(&rule);
    if (it == keys.end()) {
      return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                     "no key for '" +
                                     rule.getFullyQualifiedName() + "'");
    }
    return it->second;
  }
};

/// Get the key, recording a failure if there is none.
inline rulekey::RuleKey expectKey(llvm::Expected<rulekey::RuleKey> key) {
  if (!key) {
    ADD_FAILURE() << "unexpected error: " << llvm::toString(key.takeError());
    return rulekey::RuleKey(rulekey::HashCode::fromInt(0));
  }
  return *key;
}

/// Get the error message, recording a failure if there is none.
inline std::string expectError(llvm::Expected<rulekey::RuleKey> key) {
  if (key) {
    ADD_FAILURE() << "unexpected key: " << key->toString();
    return "";
  }
  return llvm::toString(key.takeError());
}

}
}

#endif
