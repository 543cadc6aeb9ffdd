//===-- RuleKeyFactory.cpp ------------------------------------------------===//
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

#include "rulekit/RuleKey/RuleKeyFactory.h"

#include "rulekit/Basic/Defer.h"
#include "rulekit/Basic/Version.h"
#include "rulekit/RuleKey/RuleKeyBuilder.h"
#include "rulekit/RuleKey/RuleKeyLogger.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/ThreadPool.h"
#include "llvm/Support/Threading.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace rulekit;
using namespace rulekit::rulekey;

#pragma mark - RuleKeyCache

Optional<RuleKey> RuleKeyCache::get(const BuildRule& rule) {
  std::lock_guard<std::mutex> guard(mutex);
  auto it = keys.find(&rule);
  if (it == keys.end())
    return None;
  return it->second;
}

void RuleKeyCache::put(const BuildRule& rule, const RuleKey& key) {
  std::lock_guard<std::mutex> guard(mutex);
  keys.insert({ &rule, key });
}

void RuleKeyCache::invalidate(const BuildRule& rule) {
  std::lock_guard<std::mutex> guard(mutex);
  keys.erase(&rule);
}

void RuleKeyCache::invalidateAll() {
  std::lock_guard<std::mutex> guard(mutex);
  keys.clear();
}

size_t RuleKeyCache::size() {
  std::lock_guard<std::mutex> guard(mutex);
  return keys.size();
}

#pragma mark - RuleKeyFactory

/// The resolver for one top-level computation, which tracks the chain of
/// rules being keyed in order to detect cycles.
class RuleKeyFactory::Resolution : public RuleKeyResolver {
  RuleKeyFactory& factory;
  SmallVectorImpl<const BuildRule*>& stack;

public:
  Resolution(RuleKeyFactory& factory,
             SmallVectorImpl<const BuildRule*>& stack)
    : factory(factory), stack(stack) {}

  const BuildRule* lookupRule(const BuildTarget& target) override {
    return factory.ruleResolver.lookupRule(target);
  }

  Expected<RuleKey> getRuleKey(const BuildRule& rule) override {
    return factory.buildImpl(rule, stack);
  }
};

RuleKeyFactory::RuleKeyFactory(int64_t seed,
                               HashFunctionFactory hashFunctionFactory,
                               FileHashCache& hashCache,
                               BuildRuleResolver& ruleResolver)
  : seed(seed), hashFunctionFactory(std::move(hashFunctionFactory)),
    hashCache(hashCache), ruleResolver(ruleResolver) {}

std::unique_ptr<RuleKeyFactory>
RuleKeyFactory::create(const RuleKeyConfiguration& config,
                       FileHashCache& hashCache,
                       BuildRuleResolver& ruleResolver,
                       raw_ostream* diagnostics) {
  std::unique_ptr<RuleKeyFactory> factory(new RuleKeyFactory(
      config.seed, getHashFunctionFactory(config.hashFunction), hashCache,
      ruleResolver));
  if (config.logFieldDiagnostics)
    factory->setDiagnosticsStream(diagnostics);
  return factory;
}

static Error makeRuleError(const BuildRule& rule, const Twine& message) {
  return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                 "rule '" + rule.getFullyQualifiedName() +
                                 "': " + message);
}

Expected<RuleKey>
RuleKeyFactory::buildImpl(const BuildRule& rule,
                          SmallVectorImpl<const BuildRule*>& stack) {
  if (auto cached = cache.get(rule))
    return *cached;

  if (llvm::is_contained(stack, &rule)) {
    std::string cycle;
    auto it = std::find(stack.begin(), stack.end(), &rule);
    for (; it != stack.end(); ++it) {
      cycle += (*it)->getFullyQualifiedName();
      cycle += " -> ";
    }
    cycle += rule.getFullyQualifiedName();
    return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                   "dependency cycle: " + cycle);
  }

  if (Error err = rule.getBuildTarget().validate())
    return makeRuleError(rule, llvm::toString(std::move(err)));
  if (rule.getType().empty())
    return makeRuleError(rule, "missing rule type");

  stack.push_back(&rule);
  rulekit_defer { stack.pop_back(); };

  // Dependencies are ordered by name; the declaration order of a rule's
  // dependencies does not affect its identity.
  std::vector<const BuildRule*> deps = rule.getBuildDeps();
  for (const BuildRule* dep: deps) {
    if (!dep)
      return makeRuleError(rule, "null dependency");
  }
  std::sort(deps.begin(), deps.end(),
            [](const BuildRule* lhs, const BuildRule* rhs) {
              return lhs->getFullyQualifiedName() <
                rhs->getFullyQualifiedName();
            });
  deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
  for (size_t i = 1; i < deps.size(); ++i) {
    if (deps[i - 1]->getFullyQualifiedName() ==
        deps[i]->getFullyQualifiedName())
      return makeRuleError(rule, "duplicate dependency '" +
                           deps[i]->getFullyQualifiedName() + "'");
  }
  std::vector<RuleKeyValue> depValues;
  for (const BuildRule* dep: deps) {
    depValues.push_back(RuleKeyValue::makeRule(*dep));
  }

  RecordingRuleKeyLogger recorder;
  Resolution resolution(*this, stack);
  RuleKeyBuilder builder(resolution, hashCache, hashFunctionFactory(),
                         diagnostics ? &recorder : nullptr);
  builder.setRuleName(rule.getFullyQualifiedName());
  builder.setReflectively(".cache_key_seed", seed)
    .setReflectively(".encoding_version", getRuleKeyEncodingVersion())
    .setReflectively(".build_rule_type",
                     RuleKeyValue::makeBuildRuleType(rule.getType()))
    .setReflectively(".target_name", rule.getBuildTarget())
    .setReflectively(".deps", depValues);
  rule.appendToRuleKey(builder);

  auto key = builder.build();
  if (!key)
    return key.takeError();

  cache.put(rule, *key);
  if (diagnostics) {
    std::lock_guard<std::mutex> guard(diagnosticsMutex);
    recorder.print(*diagnostics, rule.getFullyQualifiedName());
    diagnostics->flush();
  }
  return key;
}

Expected<RuleKey> RuleKeyFactory::build(const BuildRule& rule) {
  SmallVector<const BuildRule*, 16> stack;
  return buildImpl(rule, stack);
}

std::vector<Expected<RuleKey>>
RuleKeyFactory::buildAll(ArrayRef<const BuildRule*> rules, unsigned threads) {
  struct Outcome {
    Optional<RuleKey> key;
    std::string error;
  };
  std::vector<Outcome> outcomes(rules.size());

  {
    llvm::ThreadPool pool(llvm::hardware_concurrency(threads));
    for (size_t i = 0, e = rules.size(); i != e; ++i) {
      pool.async([this, &rules, &outcomes, i]() {
          auto key = build(*rules[i]);
          if (key)
            outcomes[i].key = *key;
          else
            outcomes[i].error = llvm::toString(key.takeError());
        });
    }
    pool.wait();
  }

  std::vector<Expected<RuleKey>> results;
  results.reserve(outcomes.size());
  for (auto& outcome: outcomes) {
    if (outcome.key.hasValue()) {
      results.emplace_back(*outcome.key);
    } else {
      results.emplace_back(llvm::createStringError(
                               llvm::inconvertibleErrorCode(), outcome.error));
    }
  }
  return results;
}
