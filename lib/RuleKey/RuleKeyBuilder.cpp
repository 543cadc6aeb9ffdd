//===-- RuleKeyBuilder.cpp ------------------------------------------------===//
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

#include "rulekit/RuleKey/RuleKeyBuilder.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace rulekit;
using namespace rulekit::rulekey;

RuleKeyResolver::~RuleKeyResolver() {}

/// The sink handed to appendables, which namespaces their fields under the
/// field holding the appendable.
class RuleKeyBuilder::NestedSink : public RuleKeyObjectSink {
  RuleKeyBuilder& builder;
  RuleKeyHasher& out;
  StringRef prefix;

public:
  NestedSink(RuleKeyBuilder& builder, RuleKeyHasher& out, StringRef prefix)
    : builder(builder), out(out), prefix(prefix) {}

  RuleKeyObjectSink& setReflectively(StringRef key,
                                     const RuleKeyValue& value) override {
    std::string name = (prefix + "." + key).str();
    if (key.empty()) {
      builder.fail(name, "empty field name");
      return *this;
    }
    builder.appendField(out, name, value);
    return *this;
  }
};

RuleKeyBuilder::RuleKeyBuilder(RuleKeyResolver& resolver,
                               FileHashCache& hashCache,
                               std::unique_ptr<HashFunction> hashFunction,
                               RuleKeyLogger* logger)
  : resolver(resolver), hashCache(hashCache),
    hasher(std::move(hashFunction)), logger(logger) {}

RuleKeyBuilder::~RuleKeyBuilder() {}

void RuleKeyBuilder::fail(StringRef field, const Twine& message) {
  if (error.hasValue())
    return;

  std::string description;
  if (!ruleName.empty())
    description += "rule '" + ruleName + "': ";
  description += ("field '" + field + "': " + message).str();
  error = description;
}

RuleKeyBuilder& RuleKeyBuilder::setReflectively(StringRef key,
                                                const RuleKeyValue& value) {
  if (result.hasValue()) {
    llvm::report_fatal_error("rule key field '" + key +
                             "' added after the key was built");
  }
  if (error.hasValue())
    return *this;
  if (key.empty()) {
    fail(key, "empty field name");
    return *this;
  }

  bool logging = logger && logger->isEnabled();
  if (logging)
    hasher.setRecording(&fieldBytes);
  appendField(hasher, key, value);
  if (logging) {
    hasher.setRecording(nullptr);
    if (!fieldBytes.empty())
      logger->addField(key, fieldBytes);
    fieldBytes.clear();
  }
  return *this;
}

void RuleKeyBuilder::appendField(RuleKeyHasher& out, StringRef name,
                                 const RuleKeyValue& value) {
  // An empty sequence contributes nothing, not even its name.
  if (value.isEmptySequence())
    return;

  out.putKey(name);
  appendValue(out, name, value);
}

void RuleKeyBuilder::appendValue(RuleKeyHasher& out, StringRef name,
                                 const RuleKeyValue& value) {
  switch (value.getKind()) {
  case RuleKeyValue::Kind::Null:
    out.putNull();
    return;

  case RuleKeyValue::Kind::Boolean:
    out.putBoolean(value.getBoolean());
    return;

  case RuleKeyValue::Kind::Integer: {
    uint64_t bits = value.getIntegerBits();
    switch (value.getIntegerType()) {
    case RuleKeyValue::IntegerType::Int8: out.putNumber(int8_t(bits)); break;
    case RuleKeyValue::IntegerType::UInt8: out.putNumber(uint8_t(bits)); break;
    case RuleKeyValue::IntegerType::Int16: out.putNumber(int16_t(bits)); break;
    case RuleKeyValue::IntegerType::UInt16:
      out.putNumber(uint16_t(bits));
      break;
    case RuleKeyValue::IntegerType::Int32: out.putNumber(int32_t(bits)); break;
    case RuleKeyValue::IntegerType::UInt32:
      out.putNumber(uint32_t(bits));
      break;
    case RuleKeyValue::IntegerType::Int64: out.putNumber(int64_t(bits)); break;
    case RuleKeyValue::IntegerType::UInt64: out.putNumber(bits); break;
    }
    return;
  }

  case RuleKeyValue::Kind::String:
    out.putString(value.getText());
    return;

  case RuleKeyValue::Kind::Bytes:
    out.putBytes(llvm::arrayRefFromStringRef(value.getText()));
    return;

  case RuleKeyValue::Kind::Enum:
    out.putEnum(value.getEnumTypeName(), value.getText());
    return;

  case RuleKeyValue::Kind::HashCode:
    out.putHashCode(HashCode(value.getText()));
    return;

  case RuleKeyValue::Kind::RuleKey:
    out.putRuleKey(RuleKey(HashCode(value.getText())));
    return;

  case RuleKeyValue::Kind::BuildTarget:
    out.putBuildTarget(value.getBuildTarget().getFullyQualifiedName());
    return;

  case RuleKeyValue::Kind::BuildRuleType:
    out.putBuildRuleType(value.getText());
    return;

  case RuleKeyValue::Kind::SourcePath:
    appendSourcePath(out, name, value.getSourcePath());
    return;

  case RuleKeyValue::Kind::NonHashableSourcePath:
    out.putNonHashingPath(value.getSourcePath().describe());
    return;

  case RuleKeyValue::Kind::Rule: {
    auto key = resolver.getRuleKey(value.getRule());
    if (!key) {
      fail(name, llvm::toString(key.takeError()));
      return;
    }
    out.putRuleReference(*key);
    return;
  }

  case RuleKeyValue::Kind::Appendable: {
    out.putAppendableStart();
    NestedSink sink(*this, out, name);
    value.getAppendable().appendToRuleKey(sink);
    out.putAppendableEnd();
    return;
  }

  case RuleKeyValue::Kind::Sequence: {
    auto elements = value.getElements();
    out.putContainer(ContainerKind::List, elements.size());
    for (size_t i = 0, e = elements.size(); i != e; ++i) {
      appendField(out, (name + "[" + Twine(i) + "]").str(), elements[i]);
    }
    return;
  }

  case RuleKeyValue::Kind::Mapping:
    appendMapping(out, name, value);
    return;

  case RuleKeyValue::Kind::Optional:
    out.putWrapper(WrapperKind::Optional);
    if (value.hasOptionalValue())
      appendValue(out, name, value.getOptionalValue());
    else
      out.putNull();
    return;
  }
  llvm_unreachable("invalid rule key value kind");
}

void RuleKeyBuilder::appendSourcePath(RuleKeyHasher& out, StringRef name,
                                      const SourcePath& path) {
  switch (path.getKind()) {
  case SourcePath::Kind::Path: {
    auto hash = hashCache.get(path.getAbsolutePath());
    if (!hash) {
      fail(name, llvm::toString(hash.takeError()));
      return;
    }
    out.putPath(*hash);
    return;
  }

  case SourcePath::Kind::ArchiveMember: {
    auto hash = hashCache.get(path.getAbsolutePath());
    if (!hash) {
      fail(name, llvm::toString(hash.takeError()));
      return;
    }
    out.putArchiveMemberPath(*hash, path.getMemberPath());
    return;
  }

  case SourcePath::Kind::BuildTarget: {
    const BuildRule* rule = resolver.lookupRule(path.getBuildTarget());
    if (!rule) {
      fail(name, "no rule produces '" +
           path.getBuildTarget().getFullyQualifiedName() + "'");
      return;
    }
    auto key = resolver.getRuleKey(*rule);
    if (!key) {
      fail(name, llvm::toString(key.takeError()));
      return;
    }
    out.putBuildTargetSourcePath(*key, path.getOutputPath());
    return;
  }
  }
  llvm_unreachable("invalid source path kind");
}

void RuleKeyBuilder::appendMapping(RuleKeyHasher& out, StringRef name,
                                   const RuleKeyValue& value) {
  size_t numEntries = value.getNumMappingEntries();
  out.putContainer(ContainerKind::Map, numEntries);

  // Entries are ordered by the canonical encoding of their keys, so the
  // result does not depend on insertion order.
  std::vector<std::pair<std::string, size_t>> order;
  order.reserve(numEntries);
  for (size_t i = 0; i != numEntries; ++i) {
    RuleKeyHasher capture(std::unique_ptr<HashFunction>(
                              new CapturingHashFunction()));
    appendValue(capture, name, value.getMappingKey(i));
    order.emplace_back(capture.finish().getBytes().str(), i);
  }
  std::sort(order.begin(), order.end());

  for (size_t i = 0; i != numEntries; ++i) {
    if (i != 0 && order[i].first == order[i - 1].first) {
      SmallString<64> description;
      llvm::raw_svector_ostream os(description);
      value.getMappingKey(order[i].second).print(os);
      fail(name, "duplicate mapping key " + os.str());
      return;
    }
    size_t index = order[i].second;
    appendField(out, (name + "{key}").str(), value.getMappingKey(index));
    appendField(out, (name + "{value}").str(), value.getMappingValue(index));
  }
}

Expected<RuleKey> RuleKeyBuilder::build() {
  if (error.hasValue()) {
    return llvm::createStringError(llvm::inconvertibleErrorCode(), *error);
  }
  if (!result.hasValue()) {
    result = hasher.hash();
    if (logger)
      logger->registerRuleKey(*result);
  }
  return *result;
}
