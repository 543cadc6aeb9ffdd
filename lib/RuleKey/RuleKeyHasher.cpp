//===-- RuleKeyHasher.cpp -------------------------------------------------===//
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

#include "rulekit/RuleKey/RuleKeyHasher.h"

#include "llvm/Support/ErrorHandling.h"

#include <limits>

using namespace rulekit;
using namespace rulekit::rulekey;

RuleKeyHasher::RuleKeyHasher(std::unique_ptr<HashFunction> function)
  : function(std::move(function)) {}

RuleKeyHasher::~RuleKeyHasher() {}

void RuleKeyHasher::writeTag(RuleKeyTag tag) {
  if (finished) {
    llvm::report_fatal_error("rule key hasher used after finish");
  }
  scratch.push_back(static_cast<uint8_t>(tag));
}

void RuleKeyHasher::writeByte(uint8_t value) {
  scratch.push_back(value);
}

void RuleKeyHasher::writeFixed(uint64_t value, unsigned numBytes) {
  for (unsigned i = numBytes; i != 0; --i) {
    scratch.push_back(uint8_t(value >> ((i - 1) * 8)));
  }
}

void RuleKeyHasher::writeLengthPrefixed(StringRef data) {
  if (data.size() > std::numeric_limits<uint32_t>::max()) {
    llvm::report_fatal_error("rule key item too large");
  }
  writeFixed(data.size(), 4);
  scratch.append(data.bytes_begin(), data.bytes_end());
}

void RuleKeyHasher::flush() {
  function->update(scratch);
  if (recording)
    recording->append(scratch.begin(), scratch.end());
  scratch.clear();
}

RuleKeyHasher& RuleKeyHasher::putTagged(RuleKeyTag tag, uint64_t value,
                                        unsigned numBytes) {
  writeTag(tag);
  writeFixed(value, numBytes);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putKey(StringRef key) {
  writeTag(RuleKeyTag::Key);
  writeLengthPrefixed(key);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putNull() {
  writeTag(RuleKeyTag::Null);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putBoolean(bool value) {
  return putTagged(RuleKeyTag::Boolean, value ? 1 : 0, 1);
}

RuleKeyHasher& RuleKeyHasher::putNumber(int8_t value) {
  return putTagged(RuleKeyTag::Int8, uint8_t(value), 1);
}

RuleKeyHasher& RuleKeyHasher::putNumber(uint8_t value) {
  return putTagged(RuleKeyTag::UInt8, value, 1);
}

RuleKeyHasher& RuleKeyHasher::putNumber(int16_t value) {
  return putTagged(RuleKeyTag::Int16, uint16_t(value), 2);
}

RuleKeyHasher& RuleKeyHasher::putNumber(uint16_t value) {
  return putTagged(RuleKeyTag::UInt16, value, 2);
}

RuleKeyHasher& RuleKeyHasher::putNumber(int32_t value) {
  return putTagged(RuleKeyTag::Int32, uint32_t(value), 4);
}

RuleKeyHasher& RuleKeyHasher::putNumber(uint32_t value) {
  return putTagged(RuleKeyTag::UInt32, value, 4);
}

RuleKeyHasher& RuleKeyHasher::putNumber(int64_t value) {
  return putTagged(RuleKeyTag::Int64, uint64_t(value), 8);
}

RuleKeyHasher& RuleKeyHasher::putNumber(uint64_t value) {
  return putTagged(RuleKeyTag::UInt64, value, 8);
}

RuleKeyHasher& RuleKeyHasher::putString(StringRef value) {
  writeTag(RuleKeyTag::String);
  writeLengthPrefixed(value);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putBytes(ArrayRef<uint8_t> value) {
  writeTag(RuleKeyTag::Bytes);
  writeLengthPrefixed(StringRef(reinterpret_cast<const char*>(value.data()),
                                value.size()));
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putEnum(StringRef typeName,
                                      StringRef enumerantName) {
  writeTag(RuleKeyTag::Enum);
  writeLengthPrefixed(typeName);
  writeLengthPrefixed(enumerantName);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putHashCode(const HashCode& value) {
  writeTag(RuleKeyTag::HashCode);
  writeLengthPrefixed(value.getBytes());
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putRuleKey(const RuleKey& value) {
  writeTag(RuleKeyTag::RuleKey);
  writeLengthPrefixed(value.getHashCode().getBytes());
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putRuleReference(const RuleKey& ruleKey) {
  writeTag(RuleKeyTag::RuleReference);
  writeLengthPrefixed(ruleKey.getHashCode().getBytes());
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putBuildTarget(StringRef fullyQualifiedName) {
  writeTag(RuleKeyTag::BuildTarget);
  writeLengthPrefixed(fullyQualifiedName);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putBuildRuleType(StringRef type) {
  writeTag(RuleKeyTag::BuildRuleType);
  writeLengthPrefixed(type);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putPath(const HashCode& contentHash) {
  writeTag(RuleKeyTag::Path);
  writeLengthPrefixed(contentHash.getBytes());
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putArchiveMemberPath(const HashCode& archiveHash,
                                                   StringRef memberPath) {
  writeTag(RuleKeyTag::ArchiveMemberPath);
  flush();
  putKey("archive");
  putHashCode(archiveHash);
  putKey("member");
  putString(memberPath);
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putNonHashingPath(StringRef path) {
  writeTag(RuleKeyTag::NonHashingPath);
  writeLengthPrefixed(path);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putBuildTargetSourcePath(const RuleKey& producer,
                                                       StringRef outputPath) {
  writeTag(RuleKeyTag::BuildTargetSourcePath);
  flush();
  putKey("rule");
  putRuleReference(producer);
  putKey("output");
  putString(outputPath);
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putContainer(ContainerKind kind,
                                           uint64_t size) {
  writeTag(RuleKeyTag::Container);
  writeByte(static_cast<uint8_t>(kind));
  writeFixed(size, 8);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putWrapper(WrapperKind kind) {
  writeTag(RuleKeyTag::Wrapper);
  writeByte(static_cast<uint8_t>(kind));
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putAppendableStart() {
  writeTag(RuleKeyTag::AppendableStart);
  flush();
  return *this;
}

RuleKeyHasher& RuleKeyHasher::putAppendableEnd() {
  writeTag(RuleKeyTag::AppendableEnd);
  flush();
  return *this;
}

HashCode RuleKeyHasher::finish() {
  if (finished) {
    llvm::report_fatal_error("rule key hasher finished twice");
  }
  finished = true;
  return function->finish();
}
